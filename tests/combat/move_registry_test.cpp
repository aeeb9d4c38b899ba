#include <gtest/gtest.h>

#include <string>

#include <toml++/toml.h>

#include "character/CharacterConfig.h"
#include "combat/MoveRegistry.h"
#include "support/TestData.h"

namespace {

MoveDef special(const char* name, Motion motion, std::initializer_list<Button> buttons,
                int cost = 0) {
  MoveDef m{};
  m.name = name;
  m.kind = cost > 0 ? MoveKind::Super : MoveKind::Special;
  m.motion = motion;
  m.buttons = buttons;
  m.attack.damage = 50;
  m.attack.startup = 5;
  m.attack.active = 2;
  m.attack.recovery = 10;
  m.attack.meterCost = cost;
  return m;
}

}  // namespace

TEST(MoveRegistryTest, LooksUpByNameButtonAndMotion) {
  MoveRegistry reg;
  std::string error;
  ASSERT_TRUE(reg.add(special("fireball", Motion::QCF, {Button::LP, Button::HP}), error));
  ASSERT_TRUE(reg.add(special("kick", Motion::QCB, {Button::LK}), error));

  ASSERT_NE(reg.find("fireball"), nullptr);
  EXPECT_EQ(reg.find("missing"), nullptr);
  EXPECT_EQ(reg.findSpecial(Motion::QCF, Button::HP), reg.find("fireball"));
  EXPECT_EQ(reg.findSpecial(Motion::QCF, Button::MP), nullptr);
  EXPECT_TRUE(reg.hasSpecial(Motion::QCB, ButtonClass::Kick));
  EXPECT_FALSE(reg.hasSpecial(Motion::QCB, ButtonClass::Punch));
  EXPECT_EQ(reg.size(), 2U);
}

TEST(MoveRegistryTest, CostliestSpecialWinsOnSharedInput) {
  MoveRegistry reg;
  std::string error;
  ASSERT_TRUE(reg.add(special("uppercut", Motion::DP, {Button::LP}), error));
  ASSERT_TRUE(reg.add(special("super_uppercut", Motion::DP, {Button::LP}, 75), error));
  ASSERT_NE(reg.findSpecial(Motion::DP, Button::LP), nullptr);
  EXPECT_EQ(reg.findSpecial(Motion::DP, Button::LP)->name, "super_uppercut");
  EXPECT_EQ(reg.specialNames().front(), "super_uppercut");
}

TEST(MoveRegistryTest, RejectsDuplicatesAndBadFrameData) {
  MoveRegistry reg;
  std::string error;
  ASSERT_TRUE(reg.add(special("fireball", Motion::QCF, {Button::LP}), error));
  EXPECT_FALSE(reg.add(special("fireball", Motion::QCF, {Button::MP}), error));
  EXPECT_NE(error.find("twice"), std::string::npos);

  MoveDef bad = special("broken", Motion::QCF, {Button::LP});
  bad.attack.startup = -1;
  EXPECT_FALSE(reg.add(bad, error));
  EXPECT_NE(error.find("startup"), std::string::npos);

  MoveDef noActive = special("still", Motion::QCF, {Button::LP});
  noActive.attack.active = 0;
  EXPECT_FALSE(reg.add(noActive, error));

  MoveDef noButtons = special("mute", Motion::QCF, {});
  EXPECT_FALSE(reg.add(noButtons, error));
  EXPECT_EQ(reg.size(), 1U);
}

TEST(MoveRegistryTest, RemoveUnbindsEverything) {
  MoveRegistry reg;
  std::string error;
  ASSERT_TRUE(reg.add(special("fireball", Motion::QCF, {Button::LP}), error));
  EXPECT_TRUE(reg.remove("fireball"));
  EXPECT_FALSE(reg.remove("fireball"));
  EXPECT_EQ(reg.findSpecial(Motion::QCF, Button::LP), nullptr);
  EXPECT_TRUE(reg.specialNames().empty());
}

TEST(CharacterConfigTest, LoadsTestFighter) {
  const CharacterConfig cfg = TestData::character();
  EXPECT_TRUE(cfg.errors.empty());
  EXPECT_EQ(cfg.displayName, "Tester");
  EXPECT_EQ(cfg.stats.health, 1000);
  ASSERT_NE(cfg.moves.findNormal(Button::LP), nullptr);
  EXPECT_EQ(cfg.moves.findNormal(Button::HK), nullptr);
  ASSERT_NE(cfg.moves.findThrow(), nullptr);
  EXPECT_EQ(cfg.moves.findThrow()->attack.guard, GuardType::Unblockable);
  EXPECT_TRUE(cfg.moves.findThrow()->attack.knockdown);

  const MoveDef* blast = cfg.moves.find("blast");
  ASSERT_NE(blast, nullptr);
  EXPECT_EQ(blast->kind, MoveKind::Super);
  EXPECT_EQ(blast->attack.meterCost, 50);
  EXPECT_EQ(blast->attack.superFreeze, 30);

  const MoveDef* uppercut = cfg.moves.find("uppercut");
  ASSERT_NE(uppercut, nullptr);
  EXPECT_EQ(uppercut->kind, MoveKind::Special);
  EXPECT_EQ(uppercut->attack.invulnFrom, 1);
  EXPECT_EQ(uppercut->attack.invulnTo, 4);
}

TEST(CharacterConfigTest, MissingFrameDataIsFatal) {
  CharacterConfig cfg;
  const toml::table tbl = toml::parse(R"(
[specials.fireball]
motion = "qcf"
buttons = ["lp"]
damage = 80
startup = 13
active = 4
)");
  EXPECT_FALSE(cfg.loadFromTable(tbl, "<test>"));
  ASSERT_EQ(cfg.errors.size(), 1U);
  EXPECT_NE(cfg.errors[0].find("recovery"), std::string::npos);
  EXPECT_EQ(cfg.moves.find("fireball"), nullptr);
}

TEST(CharacterConfigTest, UnknownMotionAndButtonAreFatal) {
  CharacterConfig cfg;
  const toml::table tbl = toml::parse(R"(
[specials.spin]
motion = "360"
buttons = ["lp"]
damage = 1
startup = 1
active = 1
recovery = 1

[specials.poke]
motion = "qcf"
buttons = ["xp"]
damage = 1
startup = 1
active = 1
recovery = 1
)");
  EXPECT_FALSE(cfg.loadFromTable(tbl, "<test>"));
  EXPECT_EQ(cfg.errors.size(), 2U);
  EXPECT_TRUE(cfg.moves.empty());
}

TEST(CharacterConfigTest, NumpadMotionAliases) {
  CharacterConfig cfg;
  const toml::table tbl = toml::parse(R"(
[specials.a]
motion = "236"
button = "lp"
damage = 1
startup = 1
active = 1
recovery = 1

[specials.b]
motion = "623"
button = "hk"
damage = 1
startup = 1
active = 1
recovery = 1
)");
  ASSERT_TRUE(cfg.loadFromTable(tbl, "<test>"));
  EXPECT_EQ(cfg.moves.find("a")->motion, Motion::QCF);
  EXPECT_EQ(cfg.moves.find("b")->motion, Motion::DP);
  EXPECT_NE(cfg.moves.findSpecial(Motion::DP, Button::HK), nullptr);
}

TEST(CharacterConfigTest, ShippedCharactersLoad) {
  for (const char* name : {"kaito", "rena"}) {
    CharacterConfig cfg;
    const std::string path = std::string(FRAMELOCK_DATA_DIR) + "/characters/" + name + ".toml";
    EXPECT_TRUE(cfg.loadFromToml(path.c_str())) << path;
    EXPECT_TRUE(cfg.errors.empty()) << path;
    EXPECT_EQ(cfg.id, name);
    EXPECT_NE(cfg.moves.findNormal(Button::HK), nullptr) << path;
    EXPECT_NE(cfg.moves.findThrow(), nullptr) << path;
  }
}

TEST(CharacterConfigTest, IncludedMovesCanBeOverridden) {
  CharacterConfig cfg;
  const std::string path = std::string(FRAMELOCK_DATA_DIR) + "/characters/rena.toml";
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  const MoveDef* hk = cfg.moves.findNormal(Button::HK);
  ASSERT_NE(hk, nullptr);
  EXPECT_EQ(hk->attack.damage, 90);
  EXPECT_EQ(cfg.moves.findNormal(Button::LP)->attack.damage, 30);
}
