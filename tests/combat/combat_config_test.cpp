#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "combat/CombatConfig.h"
#include "util/TomlUtil.h"

namespace {

class CombatConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("framelock_config_" + std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::create_directories(dir_);
    TomlUtil::resetWarningCount();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string write(std::string_view name, std::string_view text) {
    const std::filesystem::path p = dir_ / name;
    std::ofstream out(p);
    out << text;
    return p.string();
  }

  std::filesystem::path dir_;
};

}  // namespace

TEST(CombatConfigDefaults, MatchDocumentedTuning) {
  const CombatConfig cfg{};
  EXPECT_EQ(cfg.frameRate, 60);
  EXPECT_EQ(cfg.parry.window, 7);
  EXPECT_EQ(cfg.parry.redWindow, 2);
  EXPECT_EQ(cfg.scaling.start, 3);
  EXPECT_FLOAT_EQ(cfg.scaling.rate, 0.9F);
  EXPECT_EQ(cfg.combo.decayFrames, 180);
  EXPECT_TRUE(cfg.block.chipKo);
  EXPECT_EQ(cfg.input.socd, SocdPolicy::Neutral);
}

TEST(CombatConfigDefaults, MillisecondWindowsBecomeFrames) {
  const CombatConfig cfg{};
  const MotionWindows w = cfg.motionWindows();
  EXPECT_EQ(w.qcf, 15);
  EXPECT_EQ(w.qcb, 15);
  EXPECT_EQ(w.dp, 13);
  EXPECT_EQ(w.qcf2, 24);
  EXPECT_EQ(w.negativeEdge, 4);
  EXPECT_EQ(w.chargeFrames, 45);
  EXPECT_EQ(w.chargeRelease, 15);
  EXPECT_EQ(msToFrames(1000, 30), 30);
}

TEST_F(CombatConfigTest, OverridesFromToml) {
  const std::string path = write("combat.toml", R"(
version = 1
frame_rate = 30

[parry]
window = 10
red_enabled = false

[damage_scaling]
start = 2
rate = 0.8

[block]
chip_ko = false

[input]
socd = "last"
qcf_ms = 500
)");
  CombatConfig cfg;
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(cfg.frameRate, 30);
  EXPECT_EQ(cfg.parry.window, 10);
  EXPECT_FALSE(cfg.parry.redEnabled);
  EXPECT_EQ(cfg.scaling.start, 2);
  EXPECT_FLOAT_EQ(cfg.scaling.rate, 0.8F);
  EXPECT_FALSE(cfg.block.chipKo);
  EXPECT_EQ(cfg.input.socd, SocdPolicy::Last);
  EXPECT_EQ(cfg.motionWindows().qcf, 15);
  EXPECT_EQ(cfg.path, path);
  EXPECT_EQ(TomlUtil::warningCount(), 0);
}

TEST_F(CombatConfigTest, UnknownKeysAndBadValuesWarn) {
  const std::string path = write("combat.toml", R"(
mystery = 1

[parry]
window = -3
colour = "red"

[input]
socd = "sideways"
)");
  CombatConfig cfg;
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(cfg.parry.window, 7);
  EXPECT_EQ(cfg.input.socd, SocdPolicy::Neutral);
  EXPECT_EQ(TomlUtil::warningCount(), 4);
}

TEST_F(CombatConfigTest, ScalingRateAboveOneIsClamped) {
  const std::string path = write("combat.toml", "[damage_scaling]\nrate = 1.5\n");
  CombatConfig cfg;
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_FLOAT_EQ(cfg.scaling.rate, 1.0F);
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST_F(CombatConfigTest, IncludeIsAppliedFirst) {
  write("base.toml", R"(
[parry]
window = 9
recovery = 20
)");
  const std::string path = write("combat.toml", R"(
include = "base.toml"

[parry]
window = 5
)");
  CombatConfig cfg;
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(cfg.parry.window, 5);
  EXPECT_EQ(cfg.parry.recovery, 20);
}

TEST_F(CombatConfigTest, IncludeCycleIsSkipped) {
  write("a.toml", "include = \"b.toml\"\n[combo]\ndecay_frames = 90\n");
  const std::string path = write("b.toml", "include = \"a.toml\"\n[combo]\nmax_length = 9\n");
  CombatConfig cfg;
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(cfg.combo.decayFrames, 90);
  EXPECT_EQ(cfg.combo.maxLength, 9);
  EXPECT_EQ(TomlUtil::warningCount(), 1);
}

TEST_F(CombatConfigTest, MalformedFileFails) {
  const std::string path = write("combat.toml", "[parry\nwindow = ");
  CombatConfig cfg;
  EXPECT_FALSE(cfg.loadFromToml(path.c_str()));
  EXPECT_FALSE(cfg.loadFromToml((dir_ / "missing.toml").string().c_str()));
  EXPECT_FALSE(cfg.loadFromToml(nullptr));
}

TEST(CombatConfigShipped, DataFileLoadsCleanly) {
  TomlUtil::resetWarningCount();
  CombatConfig cfg;
  const std::string path = std::string(FRAMELOCK_DATA_DIR) + "/combat.toml";
  ASSERT_TRUE(cfg.loadFromToml(path.c_str()));
  EXPECT_EQ(TomlUtil::warningCount(), 0);
  EXPECT_EQ(cfg.stage.width, 1280.0F);
}
