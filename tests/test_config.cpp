#include <gtest/gtest.h>
#include "ar_config.h"
#include <cstdio>
#include <fstream>

using namespace photoar;

class AppConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string writeConfig(const std::string& name, const std::string& yaml) {
        path_ = ::testing::TempDir() + name;
        std::ofstream out(path_);
        out << "%YAML:1.0\n" << yaml;
        return path_;
    }

    std::string path_;
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config = AppConfig::defaultConfig();

    EXPECT_EQ(config.window.width, 1280);
    EXPECT_EQ(config.window.height, 720);
    EXPECT_EQ(config.scanner.reference_group, "AR Resources");
    EXPECT_EQ(config.scanner.plane_fit, PlaneFit::ASPECT_FILL);
    EXPECT_FLOAT_EQ(config.scanner.plane_lift, 0.001f);
    EXPECT_EQ(config.scanner.session.maximum_number_of_tracked_images, 1u);
    ASSERT_EQ(config.assets.video_extensions.size(), 3u);
    EXPECT_EQ(config.assets.video_extensions[0], "mov");
    EXPECT_EQ(config.logging.level, LogSystem::Level::INFO);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(AppConfigTest, MissingFileKeepsDefaults) {
    AppConfig config = AppConfig::loadFromFile(::testing::TempDir() + "does_not_exist.yml");
    EXPECT_EQ(config.window.width, 1280);
    EXPECT_EQ(config.scanner.reference_group, "AR Resources");
}

TEST_F(AppConfigTest, ReadsAllSections) {
    const std::string path = writeConfig("photoar_full.yml",
        "window:\n"
        "  width: 800\n"
        "  height: 600\n"
        "  title: \"Scanner\"\n"
        "  fullscreen: 1\n"
        "  vsync: 0\n"
        "camera:\n"
        "  index: 2\n"
        "  source: \"clip.mp4\"\n"
        "  width: 640\n"
        "  height: 480\n"
        "  fps: 15\n"
        "  calibration_file: \"calib.yml\"\n"
        "  async: 0\n"
        "assets:\n"
        "  root: \"/data/assets\"\n"
        "  reference_group: \"Posters\"\n"
        "  video_extensions: [ \"mp4\", \"mov\" ]\n"
        "tracking:\n"
        "  max_tracked_images: 2\n"
        "  max_features: 500\n"
        "  ratio_threshold: 0.8\n"
        "  min_inliers: 20\n"
        "  anchor_lost_frames: 5\n"
        "  interruption_timeout_ms: 250\n"
        "overlay:\n"
        "  plane_fit: \"fit\"\n"
        "  lift_m: 0.002\n"
        "  double_sided: 0\n"
        "logging:\n"
        "  level: \"debug\"\n");

    AppConfig config = AppConfig::loadFromFile(path);

    EXPECT_EQ(config.window.width, 800);
    EXPECT_EQ(config.window.height, 600);
    EXPECT_EQ(config.window.title, "Scanner");
    EXPECT_TRUE(config.window.fullscreen);
    EXPECT_FALSE(config.window.vsync);

    EXPECT_EQ(config.camera.camera_index, 2);
    EXPECT_EQ(config.camera.source, "clip.mp4");
    EXPECT_EQ(config.camera.desired_width, 640);
    EXPECT_EQ(config.camera.desired_height, 480);
    EXPECT_DOUBLE_EQ(config.camera.desired_fps, 15.0);
    EXPECT_EQ(config.camera.calibration_file, "calib.yml");
    EXPECT_FALSE(config.camera.enable_async_capture);

    EXPECT_EQ(config.assets.root, "/data/assets");
    EXPECT_EQ(config.scanner.reference_group, "Posters");
    ASSERT_EQ(config.assets.video_extensions.size(), 2u);
    EXPECT_EQ(config.assets.video_extensions[0], "mp4");

    const auto& session = config.scanner.session;
    EXPECT_EQ(session.maximum_number_of_tracked_images, 2u);
    EXPECT_EQ(config.scanner.features.max_features, 500);
    EXPECT_EQ(session.tracker.features.max_features, 500);
    EXPECT_FLOAT_EQ(session.tracker.ratio_threshold, 0.8f);
    EXPECT_EQ(session.tracker.min_inliers, 20);
    EXPECT_EQ(session.anchor_lost_frames, 5);
    EXPECT_EQ(session.interruption_timeout.count(), 250);

    EXPECT_EQ(config.scanner.plane_fit, PlaneFit::ASPECT_FIT);
    EXPECT_FLOAT_EQ(config.scanner.plane_lift, 0.002f);
    EXPECT_FALSE(config.scanner.double_sided);
    EXPECT_EQ(config.logging.level, LogSystem::Level::DEBUG);
}

TEST_F(AppConfigTest, PartialFileKeepsOtherDefaults) {
    const std::string path = writeConfig("photoar_partial.yml",
        "overlay:\n"
        "  plane_fit: \"stretch\"\n");

    AppConfig config = AppConfig::loadFromFile(path);
    EXPECT_EQ(config.scanner.plane_fit, PlaneFit::STRETCH);
    EXPECT_EQ(config.window.width, 1280);
    EXPECT_EQ(config.camera.desired_width, 1280);
    EXPECT_FLOAT_EQ(config.scanner.plane_lift, 0.001f);
    EXPECT_TRUE(config.scanner.double_sided);
}

TEST_F(AppConfigTest, UnknownPlaneFitIsConfigError) {
    const std::string path = writeConfig("photoar_bad_fit.yml",
        "overlay:\n"
        "  plane_fit: \"zoom\"\n");

    try {
        AppConfig::loadFromFile(path);
        FAIL() << "Expected ARError";
    } catch (const ARError& e) {
        EXPECT_EQ(e.getCategory(), ARError::Category::CONFIG);
    }
}

TEST_F(AppConfigTest, UnknownLogLevelIsConfigError) {
    const std::string path = writeConfig("photoar_bad_level.yml",
        "logging:\n"
        "  level: \"loud\"\n");
    EXPECT_THROW(AppConfig::loadFromFile(path), ARError);
}

TEST_F(AppConfigTest, NonPositiveSizesAreRejected) {
    const std::string path = writeConfig("photoar_bad_size.yml",
        "window:\n"
        "  width: 0\n");
    EXPECT_THROW(AppConfig::loadFromFile(path), ARError);
}

TEST_F(AppConfigTest, WrongTypeIsRejected) {
    const std::string path = writeConfig("photoar_bad_type.yml",
        "tracking:\n"
        "  min_inliers: \"many\"\n");
    EXPECT_THROW(AppConfig::loadFromFile(path), ARError);
}

TEST_F(AppConfigTest, ValidateChecksTrackingRanges) {
    AppConfig config;
    config.scanner.session.tracker.ratio_threshold = 1.5f;
    EXPECT_THROW(config.validate(), ARError);

    config = AppConfig{};
    config.scanner.session.anchor_lost_frames = 0;
    EXPECT_THROW(config.validate(), ARError);

    config = AppConfig{};
    config.scanner.plane_lift = -0.01f;
    EXPECT_THROW(config.validate(), ARError);

    config = AppConfig{};
    config.assets.video_extensions.clear();
    EXPECT_THROW(config.validate(), ARError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
