#include <gtest/gtest.h>
#include "ar_video_player.h"
#include "synthetic_scene.h"
#include <fstream>

using namespace photoar;
using namespace photoar::test_support;

namespace fs = std::filesystem;

class VideoPlayerTest : public ::testing::Test {
protected:
    static constexpr int kFrames = 10;
    static constexpr double kFps = 10.0;

    void SetUp() override {
        dir_ = scratchDirectory("photoar_video_player");
        clip_ = (dir_ / "clip.avi").string();

        cv::VideoWriter writer(clip_, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), kFps, cv::Size(64, 48));
        if (!writer.isOpened()) {
            GTEST_SKIP() << "No MJPEG writer available";
        }
        for (int i = 0; i < kFrames; ++i) {
            writer.write(cv::Mat(48, 64, CV_8UC3, cv::Scalar(i * 20, 128, 255 - i * 20)));
        }
        writer.release();
    }

    fs::path dir_;
    std::string clip_;
};

TEST_F(VideoPlayerTest, LoadBecomesReady) {
    VideoPlayer player(clip_);
    std::vector<VideoSource::Status> statuses;
    player.setStatusCallback([&](VideoSource&, VideoSource::Status status) { statuses.push_back(status); });

    EXPECT_EQ(player.status(), VideoSource::Status::UNKNOWN);
    player.load();

    ASSERT_EQ(player.status(), VideoSource::Status::READY_TO_PLAY);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0], VideoSource::Status::READY_TO_PLAY);

    EXPECT_NEAR(player.fps(), kFps, 0.5);
    EXPECT_EQ(player.renderSize(), Size2(64.0f, 48.0f));
    EXPECT_FALSE(player.orientation().is_portrait);
    EXPECT_FALSE(player.isPlaying());

    // First frame is available before playback starts
    EXPECT_EQ(player.frameSerial(), 1u);
    EXPECT_EQ(player.currentFrame().cols, 64);
    EXPECT_EQ(player.currentFrame().rows, 48);
}

TEST_F(VideoPlayerTest, UpdateAdvancesOnFrameBoundaries) {
    VideoPlayer player(clip_);
    player.load();
    player.play();
    ASSERT_TRUE(player.isPlaying());

    player.update(0.05);
    EXPECT_EQ(player.frameSerial(), 1u);

    player.update(0.06);
    EXPECT_EQ(player.frameSerial(), 2u);
    EXPECT_NEAR(player.position(), 0.11, 1e-9);

    // Falling behind decodes only the newest due frame
    player.update(0.3);
    EXPECT_EQ(player.frameSerial(), 3u);
}

TEST_F(VideoPlayerTest, PausedPlayerDoesNotAdvance) {
    VideoPlayer player(clip_);
    player.load();

    player.update(0.5);
    EXPECT_EQ(player.frameSerial(), 1u);

    player.play();
    player.pause();
    player.update(0.5);
    EXPECT_EQ(player.frameSerial(), 1u);
    EXPECT_DOUBLE_EQ(player.position(), 0.0);
}

TEST_F(VideoPlayerTest, EndIsReportedOnce) {
    VideoPlayer player(clip_);
    int ends = 0;
    player.setEndCallback([&](VideoSource&) { ++ends; });
    player.load();
    player.play();

    for (int i = 0; i < kFrames * 3; ++i) {
        player.update(0.105);
    }

    EXPECT_EQ(ends, 1);
    EXPECT_FALSE(player.isPlaying());

    // Finished players stay stopped until rewound
    player.play();
    EXPECT_FALSE(player.isPlaying());
}

TEST_F(VideoPlayerTest, SeekToZeroRestartsPlayback) {
    VideoPlayer player(clip_);
    player.load();
    player.play();
    for (int i = 0; i < kFrames * 2; ++i) {
        player.update(0.105);
    }
    ASSERT_FALSE(player.isPlaying());
    const uint64_t serial = player.frameSerial();

    player.seekToZero();
    EXPECT_DOUBLE_EQ(player.position(), 0.0);
    EXPECT_GT(player.frameSerial(), serial);

    player.play();
    EXPECT_TRUE(player.isPlaying());
    player.update(0.105);
    EXPECT_EQ(player.status(), VideoSource::Status::READY_TO_PLAY);
}

TEST_F(VideoPlayerTest, EndCallbackCanLoop) {
    VideoPlayer player(clip_);
    int ends = 0;
    player.setEndCallback([&](VideoSource& source) {
        ++ends;
        source.seekToZero();
        source.play();
    });
    player.load();
    player.play();

    for (int i = 0; i < kFrames * 3; ++i) {
        player.update(0.105);
    }

    EXPECT_GE(ends, 2);
    EXPECT_TRUE(player.isPlaying());
}

TEST_F(VideoPlayerTest, MissingFileFails) {
    VideoPlayer player((dir_ / "missing.mov").string());
    std::vector<VideoSource::Status> statuses;
    player.setStatusCallback([&](VideoSource&, VideoSource::Status status) { statuses.push_back(status); });

    player.load();

    EXPECT_EQ(player.status(), VideoSource::Status::FAILED);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0], VideoSource::Status::FAILED);

    player.play();
    EXPECT_FALSE(player.isPlaying());
    EXPECT_TRUE(player.currentFrame().empty());
}

TEST_F(VideoPlayerTest, GarbageFileFails) {
    const std::string path = (dir_ / "garbage.mp4").string();
    std::ofstream(path) << "this is not a video";

    VideoPlayer player(path);
    player.load();
    EXPECT_EQ(player.status(), VideoSource::Status::FAILED);
}

TEST(VideoStatusTest, Names) {
    EXPECT_STREQ(videoStatusName(VideoSource::Status::UNKNOWN), "unknown");
    EXPECT_STREQ(videoStatusName(VideoSource::Status::READY_TO_PLAY), "readyToPlay");
    EXPECT_STREQ(videoStatusName(VideoSource::Status::FAILED), "failed");
}

// Asset lookup
class AssetBundleTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = scratchDirectory("photoar_asset_bundle");
        touch("poster.mp4");
        touch("poster.mov");
        touch("flyer.m4v");
    }

    void touch(const std::string& name) { std::ofstream(root_ / name) << "x"; }

    fs::path root_;
};

TEST_F(AssetBundleTest, FindVideoTriesExtensionsInOrder) {
    AssetBundle bundle(root_.string());
    auto url = bundle.findVideo("poster");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(fs::path(*url).filename().string(), "poster.mov");

    AssetBundle mp4_first(root_.string(), {"mp4", "mov"});
    EXPECT_EQ(fs::path(*mp4_first.findVideo("poster")).filename().string(), "poster.mp4");

    auto flyer = bundle.findVideo("flyer");
    ASSERT_TRUE(flyer.has_value());
    EXPECT_EQ(fs::path(*flyer).extension().string(), ".m4v");
}

TEST_F(AssetBundleTest, MissingResources) {
    AssetBundle bundle(root_.string());
    EXPECT_FALSE(bundle.findVideo("unknown").has_value());
    EXPECT_FALSE(bundle.findVideo("").has_value());
    EXPECT_FALSE(bundle.urlForResource("poster", "avi").has_value());

    AssetBundle no_extensions(root_.string(), {});
    EXPECT_FALSE(no_extensions.findVideo("poster").has_value());
}

TEST_F(AssetBundleTest, UrlForResource) {
    AssetBundle bundle(root_.string());
    auto url = bundle.urlForResource("poster", "mp4");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, (root_ / "poster.mp4").string());
    EXPECT_EQ(bundle.root(), root_.string());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
