#include <gtest/gtest.h>
#include "ar_reference_image.h"
#include "ar_error.h"
#include "synthetic_scene.h"
#include <fstream>

using namespace photoar;
using namespace photoar::test_support;

namespace fs = std::filesystem;

class ReferenceImageLibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = scratchDirectory("photoar_reference_images");
        group_dir_ = root_ / "AR Resources";
        fs::create_directories(group_dir_);
    }

    void writeImage(const std::string& file, const cv::Mat& image) {
        ASSERT_TRUE(cv::imwrite((group_dir_ / file).string(), image));
    }

    fs::path root_;
    fs::path group_dir_;
};

TEST_F(ReferenceImageLibraryTest, LoadsManifestEntries) {
    writeImage("poster.png", makeTexturedImage(1));
    writeImage("postcard.png", makeTexturedImage(2, cv::Size(300, 200)));
    writeManifest(group_dir_, {
        {"poster", "poster.png", 0.30f, 0.20f},
        {"postcard", "postcard.png", 0.15f, 0.0f},
    });

    auto library = ReferenceImageLibrary::loadGroup(root_.string(), "AR Resources");

    ASSERT_EQ(library.size(), 2u);
    EXPECT_EQ(library.groupName(), "AR Resources");

    const ReferenceImage* poster = library.find("poster");
    ASSERT_NE(poster, nullptr);
    EXPECT_FLOAT_EQ(poster->physical_size.width, 0.30f);
    EXPECT_FLOAT_EQ(poster->physical_size.height, 0.20f);
    EXPECT_GE(poster->keypoints.size(), 10u);
    EXPECT_FALSE(poster->descriptors.empty());
    EXPECT_EQ(poster->image.type(), CV_8UC1);

    // Height derived from the 3:2 aspect
    const ReferenceImage* postcard = library.find("postcard");
    ASSERT_NE(postcard, nullptr);
    EXPECT_NEAR(postcard->physical_size.height, 0.10f, 1e-5f);

    EXPECT_EQ(library.find("missing"), nullptr);
}

TEST_F(ReferenceImageLibraryTest, UnreadableImageIsSkipped) {
    writeImage("good.png", makeTexturedImage(3));
    std::ofstream(group_dir_ / "broken.png") << "not an image";
    writeManifest(group_dir_, {
        {"good", "good.png", 0.2f, 0.0f},
        {"broken", "broken.png", 0.2f, 0.0f},
        {"absent", "absent.png", 0.2f, 0.0f},
    });

    auto library = ReferenceImageLibrary::loadGroup(root_.string(), "AR Resources");
    EXPECT_EQ(library.size(), 1u);
    EXPECT_NE(library.find("good"), nullptr);
    EXPECT_EQ(library.find("broken"), nullptr);
}

TEST_F(ReferenceImageLibraryTest, DuplicateManifestNameKeepsFirst) {
    writeImage("a.png", makeTexturedImage(4));
    writeImage("b.png", makeTexturedImage(5));
    writeManifest(group_dir_, {
        {"same", "a.png", 0.2f, 0.0f},
        {"same", "b.png", 0.4f, 0.0f},
    });

    auto library = ReferenceImageLibrary::loadGroup(root_.string(), "AR Resources");
    ASSERT_EQ(library.size(), 1u);
    EXPECT_FLOAT_EQ(library.find("same")->physical_size.width, 0.2f);
}

TEST_F(ReferenceImageLibraryTest, MissingGroupThrowsAssetError) {
    try {
        ReferenceImageLibrary::loadGroup(root_.string(), "Nope");
        FAIL() << "Expected ARError";
    } catch (const ARError& e) {
        EXPECT_EQ(e.getCategory(), ARError::Category::ASSET);
        EXPECT_NE(std::string(e.what()).find("Nope"), std::string::npos);
    }
}

TEST_F(ReferenceImageLibraryTest, InaccessibleGroupThrowsAssetError) {
    // A path component past NAME_MAX fails to stat with something other than "not found"
    const std::string group(300, 'g');
    try {
        ReferenceImageLibrary::loadGroup(root_.string(), group);
        FAIL() << "Expected ARError";
    } catch (const ARError& e) {
        EXPECT_EQ(e.getCategory(), ARError::Category::ASSET);
    }
}

TEST_F(ReferenceImageLibraryTest, MissingManifestThrows) {
    EXPECT_THROW(ReferenceImageLibrary::loadGroup(root_.string(), "AR Resources"), ARError);
}

TEST_F(ReferenceImageLibraryTest, GroupWithoutUsableImagesThrows) {
    writeImage("blank.png", cv::Mat(240, 320, CV_8UC1, cv::Scalar(128)));
    writeManifest(group_dir_, { {"blank", "blank.png", 0.2f, 0.0f} });

    EXPECT_THROW(ReferenceImageLibrary::loadGroup(root_.string(), "AR Resources"), ARError);
}

// Single image creation
TEST(ReferenceImageTest, RejectsBadInput) {
    EXPECT_THROW(ReferenceImageLibrary::createReferenceImage("empty", cv::Mat(), Size2(0.1f, 0.1f)), ARError);
    EXPECT_THROW(ReferenceImageLibrary::createReferenceImage("flat", makeTexturedImage(6), Size2(0.0f, 0.1f)),
                 ARError);
    EXPECT_THROW(ReferenceImageLibrary::createReferenceImage(
                     "featureless", cv::Mat(200, 200, CV_8UC1, cv::Scalar(0)), Size2(0.1f, 0.1f)),
                 ARError);
}

TEST(ReferenceImageTest, LargeImagesAreDownscaled) {
    FeatureConfig features;
    features.max_reference_dimension = 400;

    cv::Mat large = makeTexturedImage(7, cv::Size(1200, 800));
    ReferenceImage ref = ReferenceImageLibrary::createReferenceImage("large", large, Size2(0.6f, 0.0f), features);

    EXPECT_EQ(ref.image.cols, 400);
    EXPECT_NEAR(ref.image.rows, 267, 1);
    EXPECT_NEAR(ref.physical_size.height, 0.4f, 1e-5f);
}

TEST(ReferenceImageTest, ColorInputBecomesGray) {
    cv::Mat bgr;
    cv::cvtColor(makeTexturedImage(8), bgr, cv::COLOR_GRAY2BGR);
    ReferenceImage ref = ReferenceImageLibrary::createReferenceImage("color", bgr, Size2(0.2f, 0.0f));
    EXPECT_EQ(ref.image.channels(), 1);
}

TEST(ReferenceImageTest, CornersAndPhysicalCorners) {
    ReferenceImage ref = ReferenceImageLibrary::createReferenceImage("corners", makeTexturedImage(9),
                                                                     Size2(0.2f, 0.15f));

    auto pixels = ref.corners();
    ASSERT_EQ(pixels.size(), 4u);
    EXPECT_EQ(pixels[0], cv::Point2f(0.0f, 0.0f));
    EXPECT_EQ(pixels[2], cv::Point2f(320.0f, 240.0f));

    auto physical = ref.physicalCorners();
    ASSERT_EQ(physical.size(), 4u);
    // Top-left is toward -X and -Z, the print lies at y = 0
    EXPECT_FLOAT_EQ(physical[0].x, -0.1f);
    EXPECT_FLOAT_EQ(physical[0].z, -0.075f);
    EXPECT_FLOAT_EQ(physical[2].x, 0.1f);
    EXPECT_FLOAT_EQ(physical[2].z, 0.075f);
    for (const auto& p : physical) {
        EXPECT_FLOAT_EQ(p.y, 0.0f);
    }
}

TEST(ReferenceImageTest, AddRejectsDuplicates) {
    ReferenceImageLibrary library;
    library.add(ReferenceImageLibrary::createReferenceImage("dup", makeTexturedImage(10), Size2(0.2f, 0.0f)));
    EXPECT_THROW(library.add(ReferenceImageLibrary::createReferenceImage("dup", makeTexturedImage(11),
                                                                         Size2(0.2f, 0.0f))),
                 ARError);
    EXPECT_EQ(library.size(), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
