#include "ar_photo_scanner.h"
#include "ar_error.h"

namespace photoar {

PhotoScanner::PhotoScanner(AssetBundle assets, ARSession& session, Scene& scene)
    : PhotoScanner(Config{}, std::move(assets), session, scene) {}

PhotoScanner::PhotoScanner(const Config& config, AssetBundle assets, ARSession& session, Scene& scene,
                           VideoFactory video_factory)
    : config_(config)
    , assets_(std::move(assets))
    , session_(session)
    , scene_(scene)
    , video_factory_(std::move(video_factory)) {
    if (!video_factory_) {
        video_factory_ = [](const std::string& path) { return std::make_shared<VideoPlayer>(path); };
    }
}

PhotoScanner::~PhotoScanner() {
    if (session_.getDelegate() == this) {
        session_.setDelegate(nullptr);
    }
    releaseVideo();
}

void PhotoScanner::viewDidLoad(bool tracking_supported) {
    session_.setDelegate(this);
    setupAR(tracking_supported);
}

void PhotoScanner::setupAR(bool tracking_supported) {
    if (!tracking_supported) {
        PHOTOAR_ERROR("PhotoScanner", "Image tracking is not supported on this device (no camera)");
        return;
    }

    try {
        auto library = std::make_shared<ReferenceImageLibrary>(
            ReferenceImageLibrary::loadGroup(assets_.root(), config_.reference_group, config_.features));
        library->logSummary();
        reference_images_ = std::move(library);
    } catch (const ARError& e) {
        PHOTOAR_ERROR("PhotoScanner", "No reference images found in the group named '" +
                      config_.reference_group + "': " + e.what());
        return;
    }

    SessionConfiguration configuration = config_.session;
    configuration.detection_images = reference_images_;
    configuration.maximum_number_of_tracked_images = 1;

    session_.run(configuration, RUN_REMOVE_EXISTING_ANCHORS | RUN_RESET_TRACKING);
    if (session_.isRunning()) {
        PHOTOAR_INFO("PhotoScanner", "AR session started");
    }
}

void PhotoScanner::viewWillDisappear() {
    session_.pause();
    if (player_) {
        player_->pause();
    }
}

void PhotoScanner::update(double dt) {
    if (player_) {
        player_->update(dt);
    }
}

void PhotoScanner::didAddAnchor(ARSession& /*session*/, const std::shared_ptr<Anchor>& anchor) {
    PHOTOAR_DEBUG("PhotoScanner", "Anchor added");

    auto image_anchor = std::dynamic_pointer_cast<ImageAnchor>(anchor);
    if (!image_anchor) {
        PHOTOAR_WARN("PhotoScanner", "Anchor is not an image anchor");
        return;
    }

    const std::string image_name = image_anchor->referenceImageName().empty()
        ? "Unknown"
        : image_anchor->referenceImageName();
    PHOTOAR_INFO("PhotoScanner", "Detected image: " + image_name);

    const auto video_path = assets_.findVideo(image_name);
    if (!video_path) {
        PHOTOAR_ERROR("PhotoScanner", "No matching video found for image name: " + image_name);
        return;
    }

    std::shared_ptr<VideoSource> player;
    try {
        player = video_factory_(*video_path);
    } catch (const ARError& e) {
        PHOTOAR_ERROR("PhotoScanner", "Cannot create player for " + *video_path + ": " + e.what());
        return;
    }
    if (!player) {
        PHOTOAR_ERROR("PhotoScanner", "Cannot create player for " + *video_path);
        return;
    }

    player->setStatusCallback([this](VideoSource& source, VideoSource::Status status) {
        onPlayerStatus(source, status);
    });
    player->setEndCallback([](VideoSource& source) {
        source.seekToZero();
        source.play();
    });

    player->load();
    if (player->status() != VideoSource::Status::READY_TO_PLAY) {
        return;
    }

    VideoLayout layout;
    try {
        layout = computeVideoLayout(image_anchor->physicalSize(), player->renderSize(), config_.plane_fit);
    } catch (const MediaException& e) {
        PHOTOAR_ERROR("PhotoScanner", e.getFormattedMessage());
        return;
    }

    // Only one video plays at a time
    releaseVideo();

    auto plane_node = std::make_shared<SceneNode>("video_" + image_name);
    plane_node->setGeometry(PlaneGeometry{layout.plane_size.width, layout.plane_size.height});
    plane_node->setMaterial(VideoMaterial{player, layout.uv_rect, config_.double_sided});
    // Plane geometry is in X/Y; lay it flat on the image, top edge towards the image top
    plane_node->setEulerAngles(Vec3(-PI_2, 0.0f, 0.0f));
    plane_node->setPosition(Vec3(0.0f, config_.plane_lift, 0.0f));

    auto anchor_node = scene_.addAnchorNode(*image_anchor);
    anchor_node->addChildNode(plane_node);

    current_image_name_ = image_name;
    current_anchor_ = image_anchor->id();
    player_ = player;
    video_node_ = plane_node;

    player_->play();
    PHOTOAR_INFO("PhotoScanner", "Started playing video for image: " + image_name + " (" +
                 planeFitName(config_.plane_fit) + ", plane " +
                 std::to_string(layout.plane_size.width) + "m x " +
                 std::to_string(layout.plane_size.height) + "m)");
}

void PhotoScanner::didUpdateAnchor(ARSession& /*session*/, const std::shared_ptr<Anchor>& anchor) {
    scene_.updateAnchorNode(*anchor);
}

void PhotoScanner::didRemoveAnchor(ARSession& /*session*/, const std::shared_ptr<Anchor>& anchor) {
    PHOTOAR_INFO("PhotoScanner", "Image anchor removed");

    if (player_ && anchor->id() == current_anchor_) {
        releaseVideo();
    }
    scene_.removeAnchorNode(anchor->id());
}

void PhotoScanner::didFailWithError(ARSession& /*session*/, const ARError& error) {
    PHOTOAR_ERROR("PhotoScanner", std::string("AR session failed with error: ") + error.what());
}

void PhotoScanner::sessionWasInterrupted(ARSession& /*session*/) {
    PHOTOAR_WARN("PhotoScanner", "AR session was interrupted");
}

void PhotoScanner::sessionInterruptionEnded(ARSession& /*session*/) {
    PHOTOAR_INFO("PhotoScanner", "AR session interruption ended");
}

void PhotoScanner::releaseVideo() {
    if (player_) {
        player_->pause();
        player_->setEndCallback(nullptr);
        player_->setStatusCallback(nullptr);
    }
    if (video_node_) {
        video_node_->clearMaterial();
        video_node_->removeFromParentNode();
    }

    player_.reset();
    video_node_.reset();
    current_image_name_.clear();
    current_anchor_ = 0;
}

void PhotoScanner::onPlayerStatus(VideoSource& /*source*/, VideoSource::Status status) {
    switch (status) {
        case VideoSource::Status::READY_TO_PLAY:
            PHOTOAR_INFO("PhotoScanner", "Video ready to play");
            break;
        case VideoSource::Status::FAILED:
            PHOTOAR_ERROR("PhotoScanner", "Video failed to load");
            break;
        case VideoSource::Status::UNKNOWN:
            PHOTOAR_DEBUG("PhotoScanner", "Video status unknown");
            break;
    }
}

} // namespace photoar
