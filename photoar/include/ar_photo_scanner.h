#ifndef AR_PHOTO_SCANNER_H_
#define AR_PHOTO_SCANNER_H_

#include "ar_core.h"
#include "ar_scene.h"
#include "ar_session.h"
#include "ar_video_orientation.h"
#include "ar_video_player.h"
#include <functional>
#include <memory>
#include <string>

namespace photoar {

/**
 * @brief Plays the matching video on top of a detected photo
 *
 * One photo is tracked at a time. When the session adds an image anchor the
 * scanner looks up `<asset_root>/<image name>.<ext>`, loops it on a plane
 * lying on the print and tears the plane down when the anchor goes away.
 */
class PhotoScanner : public SessionDelegate {
public:
    struct Config {
        std::string reference_group = "AR Resources";
        PlaneFit plane_fit = PlaneFit::ASPECT_FILL;
        float plane_lift = 0.001f; // meters along the image normal
        bool double_sided = true;  // false culls the plane when seen from under the print
        SessionConfiguration session;
        FeatureConfig features;
    };

    using VideoFactory = std::function<std::shared_ptr<VideoSource>(const std::string& path)>;

    PhotoScanner(AssetBundle assets, ARSession& session, Scene& scene);
    PhotoScanner(const Config& config, AssetBundle assets, ARSession& session, Scene& scene,
                 VideoFactory video_factory = nullptr);
    ~PhotoScanner() override;

    PhotoScanner(const PhotoScanner&) = delete;
    PhotoScanner& operator=(const PhotoScanner&) = delete;

    /**
     * @brief Register as session delegate and start tracking
     * @param tracking_supported false when no camera is available
     */
    void viewDidLoad(bool tracking_supported = true);

    /**
     * @brief Pause the session and the active video
     */
    void viewWillDisappear();

    /**
     * @brief Advance the active video
     */
    void update(double dt);

    // SessionDelegate
    void didAddAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) override;
    void didUpdateAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) override;
    void didRemoveAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) override;
    void didFailWithError(ARSession& session, const ARError& error) override;
    void sessionWasInterrupted(ARSession& session) override;
    void sessionInterruptionEnded(ARSession& session) override;

    const std::string& currentImageName() const { return current_image_name_; }
    const std::shared_ptr<VideoSource>& activePlayer() const { return player_; }
    const std::shared_ptr<SceneNode>& videoNode() const { return video_node_; }
    std::shared_ptr<const ReferenceImageLibrary> referenceImages() const { return reference_images_; }
    const Config& getConfig() const { return config_; }

private:
    void setupAR(bool tracking_supported);
    void releaseVideo();
    void onPlayerStatus(VideoSource& source, VideoSource::Status status);

    Config config_;
    AssetBundle assets_;
    ARSession& session_;
    Scene& scene_;
    VideoFactory video_factory_;

    std::shared_ptr<const ReferenceImageLibrary> reference_images_;

    std::string current_image_name_;
    AnchorId current_anchor_ = 0;
    std::shared_ptr<VideoSource> player_;
    std::shared_ptr<SceneNode> video_node_;
};

} // namespace photoar

#endif // AR_PHOTO_SCANNER_H_
