#ifndef AR_SCENE_H_
#define AR_SCENE_H_

#include "ar_core.h"
#include "ar_la.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace photoar {

class VideoSource;

/**
 * @brief Rectangle in the node's X/Y plane, centered on the origin
 */
struct PlaneGeometry {
    float width = 1.0f;
    float height = 1.0f;
};

/**
 * @brief Video surface shown on a plane
 */
struct VideoMaterial {
    std::shared_ptr<VideoSource> source;
    Rect2 uv_rect = Rect2::unit(); // region of the upright frame mapped onto the plane
    bool double_sided = true;
};

/**
 * @brief Node of the scene graph
 *
 * Children are owned by their parent; the parent link is a plain back pointer.
 */
class SceneNode : public std::enable_shared_from_this<SceneNode> {
public:
    explicit SceneNode(std::string name = "");
    ~SceneNode();

    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;

    const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    // Local transform = T * Rx * Ry * Rz * S unless an explicit transform is set
    void setPosition(const Vec3& position);
    void setEulerAngles(const Vec3& euler);
    void setScale(const Vec3& scale);
    const Vec3& position() const { return position_; }
    const Vec3& eulerAngles() const { return euler_; }
    const Vec3& scale() const { return scale_; }

    /**
     * @brief Override position, rotation and scale with a full matrix
     */
    void setTransform(const Mat4& transform);
    bool hasExplicitTransform() const { return explicit_transform_.has_value(); }

    Mat4 localTransform() const;
    Mat4 worldTransform() const;

    void addChildNode(std::shared_ptr<SceneNode> child);
    void removeFromParentNode();

    SceneNode* parent() const { return parent_; }
    const std::vector<std::shared_ptr<SceneNode>>& childNodes() const { return children_; }
    std::shared_ptr<SceneNode> childNode(const std::string& name, bool recursive = false) const;

    void setGeometry(const PlaneGeometry& geometry) { geometry_ = geometry; }
    const std::optional<PlaneGeometry>& geometry() const { return geometry_; }

    void setMaterial(VideoMaterial material) { material_ = std::move(material); }
    void clearMaterial() { material_.reset(); }
    const std::optional<VideoMaterial>& material() const { return material_; }

    void setHidden(bool hidden) { hidden_ = hidden; }
    bool isHidden() const { return hidden_; }

    /**
     * @brief Visit this node and every visible descendant, parents first
     */
    void enumerateHierarchy(const std::function<void(const SceneNode&, const Mat4& world)>& visitor) const;

private:
    void enumerate(const std::function<void(const SceneNode&, const Mat4&)>& visitor, const Mat4& parent_world) const;

    std::string name_;
    Vec3 position_ = Vec3::zero();
    Vec3 euler_ = Vec3::zero();
    Vec3 scale_ = Vec3::one();
    std::optional<Mat4> explicit_transform_;

    SceneNode* parent_ = nullptr;
    std::vector<std::shared_ptr<SceneNode>> children_;

    std::optional<PlaneGeometry> geometry_;
    std::optional<VideoMaterial> material_;
    bool hidden_ = false;
};

/**
 * @brief Root node plus one node per tracked anchor
 */
class Scene {
public:
    Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    const std::shared_ptr<SceneNode>& rootNode() const { return root_; }

    /**
     * @brief Node following the anchor, created on first use
     */
    std::shared_ptr<SceneNode> addAnchorNode(const Anchor& anchor);
    void updateAnchorNode(const Anchor& anchor);
    void removeAnchorNode(AnchorId id);
    std::shared_ptr<SceneNode> nodeForAnchor(AnchorId id) const;

    size_t anchorNodeCount() const { return anchor_nodes_.size(); }

    void clear();

private:
    std::shared_ptr<SceneNode> root_;
    std::unordered_map<AnchorId, std::shared_ptr<SceneNode>> anchor_nodes_;
};

} // namespace photoar

#endif // AR_SCENE_H_
