#include "ar_scene.h"
#include "ar_error.h"
#include <algorithm>

namespace photoar {

SceneNode::SceneNode(std::string name) : name_(std::move(name)) {}

SceneNode::~SceneNode() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
}

void SceneNode::setPosition(const Vec3& position) {
    position_ = position;
    explicit_transform_.reset();
}

void SceneNode::setEulerAngles(const Vec3& euler) {
    euler_ = euler;
    explicit_transform_.reset();
}

void SceneNode::setScale(const Vec3& scale) {
    scale_ = scale;
    explicit_transform_.reset();
}

void SceneNode::setTransform(const Mat4& transform) {
    explicit_transform_ = transform;
    position_ = transform.getTranslation();
    scale_ = transform.getScale();
}

Mat4 SceneNode::localTransform() const {
    if (explicit_transform_) {
        return *explicit_transform_;
    }
    return Mat4::translation(position_) * Mat4::rotationEuler(euler_) * Mat4::scale(scale_);
}

Mat4 SceneNode::worldTransform() const {
    Mat4 world = localTransform();
    for (const SceneNode* node = parent_; node; node = node->parent_) {
        world = node->localTransform() * world;
    }
    return world;
}

void SceneNode::addChildNode(std::shared_ptr<SceneNode> child) {
    if (!child) {
        throw ARError(ARError::Category::GENERAL, ARError::Severity::ERROR,
                      "Cannot add a null child node", "SceneNode::addChildNode");
    }
    for (const SceneNode* node = this; node; node = node->parent_) {
        if (node == child.get()) {
            throw ARError(ARError::Category::GENERAL, ARError::Severity::ERROR,
                          "Adding " + child->name() + " would create a cycle", "SceneNode::addChildNode");
        }
    }

    child->removeFromParentNode();
    child->parent_ = this;
    children_.push_back(std::move(child));
}

void SceneNode::removeFromParentNode() {
    if (!parent_) {
        return;
    }

    auto& siblings = parent_->children_;
    // Keep ourselves alive until the erase is done
    auto self = shared_from_this();
    siblings.erase(std::remove(siblings.begin(), siblings.end(), self), siblings.end());
    parent_ = nullptr;
}

std::shared_ptr<SceneNode> SceneNode::childNode(const std::string& name, bool recursive) const {
    for (const auto& child : children_) {
        if (child->name() == name) {
            return child;
        }
    }
    if (recursive) {
        for (const auto& child : children_) {
            if (auto found = child->childNode(name, true)) {
                return found;
            }
        }
    }
    return nullptr;
}

void SceneNode::enumerateHierarchy(const std::function<void(const SceneNode&, const Mat4&)>& visitor) const {
    const Mat4 parent_world = parent_ ? parent_->worldTransform() : Mat4::identity();
    enumerate(visitor, parent_world);
}

void SceneNode::enumerate(const std::function<void(const SceneNode&, const Mat4&)>& visitor,
                          const Mat4& parent_world) const {
    if (hidden_) {
        return;
    }

    const Mat4 world = parent_world * localTransform();
    visitor(*this, world);
    for (const auto& child : children_) {
        child->enumerate(visitor, world);
    }
}

Scene::Scene() : root_(std::make_shared<SceneNode>("root")) {}

std::shared_ptr<SceneNode> Scene::addAnchorNode(const Anchor& anchor) {
    auto it = anchor_nodes_.find(anchor.id());
    if (it != anchor_nodes_.end()) {
        it->second->setTransform(anchor.transform());
        return it->second;
    }

    auto node = std::make_shared<SceneNode>("anchor_" + std::to_string(anchor.id()));
    node->setTransform(anchor.transform());
    root_->addChildNode(node);
    anchor_nodes_.emplace(anchor.id(), node);
    return node;
}

void Scene::updateAnchorNode(const Anchor& anchor) {
    auto it = anchor_nodes_.find(anchor.id());
    if (it == anchor_nodes_.end()) {
        PHOTOAR_DEBUG("Scene", "No node for anchor " + std::to_string(anchor.id()));
        return;
    }
    it->second->setTransform(anchor.transform());
}

void Scene::removeAnchorNode(AnchorId id) {
    auto it = anchor_nodes_.find(id);
    if (it == anchor_nodes_.end()) {
        return;
    }
    it->second->removeFromParentNode();
    anchor_nodes_.erase(it);
}

std::shared_ptr<SceneNode> Scene::nodeForAnchor(AnchorId id) const {
    auto it = anchor_nodes_.find(id);
    return it != anchor_nodes_.end() ? it->second : nullptr;
}

void Scene::clear() {
    for (auto& entry : anchor_nodes_) {
        entry.second->removeFromParentNode();
    }
    anchor_nodes_.clear();

    while (!root_->childNodes().empty()) {
        root_->childNodes().back()->removeFromParentNode();
    }
}

} // namespace photoar
