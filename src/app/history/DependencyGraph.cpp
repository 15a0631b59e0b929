/**
 * @file DependencyGraph.cpp
 * @brief Implementation of DependencyGraph.
 */
#include "DependencyGraph.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <queue>

namespace boxjoint::app::history {

Q_LOGGING_CATEGORY(logDependencyGraph, "boxjoint.app.history.dependency")

void DependencyGraph::clear() {
    nodes_.clear();
    forwardEdges_.clear();
    backwardEdges_.clear();
    creationOrder_.clear();
    bodyProducers_.clear();
}

FeatureNode DependencyGraph::makeNode(const FeatureRecord& feature) {
    FeatureNode node;
    node.featureId = feature.featureId;
    node.type = feature.type;
    for (const auto& face : feature.faces) {
        node.inputBodyIds.insert(face.bodyId);
        node.inputFaceIds.insert(face.faceId);
    }
    for (const auto& bodyId : feature.resultBodyIds) {
        node.outputBodyIds.insert(bodyId);
    }
    return node;
}

void DependencyGraph::rebuildFromFeatures(const std::vector<FeatureRecord>& features) {
    qCDebug(logDependencyGraph) << "rebuildFromFeatures:start" << "featureCount=" << features.size();
    clear();
    for (const auto& feature : features) {
        nodes_[feature.featureId] = makeNode(feature);
        creationOrder_.push_back(feature.featureId);
    }
    rebuildEdges();
    qCDebug(logDependencyGraph) << "rebuildFromFeatures:done"
                                << "nodeCount=" << nodes_.size()
                                << "forwardEdgeCount=" << forwardEdges_.size();
}

void DependencyGraph::addFeature(const FeatureRecord& feature) {
    qCDebug(logDependencyGraph) << "addFeature"
                                << "featureId=" << QString::fromStdString(feature.featureId)
                                << "faces=" << feature.faces.size();
    if (nodes_.find(feature.featureId) == nodes_.end()) {
        creationOrder_.push_back(feature.featureId);
    }
    nodes_[feature.featureId] = makeNode(feature);
    rebuildEdges();
}

void DependencyGraph::removeFeature(const std::string& featureId) {
    auto it = nodes_.find(featureId);
    if (it == nodes_.end()) {
        return;
    }

    nodes_.erase(it);
    creationOrder_.erase(
        std::remove(creationOrder_.begin(), creationOrder_.end(), featureId),
        creationOrder_.end());
    rebuildEdges();
}

const FeatureNode* DependencyGraph::getNode(const std::string& featureId) const {
    auto it = nodes_.find(featureId);
    return (it != nodes_.end()) ? &it->second : nullptr;
}

FeatureNode* DependencyGraph::getNode(const std::string& featureId) {
    auto it = nodes_.find(featureId);
    return (it != nodes_.end()) ? &it->second : nullptr;
}

std::vector<std::string> DependencyGraph::topologicalSort() const {
    // Kahn's algorithm
    std::unordered_map<std::string, int> inDegree;
    std::unordered_map<std::string, std::size_t> creationIndex;
    creationIndex.reserve(creationOrder_.size());
    for (std::size_t i = 0; i < creationOrder_.size(); ++i) {
        creationIndex[creationOrder_[i]] = i;
    }

    for (const auto& [featureId, _] : nodes_) {
        inDegree[featureId] = 0;
    }

    for (const auto& [featureId, upstreams] : backwardEdges_) {
        inDegree[featureId] = static_cast<int>(upstreams.size());
    }

    // Zero in-degree nodes leave in creation order
    auto cmp = [&](const std::string& a, const std::string& b) {
        auto ia = creationIndex.find(a);
        auto ib = creationIndex.find(b);
        const std::size_t indexA = (ia != creationIndex.end()) ? ia->second : creationOrder_.size();
        const std::size_t indexB = (ib != creationIndex.end()) ? ib->second : creationOrder_.size();
        return indexA > indexB;
    };
    std::priority_queue<std::string, std::vector<std::string>, decltype(cmp)> queue(cmp);
    for (const auto& [featureId, degree] : inDegree) {
        if (degree == 0) {
            queue.push(featureId);
        }
    }

    std::vector<std::string> result;
    result.reserve(nodes_.size());

    while (!queue.empty()) {
        std::string current = queue.top();
        queue.pop();
        result.push_back(current);

        auto fwdIt = forwardEdges_.find(current);
        if (fwdIt != forwardEdges_.end()) {
            for (const auto& downstream : fwdIt->second) {
                if (--inDegree[downstream] == 0) {
                    queue.push(downstream);
                }
            }
        }
    }

    if (result.size() != nodes_.size()) {
        return {};  // Empty indicates cycle
    }

    return result;
}

std::vector<std::string> DependencyGraph::getDownstream(const std::string& featureId) const {
    return reachableFrom(featureId, forwardEdges_);
}

std::vector<std::string> DependencyGraph::getUpstream(const std::string& featureId) const {
    return reachableFrom(featureId, backwardEdges_);
}

bool DependencyGraph::hasCycle() const {
    return !nodes_.empty() && topologicalSort().empty();
}

void DependencyGraph::setSuppressed(const std::string& featureId, bool suppressed) {
    if (FeatureNode* node = getNode(featureId)) {
        node->suppressed = suppressed;
    }
}

bool DependencyGraph::isSuppressed(const std::string& featureId) const {
    const FeatureNode* node = getNode(featureId);
    return node != nullptr && node->suppressed;
}

std::unordered_map<std::string, bool> DependencyGraph::getSuppressionState() const {
    std::unordered_map<std::string, bool> suppression;
    suppression.reserve(nodes_.size());
    for (const auto& entry : nodes_) {
        suppression.emplace(entry.first, entry.second.suppressed);
    }
    return suppression;
}

void DependencyGraph::setSuppressionState(const std::unordered_map<std::string, bool>& state) {
    for (const auto& entry : state) {
        setSuppressed(entry.first, entry.second);
    }
}

void DependencyGraph::setFailed(const std::string& featureId, bool failed, const std::string& reason) {
    FeatureNode* node = getNode(featureId);
    if (node == nullptr) {
        return;
    }
    node->failed = failed;
    node->failureReason = failed ? reason : std::string{};
    if (failed) {
        qCDebug(logDependencyGraph) << "setFailed"
                                    << "featureId=" << QString::fromStdString(featureId)
                                    << "reason=" << QString::fromStdString(reason);
    }
}

bool DependencyGraph::isFailed(const std::string& featureId) const {
    const FeatureNode* node = getNode(featureId);
    return node != nullptr && node->failed;
}

std::string DependencyGraph::getFailureReason(const std::string& featureId) const {
    const FeatureNode* node = getNode(featureId);
    return node != nullptr ? node->failureReason : std::string{};
}

std::vector<std::string> DependencyGraph::getFailedFeatures() const {
    // Creation order keeps the report stable across runs.
    std::vector<std::string> failed;
    for (const auto& featureId : creationOrder_) {
        const FeatureNode* node = getNode(featureId);
        if (node != nullptr && node->failed) {
            failed.push_back(featureId);
        }
    }
    return failed;
}

void DependencyGraph::clearFailures() {
    for (auto& entry : nodes_) {
        entry.second.failed = false;
        entry.second.failureReason.clear();
    }
}

void DependencyGraph::rebuildEdges() {
    forwardEdges_.clear();
    backwardEdges_.clear();
    bodyProducers_.clear();

    // Walk creation order so dependencies target the most recent producer.
    for (const auto& featureId : creationOrder_) {
        auto nodeIt = nodes_.find(featureId);
        if (nodeIt == nodes_.end()) {
            continue;
        }
        const FeatureNode& node = nodeIt->second;

        for (const auto& inputBodyId : node.inputBodyIds) {
            auto it = bodyProducers_.find(inputBodyId);
            if (it != bodyProducers_.end() && it->second != featureId) {
                forwardEdges_[it->second].insert(featureId);
                backwardEdges_[featureId].insert(it->second);
            }
        }

        for (const auto& bodyId : node.outputBodyIds) {
            bodyProducers_[bodyId] = featureId;
        }
    }
}

std::vector<std::string> DependencyGraph::reachableFrom(const std::string& featureId,
                                                        const EdgeMap& edges) const {
    std::unordered_set<std::string> seen;
    std::vector<std::string> pending{featureId};
    while (!pending.empty()) {
        const std::string current = pending.back();
        pending.pop_back();
        auto it = edges.find(current);
        if (it == edges.end()) {
            continue;
        }
        for (const auto& next : it->second) {
            if (next != featureId && seen.insert(next).second) {
                pending.push_back(next);
            }
        }
    }

    // Report in creation order, which is also a valid evaluation order.
    std::vector<std::string> result;
    result.reserve(seen.size());
    for (const auto& id : creationOrder_) {
        if (seen.count(id) != 0) {
            result.push_back(id);
        }
    }
    return result;
}

} // namespace boxjoint::app::history
