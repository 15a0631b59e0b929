/**
 * @file DependencyGraph.h
 * @brief Feature dependency tracking for the joint timeline.
 */
#ifndef BOXJOINT_APP_HISTORY_DEPENDENCYGRAPH_H
#define BOXJOINT_APP_HISTORY_DEPENDENCYGRAPH_H

#include "../document/FeatureRecord.h"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace boxjoint::app::history {

/**
 * @brief One node per timeline feature.
 */
struct FeatureNode {
    std::string featureId;
    FeatureType type = FeatureType::BoxJoint;
    std::unordered_set<std::string> inputBodyIds;
    std::unordered_set<std::string> inputFaceIds;
    std::unordered_set<std::string> outputBodyIds;
    bool suppressed = false;
    bool failed = false;
    std::string failureReason;
};

/**
 * @brief Directed graph of features linked through the bodies they read and rewrite.
 *
 * A feature depends on the most recent earlier feature that produced one of
 * its input bodies. Topological order breaks ties by creation order.
 */
class DependencyGraph {
public:
    void clear();
    void rebuildFromFeatures(const std::vector<FeatureRecord>& features);
    void addFeature(const FeatureRecord& feature);
    void removeFeature(const std::string& featureId);

    const FeatureNode* getNode(const std::string& featureId) const;
    FeatureNode* getNode(const std::string& featureId);
    std::size_t size() const { return nodes_.size(); }

    /**
     * @brief Features in dependency order. Empty when the graph has a cycle.
     */
    std::vector<std::string> topologicalSort() const;
    std::vector<std::string> getDownstream(const std::string& featureId) const;
    std::vector<std::string> getUpstream(const std::string& featureId) const;
    bool hasCycle() const;

    void setSuppressed(const std::string& featureId, bool suppressed);
    bool isSuppressed(const std::string& featureId) const;
    std::unordered_map<std::string, bool> getSuppressionState() const;
    void setSuppressionState(const std::unordered_map<std::string, bool>& state);

    void setFailed(const std::string& featureId, bool failed, const std::string& reason = {});
    bool isFailed(const std::string& featureId) const;
    std::string getFailureReason(const std::string& featureId) const;
    std::vector<std::string> getFailedFeatures() const;
    void clearFailures();

private:
    static FeatureNode makeNode(const FeatureRecord& feature);
    void rebuildEdges();
    using EdgeMap = std::unordered_map<std::string, std::unordered_set<std::string>>;
    std::vector<std::string> reachableFrom(const std::string& featureId, const EdgeMap& edges) const;

    std::unordered_map<std::string, FeatureNode> nodes_;
    EdgeMap forwardEdges_;   // producer -> consumers
    EdgeMap backwardEdges_;  // consumer -> producers
    std::vector<std::string> creationOrder_;
    std::unordered_map<std::string, std::string> bodyProducers_;  // bodyId -> last featureId writing it
};

} // namespace boxjoint::app::history

#endif // BOXJOINT_APP_HISTORY_DEPENDENCYGRAPH_H
