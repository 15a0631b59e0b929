/**
 * @file RegenerationEngine.h
 * @brief Engine for regenerating bodies from the joint feature timeline.
 *
 * Replays features in dependency order from the upstream body shapes.
 * Supports full and partial regeneration, parameter preview, and per-feature
 * failure reporting.
 */
#ifndef BOXJOINT_APP_HISTORY_REGENERATIONENGINE_H
#define BOXJOINT_APP_HISTORY_REGENERATIONENGINE_H

#include "DependencyGraph.h"
#include "../document/FeatureRecord.h"
#include "../feature/BoxJointFeature.h"
#include "../../kernel/geometry/GeometryKernel.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace boxjoint::app {
class Document;
}

namespace boxjoint::app::history {

// ─────────────────────────────────────────────────────────────────────────────
// Result Types
// ─────────────────────────────────────────────────────────────────────────────

enum class RegenStatus {
    Success,         // All features succeeded
    PartialFailure,  // Some features failed, others succeeded
    CriticalFailure  // Nothing could be regenerated
};

struct FailedFeature {
    std::string featureId;
    FeatureType type = FeatureType::BoxJoint;
    std::optional<core::joint::JointError> error;
    std::string errorMessage;
    std::vector<std::string> affectedDownstream;
};

struct RegenResult {
    RegenStatus status = RegenStatus::Success;
    std::vector<std::string> succeededFeatures;
    std::vector<FailedFeature> failedFeatures;
    std::vector<std::string> skippedFeatures;  // Suppressed
};

// ─────────────────────────────────────────────────────────────────────────────
// Regeneration Engine
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Engine for regenerating bodies from the feature timeline.
 *
 * Usage:
 *   RegenerationEngine engine(&document, kernel);
 *   auto result = engine.regenerateAll();
 *   if (result.status == RegenStatus::PartialFailure) {
 *       // Inspect failedFeatures
 *   }
 *
 * The engine owns one BoxJointFeature per timeline record. A failed feature
 * keeps contributing its last committed outputs, so later features keep
 * working from the last good geometry. Suppressed and removed features are
 * released and their cuts disappear from the current bodies.
 */
class RegenerationEngine {
public:
    RegenerationEngine(Document* doc, std::shared_ptr<const kernel::GeometryKernel> kernel);
    ~RegenerationEngine();

    RegenerationEngine(const RegenerationEngine&) = delete;
    RegenerationEngine& operator=(const RegenerationEngine&) = delete;

    /**
     * @brief Regenerate every feature from the upstream bodies.
     */
    RegenResult regenerateAll();

    /**
     * @brief Regenerate a feature and everything downstream of it.
     *
     * Features before it contribute their committed outputs without being
     * recomputed.
     */
    RegenResult regenerateFrom(const std::string& featureId);

    /**
     * @brief Preview regeneration with modified joint parameters.
     *
     * Use commitPreview() to keep the parameters, or discardPreview() to
     * restore the original ones and their geometry.
     */
    RegenResult previewFrom(const std::string& featureId, const core::joint::JointParameters& newParams);
    void commitPreview();
    void discardPreview();
    bool isPreviewActive() const { return previewActive_; }

    /**
     * @brief Release a feature instance. The next regeneration reverts its cuts.
     */
    void releaseFeature(const std::string& featureId);

    const BoxJointFeature* feature(const std::string& featureId) const;

    /**
     * @brief Worker threads per recompute for independent contact regions (0 = global pool).
     */
    void setRegionThreads(int threads) { regionThreads_ = threads; }

    using ProgressCallback = std::function<void(int current, int total, const std::string& featureId)>;
    void setProgressCallback(ProgressCallback cb) { progressCallback_ = std::move(cb); }

    DependencyGraph& graph() { return graph_; }
    const DependencyGraph& graph() const { return graph_; }

private:
    void syncGraph();
    void releaseStaleFeatures();
    BoxJointFeature& featureFor(const FeatureRecord& record);
    core::joint::BodyShapes upstreamBodies() const;

    /**
     * @brief Replay the timeline, recomputing the features in `recomputeSet`
     * (all when null) and reusing committed outputs for the rest.
     */
    RegenResult replay(const std::unordered_set<std::string>* recomputeSet);
    void publishBodies(const core::joint::BodyShapes& bodies);

    Document* doc_;
    std::shared_ptr<const kernel::GeometryKernel> kernel_;
    DependencyGraph graph_;
    ProgressCallback progressCallback_;
    std::map<std::string, std::unique_ptr<BoxJointFeature>> features_;
    int regionThreads_ = 0;

    // Preview state
    bool previewActive_ = false;
    std::string previewFeatureId_;
    core::joint::JointParameters previewOriginalParams_;
};

} // namespace boxjoint::app::history

#endif // BOXJOINT_APP_HISTORY_REGENERATIONENGINE_H
