/**
 * @file BoxJointFeature.h
 * @brief Parametric box joint feature driving detection, synthesis and application.
 */
#ifndef BOXJOINT_APP_FEATURE_BOXJOINTFEATURE_H
#define BOXJOINT_APP_FEATURE_BOXJOINTFEATURE_H

#include "../document/FeatureRecord.h"
#include "../../core/joint/ContactDetector.h"
#include "../../core/joint/JointTypes.h"
#include "../../kernel/elementmap/ElementMap.h"
#include "../../kernel/geometry/GeometryKernel.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boxjoint::app {

enum class FeatureState {
    Unconfigured,
    Recomputing,
    Computed,
    Failed,
    Deleted
};

const char* featureStateName(FeatureState state);

/**
 * @brief Body geometry a recompute reads. Never modified by the feature.
 */
struct UpstreamSnapshot {
    core::joint::BodyShapes bodies;
    const kernel::elementmap::ElementMap* elementMap = nullptr;  // Null: index-based face IDs
};

struct RecomputeOutcome {
    bool accepted = false;      // False when the call was refused (reentrant or deleted)
    bool success = false;
    std::optional<core::joint::JointError> error;
    std::vector<core::joint::JointError> warnings;
    std::vector<std::size_t> appliedRegions;
};

/**
 * @brief One Box Joint timeline entry.
 *
 * Owns its selections and parameters. Every recompute runs
 * detection -> synthesis -> application from the given upstream bodies and
 * either commits all outputs at once (Computed) or keeps the previous
 * committed outputs and records the error (Failed). Recompute is not
 * reentrant: a call made while one is running is refused without any state
 * change. release() is terminal.
 */
class BoxJointFeature {
public:
    BoxJointFeature(std::string featureId, std::shared_ptr<const kernel::GeometryKernel> kernel);

    BoxJointFeature(const BoxJointFeature&) = delete;
    BoxJointFeature& operator=(const BoxJointFeature&) = delete;

    const std::string& id() const { return featureId_; }

    bool configure(std::vector<FaceRef> faces, const core::joint::JointParameters& params);
    bool setSelections(std::vector<FaceRef> faces);
    bool setParameters(const core::joint::JointParameters& params);
    void setRegionThreads(int threads) { regionThreads_ = threads; }

    /**
     * @brief Flags that upstream bodies changed since the last recompute.
     */
    void markUpstreamChanged();
    bool needsRecompute() const { return dirty_; }

    RecomputeOutcome recompute(const UpstreamSnapshot& upstream);

    /**
     * @brief Deletes or suppresses the feature. Drops all cached results.
     */
    void release();

    FeatureState state() const { return state_; }
    bool isConfigured() const { return configured_; }
    const std::optional<core::joint::JointError>& lastError() const { return lastError_; }
    const std::vector<core::joint::JointError>& warnings() const { return warnings_; }
    const std::vector<core::joint::ContactRegion>& regions() const { return regions_; }
    const std::vector<core::joint::FingerPattern>& patterns() const { return patterns_; }

    /**
     * @brief Last committed body shapes, keyed by body ID. Empty before the first success.
     */
    const core::joint::BodyShapes& outputs() const { return outputs_; }

    const std::vector<FaceRef>& selections() const { return selections_; }
    const core::joint::JointParameters& parameters() const { return params_; }

    /**
     * @brief Bodies owning at least one selected face, sorted.
     */
    std::vector<std::string> targetBodyIds() const;

private:
    struct PipelineResult {
        bool success = false;
        std::optional<core::joint::JointError> error;
        std::vector<core::joint::JointError> warnings;
        std::vector<core::joint::ContactRegion> regions;
        std::vector<core::joint::FingerPattern> patterns;
        core::joint::BodyShapes outputs;
        std::vector<std::size_t> appliedRegions;
    };

    PipelineResult runPipeline(const UpstreamSnapshot& upstream) const;
    bool canEdit() const;

    std::string featureId_;
    std::shared_ptr<const kernel::GeometryKernel> kernel_;
    std::vector<FaceRef> selections_;
    core::joint::JointParameters params_;
    int regionThreads_ = 0;
    bool configured_ = false;
    bool dirty_ = true;

    FeatureState state_ = FeatureState::Unconfigured;
    std::optional<core::joint::JointError> lastError_;
    std::vector<core::joint::JointError> warnings_;
    std::vector<core::joint::ContactRegion> regions_;
    std::vector<core::joint::FingerPattern> patterns_;
    core::joint::BodyShapes outputs_;

    std::atomic_bool recomputing_{false};
};

} // namespace boxjoint::app

#endif // BOXJOINT_APP_FEATURE_BOXJOINTFEATURE_H
