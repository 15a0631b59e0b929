/**
 * @file BoxJointFeature.cpp
 */
#include "BoxJointFeature.h"

#include "../../core/joint/FingerPatternSynthesizer.h"
#include "../../core/joint/JointApplier.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <set>

namespace boxjoint::app {

Q_LOGGING_CATEGORY(logBoxJointFeature, "boxjoint.app.feature")

using core::joint::JointError;
using core::joint::JointErrorKind;

namespace {

class RecomputeGuard {
public:
    explicit RecomputeGuard(std::atomic_bool& flag) : flag_(flag) {}
    ~RecomputeGuard() { flag_.store(false); }

    RecomputeGuard(const RecomputeGuard&) = delete;
    RecomputeGuard& operator=(const RecomputeGuard&) = delete;

private:
    std::atomic_bool& flag_;
};

QString toQString(const std::string& value) {
    return QString::fromStdString(value);
}

} // namespace

const char* featureStateName(FeatureState state) {
    switch (state) {
        case FeatureState::Unconfigured: return "Unconfigured";
        case FeatureState::Recomputing: return "Recomputing";
        case FeatureState::Computed: return "Computed";
        case FeatureState::Failed: return "Failed";
        case FeatureState::Deleted: return "Deleted";
        default: return "Unknown";
    }
}

BoxJointFeature::BoxJointFeature(std::string featureId, std::shared_ptr<const kernel::GeometryKernel> kernel)
    : featureId_(std::move(featureId)),
      kernel_(std::move(kernel)) {}

bool BoxJointFeature::canEdit() const {
    if (state_ == FeatureState::Deleted) {
        qCWarning(logBoxJointFeature) << "edit:rejected-deleted" << "featureId=" << toQString(featureId_);
        return false;
    }
    if (recomputing_.load()) {
        qCWarning(logBoxJointFeature) << "edit:rejected-recomputing" << "featureId=" << toQString(featureId_);
        return false;
    }
    return true;
}

bool BoxJointFeature::configure(std::vector<FaceRef> faces, const core::joint::JointParameters& params) {
    if (!canEdit()) {
        return false;
    }
    selections_ = std::move(faces);
    params_ = params;
    configured_ = true;
    dirty_ = true;
    qCDebug(logBoxJointFeature) << "configure"
                                << "featureId=" << toQString(featureId_)
                                << "faces=" << selections_.size();
    return true;
}

bool BoxJointFeature::setSelections(std::vector<FaceRef> faces) {
    if (!canEdit()) {
        return false;
    }
    selections_ = std::move(faces);
    configured_ = true;
    dirty_ = true;
    return true;
}

bool BoxJointFeature::setParameters(const core::joint::JointParameters& params) {
    if (!canEdit()) {
        return false;
    }
    if (params_ == params && !dirty_) {
        return true;
    }
    params_ = params;
    dirty_ = true;
    return true;
}

void BoxJointFeature::markUpstreamChanged() {
    if (state_ != FeatureState::Deleted) {
        dirty_ = true;
    }
}

std::vector<std::string> BoxJointFeature::targetBodyIds() const {
    std::set<std::string> ids;
    for (const auto& face : selections_) {
        ids.insert(face.bodyId);
    }
    return {ids.begin(), ids.end()};
}

RecomputeOutcome BoxJointFeature::recompute(const UpstreamSnapshot& upstream) {
    RecomputeOutcome outcome;

    if (state_ == FeatureState::Deleted) {
        qCWarning(logBoxJointFeature) << "recompute:rejected-deleted" << "featureId=" << toQString(featureId_);
        return outcome;
    }

    bool expected = false;
    if (!recomputing_.compare_exchange_strong(expected, true)) {
        qCWarning(logBoxJointFeature) << "recompute:rejected-reentrant" << "featureId=" << toQString(featureId_);
        return outcome;
    }
    RecomputeGuard guard(recomputing_);
    outcome.accepted = true;

    if (!configured_) {
        outcome.error = JointError{JointErrorKind::InvalidSelection, "Feature has no selection", std::nullopt};
        return outcome;
    }

    const FeatureState previous = state_;
    state_ = FeatureState::Recomputing;
    qCInfo(logBoxJointFeature) << "recompute:start"
                               << "featureId=" << toQString(featureId_)
                               << "from=" << featureStateName(previous)
                               << "faces=" << selections_.size();

    PipelineResult result = runPipeline(upstream);
    dirty_ = false;

    outcome.success = result.success;
    outcome.error = result.error;
    outcome.warnings = result.warnings;
    outcome.appliedRegions = result.appliedRegions;

    if (!result.success) {
        // Committed outputs stay as they were.
        state_ = FeatureState::Failed;
        lastError_ = result.error;
        warnings_ = std::move(result.warnings);
        qCWarning(logBoxJointFeature) << "recompute:failed"
                                      << "featureId=" << toQString(featureId_)
                                      << "error=" << toQString(result.error ? core::joint::describe(*result.error)
                                                                            : std::string("unknown"));
        return outcome;
    }

    regions_ = std::move(result.regions);
    patterns_ = std::move(result.patterns);
    outputs_ = std::move(result.outputs);
    warnings_ = std::move(result.warnings);
    lastError_.reset();
    state_ = FeatureState::Computed;

    qCInfo(logBoxJointFeature) << "recompute:done"
                               << "featureId=" << toQString(featureId_)
                               << "regions=" << regions_.size()
                               << "applied=" << outcome.appliedRegions.size()
                               << "warnings=" << warnings_.size();
    return outcome;
}

BoxJointFeature::PipelineResult BoxJointFeature::runPipeline(const UpstreamSnapshot& upstream) const {
    PipelineResult result;
    auto fail = [&result](JointErrorKind kind, const std::string& message) {
        result.success = false;
        result.error = JointError{kind, message, std::nullopt};
        return result;
    };

    if (!kernel_) {
        return fail(JointErrorKind::BooleanFailure, "No geometry kernel available");
    }

    const core::joint::FingerPatternSynthesizer synthesizer{};
    if (auto conflict = synthesizer.validate(params_)) {
        result.error = conflict;
        return result;
    }

    // Resolve selections against the current upstream bodies.
    kernel::elementmap::ElementMap indexMap;
    const kernel::elementmap::ElementMap* elementMap = upstream.elementMap;
    const std::vector<std::string> targets = targetBodyIds();
    if (!elementMap) {
        for (const auto& bodyId : targets) {
            auto it = upstream.bodies.find(bodyId);
            if (it != upstream.bodies.end()) {
                indexMap.registerBody(bodyId, it->second);
            }
        }
        elementMap = &indexMap;
    }

    core::joint::BodyShapes working;
    for (const auto& bodyId : targets) {
        auto it = upstream.bodies.find(bodyId);
        if (it == upstream.bodies.end() || it->second.IsNull()) {
            return fail(JointErrorKind::InvalidSelection, "Body " + bodyId + " is no longer available");
        }
        working[bodyId] = it->second;
    }

    std::vector<core::joint::SelectedFace> selected;
    selected.reserve(selections_.size());
    for (const auto& ref : selections_) {
        const auto face = elementMap->resolveFace(kernel::elementmap::ElementId{ref.faceId}, working.at(ref.bodyId));
        if (!face) {
            return fail(JointErrorKind::InvalidSelection,
                        "Face " + ref.faceId + " no longer resolves on body " + ref.bodyId);
        }
        selected.push_back(core::joint::SelectedFace{ref.bodyId, ref.faceId, *face});
    }

    const core::joint::ContactDetector detector(*kernel_);
    core::joint::DetectionResult detection = detector.detect(selected, working, params_);
    result.warnings = detection.diagnostics;
    result.regions = std::move(detection.regions);

    for (std::size_t i = 0; i < result.regions.size(); ++i) {
        core::joint::SynthesisResult synthesis = synthesizer.synthesize(result.regions[i], params_, i);
        if (synthesis.error) {
            if (synthesis.error->kind == JointErrorKind::ParameterConflict) {
                result.error = synthesis.error;
                return result;
            }
            result.warnings.push_back(*synthesis.error);
            continue;
        }
        result.patterns.push_back(std::move(*synthesis.pattern));
    }

    std::vector<core::joint::RegionJob> jobs;
    jobs.reserve(result.patterns.size());
    for (const auto& pattern : result.patterns) {
        jobs.push_back(core::joint::RegionJob{&result.regions[pattern.regionIndex], &pattern});
    }

    const core::joint::JointApplier applier(*kernel_);
    core::joint::ApplyResult applied = applier.applyAll(jobs, working, regionThreads_);
    result.warnings.insert(result.warnings.end(), applied.failures.begin(), applied.failures.end());
    result.appliedRegions = std::move(applied.appliedRegions);

    if (result.appliedRegions.empty()) {
        result.error = core::joint::mostSpecificError(result.warnings,
                                                      "No contact found between the selected faces");
        return result;
    }

    result.outputs = std::move(working);
    result.success = true;
    return result;
}

void BoxJointFeature::release() {
    if (state_ == FeatureState::Deleted) {
        return;
    }
    if (recomputing_.load()) {
        qCWarning(logBoxJointFeature) << "release:rejected-recomputing" << "featureId=" << toQString(featureId_);
        return;
    }
    state_ = FeatureState::Deleted;
    regions_.clear();
    patterns_.clear();
    outputs_.clear();
    warnings_.clear();
    lastError_.reset();
    dirty_ = false;
    qCInfo(logBoxJointFeature) << "release" << "featureId=" << toQString(featureId_);
}

} // namespace boxjoint::app
