/**
 * @file RegenerationEngine.cpp
 * @brief Implementation of RegenerationEngine.
 */
#include "RegenerationEngine.h"

#include "../document/Document.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>

namespace boxjoint::app::history {

Q_LOGGING_CATEGORY(logRegen, "boxjoint.app.history.regeneration")

namespace {

RegenStatus overallStatus(const RegenResult& result) {
    if (result.failedFeatures.empty()) {
        return RegenStatus::Success;
    }
    if (!result.succeededFeatures.empty()) {
        return RegenStatus::PartialFailure;
    }
    return RegenStatus::CriticalFailure;
}

} // namespace

RegenerationEngine::RegenerationEngine(Document* doc, std::shared_ptr<const kernel::GeometryKernel> kernel)
    : doc_(doc), kernel_(std::move(kernel)), graph_() {
    qCDebug(logRegen) << "RegenerationEngine:ctor" << "hasDocument=" << (doc_ != nullptr);
    if (doc_) {
        syncGraph();
    }
}

RegenerationEngine::~RegenerationEngine() = default;

void RegenerationEngine::syncGraph() {
    graph_.rebuildFromFeatures(doc_->features());
    for (const auto& record : doc_->features()) {
        if (doc_->isFeatureSuppressed(record.featureId)) {
            graph_.setSuppressed(record.featureId, true);
        }
        if (doc_->isFeatureFailed(record.featureId)) {
            graph_.setFailed(record.featureId, true, doc_->featureFailureReason(record.featureId));
        }
    }
}

void RegenerationEngine::releaseStaleFeatures() {
    for (auto it = features_.begin(); it != features_.end();) {
        if (!doc_->findFeature(it->first)) {
            qCDebug(logRegen) << "releaseStaleFeatures" << "featureId=" << QString::fromStdString(it->first);
            it->second->release();
            it = features_.erase(it);
        } else {
            ++it;
        }
    }
}

BoxJointFeature& RegenerationEngine::featureFor(const FeatureRecord& record) {
    auto it = features_.find(record.featureId);
    if (it == features_.end() || it->second->state() == FeatureState::Deleted) {
        auto feature = std::make_unique<BoxJointFeature>(record.featureId, kernel_);
        feature->configure(record.faces, record.params);
        it = features_.insert_or_assign(record.featureId, std::move(feature)).first;
        return *it->second;
    }

    BoxJointFeature& feature = *it->second;
    if (feature.selections() != record.faces) {
        feature.setSelections(record.faces);
    }
    if (!(feature.parameters() == record.params)) {
        feature.setParameters(record.params);
    }
    return feature;
}

core::joint::BodyShapes RegenerationEngine::upstreamBodies() const {
    core::joint::BodyShapes bodies;
    for (const auto& bodyId : doc_->getBodyIds()) {
        const TopoDS_Shape* shape = doc_->getUpstreamShape(bodyId);
        if (shape && !shape->IsNull()) {
            bodies[bodyId] = *shape;
        }
    }
    return bodies;
}

RegenResult RegenerationEngine::regenerateAll() {
    qCInfo(logRegen) << "regenerateAll:start";
    if (!doc_) {
        qCCritical(logRegen) << "regenerateAll:no-document";
        RegenResult result;
        result.status = RegenStatus::CriticalFailure;
        return result;
    }
    return replay(nullptr);
}

RegenResult RegenerationEngine::regenerateFrom(const std::string& featureId) {
    if (!doc_) {
        RegenResult result;
        result.status = RegenStatus::CriticalFailure;
        return result;
    }
    if (!doc_->findFeature(featureId)) {
        qCWarning(logRegen) << "regenerateFrom:unknown-feature" << QString::fromStdString(featureId);
        RegenResult result;
        result.status = RegenStatus::CriticalFailure;
        return result;
    }

    syncGraph();
    std::unordered_set<std::string> affected{featureId};
    for (const auto& downstream : graph_.getDownstream(featureId)) {
        affected.insert(downstream);
    }
    qCInfo(logRegen) << "regenerateFrom:start"
                     << "featureId=" << QString::fromStdString(featureId)
                     << "affected=" << affected.size();
    return replay(&affected);
}

RegenResult RegenerationEngine::replay(const std::unordered_set<std::string>* recomputeSet) {
    RegenResult result;

    syncGraph();
    releaseStaleFeatures();

    std::vector<std::string> order = graph_.topologicalSort();
    if (order.empty() && graph_.size() > 0) {
        qCCritical(logRegen) << "replay:dependency-cycle-detected" << "graphSize=" << graph_.size();
        result.status = RegenStatus::CriticalFailure;
        return result;
    }

    core::joint::BodyShapes working = upstreamBodies();
    const int total = recomputeSet ? static_cast<int>(recomputeSet->size()) : static_cast<int>(order.size());
    int current = 0;

    for (const auto& featureId : order) {
        const FeatureRecord* record = doc_->findFeature(featureId);
        if (!record) {
            qCWarning(logRegen) << "replay:missing-feature-record" << QString::fromStdString(featureId);
            continue;
        }

        const bool requested = !recomputeSet || recomputeSet->count(featureId) > 0;
        if (requested) {
            ++current;
            if (progressCallback_) {
                progressCallback_(current, total, featureId);
            }
        }

        if (graph_.isSuppressed(featureId)) {
            qCDebug(logRegen) << "replay:skip-suppressed" << QString::fromStdString(featureId);
            releaseFeature(featureId);
            doc_->clearFeatureFailed(featureId);
            graph_.setFailed(featureId, false);
            if (requested) {
                result.skippedFeatures.push_back(featureId);
            }
            continue;
        }

        BoxJointFeature& feature = featureFor(*record);
        if (requested || feature.needsRecompute()) {
            feature.setRegionThreads(regionThreads_);
            const RecomputeOutcome outcome = feature.recompute(UpstreamSnapshot{working, &doc_->elementMap()});

            if (outcome.success) {
                qCDebug(logRegen) << "replay:feature-succeeded"
                                  << "featureId=" << QString::fromStdString(featureId)
                                  << "regions=" << outcome.appliedRegions.size();
                graph_.setFailed(featureId, false);
                doc_->clearFeatureFailed(featureId);
                result.succeededFeatures.push_back(featureId);
            } else {
                const std::string message = outcome.error ? core::joint::describe(*outcome.error)
                                                          : std::string("Recompute was refused");
                qCWarning(logRegen) << "replay:feature-failed"
                                    << "featureId=" << QString::fromStdString(featureId)
                                    << "error=" << QString::fromStdString(message);
                graph_.setFailed(featureId, true, message);
                doc_->setFeatureFailed(featureId, message);
                FailedFeature failed;
                failed.featureId = featureId;
                failed.type = record->type;
                failed.error = outcome.error;
                failed.errorMessage = message;
                failed.affectedDownstream = graph_.getDownstream(featureId);
                result.failedFeatures.push_back(std::move(failed));
            }
        }

        // Committed outputs only; a failed feature contributes its last good shapes.
        for (const auto& [bodyId, shape] : feature.outputs()) {
            working[bodyId] = shape;
        }
    }

    publishBodies(working);
    result.status = overallStatus(result);

    qCInfo(logRegen) << "replay:done"
                     << "status=" << static_cast<int>(result.status)
                     << "succeeded=" << result.succeededFeatures.size()
                     << "failed=" << result.failedFeatures.size()
                     << "skipped=" << result.skippedFeatures.size();
    return result;
}

void RegenerationEngine::publishBodies(const core::joint::BodyShapes& bodies) {
    for (const auto& bodyId : doc_->getBodyIds()) {
        auto it = bodies.find(bodyId);
        const TopoDS_Shape* currentShape = doc_->getBodyShape(bodyId);
        if (it == bodies.end() || !currentShape) {
            continue;
        }
        if (!currentShape->IsSame(it->second)) {
            doc_->updateBodyShape(bodyId, it->second);
        }
    }
}

RegenResult RegenerationEngine::previewFrom(const std::string& featureId,
                                            const core::joint::JointParameters& newParams) {
    FeatureRecord* record = doc_ ? doc_->findFeature(featureId) : nullptr;
    if (!record) {
        RegenResult result;
        result.status = RegenStatus::CriticalFailure;
        return result;
    }

    if (previewActive_ && previewFeatureId_ != featureId) {
        discardPreview();
        record = doc_->findFeature(featureId);
    }
    if (!previewActive_) {
        previewOriginalParams_ = record->params;
        previewFeatureId_ = featureId;
        previewActive_ = true;
    }

    record->params = newParams;
    return regenerateFrom(featureId);
}

void RegenerationEngine::commitPreview() {
    if (!previewActive_) {
        return;
    }

    if (doc_) {
        doc_->setModified(true);
    }
    previewActive_ = false;
    previewFeatureId_.clear();
}

void RegenerationEngine::discardPreview() {
    if (!previewActive_ || !doc_) {
        return;
    }

    const std::string featureId = previewFeatureId_;
    previewActive_ = false;
    previewFeatureId_.clear();

    FeatureRecord* record = doc_->findFeature(featureId);
    if (!record) {
        return;
    }
    record->params = previewOriginalParams_;
    const RegenResult restored = regenerateFrom(featureId);
    if (restored.status != RegenStatus::Success) {
        qCWarning(logRegen) << "discardPreview:restore-incomplete"
                            << "featureId=" << QString::fromStdString(featureId)
                            << "failed=" << restored.failedFeatures.size();
    }
}

void RegenerationEngine::releaseFeature(const std::string& featureId) {
    auto it = features_.find(featureId);
    if (it == features_.end()) {
        return;
    }
    it->second->release();
    features_.erase(it);
}

const BoxJointFeature* RegenerationEngine::feature(const std::string& featureId) const {
    auto it = features_.find(featureId);
    return it != features_.end() ? it->second.get() : nullptr;
}

} // namespace boxjoint::app::history
