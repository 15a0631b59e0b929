/**
 * @file JointApplier.cpp
 */
#include "JointApplier.h"

#include <QList>
#include <QLoggingCategory>
#include <QString>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentMap>

#include <algorithm>
#include <functional>
#include <map>
#include <string>

namespace boxjoint::core::joint {

Q_LOGGING_CATEGORY(logJointApplier, "boxjoint.core.joint.applier")

namespace {

// Regions that share a body, with the body shapes they read and write.
struct GroupWork {
    std::vector<RegionJob> jobs;
    BodyShapes bodies;
};

struct GroupOutcome {
    BodyShapes bodies;
    std::vector<std::size_t> applied;
    std::vector<JointError> failures;
};

class BodyUnion {
public:
    std::string find(const std::string& id) {
        auto it = parent_.find(id);
        if (it == parent_.end()) {
            parent_[id] = id;
            return id;
        }
        if (it->second == id) {
            return id;
        }
        const std::string root = find(it->second);
        parent_[id] = root;
        return root;
    }

    void unite(const std::string& a, const std::string& b) {
        const std::string rootA = find(a);
        const std::string rootB = find(b);
        if (rootA != rootB) {
            // Smaller id becomes the root so grouping is independent of insertion order.
            if (rootA < rootB) {
                parent_[rootB] = rootA;
            } else {
                parent_[rootA] = rootB;
            }
        }
    }

private:
    std::map<std::string, std::string> parent_;
};

} // namespace

JointApplier::JointApplier(const kernel::GeometryKernel& kernel)
    : kernel_(kernel),
      builder_(kernel) {}

std::optional<JointError> JointApplier::applyRegion(const ContactRegion& region,
                                                    const FingerPattern& pattern,
                                                    TopoDS_Shape& bodyA,
                                                    TopoDS_Shape& bodyB) const {
    const std::size_t regionIndex = pattern.regionIndex;
    TopoDS_Shape& hostTarget = region.hostSide == JointSide::BodyA ? bodyA : bodyB;
    TopoDS_Shape& matingTarget = region.hostSide == JointSide::BodyA ? bodyB : bodyA;

    auto abort = [&](const std::string& message) {
        qCWarning(logJointApplier) << "applyRegion:rolled-back"
                                   << "region=" << regionIndex
                                   << "bodyA=" << QString::fromStdString(region.bodyA)
                                   << "bodyB=" << QString::fromStdString(region.bodyB)
                                   << "reason=" << QString::fromStdString(message);
        return JointError{JointErrorKind::BooleanFailure, message, regionIndex};
    };

    ToolSet tools = builder_.build(region, pattern, hostTarget);
    if (!tools.ok()) {
        return abort(tools.error->message);
    }

    // Work on copies; the caller's shapes change only once every cut succeeded.
    TopoDS_Shape host = hostTarget;
    kernel::KernelResult fused = kernel_.booleanUnion(matingTarget, tools.jointVolume);
    if (!fused.ok()) {
        return abort("Joining joint volume to " + region.matingBodyId() + ": " + fused.error->message);
    }
    TopoDS_Shape mating = fused.shape;

    for (const ToolPiece& piece : tools.pieces) {
        const bool hostKeeps = piece.owner == region.hostSide;
        TopoDS_Shape& target = hostKeeps ? mating : host;
        const std::string& targetId = hostKeeps ? region.matingBodyId() : region.hostBodyId();

        kernel::KernelResult cut = kernel_.booleanSubtract(target, piece.shape);
        if (!cut.ok()) {
            return abort("Cutting segment " + std::to_string(piece.segmentIndex) +
                         (piece.reliefIndex ? " relief" : "") + " from " + targetId + ": " +
                         cut.error->message);
        }
        target = cut.shape;
    }

    hostTarget = host;
    matingTarget = mating;

    qCDebug(logJointApplier) << "applyRegion:committed"
                             << "region=" << regionIndex
                             << "pieces=" << tools.pieces.size()
                             << "fingersA=" << pattern.fingerCount(JointSide::BodyA)
                             << "fingersB=" << pattern.fingerCount(JointSide::BodyB);
    return std::nullopt;
}

ApplyResult JointApplier::applyAll(const std::vector<RegionJob>& jobs,
                                   BodyShapes& bodies,
                                   int threadCount) const {
    ApplyResult result;

    BodyUnion unionFind;
    std::vector<std::size_t> runnable;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const RegionJob& job = jobs[i];
        if (!job.region || !job.pattern) {
            continue;
        }
        if (bodies.find(job.region->bodyA) == bodies.end() || bodies.find(job.region->bodyB) == bodies.end()) {
            result.failures.push_back(JointError{JointErrorKind::InvalidSelection,
                                                 "Region body is not available", job.pattern->regionIndex});
            continue;
        }
        unionFind.unite(job.region->bodyA, job.region->bodyB);
        runnable.push_back(i);
    }

    // Groups keep the order of their first job; jobs inside keep input order.
    QList<GroupWork> groups;
    std::map<std::string, qsizetype> groupByRoot;
    for (std::size_t i : runnable) {
        const RegionJob& job = jobs[i];
        const std::string root = unionFind.find(job.region->bodyA);
        auto it = groupByRoot.find(root);
        if (it == groupByRoot.end()) {
            it = groupByRoot.emplace(root, groups.size()).first;
            groups.append(GroupWork{});
        }
        GroupWork& group = groups[it->second];
        group.jobs.push_back(job);
        group.bodies[job.region->bodyA] = bodies.at(job.region->bodyA);
        group.bodies[job.region->bodyB] = bodies.at(job.region->bodyB);
    }

    qCDebug(logJointApplier) << "applyAll:start"
                             << "jobs=" << runnable.size()
                             << "groups=" << groups.size()
                             << "threads=" << threadCount;

    std::function<GroupOutcome(const GroupWork&)> applyGroup = [this](const GroupWork& work) {
        GroupOutcome outcome;
        outcome.bodies = work.bodies;
        for (const RegionJob& job : work.jobs) {
            TopoDS_Shape& bodyA = outcome.bodies[job.region->bodyA];
            TopoDS_Shape& bodyB = outcome.bodies[job.region->bodyB];
            if (auto error = applyRegion(*job.region, *job.pattern, bodyA, bodyB)) {
                outcome.failures.push_back(*error);
            } else {
                outcome.applied.push_back(job.pattern->regionIndex);
            }
        }
        return outcome;
    };

    QList<GroupOutcome> outcomes;
    if (groups.size() <= 1) {
        for (const GroupWork& group : groups) {
            outcomes.append(applyGroup(group));
        }
    } else if (threadCount > 0) {
        QThreadPool pool;
        pool.setMaxThreadCount(threadCount);
        outcomes = QtConcurrent::blockingMapped<QList<GroupOutcome>>(&pool, groups, applyGroup);
    } else {
        outcomes = QtConcurrent::blockingMapped<QList<GroupOutcome>>(QThreadPool::globalInstance(),
                                                                     groups, applyGroup);
    }

    // Merge serially in group order.
    for (const GroupOutcome& outcome : outcomes) {
        for (const auto& [bodyId, shape] : outcome.bodies) {
            bodies[bodyId] = shape;
        }
        result.appliedRegions.insert(result.appliedRegions.end(), outcome.applied.begin(), outcome.applied.end());
        result.failures.insert(result.failures.end(), outcome.failures.begin(), outcome.failures.end());
    }

    std::sort(result.appliedRegions.begin(), result.appliedRegions.end());
    std::stable_sort(result.failures.begin(), result.failures.end(), [](const JointError& a, const JointError& b) {
        return a.regionIndex.value_or(0) < b.regionIndex.value_or(0);
    });

    qCDebug(logJointApplier) << "applyAll:done"
                             << "applied=" << result.appliedRegions.size()
                             << "failed=" << result.failures.size();
    return result;
}

} // namespace boxjoint::core::joint
