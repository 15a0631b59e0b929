/**
 * @file JointApplier.h
 * @brief Applies finger patterns to body pairs as per-region transactions.
 */
#ifndef BOXJOINT_CORE_JOINT_JOINTAPPLIER_H
#define BOXJOINT_CORE_JOINT_JOINTAPPLIER_H

#include "ContactDetector.h"
#include "JointTypes.h"
#include "ToolSolidBuilder.h"
#include "../../kernel/geometry/GeometryKernel.h"

#include <TopoDS_Shape.hxx>

#include <optional>
#include <vector>

namespace boxjoint::core::joint {

/**
 * @brief A region paired with the pattern synthesized for it.
 */
struct RegionJob {
    const ContactRegion* region = nullptr;
    const FingerPattern* pattern = nullptr;
};

struct ApplyResult {
    std::vector<std::size_t> appliedRegions;    // Pattern region indices, ascending
    std::vector<JointError> failures;           // One BooleanFailure per aborted region
};

/**
 * @brief Cuts interlocking fingers into both bodies of each region.
 *
 * For one region the mating body is first joined with the joint volume, then
 * every tool piece is subtracted from the body that does not own it. Either
 * all of a region's operations succeed or both bodies keep their previous
 * shapes.
 *
 * Regions that share no body are independent. applyAll() groups regions by
 * shared bodies, runs groups on a thread pool and applies the regions of one
 * group in order, each on top of the previous region's output.
 */
class JointApplier {
public:
    explicit JointApplier(const kernel::GeometryKernel& kernel);

    /**
     * @brief Applies one region to @p bodyA and @p bodyB in place.
     * @return BooleanFailure with both shapes untouched, or nullopt on success.
     */
    std::optional<JointError> applyRegion(const ContactRegion& region,
                                          const FingerPattern& pattern,
                                          TopoDS_Shape& bodyA,
                                          TopoDS_Shape& bodyB) const;

    /**
     * @brief Applies all jobs to @p bodies.
     * @param threadCount Worker count; 0 uses the global Qt thread pool.
     */
    ApplyResult applyAll(const std::vector<RegionJob>& jobs,
                         BodyShapes& bodies,
                         int threadCount = 0) const;

private:
    const kernel::GeometryKernel& kernel_;
    ToolSolidBuilder builder_;
};

} // namespace boxjoint::core::joint

#endif // BOXJOINT_CORE_JOINT_JOINTAPPLIER_H
