/**
 * @file ToolSolidBuilder.h
 * @brief Turns a finger pattern into solids that partition the joint volume.
 */
#ifndef BOXJOINT_CORE_JOINT_TOOLSOLIDBUILDER_H
#define BOXJOINT_CORE_JOINT_TOOLSOLIDBUILDER_H

#include "JointTypes.h"
#include "../../kernel/geometry/GeometryKernel.h"

#include <TopoDS_Shape.hxx>

#include <optional>
#include <vector>

namespace boxjoint::core::joint {

/**
 * @brief One piece of the joint volume and the body that keeps it.
 */
struct ToolPiece {
    TopoDS_Shape shape;
    JointSide owner = JointSide::BodyA;
    std::size_t segmentIndex = 0;
    std::optional<std::size_t> reliefIndex;     // Set for corner relief slivers
};

struct ToolSet {
    TopoDS_Shape jointVolume;
    std::vector<ToolPiece> pieces;
    std::optional<JointError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Builds the joint volume and its per-owner pieces for one region.
 *
 * The joint volume is the contact face swept by the pattern depth into the
 * host, clipped to the host body. Each segment piece is its slab of the
 * joint volume minus the relief slivers inside it; each relief sliver is a
 * piece of its own, owned by the relief's keeper. Pieces are pairwise
 * disjoint and together fill the joint volume.
 */
class ToolSolidBuilder {
public:
    explicit ToolSolidBuilder(const kernel::GeometryKernel& kernel);

    ToolSet build(const ContactRegion& region,
                  const FingerPattern& pattern,
                  const TopoDS_Shape& hostBody) const;

    kernel::KernelResult buildJointVolume(const ContactRegion& region,
                                          double depth,
                                          const TopoDS_Shape& hostBody) const;

    /**
     * @brief Corner material a tool of the relief radius cannot reach.
     *
     * The r x r corner box minus a 2r x 2r box whose corner edge is filleted
     * with radius r, before clipping to the joint volume.
     */
    kernel::KernelResult buildReliefSliver(const ContactRegion& region,
                                           const FingerPattern& pattern,
                                           const CornerRelief& relief) const;

private:
    const kernel::GeometryKernel& kernel_;
};

} // namespace boxjoint::core::joint

#endif // BOXJOINT_CORE_JOINT_TOOLSOLIDBUILDER_H
