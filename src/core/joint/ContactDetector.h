/**
 * @file ContactDetector.h
 * @brief Finds touching planar face pairs between bodies.
 */
#ifndef BOXJOINT_CORE_JOINT_CONTACTDETECTOR_H
#define BOXJOINT_CORE_JOINT_CONTACTDETECTOR_H

#include "JointTypes.h"
#include "../../kernel/geometry/GeometryKernel.h"

#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>

#include <string>
#include <unordered_map>
#include <vector>

namespace boxjoint::core::joint {

/**
 * @brief A user-selected face resolved against the current body geometry.
 */
struct SelectedFace {
    std::string bodyId;
    std::string faceId;
    TopoDS_Face face;
};

using BodyShapes = std::unordered_map<std::string, TopoDS_Shape>;

struct DetectionResult {
    std::vector<ContactRegion> regions;     // Sorted by (bodyA, bodyB, centroid)
    std::vector<JointError> diagnostics;    // Rejected faces and pairs
};

/**
 * @brief Detects contact regions among selected faces.
 *
 * Every unordered pair of faces on distinct bodies is tested. Faces touch when
 * they are planar, share a carrier plane and face each other. Each connected
 * overlap area becomes its own ContactRegion, framed so that Z points into the
 * host body (the one whose face extends past the contact).
 */
class ContactDetector {
public:
    explicit ContactDetector(const kernel::GeometryKernel& kernel);

    DetectionResult detect(const std::vector<SelectedFace>& faces,
                           const BodyShapes& bodies,
                           const JointParameters& params) const;

private:
    /**
     * @brief Builds the frame, host side and wall flags of one overlap patch.
     * @return Error when the patch is degenerate or the bodies interpenetrate.
     */
    std::optional<JointError> buildRegion(const SelectedFace& faceA,
                                          const SelectedFace& faceB,
                                          const kernel::OverlapPatch& patch,
                                          const BodyShapes& bodies,
                                          const JointParameters& params,
                                          ContactRegion& region) const;

    JointFrame computeFrame(const kernel::OverlapPatch& patch, const gp_Dir& zAxis,
                            double& length, double& width) const;

    const kernel::GeometryKernel& kernel_;
};

/**
 * @brief Strict weak ordering used to sort regions deterministically.
 */
bool contactRegionLess(const ContactRegion& lhs, const ContactRegion& rhs);

} // namespace boxjoint::core::joint

#endif // BOXJOINT_CORE_JOINT_CONTACTDETECTOR_H
