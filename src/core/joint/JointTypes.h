/**
 * @file JointTypes.h
 * @brief Value types shared by contact detection, finger synthesis and joint application.
 */
#ifndef BOXJOINT_CORE_JOINT_JOINTTYPES_H
#define BOXJOINT_CORE_JOINT_JOINTTYPES_H

#include <TopoDS_Face.hxx>
#include <gp_Ax2.hxx>
#include <gp_Dir.hxx>
#include <gp_Pln.hxx>
#include <gp_Pnt.hxx>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boxjoint::core::joint {

// ─────────────────────────────────────────────────────────────────────────────
// Tolerances
// ─────────────────────────────────────────────────────────────────────────────

namespace constants {
constexpr double kCoplanarTolerance = 1e-6;
constexpr double kAngularTolerance = 1e-6;   // radians
constexpr double kVolumeEpsilon = 1e-9;
constexpr double kSampleOffset = 1e-3;      // classifier sample distance outside the joint
} // namespace constants

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

enum class JointErrorKind {
    InvalidSelection,
    NoContactFound,
    DegenerateRegion,
    BooleanFailure,
    ParameterConflict
};

struct JointError {
    JointErrorKind kind = JointErrorKind::NoContactFound;
    std::string message;
    std::optional<std::size_t> regionIndex;  // Set for per-region failures
};

const char* jointErrorKindName(JointErrorKind kind);

/**
 * @brief Rank used to surface the most specific error when no joint was produced.
 *
 * Higher is more specific.
 */
int jointErrorSpecificity(JointErrorKind kind);

/**
 * @brief Pick the most specific error out of a list of diagnostics.
 * @return NoContactFound with @p fallbackMessage when @p errors is empty.
 */
JointError mostSpecificError(const std::vector<JointError>& errors,
                             const std::string& fallbackMessage);

std::string describe(const JointError& error);

// ─────────────────────────────────────────────────────────────────────────────
// Parameters
// ─────────────────────────────────────────────────────────────────────────────

enum class CornerFilletPolicy {
    RoundBoth,
    RoundNoneRequireManualFit
};

const char* cornerFilletPolicyName(CornerFilletPolicy policy);
std::optional<CornerFilletPolicy> cornerFilletPolicyFromName(std::string_view name);

/**
 * @brief User-editable joint options.
 *
 * The member initializers are the built-in defaults for new features and for
 * keys missing from a stored record.
 */
struct JointParameters {
    double materialThickness = 6.0;         // Joint depth into the host body
    double targetFingerWidth = 10.0;        // Ignored when fingerCount > 0
    int fingerCount = 0;                    // 0 derives the count from targetFingerWidth
    double toolRadius = 3.175;              // 1/4" end mill
    CornerFilletPolicy cornerFilletPolicy = CornerFilletPolicy::RoundBoth;
    double minimumFeatureSize = 1.0;

    double fingerRatio = 0.5;               // bodyB finger's share of each bodyA/bodyB pair
    double margin = 0.0;                    // Host length left uncut at each end
    int minFingers = 2;
    int maxFingers = 0;                     // 0 leaves the count unbounded
    double minFingerWidth = 0.0;
    double maxFingerWidth = 0.0;            // 0 leaves the width unbounded
    bool symmetricEnds = false;             // Odd count, bodyA fingers at both ends

    bool operator==(const JointParameters&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Contact Regions
// ─────────────────────────────────────────────────────────────────────────────

enum class JointSide {
    BodyA,
    BodyB
};

inline JointSide opposite(JointSide side) {
    return side == JointSide::BodyA ? JointSide::BodyB : JointSide::BodyA;
}

inline const char* jointSideName(JointSide side) {
    return side == JointSide::BodyA ? "bodyA" : "bodyB";
}

/**
 * @brief Local coordinate system of a joint.
 *
 * X runs along the contact's primary axis, Y across the contact (the mating
 * board's thickness), Z into the host body. The origin is the minimum corner
 * of the contact polygon's extent in X/Y.
 */
struct JointFrame {
    gp_Pnt origin;
    gp_Dir xAxis{1.0, 0.0, 0.0};
    gp_Dir yAxis{0.0, 1.0, 0.0};
    gp_Dir zAxis{0.0, 0.0, 1.0};

    gp_Pnt toWorld(double x, double y, double z) const;
    gp_Pnt toLocal(const gp_Pnt& world) const;
    gp_Ax2 placement(double x, double y, double z) const;
};

struct ContactRegion {
    std::string bodyA;
    std::string faceA;
    std::string bodyB;
    std::string faceB;
    gp_Pln contactPlane;
    std::vector<gp_Pnt> contactPolygon;     // Outer boundary on contactPlane
    TopoDS_Face contactFace;
    double area = 0.0;
    gp_Pnt centroid;
    double dihedralAngleDeg = 90.0;

    JointSide hostSide = JointSide::BodyA;  // Body the joint depth cuts into
    JointFrame frame;
    double length = 0.0;                    // Extent along frame X
    double width = 0.0;                     // Extent along frame Y

    // Host material continues past these sides of the joint volume.
    bool hostWallAtMinY = false;
    bool hostWallAtMaxY = false;
    bool hostExtendsBeforeStart = false;
    bool hostExtendsAfterEnd = false;

    const std::string& hostBodyId() const { return hostSide == JointSide::BodyA ? bodyA : bodyB; }
    const std::string& matingBodyId() const { return hostSide == JointSide::BodyA ? bodyB : bodyA; }
    const std::string& bodyId(JointSide side) const { return side == JointSide::BodyA ? bodyA : bodyB; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Finger Patterns
// ─────────────────────────────────────────────────────────────────────────────

struct FingerSegment {
    double start = 0.0;
    double end = 0.0;
    JointSide owner = JointSide::BodyA;
    bool margin = false;                    // Uncut host strip at a region end

    double width() const { return end - start; }
};

enum class ReliefKind {
    MatingFace,     // Edge along Y at z = 0, concave on the mating body
    HostWallMinY,   // Edge along Z at y = 0, concave on the host body
    HostWallMaxY    // Edge along Z at y = width, concave on the host body
};

const char* reliefKindName(ReliefKind kind);

/**
 * @brief Corner material that stays with the body whose concave corner it rounds.
 *
 * The relief occupies the r x r square between @c boundary and
 * @c boundary + direction * r inside segment @c intoSegment, minus the quarter
 * disc a tool of radius r sweeps there. The keeper retains it; the owner of
 * @c intoSegment loses it, which rounds that owner's convex corner by the
 * same radius.
 */
struct CornerRelief {
    double boundary = 0.0;
    int direction = 1;                      // +1 extends toward +X, -1 toward -X
    ReliefKind kind = ReliefKind::MatingFace;
    JointSide keeper = JointSide::BodyA;
    std::size_t intoSegment = 0;
    double radius = 0.0;
};

struct FingerPattern {
    std::size_t regionIndex = 0;
    double length = 0.0;
    double width = 0.0;
    double depth = 0.0;
    CornerFilletPolicy policy = CornerFilletPolicy::RoundBoth;
    double toolRadius = 0.0;
    double margin = 0.0;                    // Effective strip kept by the host at each end
    std::vector<FingerSegment> segments;
    std::vector<CornerRelief> reliefs;

    /// Segments owned by @p side, not counting margin strips.
    std::size_t fingerCount(JointSide side) const;
};

} // namespace boxjoint::core::joint

#endif // BOXJOINT_CORE_JOINT_JOINTTYPES_H
