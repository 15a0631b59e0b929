/**
 * @file FingerPatternSynthesizer.h
 * @brief Lays out alternating fingers and tool reliefs along a contact region.
 */
#ifndef BOXJOINT_CORE_JOINT_FINGERPATTERNSYNTHESIZER_H
#define BOXJOINT_CORE_JOINT_FINGERPATTERNSYNTHESIZER_H

#include "JointTypes.h"

#include <optional>

namespace boxjoint::core::joint {

struct SynthesisResult {
    std::optional<FingerPattern> pattern;
    std::optional<JointError> error;

    bool ok() const { return pattern.has_value() && !error.has_value(); }
};

/**
 * @brief Computes the finger layout of one contact region.
 *
 * Pure computation on the region's frame extents; no kernel calls. Fingers
 * fill the region minus a host-owned margin at each end. The count is the
 * explicit finger count when one is set, otherwise
 * max(2, round(fingerLength / targetFingerWidth)) clamped to
 * [minFingers, maxFingers] and moved until the widths fit the finger width
 * bounds. symmetricEnds restricts counts to odd values so bodyA owns both
 * ends. Ownership alternates starting with bodyA; fingerRatio splits each
 * bodyA/bodyB pair. Width above maxFingerWidth goes to the end margins, and
 * a margin strip next to a host finger merges into it.
 *
 * With CornerFilletPolicy::RoundBoth and a positive tool radius each concave
 * corner gets a CornerRelief: the keeper retains an r x r sliver minus the
 * tool's quarter disc, so the neighbour's convex corner is rounded by r.
 */
class FingerPatternSynthesizer {
public:
    /**
     * @brief Region-independent parameter checks.
     * @return ParameterConflict without a region index, or nullopt.
     */
    std::optional<JointError> validate(const JointParameters& params) const;

    SynthesisResult synthesize(const ContactRegion& region,
                               const JointParameters& params,
                               std::size_t regionIndex) const;

private:
    void addReliefs(const ContactRegion& region, FingerPattern& pattern) const;
};

} // namespace boxjoint::core::joint

#endif // BOXJOINT_CORE_JOINT_FINGERPATTERNSYNTHESIZER_H
