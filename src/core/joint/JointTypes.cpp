/**
 * @file JointTypes.cpp
 * @brief Helpers for joint value types.
 */
#include "JointTypes.h"

#include <gp_Vec.hxx>

#include <algorithm>

namespace boxjoint::core::joint {

const char* jointErrorKindName(JointErrorKind kind) {
    switch (kind) {
        case JointErrorKind::InvalidSelection: return "InvalidSelection";
        case JointErrorKind::NoContactFound: return "NoContactFound";
        case JointErrorKind::DegenerateRegion: return "DegenerateRegion";
        case JointErrorKind::BooleanFailure: return "BooleanFailure";
        case JointErrorKind::ParameterConflict: return "ParameterConflict";
        default: return "Unknown";
    }
}

int jointErrorSpecificity(JointErrorKind kind) {
    switch (kind) {
        case JointErrorKind::ParameterConflict: return 5;
        case JointErrorKind::InvalidSelection: return 4;
        case JointErrorKind::DegenerateRegion: return 3;
        case JointErrorKind::BooleanFailure: return 2;
        case JointErrorKind::NoContactFound: return 1;
        default: return 0;
    }
}

JointError mostSpecificError(const std::vector<JointError>& errors,
                             const std::string& fallbackMessage) {
    if (errors.empty()) {
        return JointError{JointErrorKind::NoContactFound, fallbackMessage, std::nullopt};
    }

    // First error of the highest rank wins so the report is stable.
    auto best = errors.begin();
    for (auto it = errors.begin(); it != errors.end(); ++it) {
        if (jointErrorSpecificity(it->kind) > jointErrorSpecificity(best->kind)) {
            best = it;
        }
    }
    return *best;
}

std::string describe(const JointError& error) {
    std::string text = jointErrorKindName(error.kind);
    if (error.regionIndex) {
        text += " (region " + std::to_string(*error.regionIndex) + ")";
    }
    if (!error.message.empty()) {
        text += ": " + error.message;
    }
    return text;
}

const char* cornerFilletPolicyName(CornerFilletPolicy policy) {
    switch (policy) {
        case CornerFilletPolicy::RoundBoth: return "roundBoth";
        case CornerFilletPolicy::RoundNoneRequireManualFit: return "roundNoneRequireManualFit";
        default: return "roundBoth";
    }
}

std::optional<CornerFilletPolicy> cornerFilletPolicyFromName(std::string_view name) {
    if (name == "roundBoth") return CornerFilletPolicy::RoundBoth;
    if (name == "roundNoneRequireManualFit") return CornerFilletPolicy::RoundNoneRequireManualFit;
    return std::nullopt;
}

const char* reliefKindName(ReliefKind kind) {
    switch (kind) {
        case ReliefKind::MatingFace: return "MatingFace";
        case ReliefKind::HostWallMinY: return "HostWallMinY";
        case ReliefKind::HostWallMaxY: return "HostWallMaxY";
        default: return "Unknown";
    }
}

gp_Pnt JointFrame::toWorld(double x, double y, double z) const {
    gp_Vec offset = gp_Vec(xAxis) * x + gp_Vec(yAxis) * y + gp_Vec(zAxis) * z;
    return origin.Translated(offset);
}

gp_Pnt JointFrame::toLocal(const gp_Pnt& world) const {
    const gp_Vec v(origin, world);
    return gp_Pnt(v.Dot(gp_Vec(xAxis)), v.Dot(gp_Vec(yAxis)), v.Dot(gp_Vec(zAxis)));
}

gp_Ax2 JointFrame::placement(double x, double y, double z) const {
    // gp_Ax2 derives Y as Z ^ X, which matches yAxis by construction.
    return gp_Ax2(toWorld(x, y, z), zAxis, xAxis);
}

std::size_t FingerPattern::fingerCount(JointSide side) const {
    return static_cast<std::size_t>(std::count_if(segments.begin(), segments.end(),
        [side](const FingerSegment& segment) { return segment.owner == side && !segment.margin; }));
}

} // namespace boxjoint::core::joint
