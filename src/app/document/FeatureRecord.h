/**
 * @file FeatureRecord.h
 * @brief Persisted timeline records for joint features.
 */
#ifndef BOXJOINT_APP_DOCUMENT_FEATURERECORD_H
#define BOXJOINT_APP_DOCUMENT_FEATURERECORD_H

#include "../../core/joint/JointTypes.h"

#include <string>
#include <vector>

namespace boxjoint::app {

// ─────────────────────────────────────────────────────────────────────────────
// Feature Types
// ─────────────────────────────────────────────────────────────────────────────

enum class FeatureType {
    BoxJoint
};

// ─────────────────────────────────────────────────────────────────────────────
// Reference Types
// ─────────────────────────────────────────────────────────────────────────────

struct FaceRef {
    std::string bodyId;
    std::string faceId;                     // ElementMap face ID

    bool operator==(const FaceRef&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Feature Record (single timeline entry)
// ─────────────────────────────────────────────────────────────────────────────

struct FeatureRecord {
    std::string featureId;                      // Unique feature ID (UUID)
    FeatureType type = FeatureType::BoxJoint;
    std::vector<FaceRef> faces;                 // Selection order is preserved
    core::joint::JointParameters params;
    std::vector<std::string> resultBodyIds;     // Bodies this feature rewrites
};

// ─────────────────────────────────────────────────────────────────────────────
// Utility Functions
// ─────────────────────────────────────────────────────────────────────────────

inline const char* featureTypeName(FeatureType type) {
    switch (type) {
        case FeatureType::BoxJoint: return "BoxJoint";
        default: return "Unknown";
    }
}

} // namespace boxjoint::app

#endif // BOXJOINT_APP_DOCUMENT_FEATURERECORD_H
