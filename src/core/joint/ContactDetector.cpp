/**
 * @file ContactDetector.cpp
 */
#include "ContactDetector.h"

#include <QLoggingCategory>
#include <QString>

#include <gp_Vec.hxx>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <set>
#include <tuple>

namespace boxjoint::core::joint {

Q_LOGGING_CATEGORY(logContactDetector, "boxjoint.core.joint.contact")

namespace {

constexpr double kOrderTolerance = 1e-6;

JointError makeError(JointErrorKind kind, std::string message) {
    return JointError{kind, std::move(message), std::nullopt};
}

// Flip a direction so its first significant component is positive.
gp_Vec canonicalDirection(const gp_Vec& v) {
    const double components[3] = {v.X(), v.Y(), v.Z()};
    for (double c : components) {
        if (std::abs(c) > 1e-9) {
            return c < 0.0 ? v.Reversed() : v;
        }
    }
    return v;
}

bool lexicographicallyGreater(const gp_Vec& a, const gp_Vec& b) {
    if (std::abs(a.X() - b.X()) > 1e-9) return a.X() > b.X();
    if (std::abs(a.Y() - b.Y()) > 1e-9) return a.Y() > b.Y();
    return a.Z() > b.Z() + 1e-9;
}

// Centroid snapped to the ordering grid. Comparing snapped keys keeps the
// order a strict weak ordering, which tolerance comparisons are not.
std::tuple<long long, long long, long long> centroidKey(const gp_Pnt& centroid) {
    return {std::llround(centroid.X() / kOrderTolerance),
            std::llround(centroid.Y() / kOrderTolerance),
            std::llround(centroid.Z() / kOrderTolerance)};
}

} // namespace

bool contactRegionLess(const ContactRegion& lhs, const ContactRegion& rhs) {
    if (lhs.bodyA != rhs.bodyA) return lhs.bodyA < rhs.bodyA;
    if (lhs.bodyB != rhs.bodyB) return lhs.bodyB < rhs.bodyB;
    const auto lhsKey = centroidKey(lhs.centroid);
    const auto rhsKey = centroidKey(rhs.centroid);
    if (lhsKey != rhsKey) return lhsKey < rhsKey;
    return std::tie(lhs.faceA, lhs.faceB) < std::tie(rhs.faceA, rhs.faceB);
}

ContactDetector::ContactDetector(const kernel::GeometryKernel& kernel)
    : kernel_(kernel) {}

DetectionResult ContactDetector::detect(const std::vector<SelectedFace>& faces,
                                        const BodyShapes& bodies,
                                        const JointParameters& params) const {
    DetectionResult result;

    // Sorted, de-duplicated selection so the input order never matters.
    std::vector<SelectedFace> candidates;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& face : faces) {
        if (!seen.insert({face.bodyId, face.faceId}).second) {
            continue;
        }
        if (bodies.find(face.bodyId) == bodies.end() || face.face.IsNull()) {
            result.diagnostics.push_back(makeError(JointErrorKind::InvalidSelection,
                "Face " + face.faceId + " does not resolve on body " + face.bodyId));
            continue;
        }
        if (!kernel_.isPlanar(face.face)) {
            result.diagnostics.push_back(makeError(JointErrorKind::InvalidSelection,
                "Face " + face.faceId + " is not planar"));
            continue;
        }
        candidates.push_back(face);
    }
    std::sort(candidates.begin(), candidates.end(), [](const SelectedFace& a, const SelectedFace& b) {
        return std::tie(a.bodyId, a.faceId) < std::tie(b.bodyId, b.faceId);
    });

    std::set<std::string> bodyIds;
    for (const auto& face : candidates) {
        bodyIds.insert(face.bodyId);
    }
    if (bodyIds.size() < 2) {
        result.diagnostics.push_back(makeError(JointErrorKind::InvalidSelection,
            "Selected faces must span at least two bodies"));
    }

    qCDebug(logContactDetector) << "detect:start"
                                << "faces=" << candidates.size()
                                << "bodies=" << bodyIds.size();

    const double minArea = params.minimumFeatureSize * params.minimumFeatureSize;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        for (std::size_t j = i + 1; j < candidates.size(); ++j) {
            const SelectedFace& faceA = candidates[i];
            const SelectedFace& faceB = candidates[j];
            if (faceA.bodyId == faceB.bodyId) {
                continue;
            }

            const kernel::OverlapResult overlap = kernel_.coplanarOverlap(faceA.face, faceB.face);
            if (overlap.error) {
                const JointErrorKind kind = overlap.error->kind == kernel::KernelErrorKind::DegenerateFace
                                                ? JointErrorKind::InvalidSelection
                                                : JointErrorKind::BooleanFailure;
                result.diagnostics.push_back(makeError(kind,
                    "Overlap of " + faceA.faceId + " and " + faceB.faceId + ": " + overlap.error->message));
                continue;
            }
            if (overlap.patches.empty()) {
                continue;
            }

            for (const auto& patch : overlap.patches) {
                if (patch.area < minArea) {
                    result.diagnostics.push_back(makeError(JointErrorKind::DegenerateRegion,
                        "Contact between " + faceA.faceId + " and " + faceB.faceId +
                            " is below the minimum feature size"));
                    continue;
                }

                ContactRegion region;
                if (auto error = buildRegion(faceA, faceB, patch, bodies, params, region)) {
                    result.diagnostics.push_back(*error);
                    continue;
                }
                result.regions.push_back(std::move(region));
            }
        }
    }

    std::sort(result.regions.begin(), result.regions.end(), contactRegionLess);

    qCDebug(logContactDetector) << "detect:done"
                                << "regions=" << result.regions.size()
                                << "diagnostics=" << result.diagnostics.size();
    return result;
}

std::optional<JointError> ContactDetector::buildRegion(const SelectedFace& faceA,
                                                       const SelectedFace& faceB,
                                                       const kernel::OverlapPatch& patch,
                                                       const BodyShapes& bodies,
                                                       const JointParameters& params,
                                                       ContactRegion& region) const {
    region.bodyA = faceA.bodyId;
    region.faceA = faceA.faceId;
    region.bodyB = faceB.bodyId;
    region.faceB = faceB.faceId;
    region.contactFace = patch.face;
    region.contactPolygon = patch.boundary;
    region.area = patch.area;
    region.centroid = patch.centroid;

    // The host is the board whose face runs past the contact.
    const double areaA = kernel_.area(faceA.face);
    const double areaB = kernel_.area(faceB.face);
    region.hostSide = (areaB > areaA + constants::kCoplanarTolerance) ? JointSide::BodyB : JointSide::BodyA;

    const TopoDS_Face& hostFace = region.hostSide == JointSide::BodyA ? faceA.face : faceB.face;
    const auto hostPlane = kernel_.outwardPlane(hostFace);
    if (!hostPlane) {
        const std::string& hostFaceId = region.hostSide == JointSide::BodyA ? region.faceA : region.faceB;
        return makeError(JointErrorKind::InvalidSelection, "Host face " + hostFaceId + " is not planar");
    }
    const gp_Dir zAxis = hostPlane->Axis().Direction().Reversed();

    region.frame = computeFrame(patch, zAxis, region.length, region.width);
    region.contactPlane = gp_Pln(region.frame.origin, hostPlane->Axis().Direction());
    if (region.length <= constants::kCoplanarTolerance || region.width <= constants::kCoplanarTolerance) {
        return makeError(JointErrorKind::DegenerateRegion,
                         "Contact between " + region.faceA + " and " + region.faceB + " has no extent");
    }

    const TopoDS_Shape& host = bodies.at(region.hostBodyId());
    const TopoDS_Shape& mating = bodies.at(region.matingBodyId());
    const JointFrame& frame = region.frame;

    const gp_Vec towardMating(patch.centroid, kernel_.centreOfMass(mating));
    const gp_Vec outward = gp_Vec(frame.zAxis).Reversed();
    if (towardMating.Dot(outward) <= constants::kCoplanarTolerance) {
        return makeError(JointErrorKind::DegenerateRegion,
                         "Bodies " + region.bodyA + " and " + region.bodyB + " interpenetrate at the contact");
    }

    const double sampleDepth = params.materialThickness > 0.0 ? 0.5 * params.materialThickness
                                                              : constants::kSampleOffset;
    const double midX = 0.5 * region.length;
    const double midY = 0.5 * region.width;
    region.hostWallAtMinY = kernel_.containsPoint(host, frame.toWorld(midX, -constants::kSampleOffset, sampleDepth));
    region.hostWallAtMaxY = kernel_.containsPoint(
        host, frame.toWorld(midX, region.width + constants::kSampleOffset, sampleDepth));
    region.hostExtendsBeforeStart = kernel_.containsPoint(
        host, frame.toWorld(-constants::kSampleOffset, midY, sampleDepth));
    region.hostExtendsAfterEnd = kernel_.containsPoint(
        host, frame.toWorld(region.length + constants::kSampleOffset, midY, sampleDepth));

    // Angle between the host's in-plane bulk and the mating board, seen along X.
    gp_Vec hostBulk(frame.yAxis);
    if (region.hostWallAtMinY && !region.hostWallAtMaxY) {
        hostBulk.Reverse();
    }
    gp_Vec matingDirection = towardMating - gp_Vec(frame.xAxis) * towardMating.Dot(gp_Vec(frame.xAxis));
    if (matingDirection.Magnitude() <= constants::kCoplanarTolerance) {
        return makeError(JointErrorKind::DegenerateRegion, "Mating body direction is undefined");
    }
    matingDirection.Normalize();
    const double cosine = std::clamp(matingDirection.Dot(hostBulk), -1.0, 1.0);
    region.dihedralAngleDeg = std::acos(cosine) * 180.0 / std::numbers::pi;

    const double angularToleranceDeg = constants::kAngularTolerance * 180.0 / std::numbers::pi;
    if (region.dihedralAngleDeg <= angularToleranceDeg ||
        region.dihedralAngleDeg >= 180.0 - angularToleranceDeg) {
        return makeError(JointErrorKind::DegenerateRegion,
                         "Bodies " + region.bodyA + " and " + region.bodyB + " meet flush");
    }

    qCDebug(logContactDetector) << "buildRegion:accepted"
                                << "bodyA=" << QString::fromStdString(region.bodyA)
                                << "bodyB=" << QString::fromStdString(region.bodyB)
                                << "host=" << jointSideName(region.hostSide)
                                << "length=" << region.length
                                << "width=" << region.width
                                << "area=" << region.area
                                << "dihedral=" << region.dihedralAngleDeg
                                << "walls=" << region.hostWallAtMinY << region.hostWallAtMaxY;
    return std::nullopt;
}

JointFrame ContactDetector::computeFrame(const kernel::OverlapPatch& patch, const gp_Dir& zAxis,
                                         double& length, double& width) const {
    JointFrame frame;
    length = 0.0;
    width = 0.0;

    const auto& polygon = patch.boundary;
    if (polygon.size() < 3) {
        return frame;
    }

    // Primary axis follows the longest boundary edge.
    const gp_Vec normal(zAxis);
    gp_Vec bestDirection;
    double bestLength = 0.0;
    for (std::size_t k = 0; k < polygon.size(); ++k) {
        gp_Vec edge(polygon[k], polygon[(k + 1) % polygon.size()]);
        edge -= normal * edge.Dot(normal);
        const double edgeLength = edge.Magnitude();
        if (edgeLength <= constants::kCoplanarTolerance) {
            continue;
        }
        const gp_Vec direction = canonicalDirection(edge / edgeLength);
        if (edgeLength > bestLength + constants::kCoplanarTolerance ||
            (std::abs(edgeLength - bestLength) <= constants::kCoplanarTolerance &&
             lexicographicallyGreater(direction, bestDirection))) {
            bestLength = std::max(bestLength, edgeLength);
            bestDirection = direction;
        }
    }
    if (bestLength <= 0.0) {
        return frame;
    }

    frame.origin = polygon.front();
    frame.zAxis = zAxis;
    frame.xAxis = gp_Dir(bestDirection);
    frame.yAxis = zAxis.Crossed(frame.xAxis);

    double minX = 0.0, maxX = 0.0, minY = 0.0, maxY = 0.0;
    bool first = true;
    for (const auto& point : polygon) {
        const gp_Pnt local = frame.toLocal(point);
        if (first) {
            minX = maxX = local.X();
            minY = maxY = local.Y();
            first = false;
            continue;
        }
        minX = std::min(minX, local.X());
        maxX = std::max(maxX, local.X());
        minY = std::min(minY, local.Y());
        maxY = std::max(maxY, local.Y());
    }

    frame.origin = frame.toWorld(minX, minY, 0.0);
    length = maxX - minX;
    width = maxY - minY;
    return frame;
}

} // namespace boxjoint::core::joint
