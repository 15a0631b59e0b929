/**
 * @file ToolSolidBuilder.cpp
 */
#include "ToolSolidBuilder.h"

#include <QLoggingCategory>
#include <QString>

#include <BRepAdaptor_Curve.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Edge.hxx>

#include <algorithm>
#include <cmath>

namespace boxjoint::core::joint {

Q_LOGGING_CATEGORY(logToolBuilder, "boxjoint.core.joint.tools")

namespace {

constexpr double kEdgeMatchTolerance = 1e-6;

struct LocalBox {
    double x0, x1, y0, y1, z0, z1;
};

LocalBox ordered(LocalBox box) {
    if (box.x0 > box.x1) std::swap(box.x0, box.x1);
    if (box.y0 > box.y1) std::swap(box.y0, box.y1);
    if (box.z0 > box.z1) std::swap(box.z0, box.z1);
    return box;
}

TopoDS_Shape makeFrameBox(const JointFrame& frame, const LocalBox& input) {
    const LocalBox box = ordered(input);
    BRepPrimAPI_MakeBox maker(frame.placement(box.x0, box.y0, box.z0),
                              box.x1 - box.x0, box.y1 - box.y0, box.z1 - box.z0);
    return maker.Shape();
}

/**
 * @brief Finds the box edge whose midpoint sits at the given local coordinates.
 *
 * Coordinates set to NaN are ignored, which selects the edge running along
 * that axis.
 */
TopoDS_Edge findFrameEdge(const TopoDS_Shape& box, const JointFrame& frame,
                          double x, double y, double z) {
    for (TopExp_Explorer exp(box, TopAbs_EDGE); exp.More(); exp.Next()) {
        const TopoDS_Edge edge = TopoDS::Edge(exp.Current());
        BRepAdaptor_Curve curve(edge);
        const gp_Pnt mid = curve.Value(0.5 * (curve.FirstParameter() + curve.LastParameter()));
        const gp_Pnt local = frame.toLocal(mid);
        const bool matchX = std::isnan(x) || std::abs(local.X() - x) < kEdgeMatchTolerance;
        const bool matchY = std::isnan(y) || std::abs(local.Y() - y) < kEdgeMatchTolerance;
        const bool matchZ = std::isnan(z) || std::abs(local.Z() - z) < kEdgeMatchTolerance;
        if (matchX && matchY && matchZ) {
            return edge;
        }
    }
    return TopoDS_Edge();
}

JointError booleanError(std::size_t regionIndex, const std::string& what, const kernel::KernelError& error) {
    return JointError{JointErrorKind::BooleanFailure,
                      what + " (" + kernel::kernelErrorKindName(error.kind) + "): " + error.message,
                      regionIndex};
}

} // namespace

ToolSolidBuilder::ToolSolidBuilder(const kernel::GeometryKernel& kernel)
    : kernel_(kernel) {}

kernel::KernelResult ToolSolidBuilder::buildJointVolume(const ContactRegion& region,
                                                        double depth,
                                                        const TopoDS_Shape& hostBody) const {
    const gp_Vec sweepVector = gp_Vec(region.frame.zAxis) * depth;
    kernel::KernelResult prism = kernel_.sweep(region.contactFace, sweepVector);
    if (!prism.ok()) {
        return prism;
    }
    return kernel_.booleanCommon(prism.shape, hostBody);
}

kernel::KernelResult ToolSolidBuilder::buildReliefSliver(const ContactRegion& region,
                                                         const FingerPattern& pattern,
                                                         const CornerRelief& relief) const {
    const JointFrame& frame = region.frame;
    const double r = relief.radius;
    const double b = relief.boundary;
    const double d = static_cast<double>(relief.direction);
    const double pad = 1.0 + pattern.depth;
    const double nan = std::nan("");

    LocalBox corner{};
    LocalBox rounded{};
    double edgeX = b;
    double edgeY = nan;
    double edgeZ = nan;

    switch (relief.kind) {
        case ReliefKind::MatingFace:
            corner = {b, b + d * r, -pad, pattern.width + pad, 0.0, r};
            rounded = {b, b + 2.0 * d * r, -pad, pattern.width + pad, 0.0, 2.0 * r};
            edgeZ = 0.0;
            break;
        case ReliefKind::HostWallMinY:
            corner = {b, b + d * r, 0.0, r, -pad, pattern.depth + pad};
            rounded = {b, b + 2.0 * d * r, 0.0, 2.0 * r, -pad, pattern.depth + pad};
            edgeY = 0.0;
            break;
        case ReliefKind::HostWallMaxY:
            corner = {b, b + d * r, pattern.width - r, pattern.width, -pad, pattern.depth + pad};
            rounded = {b, b + 2.0 * d * r, pattern.width - 2.0 * r, pattern.width, -pad, pattern.depth + pad};
            edgeY = pattern.width;
            break;
    }

    try {
        const TopoDS_Shape cornerBox = makeFrameBox(frame, corner);
        const TopoDS_Shape roundedBox = makeFrameBox(frame, rounded);
        const TopoDS_Edge edge = findFrameEdge(roundedBox, frame, edgeX, edgeY, edgeZ);
        if (edge.IsNull()) {
            return kernel::KernelResult::failure(kernel::KernelErrorKind::OperationFailed,
                                                 "Relief corner edge not found");
        }

        kernel::KernelResult filleted = kernel_.fillet(roundedBox, edge, r);
        if (!filleted.ok()) {
            return filleted;
        }
        return kernel_.booleanSubtract(cornerBox, filleted.shape);
    } catch (const Standard_Failure& failure) {
        const char* message = failure.GetMessageString();
        return kernel::KernelResult::failure(kernel::KernelErrorKind::OperationFailed,
                                             std::string("Relief box construction raised: ") +
                                                 ((message && *message) ? message : "<no message>"));
    }
}

ToolSet ToolSolidBuilder::build(const ContactRegion& region,
                                const FingerPattern& pattern,
                                const TopoDS_Shape& hostBody) const {
    ToolSet result;
    const std::size_t regionIndex = pattern.regionIndex;

    kernel::KernelResult joint = buildJointVolume(region, pattern.depth, hostBody);
    if (!joint.ok()) {
        result.error = booleanError(regionIndex, "Joint volume", *joint.error);
        return result;
    }
    result.jointVolume = joint.shape;

    // Clip every relief to the joint; a relief outside it has nothing to keep.
    std::vector<std::optional<TopoDS_Shape>> reliefShapes(pattern.reliefs.size());
    for (std::size_t k = 0; k < pattern.reliefs.size(); ++k) {
        const CornerRelief& relief = pattern.reliefs[k];
        kernel::KernelResult sliver = buildReliefSliver(region, pattern, relief);
        if (!sliver.ok()) {
            result.error = booleanError(regionIndex, "Corner relief", *sliver.error);
            return result;
        }
        kernel::KernelResult clipped = kernel_.booleanCommon(sliver.shape, result.jointVolume);
        if (!clipped.ok()) {
            if (clipped.error->kind == kernel::KernelErrorKind::EmptyResult) {
                qCDebug(logToolBuilder) << "build:relief-outside-joint"
                                        << "region=" << regionIndex
                                        << "boundary=" << relief.boundary
                                        << "kind=" << reliefKindName(relief.kind);
                continue;
            }
            result.error = booleanError(regionIndex, "Corner relief clip", *clipped.error);
            return result;
        }
        reliefShapes[k] = clipped.shape;
    }

    const double pad = 1.0 + pattern.depth;
    for (std::size_t i = 0; i < pattern.segments.size(); ++i) {
        const FingerSegment& segment = pattern.segments[i];
        const bool first = i == 0;
        const bool last = i + 1 == pattern.segments.size();
        const LocalBox slab{first ? -pad : segment.start,
                            last ? pattern.length + pad : segment.end,
                            -pad, pattern.width + pad,
                            -pad, pattern.depth + pad};

        TopoDS_Shape slabBox;
        try {
            slabBox = makeFrameBox(region.frame, slab);
        } catch (const Standard_Failure&) {
            result.error = JointError{JointErrorKind::BooleanFailure, "Segment box construction failed", regionIndex};
            return result;
        }

        kernel::KernelResult piece = kernel_.booleanCommon(slabBox, result.jointVolume);
        if (!piece.ok()) {
            result.error = booleanError(regionIndex, "Segment " + std::to_string(i), *piece.error);
            return result;
        }

        for (std::size_t k = 0; k < pattern.reliefs.size(); ++k) {
            if (pattern.reliefs[k].intoSegment != i || !reliefShapes[k]) {
                continue;
            }
            kernel::KernelResult trimmed = kernel_.booleanSubtract(piece.shape, *reliefShapes[k]);
            if (!trimmed.ok()) {
                result.error = booleanError(regionIndex, "Segment " + std::to_string(i) + " relief", *trimmed.error);
                return result;
            }
            piece = trimmed;
        }

        result.pieces.push_back(ToolPiece{piece.shape, segment.owner, i, std::nullopt});
    }

    for (std::size_t k = 0; k < pattern.reliefs.size(); ++k) {
        if (!reliefShapes[k]) {
            continue;
        }
        const CornerRelief& relief = pattern.reliefs[k];
        result.pieces.push_back(ToolPiece{*reliefShapes[k], relief.keeper, relief.intoSegment, k});
    }

    qCDebug(logToolBuilder) << "build:done"
                            << "region=" << regionIndex
                            << "pieces=" << result.pieces.size()
                            << "jointVolume=" << kernel_.volume(result.jointVolume);
    return result;
}

} // namespace boxjoint::core::joint
