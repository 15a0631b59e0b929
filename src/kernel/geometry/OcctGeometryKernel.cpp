/**
 * @file OcctGeometryKernel.cpp
 * @brief OpenCASCADE implementation of the geometry capability interface.
 */
#include "OcctGeometryKernel.h"

#include "../../core/joint/JointTypes.h"

#include <QLoggingCategory>
#include <QString>

#include <BRepAdaptor_Surface.hxx>
#include <BRepAlgoAPI_Common.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepCheck_Analyzer.hxx>
#include <BRepClass3d_SolidClassifier.hxx>
#include <BRepFilletAPI_MakeFillet.hxx>
#include <BRepGProp.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepTools.hxx>
#include <BRepTools_WireExplorer.hxx>
#include <BRep_Tool.hxx>
#include <GProp_GProps.hxx>
#include <GeomAbs_SurfaceType.hxx>
#include <ShapeUpgrade_UnifySameDomain.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_ListOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Wire.hxx>

#include <memory>

namespace boxjoint::kernel {

Q_LOGGING_CATEGORY(logGeometryKernel, "boxjoint.kernel.geometry")

namespace {

QString failureText(const Standard_Failure& failure) {
    const char* message = failure.GetMessageString();
    return (message && *message) ? QString::fromUtf8(message) : QStringLiteral("<no message>");
}

} // namespace

const char* kernelErrorKindName(KernelErrorKind kind) {
    switch (kind) {
        case KernelErrorKind::DegenerateFace: return "DegenerateFace";
        case KernelErrorKind::ZeroVolumeTool: return "ZeroVolumeTool";
        case KernelErrorKind::NonManifoldResult: return "NonManifoldResult";
        case KernelErrorKind::EmptyResult: return "EmptyResult";
        case KernelErrorKind::OperationFailed: return "OperationFailed";
        default: return "Unknown";
    }
}

OcctGeometryKernel::OcctGeometryKernel(double linearTolerance)
    : linearTolerance_(linearTolerance) {}

bool OcctGeometryKernel::isPlanar(const TopoDS_Face& face) const {
    if (face.IsNull()) {
        return false;
    }
    BRepAdaptor_Surface surface(face, true);
    return surface.GetType() == GeomAbs_Plane;
}

std::optional<gp_Pln> OcctGeometryKernel::outwardPlane(const TopoDS_Face& face) const {
    if (!isPlanar(face)) {
        return std::nullopt;
    }

    BRepAdaptor_Surface surface(face, true);
    gp_Pln plane = surface.Plane();
    if (face.Orientation() == TopAbs_REVERSED) {
        plane = gp_Pln(plane.Location(), plane.Axis().Direction().Reversed());
    }
    return plane;
}

OverlapResult OcctGeometryKernel::coplanarOverlap(const TopoDS_Face& faceA,
                                                  const TopoDS_Face& faceB) const {
    OverlapResult result;

    const auto planeA = outwardPlane(faceA);
    const auto planeB = outwardPlane(faceB);
    if (!planeA || !planeB) {
        result.error = KernelError{KernelErrorKind::DegenerateFace, "Overlap requires two planar faces"};
        return result;
    }

    // Touching faces face each other; same-direction normals are flush, not touching.
    const gp_Dir normalA = planeA->Axis().Direction();
    const gp_Dir normalB = planeB->Axis().Direction();
    if (!normalA.IsOpposite(normalB, core::joint::constants::kAngularTolerance)) {
        return result;
    }
    if (planeA->Distance(planeB->Location()) > linearTolerance_) {
        return result;
    }

    try {
        BRepAlgoAPI_Common common;
        TopTools_ListOfShape arguments;
        TopTools_ListOfShape tools;
        arguments.Append(faceA);
        tools.Append(faceB);
        common.SetArguments(arguments);
        common.SetTools(tools);
        common.SetFuzzyValue(linearTolerance_);
        common.SetNonDestructive(true);
        common.Build();
        if (!common.IsDone()) {
            result.error = KernelError{KernelErrorKind::OperationFailed, "Face common did not complete"};
            return result;
        }

        // Merge split pieces so each connected contact area is a single face.
        ShapeUpgrade_UnifySameDomain unify(common.Shape(), true, true, false);
        unify.Build();
        const TopoDS_Shape merged = unify.Shape();

        for (TopExp_Explorer exp(merged, TopAbs_FACE); exp.More(); exp.Next()) {
            const TopoDS_Face patchFace = TopoDS::Face(exp.Current());

            GProp_GProps props;
            BRepGProp::SurfaceProperties(patchFace, props);
            if (props.Mass() <= linearTolerance_ * linearTolerance_) {
                continue;
            }

            OverlapPatch patch;
            patch.face = patchFace;
            patch.area = props.Mass();
            patch.centroid = props.CentreOfMass();

            const TopoDS_Wire outer = BRepTools::OuterWire(patchFace);
            for (BRepTools_WireExplorer wexp(outer, patchFace); wexp.More(); wexp.Next()) {
                patch.boundary.push_back(BRep_Tool::Pnt(wexp.CurrentVertex()));
            }
            result.patches.push_back(std::move(patch));
        }
    } catch (const Standard_Failure& failure) {
        qCWarning(logGeometryKernel) << "coplanarOverlap:kernel-exception" << failureText(failure);
        result.patches.clear();
        result.error = KernelError{KernelErrorKind::OperationFailed,
                                   "Face common raised: " + failureText(failure).toStdString()};
    }

    qCDebug(logGeometryKernel) << "coplanarOverlap:done" << "patches=" << result.patches.size();
    return result;
}

KernelResult OcctGeometryKernel::booleanSubtract(const TopoDS_Shape& body, const TopoDS_Shape& tool) const {
    return runBoolean(BooleanKind::Cut, body, tool);
}

KernelResult OcctGeometryKernel::booleanUnion(const TopoDS_Shape& body, const TopoDS_Shape& tool) const {
    return runBoolean(BooleanKind::Fuse, body, tool);
}

KernelResult OcctGeometryKernel::booleanCommon(const TopoDS_Shape& body, const TopoDS_Shape& tool) const {
    return runBoolean(BooleanKind::Common, body, tool);
}

KernelResult OcctGeometryKernel::runBoolean(BooleanKind kind,
                                            const TopoDS_Shape& body,
                                            const TopoDS_Shape& tool) const {
    if (body.IsNull() || tool.IsNull()) {
        return KernelResult::failure(KernelErrorKind::OperationFailed, "Boolean input is null");
    }
    if (volume(tool) <= core::joint::constants::kVolumeEpsilon) {
        return KernelResult::failure(KernelErrorKind::ZeroVolumeTool, "Boolean tool has no volume");
    }

    try {
        std::unique_ptr<BRepAlgoAPI_BooleanOperation> op;
        switch (kind) {
            case BooleanKind::Cut: op = std::make_unique<BRepAlgoAPI_Cut>(); break;
            case BooleanKind::Fuse: op = std::make_unique<BRepAlgoAPI_Fuse>(); break;
            case BooleanKind::Common: op = std::make_unique<BRepAlgoAPI_Common>(); break;
        }

        TopTools_ListOfShape arguments;
        TopTools_ListOfShape tools;
        arguments.Append(body);
        tools.Append(tool);
        op->SetArguments(arguments);
        op->SetTools(tools);
        op->SetFuzzyValue(linearTolerance_);
        op->SetNonDestructive(true);
        op->Build();

        if (!op->IsDone() || op->HasErrors()) {
            qCWarning(logGeometryKernel) << "runBoolean:not-done" << "kind=" << static_cast<int>(kind);
            return KernelResult::failure(KernelErrorKind::OperationFailed, "Boolean operation failed");
        }

        TopoDS_Shape shape = op->Shape();
        if (kind == BooleanKind::Fuse) {
            // Keep fused bodies free of seams along the former contact.
            ShapeUpgrade_UnifySameDomain unify(shape, true, true, false);
            unify.Build();
            shape = unify.Shape();
        }

        if (auto error = validateSolid(shape)) {
            qCWarning(logGeometryKernel) << "runBoolean:invalid-result"
                                         << "kind=" << static_cast<int>(kind)
                                         << "error=" << QString::fromStdString(error->message);
            return KernelResult{TopoDS_Shape(), error};
        }
        return KernelResult::success(shape);
    } catch (const Standard_Failure& failure) {
        qCWarning(logGeometryKernel) << "runBoolean:kernel-exception" << failureText(failure);
        return KernelResult::failure(KernelErrorKind::OperationFailed,
                                     "Boolean operation raised: " + failureText(failure).toStdString());
    }
}

KernelResult OcctGeometryKernel::fillet(const TopoDS_Shape& solid, const TopoDS_Edge& edge, double radius) const {
    if (solid.IsNull() || edge.IsNull()) {
        return KernelResult::failure(KernelErrorKind::OperationFailed, "Fillet input is null");
    }
    if (radius <= linearTolerance_) {
        return KernelResult::failure(KernelErrorKind::OperationFailed, "Fillet radius too small");
    }

    try {
        BRepFilletAPI_MakeFillet fillet(solid);
        fillet.Add(radius, edge);
        fillet.Build();
        if (!fillet.IsDone()) {
            return KernelResult::failure(KernelErrorKind::OperationFailed, "Fillet operation failed");
        }
        if (auto error = validateSolid(fillet.Shape())) {
            return KernelResult{TopoDS_Shape(), error};
        }
        return KernelResult::success(fillet.Shape());
    } catch (const Standard_Failure& failure) {
        qCWarning(logGeometryKernel) << "fillet:kernel-exception" << "radius=" << radius << failureText(failure);
        return KernelResult::failure(KernelErrorKind::OperationFailed,
                                     "Fillet operation raised (radius too large?): " +
                                         failureText(failure).toStdString());
    }
}

KernelResult OcctGeometryKernel::sweep(const TopoDS_Face& face, const gp_Vec& direction) const {
    if (face.IsNull()) {
        return KernelResult::failure(KernelErrorKind::DegenerateFace, "Sweep face is null");
    }
    if (direction.Magnitude() <= linearTolerance_) {
        return KernelResult::failure(KernelErrorKind::ZeroVolumeTool, "Sweep distance too small");
    }

    try {
        BRepPrimAPI_MakePrism prism(face, direction, true);
        if (!prism.IsDone()) {
            return KernelResult::failure(KernelErrorKind::OperationFailed, "Prism construction failed");
        }
        if (auto error = validateSolid(prism.Shape())) {
            return KernelResult{TopoDS_Shape(), error};
        }
        return KernelResult::success(prism.Shape());
    } catch (const Standard_Failure& failure) {
        return KernelResult::failure(KernelErrorKind::OperationFailed,
                                     "Prism construction raised: " + failureText(failure).toStdString());
    }
}

double OcctGeometryKernel::volume(const TopoDS_Shape& shape) const {
    if (shape.IsNull()) {
        return 0.0;
    }
    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.Mass();
}

double OcctGeometryKernel::area(const TopoDS_Face& face) const {
    if (face.IsNull()) {
        return 0.0;
    }
    GProp_GProps props;
    BRepGProp::SurfaceProperties(face, props);
    return props.Mass();
}

gp_Pnt OcctGeometryKernel::centreOfMass(const TopoDS_Shape& shape) const {
    if (shape.IsNull()) {
        return gp_Pnt();
    }
    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.CentreOfMass();
}

bool OcctGeometryKernel::containsPoint(const TopoDS_Shape& solid, const gp_Pnt& point) const {
    if (solid.IsNull()) {
        return false;
    }
    BRepClass3d_SolidClassifier classifier(solid, point, linearTolerance_);
    return classifier.State() == TopAbs_IN;
}

std::optional<KernelError> OcctGeometryKernel::validateSolid(const TopoDS_Shape& shape) const {
    if (shape.IsNull()) {
        return KernelError{KernelErrorKind::EmptyResult, "Result shape is null"};
    }

    BRepCheck_Analyzer analyzer(shape);
    if (!analyzer.IsValid()) {
        return KernelError{KernelErrorKind::NonManifoldResult, "Result shape failed validity check"};
    }

    int solidCount = 0;
    for (TopExp_Explorer exp(shape, TopAbs_SOLID); exp.More(); exp.Next()) {
        ++solidCount;
    }
    if (solidCount == 0) {
        return KernelError{KernelErrorKind::EmptyResult, "Result contains no solid"};
    }

    if (volume(shape) <= core::joint::constants::kVolumeEpsilon) {
        return KernelError{KernelErrorKind::EmptyResult, "Result has zero volume"};
    }
    return std::nullopt;
}

} // namespace boxjoint::kernel
