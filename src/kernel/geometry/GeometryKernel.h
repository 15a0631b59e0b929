/**
 * @file GeometryKernel.h
 * @brief Capability interface over the boundary-representation kernel.
 *
 * The joint pipeline only talks to geometry through this interface. It holds
 * no state; every call works on shapes owned by the caller.
 */
#ifndef BOXJOINT_KERNEL_GEOMETRY_GEOMETRYKERNEL_H
#define BOXJOINT_KERNEL_GEOMETRY_GEOMETRYKERNEL_H

#include <TopoDS_Edge.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <gp_Pln.hxx>
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace boxjoint::kernel {

// ─────────────────────────────────────────────────────────────────────────────
// Result Types
// ─────────────────────────────────────────────────────────────────────────────

enum class KernelErrorKind {
    DegenerateFace,      // Input face is null, non-planar or has no area
    ZeroVolumeTool,      // Tool solid encloses no volume
    NonManifoldResult,   // Result failed validity checks
    EmptyResult,         // Result has no solid or no volume left
    OperationFailed      // Kernel reported failure or raised
};

const char* kernelErrorKindName(KernelErrorKind kind);

struct KernelError {
    KernelErrorKind kind = KernelErrorKind::OperationFailed;
    std::string message;
};

struct KernelResult {
    TopoDS_Shape shape;
    std::optional<KernelError> error;

    bool ok() const { return !error.has_value() && !shape.IsNull(); }

    static KernelResult success(const TopoDS_Shape& shape) { return KernelResult{shape, std::nullopt}; }
    static KernelResult failure(KernelErrorKind kind, std::string message) {
        return KernelResult{TopoDS_Shape(), KernelError{kind, std::move(message)}};
    }
};

/**
 * @brief One connected area where two coplanar faces coincide.
 */
struct OverlapPatch {
    TopoDS_Face face;
    std::vector<gp_Pnt> boundary;   // Outer wire vertices in order
    double area = 0.0;
    gp_Pnt centroid;
};

struct OverlapResult {
    std::vector<OverlapPatch> patches;
    std::optional<KernelError> error;
};

// ─────────────────────────────────────────────────────────────────────────────
// Kernel Interface
// ─────────────────────────────────────────────────────────────────────────────

class GeometryKernel {
public:
    virtual ~GeometryKernel() = default;

    virtual bool isPlanar(const TopoDS_Face& face) const = 0;

    /**
     * @brief Carrier plane of a planar face with its axis along the outward normal.
     */
    virtual std::optional<gp_Pln> outwardPlane(const TopoDS_Face& face) const = 0;

    /**
     * @brief Areas where two planar faces touch back to back.
     *
     * Faces must share a carrier plane and have opposite outward normals.
     * Returns one patch per connected area; no patches when the faces do not touch.
     */
    virtual OverlapResult coplanarOverlap(const TopoDS_Face& faceA,
                                          const TopoDS_Face& faceB) const = 0;

    virtual KernelResult booleanSubtract(const TopoDS_Shape& body, const TopoDS_Shape& tool) const = 0;
    virtual KernelResult booleanUnion(const TopoDS_Shape& body, const TopoDS_Shape& tool) const = 0;
    virtual KernelResult booleanCommon(const TopoDS_Shape& body, const TopoDS_Shape& tool) const = 0;

    /**
     * @brief Round one edge of @p solid with a constant radius.
     */
    virtual KernelResult fillet(const TopoDS_Shape& solid, const TopoDS_Edge& edge, double radius) const = 0;

    virtual KernelResult sweep(const TopoDS_Face& face, const gp_Vec& direction) const = 0;

    virtual double volume(const TopoDS_Shape& shape) const = 0;
    virtual double area(const TopoDS_Face& face) const = 0;
    virtual gp_Pnt centreOfMass(const TopoDS_Shape& shape) const = 0;
    virtual bool containsPoint(const TopoDS_Shape& solid, const gp_Pnt& point) const = 0;
};

} // namespace boxjoint::kernel

#endif // BOXJOINT_KERNEL_GEOMETRY_GEOMETRYKERNEL_H
