/**
 * @file OcctGeometryKernel.h
 * @brief GeometryKernel backed by OpenCASCADE.
 */
#ifndef BOXJOINT_KERNEL_GEOMETRY_OCCTGEOMETRYKERNEL_H
#define BOXJOINT_KERNEL_GEOMETRY_OCCTGEOMETRYKERNEL_H

#include "GeometryKernel.h"

namespace boxjoint::kernel {

class OcctGeometryKernel : public GeometryKernel {
public:
    explicit OcctGeometryKernel(double linearTolerance = 1e-6);

    bool isPlanar(const TopoDS_Face& face) const override;
    std::optional<gp_Pln> outwardPlane(const TopoDS_Face& face) const override;
    OverlapResult coplanarOverlap(const TopoDS_Face& faceA,
                                  const TopoDS_Face& faceB) const override;

    KernelResult booleanSubtract(const TopoDS_Shape& body, const TopoDS_Shape& tool) const override;
    KernelResult booleanUnion(const TopoDS_Shape& body, const TopoDS_Shape& tool) const override;
    KernelResult booleanCommon(const TopoDS_Shape& body, const TopoDS_Shape& tool) const override;
    KernelResult fillet(const TopoDS_Shape& solid, const TopoDS_Edge& edge, double radius) const override;
    KernelResult sweep(const TopoDS_Face& face, const gp_Vec& direction) const override;

    double volume(const TopoDS_Shape& shape) const override;
    double area(const TopoDS_Face& face) const override;
    gp_Pnt centreOfMass(const TopoDS_Shape& shape) const override;
    bool containsPoint(const TopoDS_Shape& solid, const gp_Pnt& point) const override;

    double linearTolerance() const { return linearTolerance_; }

private:
    enum class BooleanKind { Cut, Fuse, Common };

    KernelResult runBoolean(BooleanKind kind, const TopoDS_Shape& body, const TopoDS_Shape& tool) const;

    /**
     * @brief Checks that @p shape is a valid solid with positive volume.
     */
    std::optional<KernelError> validateSolid(const TopoDS_Shape& shape) const;

    double linearTolerance_;
};

} // namespace boxjoint::kernel

#endif // BOXJOINT_KERNEL_GEOMETRY_OCCTGEOMETRYKERNEL_H
