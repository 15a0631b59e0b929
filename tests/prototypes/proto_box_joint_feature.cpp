/**
 * @file proto_box_joint_feature.cpp
 * @brief Prototype tests for the BoxJointFeature state machine.
 *
 * Test cases:
 * 1. Unconfigured -> Computed
 * 2. Recompute is idempotent
 * 3. Failed recompute keeps the last committed outputs
 * 4. A failing region leaves other regions applied
 * 5. Every region failing fails the feature
 * 6. Reentrant recompute is refused
 * 7. Release is terminal
 * 8. No contact and unresolved selections
 * 9. Upstream change marks the feature dirty
 */

#include "app/feature/BoxJointFeature.h"
#include "kernel/elementmap/ElementMap.h"
#include "kernel/geometry/OcctGeometryKernel.h"

#include <BRepBndLib.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <Bnd_Box.hxx>
#include <TopExp.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>

#include <QCoreApplication>

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

using namespace boxjoint;
using namespace boxjoint::app;
using namespace boxjoint::core::joint;

namespace {

bool nearlyEqual(double a, double b, double tol = 1e-2) {
    return std::abs(a - b) <= tol;
}

TopoDS_Shape makeBox(double x, double y, double z, double dx, double dy, double dz) {
    return BRepPrimAPI_MakeBox(gp_Pnt(x, y, z), dx, dy, dz).Shape();
}

/**
 * @brief Index-based face reference for the planar face with the given outward normal.
 */
FaceRef faceRef(const std::string& bodyId, const TopoDS_Shape& body, const gp_Dir& normal) {
    const kernel::OcctGeometryKernel occt;
    TopTools_IndexedMapOfShape faces;
    TopExp::MapShapes(body, TopAbs_FACE, faces);
    for (int i = 1; i <= faces.Extent(); ++i) {
        const auto plane = occt.outwardPlane(TopoDS::Face(faces(i)));
        if (plane && plane->Axis().Direction().IsEqual(normal, 1e-6)) {
            return FaceRef{bodyId, kernel::elementmap::ElementMap::makeFaceId(bodyId, i - 1).value};
        }
    }
    assert(false && "face not found");
    return {};
}

/**
 * @brief Flat board and a board standing on its front edge, shifted along X.
 */
void addCorner(UpstreamSnapshot& snapshot, std::vector<FaceRef>& faces,
               const std::string& flatId, const std::string& standingId,
               double offsetX, double lift = 0.0) {
    snapshot.bodies[flatId] = makeBox(offsetX, 0.0, 0.0, 100.0, 50.0, 6.0);
    snapshot.bodies[standingId] = makeBox(offsetX, 0.0, 6.0 + lift, 100.0, 6.0, 50.0);
    // Top of the flat board; bottom of the standing one.
    faces.push_back(faceRef(flatId, snapshot.bodies[flatId], gp::DZ()));
    faces.push_back(faceRef(standingId, snapshot.bodies[standingId], -gp::DZ()));
}

JointParameters squareParams() {
    JointParameters params;
    params.materialThickness = 6.0;
    params.targetFingerWidth = 10.0;
    params.toolRadius = 0.0;
    params.cornerFilletPolicy = CornerFilletPolicy::RoundNoneRequireManualFit;
    return params;
}

/**
 * @brief Refuses every subtraction whose tool lies right of @p limitX.
 */
class RegionFailingKernel : public kernel::OcctGeometryKernel {
public:
    explicit RegionFailingKernel(double limitX) : limitX_(limitX) {}

    kernel::KernelResult booleanSubtract(const TopoDS_Shape& body, const TopoDS_Shape& tool) const override {
        Bnd_Box box;
        BRepBndLib::Add(tool, box);
        double xMin, yMin, zMin, xMax, yMax, zMax;
        box.Get(xMin, yMin, zMin, xMax, yMax, zMax);
        if (0.5 * (xMin + xMax) > limitX_) {
            return kernel::KernelResult::failure(kernel::KernelErrorKind::OperationFailed, "injected failure");
        }
        return OcctGeometryKernel::booleanSubtract(body, tool);
    }

private:
    double limitX_;
};

/**
 * @brief Calls back into the feature from inside a recompute.
 */
class ReentrantKernel : public kernel::OcctGeometryKernel {
public:
    bool isPlanar(const TopoDS_Face& face) const override {
        if (feature && snapshot && !innerOutcome) {
            innerOutcome = feature->recompute(*snapshot);
        }
        return OcctGeometryKernel::isPlanar(face);
    }

    mutable BoxJointFeature* feature = nullptr;
    mutable const UpstreamSnapshot* snapshot = nullptr;
    mutable std::optional<RecomputeOutcome> innerOutcome;
};

} // namespace

void testStateTransitions() {
    std::cout << "Test 1: Unconfigured -> Computed..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    BoxJointFeature feature("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    assert(feature.state() == FeatureState::Unconfigured);
    assert(feature.needsRecompute());

    const RecomputeOutcome early = feature.recompute(snapshot);
    assert(early.accepted);
    assert(!early.success);
    assert(early.error->kind == JointErrorKind::InvalidSelection);
    assert(feature.state() == FeatureState::Unconfigured);

    assert(feature.configure(faces, squareParams()));
    assert(feature.isConfigured());

    const RecomputeOutcome outcome = feature.recompute(snapshot);
    assert(outcome.accepted && outcome.success);
    assert(feature.state() == FeatureState::Computed);
    assert(!feature.needsRecompute());
    assert(feature.regions().size() == 1);
    assert(feature.patterns().size() == 1);
    assert(outcome.appliedRegions.size() == 1);
    assert(feature.outputs().size() == 2);
    assert(nearlyEqual(kernel::OcctGeometryKernel().volume(feature.outputs().at("boardA")), 28200.0));
    assert(nearlyEqual(kernel::OcctGeometryKernel().volume(feature.outputs().at("boardB")), 31800.0));

    // Upstream shapes are never touched.
    assert(nearlyEqual(kernel::OcctGeometryKernel().volume(snapshot.bodies.at("boardA")), 30000.0));

    std::cout << " PASS\n";
}

void testIdempotentRecompute() {
    std::cout << "Test 2: Recompute is idempotent..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);
    const kernel::OcctGeometryKernel occt;

    BoxJointFeature feature("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    feature.configure(faces, squareParams());

    assert(feature.recompute(snapshot).success);
    const double firstA = occt.volume(feature.outputs().at("boardA"));
    const double firstB = occt.volume(feature.outputs().at("boardB"));

    assert(feature.recompute(snapshot).success);
    assert(feature.state() == FeatureState::Computed);
    assert(nearlyEqual(occt.volume(feature.outputs().at("boardA")), firstA, 1e-6));
    assert(nearlyEqual(occt.volume(feature.outputs().at("boardB")), firstB, 1e-6));

    std::cout << " PASS\n";
}

void testFailureKeepsOutputs() {
    std::cout << "Test 3: Failure keeps committed outputs..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    BoxJointFeature feature("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    feature.configure(faces, squareParams());
    assert(feature.recompute(snapshot).success);
    const TopoDS_Shape committedA = feature.outputs().at("boardA");

    JointParameters broken = squareParams();
    broken.materialThickness = 0.0;
    assert(feature.setParameters(broken));
    assert(feature.needsRecompute());

    const RecomputeOutcome failed = feature.recompute(snapshot);
    assert(failed.accepted && !failed.success);
    assert(failed.error->kind == JointErrorKind::ParameterConflict);
    assert(feature.state() == FeatureState::Failed);
    assert(feature.lastError()->kind == JointErrorKind::ParameterConflict);
    assert(feature.outputs().at("boardA").IsSame(committedA));

    // Fixing the parameter recovers.
    assert(feature.setParameters(squareParams()));
    assert(feature.recompute(snapshot).success);
    assert(feature.state() == FeatureState::Computed);
    assert(!feature.lastError().has_value());

    std::cout << " PASS\n";
}

void testRegionContainment() {
    std::cout << "Test 4: Failing region is contained..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "p1a", "p1b", 0.0);
    addCorner(snapshot, faces, "p2a", "p2b", 500.0);
    addCorner(snapshot, faces, "p3a", "p3b", 1000.0);

    BoxJointFeature feature("joint-1", std::make_shared<RegionFailingKernel>(900.0));
    feature.configure(faces, squareParams());
    feature.setRegionThreads(2);

    const RecomputeOutcome outcome = feature.recompute(snapshot);
    assert(outcome.success);
    assert(feature.state() == FeatureState::Computed);
    assert(outcome.appliedRegions.size() == 2);
    assert(outcome.appliedRegions[0] == 0);
    assert(outcome.appliedRegions[1] == 1);

    bool sawFailure = false;
    for (const auto& warning : outcome.warnings) {
        if (warning.kind == JointErrorKind::BooleanFailure) {
            assert(warning.regionIndex == std::optional<std::size_t>(2));
            sawFailure = true;
        }
    }
    assert(sawFailure);

    // The failing pair keeps its upstream shapes.
    assert(feature.outputs().at("p3a").IsSame(snapshot.bodies.at("p3a")));
    assert(feature.outputs().at("p3b").IsSame(snapshot.bodies.at("p3b")));
    assert(!feature.outputs().at("p1a").IsSame(snapshot.bodies.at("p1a")));

    std::cout << " PASS\n";
}

void testAllRegionsFail() {
    std::cout << "Test 5: Every region failing..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    BoxJointFeature feature("joint-1", std::make_shared<RegionFailingKernel>(-1000.0));
    feature.configure(faces, squareParams());

    const RecomputeOutcome outcome = feature.recompute(snapshot);
    assert(outcome.accepted && !outcome.success);
    assert(outcome.error->kind == JointErrorKind::BooleanFailure);
    assert(feature.state() == FeatureState::Failed);
    assert(feature.outputs().empty());

    std::cout << " PASS\n";
}

void testReentrantRecompute() {
    std::cout << "Test 6: Reentrant recompute is refused..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    auto kernel = std::make_shared<ReentrantKernel>();
    BoxJointFeature feature("joint-1", kernel);
    feature.configure(faces, squareParams());
    kernel->feature = &feature;
    kernel->snapshot = &snapshot;

    const RecomputeOutcome outer = feature.recompute(snapshot);
    assert(kernel->innerOutcome.has_value());
    assert(!kernel->innerOutcome->accepted);
    assert(!kernel->innerOutcome->success);
    assert(outer.accepted && outer.success);
    assert(feature.state() == FeatureState::Computed);

    std::cout << " PASS\n";
}

void testRelease() {
    std::cout << "Test 7: Release is terminal..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    BoxJointFeature feature("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    feature.configure(faces, squareParams());
    assert(feature.recompute(snapshot).success);

    feature.release();
    assert(feature.state() == FeatureState::Deleted);
    assert(feature.outputs().empty());
    assert(feature.regions().empty());

    const RecomputeOutcome after = feature.recompute(snapshot);
    assert(!after.accepted);
    assert(!feature.configure(faces, squareParams()));
    assert(!feature.setParameters(squareParams()));
    assert(feature.state() == FeatureState::Deleted);

    std::cout << " PASS\n";
}

void testNoContactAndUnresolved() {
    std::cout << "Test 8: No contact and unresolved faces..." << std::flush;

    UpstreamSnapshot lifted;
    std::vector<FaceRef> liftedFaces;
    addCorner(lifted, liftedFaces, "boardA", "boardB", 0.0, 2.0);

    BoxJointFeature apart("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    apart.configure(liftedFaces, squareParams());
    const RecomputeOutcome noContact = apart.recompute(lifted);
    assert(!noContact.success);
    assert(noContact.error->kind == JointErrorKind::NoContactFound);
    assert(apart.state() == FeatureState::Failed);

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);
    faces[1].faceId = "boardB/face/99";

    BoxJointFeature stale("joint-2", std::make_shared<kernel::OcctGeometryKernel>());
    stale.configure(faces, squareParams());
    const RecomputeOutcome unresolved = stale.recompute(snapshot);
    assert(!unresolved.success);
    assert(unresolved.error->kind == JointErrorKind::InvalidSelection);

    // A selected body missing from the snapshot.
    faces[1] = FaceRef{"boardC", "boardC/face/0"};
    assert(stale.setSelections(faces));
    const RecomputeOutcome missing = stale.recompute(snapshot);
    assert(missing.error->kind == JointErrorKind::InvalidSelection);

    std::cout << " PASS\n";
}

void testUpstreamChange() {
    std::cout << "Test 9: Upstream change marks dirty..." << std::flush;

    UpstreamSnapshot snapshot;
    std::vector<FaceRef> faces;
    addCorner(snapshot, faces, "boardA", "boardB", 0.0);

    BoxJointFeature feature("joint-1", std::make_shared<kernel::OcctGeometryKernel>());
    feature.configure(faces, squareParams());
    assert(feature.recompute(snapshot).success);
    assert(!feature.needsRecompute());

    feature.markUpstreamChanged();
    assert(feature.needsRecompute());

    // Unchanged parameters on a clean feature do not dirty it.
    assert(feature.recompute(snapshot).success);
    assert(feature.setParameters(squareParams()));
    assert(!feature.needsRecompute());

    std::cout << " PASS\n";
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    std::cout << "\n=== BoxJointFeature Prototype Tests ===\n\n";

    testStateTransitions();
    testIdempotentRecompute();
    testFailureKeepsOutputs();
    testRegionContainment();
    testAllRegionsFail();
    testReentrantRecompute();
    testRelease();
    testNoContactAndUnresolved();
    testUpstreamChange();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
