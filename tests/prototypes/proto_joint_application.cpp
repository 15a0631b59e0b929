/**
 * @file proto_joint_application.cpp
 * @brief Prototype tests for ToolSolidBuilder and JointApplier.
 *
 * Test cases:
 * 1. Tool pieces partition the joint volume
 * 2. Square fingers: exact volumes, valid solids, no overlap
 * 3. Rounded fingers conserve material
 * 4. A failing cut rolls both bodies back
 * 5. Independent regions applied on worker threads
 * 6. A failed region leaves earlier cuts on a shared body in place
 * 7. End margins stay uncut on the host
 */

#include "core/joint/ContactDetector.h"
#include "core/joint/FingerPatternSynthesizer.h"
#include "core/joint/JointApplier.h"
#include "core/joint/ToolSolidBuilder.h"
#include "kernel/geometry/OcctGeometryKernel.h"

#include <BRepCheck_Analyzer.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <TopExp.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>

#include <QCoreApplication>

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace boxjoint;
using namespace boxjoint::core::joint;

namespace {

const kernel::OcctGeometryKernel kKernel;

bool nearlyEqual(double a, double b, double tol = 1e-3) {
    return std::abs(a - b) <= tol;
}

bool shapeValid(const TopoDS_Shape& shape) {
    if (shape.IsNull()) return false;
    BRepCheck_Analyzer analyzer(shape);
    return analyzer.IsValid();
}

// Touching solids share no volume.
bool disjoint(const TopoDS_Shape& a, const TopoDS_Shape& b) {
    const kernel::KernelResult common = kKernel.booleanCommon(a, b);
    return !common.ok() || kKernel.volume(common.shape) < 1e-3;
}

TopoDS_Shape makeBox(double x, double y, double z, double dx, double dy, double dz) {
    return BRepPrimAPI_MakeBox(gp_Pnt(x, y, z), dx, dy, dz).Shape();
}

SelectedFace selectFace(const std::string& bodyId, const TopoDS_Shape& body,
                        const gp_Dir& normal, double offset) {
    TopTools_IndexedMapOfShape faces;
    TopExp::MapShapes(body, TopAbs_FACE, faces);
    for (int i = 1; i <= faces.Extent(); ++i) {
        const TopoDS_Face face = TopoDS::Face(faces(i));
        const auto plane = kKernel.outwardPlane(face);
        if (plane && plane->Axis().Direction().IsEqual(normal, 1e-6) &&
            std::abs(gp_Vec(plane->Location().XYZ()).Dot(gp_Vec(normal)) - offset) < 1e-6) {
            return SelectedFace{bodyId, bodyId + "/face/" + std::to_string(i - 1), face};
        }
    }
    assert(false && "face not found");
    return {};
}

/**
 * @brief Flat 100 x 50 x 6 board with a 100 x 6 x 50 board standing on its front edge.
 */
void addCorner(BodyShapes& bodies, std::vector<SelectedFace>& faces,
               const std::string& flatId, const std::string& standingId, double offsetX) {
    bodies[flatId] = makeBox(offsetX, 0.0, 0.0, 100.0, 50.0, 6.0);
    bodies[standingId] = makeBox(offsetX, 0.0, 6.0, 100.0, 6.0, 50.0);
    faces.push_back(selectFace(flatId, bodies[flatId], gp::DZ(), 6.0));
    faces.push_back(selectFace(standingId, bodies[standingId], -gp::DZ(), -6.0));
}

JointParameters squareParams() {
    JointParameters params;
    params.materialThickness = 6.0;
    params.targetFingerWidth = 10.0;
    params.toolRadius = 0.0;
    params.cornerFilletPolicy = CornerFilletPolicy::RoundNoneRequireManualFit;
    return params;
}

JointParameters roundedParams() {
    JointParameters params = squareParams();
    params.toolRadius = 1.5;
    params.cornerFilletPolicy = CornerFilletPolicy::RoundBoth;
    return params;
}

struct Prepared {
    BodyShapes bodies;
    std::vector<ContactRegion> regions;
    std::vector<FingerPattern> patterns;
};

Prepared prepare(const JointParameters& params, int cornerCount = 1) {
    Prepared prepared;
    std::vector<SelectedFace> faces;
    for (int i = 0; i < cornerCount; ++i) {
        addCorner(prepared.bodies, faces, "flat" + std::to_string(i), "standing" + std::to_string(i), 500.0 * i);
    }

    ContactDetector detector(kKernel);
    DetectionResult detection = detector.detect(faces, prepared.bodies, params);
    assert(detection.regions.size() == static_cast<std::size_t>(cornerCount));
    prepared.regions = std::move(detection.regions);

    FingerPatternSynthesizer synthesizer;
    for (std::size_t i = 0; i < prepared.regions.size(); ++i) {
        SynthesisResult synthesis = synthesizer.synthesize(prepared.regions[i], params, i);
        assert(synthesis.ok());
        prepared.patterns.push_back(std::move(*synthesis.pattern));
    }
    return prepared;
}

/**
 * @brief Fails the n-th subtraction; every other call goes to OCCT.
 */
class FailingSubtractKernel : public kernel::OcctGeometryKernel {
public:
    explicit FailingSubtractKernel(int failAt) : failAt_(failAt) {}

    kernel::KernelResult booleanSubtract(const TopoDS_Shape& body, const TopoDS_Shape& tool) const override {
        if (++calls_ == failAt_) {
            return kernel::KernelResult::failure(kernel::KernelErrorKind::OperationFailed, "injected failure");
        }
        return OcctGeometryKernel::booleanSubtract(body, tool);
    }

private:
    int failAt_;
    mutable std::atomic_int calls_{0};
};

} // namespace

void testToolPartition() {
    std::cout << "Test 1: Tool pieces partition the joint volume..." << std::flush;

    Prepared prepared = prepare(roundedParams());
    const ContactRegion& region = prepared.regions.front();
    const FingerPattern& pattern = prepared.patterns.front();

    ToolSolidBuilder builder(kKernel);
    const ToolSet tools = builder.build(region, pattern, prepared.bodies.at(region.hostBodyId()));
    assert(tools.ok());
    assert(nearlyEqual(kKernel.volume(tools.jointVolume), 100.0 * 6.0 * 6.0, 1e-2));

    double total = 0.0;
    std::size_t segmentPieces = 0;
    std::size_t reliefPieces = 0;
    for (const auto& piece : tools.pieces) {
        assert(shapeValid(piece.shape));
        total += kKernel.volume(piece.shape);
        if (piece.reliefIndex) {
            ++reliefPieces;
            // Material a tool of radius r cannot reach: r^2 (1 - pi/4) across 6mm.
            const double expected = 1.5 * 1.5 * (1.0 - M_PI / 4.0) * 6.0;
            assert(nearlyEqual(kKernel.volume(piece.shape), expected, 1e-2));
        } else {
            ++segmentPieces;
        }
    }
    assert(segmentPieces == pattern.segments.size());
    assert(reliefPieces == pattern.reliefs.size());
    assert(nearlyEqual(total, kKernel.volume(tools.jointVolume), 1e-2));

    // Neighbouring finger pieces only touch.
    assert(disjoint(tools.pieces[0].shape, tools.pieces[1].shape));

    std::cout << " PASS\n";
}

void testSquareFingers() {
    std::cout << "Test 2: Square fingers..." << std::flush;

    Prepared prepared = prepare(squareParams());
    const ContactRegion& region = prepared.regions.front();
    TopoDS_Shape flat = prepared.bodies.at("flat0");
    TopoDS_Shape standing = prepared.bodies.at("standing0");

    JointApplier applier(kKernel);
    const auto error = applier.applyRegion(region, prepared.patterns.front(), flat, standing);
    assert(!error.has_value());

    assert(shapeValid(flat));
    assert(shapeValid(standing));

    // Five 10 x 6 x 6 notches leave the flat board; the standing board gains the joint minus them.
    assert(nearlyEqual(kKernel.volume(flat), 30000.0 - 5.0 * 360.0, 1e-2));
    assert(nearlyEqual(kKernel.volume(standing), 30000.0 + 3600.0 - 5.0 * 360.0, 1e-2));
    assert(disjoint(flat, standing));

    std::cout << " PASS\n";
}

void testRoundedFingers() {
    std::cout << "Test 3: Rounded fingers conserve material..." << std::flush;

    Prepared prepared = prepare(roundedParams());
    TopoDS_Shape flat = prepared.bodies.at("flat0");
    TopoDS_Shape standing = prepared.bodies.at("standing0");
    const double before = kKernel.volume(flat) + kKernel.volume(standing);

    JointApplier applier(kKernel);
    const auto error = applier.applyRegion(prepared.regions.front(), prepared.patterns.front(), flat, standing);
    assert(!error.has_value());

    assert(shapeValid(flat));
    assert(shapeValid(standing));
    assert(nearlyEqual(kKernel.volume(flat) + kKernel.volume(standing), before, 1e-2));
    assert(disjoint(flat, standing));

    std::cout << " PASS\n";
}

void testRollbackOnFailure() {
    std::cout << "Test 4: Failed cut rolls back both bodies..." << std::flush;

    Prepared prepared = prepare(squareParams());
    const TopoDS_Shape originalFlat = prepared.bodies.at("flat0");
    const TopoDS_Shape originalStanding = prepared.bodies.at("standing0");
    TopoDS_Shape flat = originalFlat;
    TopoDS_Shape standing = originalStanding;

    FailingSubtractKernel failing(3);
    JointApplier applier(failing);
    const auto error = applier.applyRegion(prepared.regions.front(), prepared.patterns.front(), flat, standing);

    assert(error.has_value());
    assert(error->kind == JointErrorKind::BooleanFailure);
    assert(error->regionIndex == std::optional<std::size_t>(0));
    assert(flat.IsSame(originalFlat));
    assert(standing.IsSame(originalStanding));

    std::cout << " PASS\n";
}

void testParallelRegions() {
    std::cout << "Test 5: Independent regions on worker threads..." << std::flush;

    Prepared prepared = prepare(squareParams(), 2);
    std::vector<RegionJob> jobs;
    for (std::size_t i = 0; i < prepared.patterns.size(); ++i) {
        jobs.push_back(RegionJob{&prepared.regions[i], &prepared.patterns[i]});
    }

    // A job naming a body that is not in the snapshot.
    ContactRegion orphan = prepared.regions.front();
    orphan.bodyB = "missing";
    FingerPattern orphanPattern = prepared.patterns.front();
    orphanPattern.regionIndex = 7;
    jobs.push_back(RegionJob{&orphan, &orphanPattern});

    BodyShapes bodies = prepared.bodies;
    JointApplier applier(kKernel);
    const ApplyResult result = applier.applyAll(jobs, bodies, 2);

    assert(result.appliedRegions.size() == 2);
    assert(result.appliedRegions[0] == 0);
    assert(result.appliedRegions[1] == 1);
    assert(result.failures.size() == 1);
    assert(result.failures[0].kind == JointErrorKind::InvalidSelection);
    assert(result.failures[0].regionIndex == std::optional<std::size_t>(7));

    for (const auto& id : {"flat0", "flat1"}) {
        assert(nearlyEqual(kKernel.volume(bodies.at(id)), 28200.0, 1e-2));
    }
    for (const auto& id : {"standing0", "standing1"}) {
        assert(nearlyEqual(kKernel.volume(bodies.at(id)), 31800.0, 1e-2));
    }
    assert(bodies.find("missing") == bodies.end());

    std::cout << " PASS\n";
}

void testSharedBodyFailure() {
    std::cout << "Test 6: Failed region on a shared body..." << std::flush;

    // One flat board carries a standing board on its front and back edges.
    BodyShapes bodies;
    bodies["flat"] = makeBox(0.0, 0.0, 0.0, 100.0, 50.0, 6.0);
    bodies["standingFront"] = makeBox(0.0, 0.0, 6.0, 100.0, 6.0, 50.0);
    bodies["standingBack"] = makeBox(0.0, 44.0, 6.0, 100.0, 6.0, 50.0);
    const std::vector<SelectedFace> faces = {
        selectFace("flat", bodies["flat"], gp::DZ(), 6.0),
        selectFace("standingFront", bodies["standingFront"], -gp::DZ(), -6.0),
        selectFace("standingBack", bodies["standingBack"], -gp::DZ(), -6.0)};

    const JointParameters params = squareParams();
    ContactDetector detector(kKernel);
    const DetectionResult detection = detector.detect(faces, bodies, params);
    assert(detection.regions.size() == 2);

    FingerPatternSynthesizer synthesizer;
    std::vector<FingerPattern> patterns;
    std::vector<RegionJob> jobs;
    for (std::size_t i = 0; i < detection.regions.size(); ++i) {
        assert(detection.regions[i].hostBodyId() == "flat");
        SynthesisResult synthesis = synthesizer.synthesize(detection.regions[i], params, i);
        assert(synthesis.ok());
        assert(synthesis.pattern->segments.size() == 10);
        patterns.push_back(std::move(*synthesis.pattern));
    }
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        jobs.push_back(RegionJob{&detection.regions[i], &patterns[i]});
    }

    const std::string firstMating = detection.regions[0].matingBodyId();
    const std::string secondMating = detection.regions[1].matingBodyId();
    const TopoDS_Shape originalSecond = bodies.at(secondMating);

    // Ten cuts per square region: the eleventh is the second region's first.
    FailingSubtractKernel failing(11);
    JointApplier applier(failing);
    const ApplyResult result = applier.applyAll(jobs, bodies, 2);

    assert(result.appliedRegions.size() == 1);
    assert(result.appliedRegions[0] == 0);
    assert(result.failures.size() == 1);
    assert(result.failures[0].kind == JointErrorKind::BooleanFailure);
    assert(result.failures[0].regionIndex == std::optional<std::size_t>(1));

    assert(shapeValid(bodies.at("flat")));
    assert(nearlyEqual(kKernel.volume(bodies.at("flat")), 30000.0 - 5.0 * 360.0, 1e-2));
    assert(nearlyEqual(kKernel.volume(bodies.at(firstMating)), 30000.0 + 5.0 * 360.0, 1e-2));
    assert(bodies.at(secondMating).IsSame(originalSecond));

    std::cout << " PASS\n";
}

void testEndMargins() {
    std::cout << "Test 7: End margins stay on the host..." << std::flush;

    JointParameters params = squareParams();
    params.margin = 10.0;
    Prepared prepared = prepare(params);
    TopoDS_Shape flat = prepared.bodies.at("flat0");
    TopoDS_Shape standing = prepared.bodies.at("standing0");

    JointApplier applier(kKernel);
    const auto error = applier.applyRegion(prepared.regions.front(), prepared.patterns.front(), flat, standing);
    assert(!error.has_value());

    assert(shapeValid(flat));
    assert(shapeValid(standing));
    // Eight 10mm fingers between the margins: four notches leave the flat board.
    assert(nearlyEqual(kKernel.volume(flat), 30000.0 - 4.0 * 360.0, 1e-2));
    assert(nearlyEqual(kKernel.volume(standing), 30000.0 + 4.0 * 360.0, 1e-2));
    assert(disjoint(flat, standing));

    // The strip past the last finger belongs to the flat board.
    assert(kKernel.containsPoint(flat, gp_Pnt(95.0, 3.0, 3.0)));
    assert(!kKernel.containsPoint(standing, gp_Pnt(95.0, 3.0, 3.0)));
    assert(kKernel.containsPoint(standing, gp_Pnt(85.0, 3.0, 3.0)));

    std::cout << " PASS\n";
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    std::cout << "\n=== Joint Application Prototype Tests ===\n\n";

    testToolPartition();
    testSquareFingers();
    testRoundedFingers();
    testRollbackOnFailure();
    testParallelRegions();
    testSharedBodyFailure();
    testEndMargins();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
