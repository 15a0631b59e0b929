/**
 * @file proto_pattern_synthesis.cpp
 * @brief Prototype tests for FingerPatternSynthesizer.
 *
 * Test cases:
 * 1. 100mm contact, 10mm fingers, 1.5mm tool: ten alternating segments
 * 2. Short contact below two minimum features is degenerate
 * 3. Parameter conflicts are reported with the region index
 * 4. Explicit finger count overrides the target width
 * 5. Count rounding and the two-segment floor
 * 6. Relief placement and keepers
 * 7. Host material past the ends adds end reliefs
 * 8. No reliefs without a tool radius or with manual fit
 * 9. Finger ratio gives bodyA and bodyB fingers different widths
 * 10. Margins stay with the host at both ends
 * 11. Count and width bounds, symmetric ends
 */

#include "core/joint/FingerPatternSynthesizer.h"

#include <QCoreApplication>

#include <cassert>
#include <cmath>
#include <iostream>

using namespace boxjoint;
using namespace boxjoint::core::joint;

namespace {

bool nearlyEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

ContactRegion makeRegion(double length, double width) {
    ContactRegion region;
    region.bodyA = "boardA";
    region.bodyB = "boardB";
    region.faceA = "boardA/face/5";
    region.faceB = "boardB/face/4";
    region.length = length;
    region.width = width;
    region.hostSide = JointSide::BodyA;
    region.hostWallAtMinY = true;
    return region;
}

JointParameters makeParams(double thickness, double fingerWidth, double toolRadius) {
    JointParameters params;
    params.materialThickness = thickness;
    params.targetFingerWidth = fingerWidth;
    params.toolRadius = toolRadius;
    params.cornerFilletPolicy = CornerFilletPolicy::RoundBoth;
    params.minimumFeatureSize = 1.0;
    return params;
}

std::size_t countReliefs(const FingerPattern& pattern, ReliefKind kind) {
    std::size_t count = 0;
    for (const auto& relief : pattern.reliefs) {
        if (relief.kind == kind) {
            ++count;
        }
    }
    return count;
}

} // namespace

void testStandardLayout() {
    std::cout << "Test 1: Standard 100mm layout..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const ContactRegion region = makeRegion(100.0, 6.0);
    const SynthesisResult result = synthesizer.synthesize(region, makeParams(6.0, 10.0, 1.5), 0);

    assert(result.ok());
    const FingerPattern& pattern = *result.pattern;
    assert(pattern.segments.size() == 10);
    assert(pattern.fingerCount(JointSide::BodyA) == 5);
    assert(pattern.fingerCount(JointSide::BodyB) == 5);
    assert(nearlyEqual(pattern.depth, 6.0));
    assert(nearlyEqual(pattern.toolRadius, 1.5));

    // Segments tile [0, length] with alternating owners.
    double cursor = 0.0;
    for (std::size_t i = 0; i < pattern.segments.size(); ++i) {
        const FingerSegment& segment = pattern.segments[i];
        assert(nearlyEqual(segment.start, cursor));
        assert(nearlyEqual(segment.width(), 10.0, 1e-9));
        assert(segment.owner == (i % 2 == 0 ? JointSide::BodyA : JointSide::BodyB));
        cursor = segment.end;
    }
    assert(pattern.segments.back().end == 100.0);

    // Same input, same pattern.
    const SynthesisResult again = synthesizer.synthesize(region, makeParams(6.0, 10.0, 1.5), 0);
    assert(again.ok());
    assert(again.pattern->segments.size() == pattern.segments.size());
    assert(again.pattern->reliefs.size() == pattern.reliefs.size());
    for (std::size_t i = 0; i < pattern.segments.size(); ++i) {
        assert(again.pattern->segments[i].start == pattern.segments[i].start);
        assert(again.pattern->segments[i].end == pattern.segments[i].end);
    }

    std::cout << " PASS\n";
}

void testDegenerateRegion() {
    std::cout << "Test 2: Contact shorter than two minimum features..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    JointParameters params = makeParams(6.0, 10.0, 1.5);
    params.minimumFeatureSize = 5.0;

    const SynthesisResult result = synthesizer.synthesize(makeRegion(7.0, 6.0), params, 3);
    assert(!result.ok());
    assert(!result.pattern.has_value());
    assert(result.error->kind == JointErrorKind::DegenerateRegion);
    assert(result.error->regionIndex == std::optional<std::size_t>(3));

    std::cout << " PASS\n";
}

void testParameterConflicts() {
    std::cout << "Test 3: Parameter conflicts..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const ContactRegion region = makeRegion(100.0, 6.0);

    auto expectConflict = [&](const JointParameters& params) {
        const SynthesisResult result = synthesizer.synthesize(region, params, 2);
        assert(!result.ok());
        assert(result.error->kind == JointErrorKind::ParameterConflict);
        assert(result.error->regionIndex == std::optional<std::size_t>(2));
    };

    // Zero thickness
    expectConflict(makeParams(0.0, 10.0, 1.5));

    // Finger wider than the contact
    expectConflict(makeParams(6.0, 150.0, 1.5));

    // Single segment
    JointParameters single = makeParams(6.0, 10.0, 1.5);
    single.fingerCount = 1;
    expectConflict(single);

    // Segments narrower than the minimum feature
    JointParameters crowded = makeParams(6.0, 10.0, 0.0);
    crowded.fingerCount = 200;
    expectConflict(crowded);

    // Two tool radii do not fit in one segment
    expectConflict(makeParams(6.0, 10.0, 6.0));

    // Tool radius deeper than the material
    expectConflict(makeParams(3.0, 10.0, 4.0));

    // Region-independent checks carry no index
    const auto direct = synthesizer.validate(makeParams(-1.0, 10.0, 0.0));
    assert(direct.has_value());
    assert(direct->kind == JointErrorKind::ParameterConflict);
    assert(!direct->regionIndex.has_value());
    assert(!synthesizer.validate(makeParams(6.0, 10.0, 1.5)).has_value());

    std::cout << " PASS\n";
}

void testExplicitFingerCount() {
    std::cout << "Test 4: Explicit finger count..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    JointParameters params = makeParams(6.0, 10.0, 0.0);
    params.fingerCount = 4;

    const SynthesisResult result = synthesizer.synthesize(makeRegion(90.0, 6.0), params, 0);
    assert(result.ok());
    assert(result.pattern->segments.size() == 4);
    for (const auto& segment : result.pattern->segments) {
        assert(nearlyEqual(segment.width(), 22.5));
    }
    assert(result.pattern->fingerCount(JointSide::BodyA) == 2);
    assert(result.pattern->fingerCount(JointSide::BodyB) == 2);

    std::cout << " PASS\n";
}

void testCountRounding() {
    std::cout << "Test 5: Count rounding..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const JointParameters params = makeParams(6.0, 10.0, 0.0);

    const SynthesisResult halfway = synthesizer.synthesize(makeRegion(95.0, 6.0), params, 0);
    assert(halfway.ok());
    assert(halfway.pattern->segments.size() == 10);
    assert(nearlyEqual(halfway.pattern->segments.front().width(), 9.5));

    const SynthesisResult shortContact = synthesizer.synthesize(makeRegion(14.0, 6.0), params, 0);
    assert(shortContact.ok());
    assert(shortContact.pattern->segments.size() == 2);
    assert(nearlyEqual(shortContact.pattern->segments.front().width(), 7.0));

    std::cout << " PASS\n";
}

void testReliefPlacement() {
    std::cout << "Test 6: Relief placement..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const SynthesisResult result = synthesizer.synthesize(makeRegion(100.0, 6.0), makeParams(6.0, 10.0, 1.5), 0);
    assert(result.ok());
    const FingerPattern& pattern = *result.pattern;

    // Nine internal boundaries, one wall on the host.
    assert(countReliefs(pattern, ReliefKind::MatingFace) == 9);
    assert(countReliefs(pattern, ReliefKind::HostWallMinY) == 9);
    assert(countReliefs(pattern, ReliefKind::HostWallMaxY) == 0);

    for (const auto& relief : pattern.reliefs) {
        assert(nearlyEqual(relief.radius, 1.5));
        const FingerSegment& into = pattern.segments[relief.intoSegment];
        assert(relief.boundary > 0.0 && relief.boundary < 100.0);
        assert(nearlyEqual(relief.boundary, into.start) || nearlyEqual(relief.boundary, into.end));

        // The relief extends into its segment from the boundary.
        const double inside = relief.boundary + relief.direction * 0.5 * relief.radius;
        assert(inside > into.start && inside < into.end);

        if (relief.kind == ReliefKind::MatingFace) {
            // Kept by the mating board, carved out of a host finger.
            assert(relief.keeper == JointSide::BodyB);
            assert(into.owner == JointSide::BodyA);
        } else {
            assert(relief.keeper == JointSide::BodyA);
            assert(into.owner == JointSide::BodyB);
        }
    }

    std::cout << " PASS\n";
}

void testEndReliefs() {
    std::cout << "Test 7: End reliefs where the host continues..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    ContactRegion region = makeRegion(40.0, 6.0);
    region.hostSide = JointSide::BodyB;
    region.hostWallAtMinY = true;
    region.hostWallAtMaxY = true;
    region.hostExtendsBeforeStart = true;
    region.hostExtendsAfterEnd = true;

    JointParameters params = makeParams(6.0, 10.0, 1.0);
    params.fingerCount = 4;

    const SynthesisResult result = synthesizer.synthesize(region, params, 0);
    assert(result.ok());
    const FingerPattern& pattern = *result.pattern;

    // Three internal boundaries with a mating relief and two wall reliefs each,
    // plus both walls at the start where the first segment belongs to the mating body.
    assert(pattern.reliefs.size() == 11);
    assert(countReliefs(pattern, ReliefKind::MatingFace) == 3);
    assert(countReliefs(pattern, ReliefKind::HostWallMinY) == 4);
    assert(countReliefs(pattern, ReliefKind::HostWallMaxY) == 4);

    std::size_t startReliefs = 0;
    for (const auto& relief : pattern.reliefs) {
        if (relief.boundary == 0.0) {
            ++startReliefs;
            assert(relief.direction == 1);
            assert(relief.intoSegment == 0);
            assert(relief.keeper == JointSide::BodyB);
        }
        assert(relief.boundary != 40.0);
    }
    assert(startReliefs == 2);

    std::cout << " PASS\n";
}

void testNoReliefs() {
    std::cout << "Test 8: No reliefs without rounding..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const ContactRegion region = makeRegion(100.0, 6.0);

    JointParameters manual = makeParams(6.0, 10.0, 1.5);
    manual.cornerFilletPolicy = CornerFilletPolicy::RoundNoneRequireManualFit;
    const SynthesisResult manualResult = synthesizer.synthesize(region, manual, 0);
    assert(manualResult.ok());
    assert(manualResult.pattern->reliefs.empty());
    assert(manualResult.pattern->toolRadius == 0.0);
    assert(manualResult.pattern->policy == CornerFilletPolicy::RoundNoneRequireManualFit);

    // A huge radius is no conflict when nothing gets rounded.
    manual.toolRadius = 50.0;
    assert(synthesizer.synthesize(region, manual, 0).ok());

    const SynthesisResult sharp = synthesizer.synthesize(region, makeParams(6.0, 10.0, 0.0), 0);
    assert(sharp.ok());
    assert(sharp.pattern->reliefs.empty());

    std::cout << " PASS\n";
}

void testFingerRatio() {
    std::cout << "Test 9: Finger ratio..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    JointParameters params = makeParams(6.0, 10.0, 0.0);
    params.fingerCount = 5;
    params.fingerRatio = 0.25;

    const SynthesisResult result = synthesizer.synthesize(makeRegion(100.0, 6.0), params, 0);
    assert(result.ok());
    const FingerPattern& pattern = *result.pattern;
    assert(pattern.segments.size() == 5);

    // Three A fingers and two B fingers, each B a third of an A.
    double cursor = 0.0;
    for (const auto& segment : pattern.segments) {
        assert(nearlyEqual(segment.start, cursor));
        const double expected = segment.owner == JointSide::BodyA ? 300.0 / 11.0 : 100.0 / 11.0;
        assert(nearlyEqual(segment.width(), expected, 1e-9));
        cursor = segment.end;
    }
    assert(pattern.segments.back().end == 100.0);

    JointParameters none = params;
    none.fingerRatio = 0.0;
    assert(synthesizer.validate(none).has_value());
    none.fingerRatio = 1.0;
    assert(synthesizer.validate(none).has_value());

    std::cout << " PASS\n";
}

void testMargins() {
    std::cout << "Test 10: Margins..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    JointParameters params = makeParams(6.0, 10.0, 0.0);
    params.margin = 10.0;

    // Host A: the first A finger absorbs the leading strip; the trailing
    // strip stands alone after the last B finger.
    const SynthesisResult hostA = synthesizer.synthesize(makeRegion(100.0, 6.0), params, 0);
    assert(hostA.ok());
    const FingerPattern& a = *hostA.pattern;
    assert(nearlyEqual(a.margin, 10.0));
    assert(a.segments.size() == 9);
    assert(a.segments.front().owner == JointSide::BodyA);
    assert(!a.segments.front().margin);
    assert(nearlyEqual(a.segments.front().width(), 20.0));
    assert(a.segments.back().owner == JointSide::BodyA);
    assert(a.segments.back().margin);
    assert(nearlyEqual(a.segments.back().start, 90.0));
    assert(a.segments.back().end == 100.0);
    assert(a.fingerCount(JointSide::BodyA) == 4);
    assert(a.fingerCount(JointSide::BodyB) == 4);
    for (std::size_t i = 0; i + 1 < a.segments.size(); ++i) {
        assert(a.segments[i].owner != a.segments[i + 1].owner);
        assert(a.segments[i].end == a.segments[i + 1].start);
    }

    // Host B: the leading strip stands alone, the trailing one merges.
    ContactRegion regionB = makeRegion(100.0, 6.0);
    regionB.hostSide = JointSide::BodyB;
    const SynthesisResult hostB = synthesizer.synthesize(regionB, params, 0);
    assert(hostB.ok());
    assert(hostB.pattern->segments.size() == 9);
    assert(hostB.pattern->segments.front().margin);
    assert(hostB.pattern->segments.front().owner == JointSide::BodyB);
    assert(nearlyEqual(hostB.pattern->segments.back().width(), 20.0));
    assert(hostB.pattern->fingerCount(JointSide::BodyB) == 4);

    // The tool rounds the corner where the last B finger meets the strip.
    JointParameters rounded = makeParams(6.0, 10.0, 1.5);
    rounded.margin = 10.0;
    const SynthesisResult roundedResult = synthesizer.synthesize(makeRegion(100.0, 6.0), rounded, 0);
    assert(roundedResult.ok());
    const FingerPattern& r = *roundedResult.pattern;
    assert(countReliefs(r, ReliefKind::MatingFace) == 8);
    bool stripRelief = false;
    for (const auto& relief : r.reliefs) {
        if (relief.kind == ReliefKind::MatingFace && relief.intoSegment == r.segments.size() - 1) {
            assert(nearlyEqual(relief.boundary, 90.0));
            assert(relief.direction == 1);
            stripRelief = true;
        }
    }
    assert(stripRelief);

    // A loose strip narrower than the minimum feature or the tool radius conflicts.
    JointParameters sliver = makeParams(6.0, 10.0, 0.0);
    sliver.margin = 0.5;
    const SynthesisResult sliverResult = synthesizer.synthesize(regionB, sliver, 1);
    assert(sliverResult.error->kind == JointErrorKind::ParameterConflict);

    JointParameters tight = makeParams(6.0, 10.0, 1.5);
    tight.margin = 1.0;
    const SynthesisResult tightResult = synthesizer.synthesize(regionB, tight, 1);
    assert(tightResult.error->kind == JointErrorKind::ParameterConflict);

    // Margins that swallow the contact leave a degenerate region.
    JointParameters wide = makeParams(6.0, 10.0, 0.0);
    wide.margin = 49.6;
    const SynthesisResult wideResult = synthesizer.synthesize(makeRegion(100.0, 6.0), wide, 1);
    assert(wideResult.error->kind == JointErrorKind::DegenerateRegion);

    JointParameters negative = makeParams(6.0, 10.0, 0.0);
    negative.margin = -1.0;
    assert(synthesizer.validate(negative).has_value());

    std::cout << " PASS\n";
}

void testCountAndWidthBounds() {
    std::cout << "Test 11: Count and width bounds..." << std::flush;

    FingerPatternSynthesizer synthesizer;
    const ContactRegion region = makeRegion(100.0, 6.0);

    // Symmetric ends round ten segments up to eleven, bodyA at both ends.
    JointParameters symmetric = makeParams(6.0, 10.0, 0.0);
    symmetric.symmetricEnds = true;
    const SynthesisResult odd = synthesizer.synthesize(region, symmetric, 0);
    assert(odd.ok());
    assert(odd.pattern->segments.size() == 11);
    assert(odd.pattern->segments.front().owner == JointSide::BodyA);
    assert(odd.pattern->segments.back().owner == JointSide::BodyA);
    assert(odd.pattern->fingerCount(JointSide::BodyA) == 6);
    assert(odd.pattern->fingerCount(JointSide::BodyB) == 5);
    assert(nearlyEqual(odd.pattern->segments[3].width(), 100.0 / 11.0));

    symmetric.fingerCount = 4;
    assert(synthesizer.validate(symmetric).has_value());

    // Count capped by the maximum.
    JointParameters capped = makeParams(6.0, 10.0, 0.0);
    capped.maxFingers = 6;
    const SynthesisResult six = synthesizer.synthesize(region, capped, 0);
    assert(six.ok());
    assert(six.pattern->segments.size() == 6);

    // Minimum width drops the count from ten to eight.
    JointParameters minWidth = makeParams(6.0, 10.0, 0.0);
    minWidth.minFingerWidth = 12.0;
    const SynthesisResult eight = synthesizer.synthesize(region, minWidth, 0);
    assert(eight.ok());
    assert(eight.pattern->segments.size() == 8);
    assert(nearlyEqual(eight.pattern->segments.front().width(), 12.5));

    // Two 10mm fingers cannot reach a 12mm minimum.
    const SynthesisResult tooShort = synthesizer.synthesize(makeRegion(20.0, 6.0), minWidth, 4);
    assert(tooShort.error->kind == JointErrorKind::DegenerateRegion);
    assert(tooShort.error->regionIndex == std::optional<std::size_t>(4));

    // Maximum width adds fingers when the count allows it.
    JointParameters maxWidth = makeParams(6.0, 10.0, 0.0);
    maxWidth.maxFingerWidth = 8.0;
    const SynthesisResult thirteen = synthesizer.synthesize(region, maxWidth, 0);
    assert(thirteen.ok());
    assert(thirteen.pattern->segments.size() == 13);
    assert(thirteen.pattern->margin == 0.0);

    // Otherwise fingers are capped and the rest becomes margin.
    maxWidth.maxFingers = 10;
    const SynthesisResult cappedWidth = synthesizer.synthesize(region, maxWidth, 0);
    assert(cappedWidth.ok());
    const FingerPattern& c = *cappedWidth.pattern;
    assert(nearlyEqual(c.margin, 10.0));
    assert(c.segments.size() == 11);
    assert(nearlyEqual(c.segments.front().width(), 18.0));
    assert(nearlyEqual(c.segments[1].width(), 8.0));
    assert(c.segments.back().margin);
    assert(nearlyEqual(c.segments.back().width(), 10.0));
    assert(c.fingerCount(JointSide::BodyA) == 5);
    assert(c.fingerCount(JointSide::BodyB) == 5);

    // Inconsistent bounds.
    JointParameters inverted = makeParams(6.0, 10.0, 0.0);
    inverted.minFingerWidth = 6.0;
    inverted.maxFingerWidth = 5.0;
    assert(synthesizer.validate(inverted).has_value());

    JointParameters fewMax = makeParams(6.0, 10.0, 0.0);
    fewMax.minFingers = 4;
    fewMax.maxFingers = 3;
    assert(synthesizer.validate(fewMax).has_value());

    JointParameters noOdd = makeParams(6.0, 10.0, 0.0);
    noOdd.symmetricEnds = true;
    noOdd.minFingers = 4;
    noOdd.maxFingers = 4;
    assert(synthesizer.validate(noOdd).has_value());

    std::cout << " PASS\n";
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    std::cout << "\n=== FingerPatternSynthesizer Prototype Tests ===\n\n";

    testStandardLayout();
    testDegenerateRegion();
    testParameterConflicts();
    testExplicitFingerCount();
    testCountRounding();
    testReliefPlacement();
    testEndReliefs();
    testNoReliefs();
    testFingerRatio();
    testMargins();
    testCountAndWidthBounds();

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
