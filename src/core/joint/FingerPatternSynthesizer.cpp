/**
 * @file FingerPatternSynthesizer.cpp
 */
#include "FingerPatternSynthesizer.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace boxjoint::core::joint {

Q_LOGGING_CATEGORY(logFingerSynthesis, "boxjoint.core.joint.synthesis")

namespace {

constexpr double kLengthTolerance = 1e-9;

SynthesisResult failure(JointErrorKind kind, const std::string& message, std::size_t regionIndex) {
    qCDebug(logFingerSynthesis) << "synthesize:rejected"
                                << "region=" << regionIndex
                                << "kind=" << jointErrorKindName(kind)
                                << "message=" << QString::fromStdString(message);
    return SynthesisResult{std::nullopt, JointError{kind, message, regionIndex}};
}

std::string formatLength(double value) {
    std::ostringstream out;
    out << value << "mm";
    return out.str();
}

// Allowed segment counts; symmetric ends keep only odd counts.
struct CountRange {
    int lowest = 2;
    int highest = std::numeric_limits<int>::max();
    int step = 1;
};

CountRange countRange(const JointParameters& params) {
    CountRange range;
    range.lowest = params.minFingers;
    if (params.maxFingers > 0) {
        range.highest = params.maxFingers;
    }
    if (params.symmetricEnds) {
        range.lowest = std::max(3, range.lowest | 1);
        if (range.highest % 2 == 0) {
            --range.highest;
        }
        range.step = 2;
    }
    return range;
}

int fingersOf(JointSide side, int count) {
    return side == JointSide::BodyA ? (count + 1) / 2 : count / 2;
}

struct FingerWidths {
    double a = 0.0;
    double b = 0.0;

    double narrowest() const { return std::min(a, b); }
    double widest() const { return std::max(a, b); }
    double of(JointSide side) const { return side == JointSide::BodyA ? a : b; }
};

/**
 * @brief Widths of bodyA and bodyB fingers that fill @p fingerLength with @p count segments.
 *
 * bodyB's finger takes @p ratio of every bodyA/bodyB pair.
 */
FingerWidths fingerWidths(double fingerLength, int count, double ratio) {
    const double bPerA = ratio / (1.0 - ratio);
    FingerWidths widths;
    widths.a = fingerLength / (fingersOf(JointSide::BodyA, count) + fingersOf(JointSide::BodyB, count) * bPerA);
    widths.b = widths.a * bPerA;
    return widths;
}

} // namespace

std::optional<JointError> FingerPatternSynthesizer::validate(const JointParameters& params) const {
    auto conflict = [](const std::string& message) {
        return JointError{JointErrorKind::ParameterConflict, message, std::nullopt};
    };

    if (params.materialThickness <= 0.0) {
        return conflict("Material thickness must be positive");
    }
    if (params.minimumFeatureSize < 0.0 || params.toolRadius < 0.0) {
        return conflict("Minimum feature size and tool radius must not be negative");
    }
    if (params.fingerRatio <= 0.0 || params.fingerRatio >= 1.0) {
        return conflict("Finger ratio must lie strictly between 0 and 1");
    }
    if (params.margin < 0.0) {
        return conflict("Margin must not be negative");
    }
    if (params.minFingers < 2) {
        return conflict("Minimum finger count must be at least two");
    }
    if (params.maxFingers != 0 && params.maxFingers < params.minFingers) {
        return conflict("Maximum finger count is below the minimum");
    }
    if (params.minFingerWidth < 0.0 || params.maxFingerWidth < 0.0) {
        return conflict("Finger width bounds must not be negative");
    }
    if (params.maxFingerWidth > 0.0 && params.maxFingerWidth < params.minFingerWidth) {
        return conflict("Maximum finger width is below the minimum");
    }

    const CountRange range = countRange(params);
    if (range.highest < range.lowest) {
        return conflict("No odd finger count lies between the minimum and maximum");
    }
    if (params.fingerCount != 0) {
        if (params.fingerCount < 2) {
            return conflict("A finger joint needs at least two segments");
        }
        if (params.fingerCount < range.lowest || params.fingerCount > range.highest) {
            return conflict("Finger count " + std::to_string(params.fingerCount) + " is outside the allowed range");
        }
        if (params.symmetricEnds && params.fingerCount % 2 == 0) {
            return conflict("Symmetric ends need an odd finger count");
        }
    } else if (params.targetFingerWidth <= 0.0) {
        return conflict("Target finger width must be positive");
    }
    return std::nullopt;
}

SynthesisResult FingerPatternSynthesizer::synthesize(const ContactRegion& region,
                                                     const JointParameters& params,
                                                     std::size_t regionIndex) const {
    const double length = region.length;
    const double fingerLength = length - 2.0 * params.margin;

    if (fingerLength <= kLengthTolerance || fingerLength < 2.0 * params.minimumFeatureSize) {
        const std::string available = params.margin > 0.0
                                          ? formatLength(fingerLength) + " between margins"
                                          : formatLength(length);
        return failure(JointErrorKind::DegenerateRegion,
                       "Contact length " + available +
                           " is too short for a finger pair at minimum feature size " +
                           formatLength(params.minimumFeatureSize),
                       regionIndex);
    }

    if (auto conflict = validate(params)) {
        conflict->regionIndex = regionIndex;
        return SynthesisResult{std::nullopt, conflict};
    }

    const CountRange range = countRange(params);
    int count = params.fingerCount;
    FingerWidths widths;
    if (count == 0) {
        if (params.targetFingerWidth > fingerLength + kLengthTolerance) {
            return failure(JointErrorKind::ParameterConflict,
                           "Finger width " + formatLength(params.targetFingerWidth) +
                               " exceeds contact length " + formatLength(fingerLength),
                           regionIndex);
        }
        count = std::max(2, static_cast<int>(std::lround(fingerLength / params.targetFingerWidth)));
        if (params.symmetricEnds) {
            count |= 1;
        }
        count = std::clamp(count, range.lowest, range.highest);
        widths = fingerWidths(fingerLength, count, params.fingerRatio);

        // Fewer, wider fingers until the narrowest clears the minimum width.
        while (widths.narrowest() + kLengthTolerance < params.minFingerWidth && count - range.step >= range.lowest) {
            count -= range.step;
            widths = fingerWidths(fingerLength, count, params.fingerRatio);
        }
        if (widths.narrowest() + kLengthTolerance < params.minFingerWidth) {
            return failure(JointErrorKind::DegenerateRegion,
                           "Contact length " + formatLength(fingerLength) + " cannot hold " +
                               std::to_string(range.lowest) + " fingers of at least " +
                               formatLength(params.minFingerWidth),
                           regionIndex);
        }

        // More, narrower fingers while the widest exceeds the maximum width.
        if (params.maxFingerWidth > 0.0) {
            while (widths.widest() > params.maxFingerWidth + kLengthTolerance &&
                   count <= range.highest - range.step) {
                const FingerWidths next = fingerWidths(fingerLength, count + range.step, params.fingerRatio);
                if (next.narrowest() + kLengthTolerance < params.minFingerWidth) {
                    break;
                }
                count += range.step;
                widths = next;
            }
        }
    } else {
        widths = fingerWidths(fingerLength, count, params.fingerRatio);
    }

    // Fingers that still exceed the maximum width are capped and the rest
    // of the length goes to the end margins.
    double endMargin = params.margin;
    if (params.maxFingerWidth > 0.0 && widths.widest() > params.maxFingerWidth + kLengthTolerance) {
        const double scale = params.maxFingerWidth / widths.widest();
        widths.a *= scale;
        widths.b *= scale;
        const double used = fingersOf(JointSide::BodyA, count) * widths.a +
                            fingersOf(JointSide::BodyB, count) * widths.b;
        endMargin += 0.5 * (fingerLength - used);
    }
    if (endMargin <= kLengthTolerance) {
        endMargin = 0.0;
    }

    if (widths.narrowest() + kLengthTolerance < params.minFingerWidth) {
        return failure(JointErrorKind::ParameterConflict,
                       std::to_string(count) + " fingers over " + formatLength(fingerLength) +
                           " are narrower than the minimum finger width " + formatLength(params.minFingerWidth),
                       regionIndex);
    }
    if (widths.narrowest() + kLengthTolerance < params.minimumFeatureSize) {
        return failure(JointErrorKind::ParameterConflict,
                       std::to_string(count) + " fingers over " + formatLength(fingerLength) +
                           " are narrower than the minimum feature size",
                       regionIndex);
    }

    const JointSide host = region.hostSide;
    const JointSide lastOwner = (count % 2 == 1) ? JointSide::BodyA : JointSide::BodyB;
    // A margin strip next to a host finger merges into it.
    const bool looseMargin = endMargin > 0.0 && (host != JointSide::BodyA || host != lastOwner);
    if (looseMargin && endMargin + kLengthTolerance < params.minimumFeatureSize) {
        return failure(JointErrorKind::ParameterConflict,
                       "Margin strip " + formatLength(endMargin) + " is narrower than the minimum feature size",
                       regionIndex);
    }

    const bool rounded = params.cornerFilletPolicy == CornerFilletPolicy::RoundBoth &&
                         params.toolRadius > 0.0;
    if (rounded) {
        const double r = params.toolRadius;
        if (2.0 * r > widths.narrowest() + kLengthTolerance) {
            return failure(JointErrorKind::ParameterConflict,
                           "Tool radius " + formatLength(r) + " leaves no room for complementary fillets in " +
                               formatLength(widths.narrowest()) + " fingers",
                           regionIndex);
        }
        if (r > region.width + kLengthTolerance) {
            return failure(JointErrorKind::ParameterConflict,
                           "Tool radius " + formatLength(r) + " exceeds joint width " +
                               formatLength(region.width),
                           regionIndex);
        }
        if (r > params.materialThickness + kLengthTolerance) {
            return failure(JointErrorKind::ParameterConflict,
                           "Tool radius " + formatLength(r) + " exceeds material thickness " +
                               formatLength(params.materialThickness),
                           regionIndex);
        }
        if (looseMargin && r > endMargin + kLengthTolerance) {
            return failure(JointErrorKind::ParameterConflict,
                           "Tool radius " + formatLength(r) + " exceeds margin strip " + formatLength(endMargin),
                           regionIndex);
        }
    }

    FingerPattern pattern;
    pattern.regionIndex = regionIndex;
    pattern.length = length;
    pattern.width = region.width;
    pattern.depth = params.materialThickness;
    pattern.policy = params.cornerFilletPolicy;
    pattern.toolRadius = rounded ? params.toolRadius : 0.0;
    pattern.margin = endMargin;
    pattern.segments.reserve(static_cast<std::size_t>(count) + 2);

    auto append = [&pattern](double start, double end, JointSide owner, bool margin) {
        auto& segments = pattern.segments;
        if (!segments.empty() && segments.back().owner == owner) {
            segments.back().end = end;
            segments.back().margin = segments.back().margin && margin;
            return;
        }
        segments.push_back(FingerSegment{start, end, owner, margin});
    };

    const double fingersEnd = length - endMargin;
    if (endMargin > 0.0) {
        append(0.0, endMargin, host, true);
    }
    double cursor = endMargin;
    for (int i = 0; i < count; ++i) {
        const JointSide owner = (i % 2 == 0) ? JointSide::BodyA : JointSide::BodyB;
        // Last finger closes exactly on the finger span end.
        const double end = (i == count - 1) ? fingersEnd : cursor + widths.of(owner);
        append(cursor, end, owner, false);
        cursor = end;
    }
    if (endMargin > 0.0) {
        append(fingersEnd, length, host, true);
    }
    if (rounded) {
        addReliefs(region, pattern);
    }

    qCDebug(logFingerSynthesis) << "synthesize:done"
                                << "region=" << regionIndex
                                << "length=" << length
                                << "fingers=" << count
                                << "segments=" << pattern.segments.size()
                                << "widthA=" << widths.a
                                << "widthB=" << widths.b
                                << "margin=" << endMargin
                                << "reliefs=" << pattern.reliefs.size();
    return SynthesisResult{std::move(pattern), std::nullopt};
}

void FingerPatternSynthesizer::addReliefs(const ContactRegion& region, FingerPattern& pattern) const {
    const JointSide host = region.hostSide;
    const JointSide mating = opposite(host);
    const double r = pattern.toolRadius;
    const auto& segments = pattern.segments;

    auto addHostWallReliefs = [&](double boundary, int direction, std::size_t segmentIndex) {
        if (region.hostWallAtMinY) {
            pattern.reliefs.push_back(
                CornerRelief{boundary, direction, ReliefKind::HostWallMinY, host, segmentIndex, r});
        }
        if (region.hostWallAtMaxY) {
            pattern.reliefs.push_back(
                CornerRelief{boundary, direction, ReliefKind::HostWallMaxY, host, segmentIndex, r});
        }
    };

    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        const double boundary = segments[i].end;
        const bool leftIsHost = segments[i].owner == host;
        const std::size_t hostSegment = leftIsHost ? i : i + 1;
        const std::size_t matingSegment = leftIsHost ? i + 1 : i;
        const int towardHost = leftIsHost ? -1 : 1;
        const int towardMating = -towardHost;

        // The mating body's notch bottom meets its finger flank here.
        pattern.reliefs.push_back(
            CornerRelief{boundary, towardHost, ReliefKind::MatingFace, mating, hostSegment, r});

        // The host's notch side walls meet the host finger flank here.
        addHostWallReliefs(boundary, towardMating, matingSegment);
    }

    // Host material past either end closes the end notch like a wall.
    if (region.hostExtendsBeforeStart && segments.front().owner == mating) {
        addHostWallReliefs(0.0, 1, 0);
    }
    if (region.hostExtendsAfterEnd && segments.back().owner == mating) {
        addHostWallReliefs(pattern.length, -1, segments.size() - 1);
    }
}

} // namespace boxjoint::core::joint
