/**
 * @file JointSettings.cpp
 */
#include "JointSettings.h"

#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QVariant>

#include <optional>

namespace boxjoint::app {

Q_LOGGING_CATEGORY(logJointSettings, "boxjoint.app.settings")

namespace {

const char* const kOrganization = "BoxJoint";
const char* const kApplication = "BoxJoint";

std::optional<double> parseLength(const QVariant& value) {
    bool ok = false;
    const double parsed = value.toString().trimmed().toDouble(&ok);
    if (!ok || parsed < 0.0) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<int> parseCount(const QVariant& value) {
    bool ok = false;
    const int parsed = value.toString().trimmed().toInt(&ok);
    if (!ok || parsed < 0) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> parseRatio(const QVariant& value) {
    bool ok = false;
    const double parsed = value.toString().trimmed().toDouble(&ok);
    if (!ok || parsed <= 0.0 || parsed >= 1.0) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<bool> parseFlag(const QVariant& value) {
    const QString text = value.toString().trimmed().toLower();
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<core::joint::CornerFilletPolicy> parsePolicy(const QVariant& value) {
    return core::joint::cornerFilletPolicyFromName(value.toString().trimmed().toStdString());
}

/**
 * @brief Reads a stored value, then lets a non-empty environment variable override it.
 */
template <typename T, typename Parser>
T readSetting(const QSettings& settings, const QString& key, const char* envVar, T fallback, Parser parse) {
    T result = fallback;

    if (settings.contains(key)) {
        const QVariant stored = settings.value(key);
        if (auto parsed = parse(stored)) {
            result = *parsed;
        } else {
            qCWarning(logJointSettings) << "load:invalid-setting"
                                        << "key=" << key
                                        << "value=" << stored.toString()
                                        << "using default";
        }
    }

    const QString env = qEnvironmentVariable(envVar).trimmed();
    if (!env.isEmpty()) {
        if (auto parsed = parse(QVariant(env))) {
            result = *parsed;
            qCDebug(logJointSettings) << "load:env-override" << "var=" << envVar << "value=" << env;
        } else {
            qCWarning(logJointSettings) << "load:invalid-env"
                                        << "var=" << envVar
                                        << "value=" << env;
        }
    }
    return result;
}

} // namespace

JointSettings::JointSettings()
    : parameters_(builtInParameters()) {}

core::joint::JointParameters JointSettings::builtInParameters() {
    return core::joint::JointParameters{};
}

JointSettings JointSettings::load() {
    JointSettings result;
    const core::joint::JointParameters defaults = builtInParameters();
    QSettings settings(kOrganization, kApplication);

    auto& params = result.parameters_;
    params.materialThickness = readSetting(settings, QStringLiteral("joint/materialThickness"),
                                           "BOXJOINT_MATERIAL_THICKNESS", defaults.materialThickness, parseLength);
    params.targetFingerWidth = readSetting(settings, QStringLiteral("joint/targetFingerWidth"),
                                           "BOXJOINT_FINGER_WIDTH", defaults.targetFingerWidth, parseLength);
    params.fingerCount = readSetting(settings, QStringLiteral("joint/fingerCount"),
                                     "BOXJOINT_FINGER_COUNT", defaults.fingerCount, parseCount);
    params.toolRadius = readSetting(settings, QStringLiteral("joint/toolRadius"),
                                    "BOXJOINT_TOOL_RADIUS", defaults.toolRadius, parseLength);
    params.cornerFilletPolicy = readSetting(settings, QStringLiteral("joint/cornerFilletPolicy"),
                                            "BOXJOINT_CORNER_POLICY", defaults.cornerFilletPolicy, parsePolicy);
    params.minimumFeatureSize = readSetting(settings, QStringLiteral("joint/minimumFeatureSize"),
                                            "BOXJOINT_MIN_FEATURE", defaults.minimumFeatureSize, parseLength);
    params.fingerRatio = readSetting(settings, QStringLiteral("joint/fingerRatio"),
                                     "BOXJOINT_FINGER_RATIO", defaults.fingerRatio, parseRatio);
    params.margin = readSetting(settings, QStringLiteral("joint/margin"),
                                "BOXJOINT_MARGIN", defaults.margin, parseLength);
    params.minFingers = readSetting(settings, QStringLiteral("joint/minFingers"),
                                    "BOXJOINT_MIN_FINGERS", defaults.minFingers, parseCount);
    params.maxFingers = readSetting(settings, QStringLiteral("joint/maxFingers"),
                                    "BOXJOINT_MAX_FINGERS", defaults.maxFingers, parseCount);
    params.minFingerWidth = readSetting(settings, QStringLiteral("joint/minFingerWidth"),
                                        "BOXJOINT_MIN_FINGER_WIDTH", defaults.minFingerWidth, parseLength);
    params.maxFingerWidth = readSetting(settings, QStringLiteral("joint/maxFingerWidth"),
                                        "BOXJOINT_MAX_FINGER_WIDTH", defaults.maxFingerWidth, parseLength);
    params.symmetricEnds = readSetting(settings, QStringLiteral("joint/symmetricEnds"),
                                       "BOXJOINT_SYMMETRIC_ENDS", defaults.symmetricEnds, parseFlag);
    result.regionThreads_ = readSetting(settings, QStringLiteral("runtime/regionThreads"),
                                        "BOXJOINT_REGION_THREADS", 0, parseCount);

    qCInfo(logJointSettings) << "load:done"
                             << "thickness=" << params.materialThickness
                             << "fingerWidth=" << params.targetFingerWidth
                             << "fingerCount=" << params.fingerCount
                             << "toolRadius=" << params.toolRadius
                             << "policy=" << core::joint::cornerFilletPolicyName(params.cornerFilletPolicy)
                             << "minFeature=" << params.minimumFeatureSize
                             << "ratio=" << params.fingerRatio
                             << "margin=" << params.margin
                             << "symmetricEnds=" << params.symmetricEnds
                             << "regionThreads=" << result.regionThreads_;
    return result;
}

void JointSettings::saveDefaults() const {
    QSettings settings(kOrganization, kApplication);

    settings.setValue("joint/materialThickness", parameters_.materialThickness);
    settings.setValue("joint/targetFingerWidth", parameters_.targetFingerWidth);
    settings.setValue("joint/fingerCount", parameters_.fingerCount);
    settings.setValue("joint/toolRadius", parameters_.toolRadius);
    settings.setValue("joint/cornerFilletPolicy",
                      QString::fromLatin1(core::joint::cornerFilletPolicyName(parameters_.cornerFilletPolicy)));
    settings.setValue("joint/minimumFeatureSize", parameters_.minimumFeatureSize);
    settings.setValue("joint/fingerRatio", parameters_.fingerRatio);
    settings.setValue("joint/margin", parameters_.margin);
    settings.setValue("joint/minFingers", parameters_.minFingers);
    settings.setValue("joint/maxFingers", parameters_.maxFingers);
    settings.setValue("joint/minFingerWidth", parameters_.minFingerWidth);
    settings.setValue("joint/maxFingerWidth", parameters_.maxFingerWidth);
    settings.setValue("joint/symmetricEnds", parameters_.symmetricEnds);
    settings.setValue("runtime/regionThreads", regionThreads_);
    settings.sync(); // Force immediate write
}

} // namespace boxjoint::app
