/**
 * @file FeatureIO.cpp
 * @brief Implementation of feature timeline serialization
 */

#include "FeatureIO.h"
#include "../app/document/Document.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>

#include <cmath>
#include <limits>

namespace boxjoint::io {

using namespace app;

Q_LOGGING_CATEGORY(logFeatureIO, "boxjoint.io.features")

namespace {

QString featureTypeToString(FeatureType type) {
    return QString::fromLatin1(featureTypeName(type));
}

std::optional<FeatureType> stringToFeatureType(const QString& str) {
    if (str == "BoxJoint") return FeatureType::BoxJoint;
    return std::nullopt;
}

bool writeFile(const QString& path, const QByteArray& data, QString& errorMessage) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        errorMessage = QString("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

// Missing keys keep the default; present keys must be numbers.
bool readNumber(const QJsonObject& params, const char* key, double& value, QString& errorMessage) {
    if (!params.contains(key)) {
        return true;
    }
    const QJsonValue field = params.value(key);
    if (!field.isDouble()) {
        errorMessage = QString("Parameter '%1' is not a number").arg(key);
        return false;
    }
    value = field.toDouble();
    return true;
}

bool readCount(const QJsonObject& params, const char* key, int& value, QString& errorMessage) {
    if (!params.contains(key)) {
        return true;
    }
    const QJsonValue field = params.value(key);
    const double number = field.toDouble();
    if (!field.isDouble() || std::floor(number) != number ||
        number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        errorMessage = QString("Parameter '%1' is not an integer").arg(key);
        return false;
    }
    value = static_cast<int>(number);
    return true;
}

bool readFlag(const QJsonObject& params, const char* key, bool& value, QString& errorMessage) {
    if (!params.contains(key)) {
        return true;
    }
    const QJsonValue field = params.value(key);
    if (!field.isBool()) {
        errorMessage = QString("Parameter '%1' is not a boolean").arg(key);
        return false;
    }
    value = field.toBool();
    return true;
}

} // anonymous namespace

bool FeatureIO::saveFeatures(const QString& directory,
                             const std::vector<FeatureRecord>& features,
                             const std::unordered_map<std::string, bool>& suppressionState,
                             QString& errorMessage) {
    qCInfo(logFeatureIO) << "saveFeatures:start"
                         << "featureCount=" << features.size()
                         << "suppressionEntries=" << suppressionState.size();
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(".")) {
        errorMessage = QString("Cannot create directory %1").arg(directory);
        qCWarning(logFeatureIO) << "saveFeatures:failed-mkpath" << directory;
        return false;
    }

    QByteArray featuresData;
    for (const auto& feature : features) {
        QJsonDocument doc(serializeFeature(feature));
        featuresData.append(doc.toJson(QJsonDocument::Compact));
        featuresData.append('\n');
    }
    if (!writeFile(dir.filePath(kFeaturesFileName), featuresData, errorMessage)) {
        qCWarning(logFeatureIO) << "saveFeatures:failed-write-features" << errorMessage;
        return false;
    }

    // Suppressed IDs in timeline order so the file is stable across saves.
    QJsonArray suppressedFeatures;
    for (const auto& feature : features) {
        auto it = suppressionState.find(feature.featureId);
        if (it != suppressionState.end() && it->second) {
            suppressedFeatures.append(QString::fromStdString(feature.featureId));
        }
    }
    QJsonObject stateJson;
    stateJson["featureCount"] = static_cast<int>(features.size());
    stateJson["suppressedFeatures"] = suppressedFeatures;

    if (!writeFile(dir.filePath(kStateFileName), QJsonDocument(stateJson).toJson(QJsonDocument::Indented),
                   errorMessage)) {
        qCWarning(logFeatureIO) << "saveFeatures:failed-write-state" << errorMessage;
        return false;
    }
    qCInfo(logFeatureIO) << "saveFeatures:done";
    return true;
}

bool FeatureIO::loadFeatures(const QString& directory,
                             Document* document,
                             QString& errorMessage) {
    qCInfo(logFeatureIO) << "loadFeatures:start" << directory;
    if (!document) {
        errorMessage = "No document to load into";
        return false;
    }

    const QDir dir(directory);
    QFile featuresFile(dir.filePath(kFeaturesFileName));
    if (!featuresFile.exists()) {
        qCDebug(logFeatureIO) << "loadFeatures:no-features-file";
        return true;
    }
    if (!featuresFile.open(QIODevice::ReadOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(featuresFile.fileName(), featuresFile.errorString());
        return false;
    }
    const QByteArray featuresData = featuresFile.readAll();

    std::vector<FeatureRecord> records;
    const QList<QByteArray> lines = featuresData.split('\n');
    int lineNumber = 0;
    for (const QByteArray& line : lines) {
        ++lineNumber;
        if (line.trimmed().isEmpty()) continue;

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            errorMessage = QString("Invalid JSON in %1 line %2: %3")
                               .arg(kFeaturesFileName)
                               .arg(lineNumber)
                               .arg(parseError.errorString());
            qCWarning(logFeatureIO) << "loadFeatures:invalid-json" << errorMessage;
            return false;
        }

        QString recordError;
        std::optional<FeatureRecord> record = deserializeFeature(doc.object(), recordError);
        if (!record) {
            errorMessage = QString("Invalid feature in %1 line %2: %3")
                               .arg(kFeaturesFileName)
                               .arg(lineNumber)
                               .arg(recordError);
            qCWarning(logFeatureIO) << "loadFeatures:invalid-feature" << errorMessage;
            return false;
        }
        records.push_back(std::move(*record));
    }

    // Nothing is added unless every line parsed.
    for (const auto& record : records) {
        if (document->findFeature(record.featureId)) {
            errorMessage = QString("Duplicate feature ID %1").arg(QString::fromStdString(record.featureId));
            return false;
        }
    }
    for (const auto& record : records) {
        document->addFeature(record);
    }

    QFile stateFile(dir.filePath(kStateFileName));
    if (stateFile.open(QIODevice::ReadOnly)) {
        QJsonParseError stateError;
        QJsonDocument stateDoc = QJsonDocument::fromJson(stateFile.readAll(), &stateError);
        if (stateError.error == QJsonParseError::NoError && stateDoc.isObject()) {
            const QJsonArray suppressed = stateDoc.object()["suppressedFeatures"].toArray();
            std::unordered_map<std::string, bool> suppressionState;
            suppressionState.reserve(static_cast<size_t>(suppressed.size()));
            for (const auto& featureVal : suppressed) {
                suppressionState[featureVal.toString().toStdString()] = true;
            }
            document->setFeatureSuppressionState(suppressionState);
            qCDebug(logFeatureIO) << "loadFeatures:suppression-state-loaded"
                                  << "suppressedCount=" << suppressionState.size();
        } else {
            qCWarning(logFeatureIO) << "loadFeatures:invalid-state-json" << stateError.errorString();
        }
    }

    qCInfo(logFeatureIO) << "loadFeatures:done" << "featureCount=" << records.size();
    return true;
}

QJsonObject FeatureIO::serializeFeature(const FeatureRecord& feature) {
    QJsonObject json;

    json["featureId"] = QString::fromStdString(feature.featureId);
    json["type"] = featureTypeToString(feature.type);

    QJsonArray faces;
    for (const auto& ref : feature.faces) {
        QJsonObject face;
        face["bodyId"] = QString::fromStdString(ref.bodyId);
        face["faceId"] = QString::fromStdString(ref.faceId);
        faces.append(face);
    }
    json["faces"] = faces;

    const auto& p = feature.params;
    QJsonObject params;
    params["materialThickness"] = p.materialThickness;
    params["targetFingerWidth"] = p.targetFingerWidth;
    params["fingerCount"] = p.fingerCount;
    params["toolRadius"] = p.toolRadius;
    params["cornerFilletPolicy"] = QString::fromLatin1(core::joint::cornerFilletPolicyName(p.cornerFilletPolicy));
    params["minimumFeatureSize"] = p.minimumFeatureSize;
    params["fingerRatio"] = p.fingerRatio;
    params["margin"] = p.margin;
    params["minFingers"] = p.minFingers;
    params["maxFingers"] = p.maxFingers;
    params["minFingerWidth"] = p.minFingerWidth;
    params["maxFingerWidth"] = p.maxFingerWidth;
    params["symmetricEnds"] = p.symmetricEnds;
    json["params"] = params;

    QJsonArray resultBodies;
    for (const auto& bodyId : feature.resultBodyIds) {
        resultBodies.append(QString::fromStdString(bodyId));
    }
    json["resultBodyIds"] = resultBodies;

    return json;
}

std::optional<FeatureRecord> FeatureIO::deserializeFeature(const QJsonObject& json, QString& errorMessage) {
    FeatureRecord feature;

    feature.featureId = json["featureId"].toString().toStdString();
    if (feature.featureId.empty()) {
        errorMessage = "Missing featureId";
        return std::nullopt;
    }

    const auto type = stringToFeatureType(json["type"].toString());
    if (!type) {
        errorMessage = QString("Unknown feature type '%1'").arg(json["type"].toString());
        return std::nullopt;
    }
    feature.type = *type;

    const QJsonArray faces = json["faces"].toArray();
    for (const auto& faceVal : faces) {
        const QJsonObject face = faceVal.toObject();
        FaceRef ref;
        ref.bodyId = face["bodyId"].toString().toStdString();
        ref.faceId = face["faceId"].toString().toStdString();
        if (ref.bodyId.empty() || ref.faceId.empty()) {
            errorMessage = "Face reference needs bodyId and faceId";
            return std::nullopt;
        }
        feature.faces.push_back(std::move(ref));
    }

    // Missing keys keep the JointParameters defaults.
    const QJsonObject params = json["params"].toObject();
    auto& p = feature.params;
    if (!readNumber(params, "materialThickness", p.materialThickness, errorMessage) ||
        !readNumber(params, "targetFingerWidth", p.targetFingerWidth, errorMessage) ||
        !readCount(params, "fingerCount", p.fingerCount, errorMessage) ||
        !readNumber(params, "toolRadius", p.toolRadius, errorMessage) ||
        !readNumber(params, "minimumFeatureSize", p.minimumFeatureSize, errorMessage) ||
        !readNumber(params, "fingerRatio", p.fingerRatio, errorMessage) ||
        !readNumber(params, "margin", p.margin, errorMessage) ||
        !readCount(params, "minFingers", p.minFingers, errorMessage) ||
        !readCount(params, "maxFingers", p.maxFingers, errorMessage) ||
        !readNumber(params, "minFingerWidth", p.minFingerWidth, errorMessage) ||
        !readNumber(params, "maxFingerWidth", p.maxFingerWidth, errorMessage) ||
        !readFlag(params, "symmetricEnds", p.symmetricEnds, errorMessage)) {
        return std::nullopt;
    }
    if (params.contains("cornerFilletPolicy")) {
        const QString policyName = params["cornerFilletPolicy"].toString();
        const auto policy = core::joint::cornerFilletPolicyFromName(policyName.toStdString());
        if (!policy) {
            errorMessage = QString("Unknown corner fillet policy '%1'").arg(policyName);
            return std::nullopt;
        }
        p.cornerFilletPolicy = *policy;
    }

    const QJsonArray resultBodies = json["resultBodyIds"].toArray();
    for (const auto& bodyVal : resultBodies) {
        feature.resultBodyIds.push_back(bodyVal.toString().toStdString());
    }

    return feature;
}

QString FeatureIO::computeFeaturesHash(const std::vector<FeatureRecord>& features) {
    QCryptographicHash hash(QCryptographicHash::Sha256);

    for (const auto& feature : features) {
        QJsonDocument doc(serializeFeature(feature));
        hash.addData(doc.toJson(QJsonDocument::Compact));
    }

    return QString::fromLatin1(hash.result().toHex());
}

} // namespace boxjoint::io
