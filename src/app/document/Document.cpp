#include "Document.h"

#include <QLoggingCategory>
#include <QUuid>

#include <algorithm>
#include <set>

namespace boxjoint::app {

Q_LOGGING_CATEGORY(logDocument, "boxjoint.app.document")

Document::Document(QObject* parent)
    : QObject(parent)
{
}

Document::~Document() = default;

void Document::setModified(bool modified) {
    if (modified_ != modified) {
        modified_ = modified;
        emit modifiedChanged(modified);
    }
}

void Document::clear() {
    bodies_.clear();
    bodyNames_.clear();
    features_.clear();
    suppressedFeatures_.clear();
    featureFailures_.clear();
    elementMap_.clear();

    nextBodyNumber_ = 1;
    setModified(false);
    emit documentCleared();
}

// Body management

std::string Document::addBody(const TopoDS_Shape& shape, const std::string& name) {
    if (shape.IsNull()) {
        return {};
    }

    std::string id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    if (!addBodyWithId(id, shape, name)) {
        return {};
    }
    return id;
}

bool Document::addBodyWithId(const std::string& id,
                             const TopoDS_Shape& shape,
                             const std::string& name) {
    if (shape.IsNull() || id.empty()) {
        return false;
    }
    if (bodies_.find(id) != bodies_.end()) {
        return false;
    }

    std::string finalName = name;
    if (finalName.empty()) {
        finalName = "Body " + std::to_string(nextBodyNumber_++);
    }
    bodyNames_[id] = finalName;
    bodies_[id] = BodyEntry{shape, shape};

    const auto faces = elementMap_.registerBody(id, shape);
    qCDebug(logDocument) << "addBody"
                         << "id=" << QString::fromStdString(id)
                         << "faces=" << faces.size();

    setModified(true);
    emit bodyAdded(QString::fromStdString(id));
    return true;
}

bool Document::setUpstreamShape(const std::string& id, const TopoDS_Shape& shape) {
    if (shape.IsNull()) {
        return false;
    }
    auto it = bodies_.find(id);
    if (it == bodies_.end()) {
        return false;
    }

    it->second.upstream = shape;
    it->second.current = shape;
    const int rebound = elementMap_.rebindBody(id, shape);
    qCDebug(logDocument) << "setUpstreamShape"
                         << "id=" << QString::fromStdString(id)
                         << "reboundFaces=" << rebound;

    setModified(true);
    emit upstreamChanged(QString::fromStdString(id));
    emit bodyUpdated(QString::fromStdString(id));
    return true;
}

const TopoDS_Shape* Document::getUpstreamShape(const std::string& id) const {
    auto it = bodies_.find(id);
    if (it == bodies_.end()) {
        return nullptr;
    }
    return &it->second.upstream;
}

bool Document::updateBodyShape(const std::string& id, const TopoDS_Shape& shape, bool emitSignal) {
    if (shape.IsNull()) {
        return false;
    }
    auto it = bodies_.find(id);
    if (it == bodies_.end()) {
        return false;
    }

    it->second.current = shape;
    setModified(true);
    if (emitSignal) {
        emit bodyUpdated(QString::fromStdString(id));
    }
    return true;
}

const TopoDS_Shape* Document::getBodyShape(const std::string& id) const {
    auto it = bodies_.find(id);
    if (it == bodies_.end()) {
        return nullptr;
    }
    return &it->second.current;
}

void Document::resetBodiesToUpstream() {
    for (auto& [id, body] : bodies_) {
        if (!body.current.IsSame(body.upstream)) {
            body.current = body.upstream;
            emit bodyUpdated(QString::fromStdString(id));
        }
    }
}

std::vector<std::string> Document::getBodyIds() const {
    std::vector<std::string> ids;
    ids.reserve(bodies_.size());
    for (const auto& [id, body] : bodies_) {
        (void)body;
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool Document::removeBody(const std::string& id) {
    auto it = bodies_.find(id);
    if (it == bodies_.end()) {
        return false;
    }

    bodies_.erase(it);
    bodyNames_.erase(id);
    elementMap_.removeBody(id);

    setModified(true);
    emit bodyRemoved(QString::fromStdString(id));
    return true;
}

std::string Document::getBodyName(const std::string& id) const {
    auto it = bodyNames_.find(id);
    if (it != bodyNames_.end()) {
        return it->second;
    }
    return "Unnamed Body";
}

void Document::setBodyName(const std::string& id, const std::string& name) {
    if (bodies_.find(id) == bodies_.end()) {
        return;
    }

    std::string finalName = name;
    if (finalName.empty() || finalName.find_first_not_of(" \t\n\r") == std::string::npos) {
        finalName = "Untitled";
    }

    auto it = bodyNames_.find(id);
    if (it != bodyNames_.end() && it->second == finalName) {
        return;
    }

    bodyNames_[id] = finalName;
    setModified(true);
    emit bodyRenamed(QString::fromStdString(id), QString::fromStdString(finalName));
}

// Feature timeline

std::vector<std::string> Document::bodiesOfFaces(const std::vector<FaceRef>& faces) {
    std::set<std::string> ids;
    for (const auto& face : faces) {
        ids.insert(face.bodyId);
    }
    return {ids.begin(), ids.end()};
}

void Document::addFeature(const FeatureRecord& record) {
    insertFeature(features_.size(), record);
}

bool Document::insertFeature(std::size_t index, const FeatureRecord& record) {
    if (index > features_.size() || record.featureId.empty() || findFeature(record.featureId)) {
        return false;
    }
    FeatureRecord stored = record;
    if (stored.resultBodyIds.empty()) {
        stored.resultBodyIds = bodiesOfFaces(stored.faces);
    }
    features_.insert(features_.begin() + static_cast<std::ptrdiff_t>(index), std::move(stored));
    setModified(true);
    emit featureAdded(QString::fromStdString(record.featureId));
    return true;
}

bool Document::updateFeatureParams(const std::string& featureId, const core::joint::JointParameters& params) {
    FeatureRecord* record = findFeature(featureId);
    if (!record) {
        return false;
    }
    record->params = params;
    setModified(true);
    emit featureUpdated(QString::fromStdString(featureId));
    return true;
}

bool Document::updateFeatureFaces(const std::string& featureId, const std::vector<FaceRef>& faces) {
    FeatureRecord* record = findFeature(featureId);
    if (!record) {
        return false;
    }
    record->faces = faces;
    record->resultBodyIds = bodiesOfFaces(faces);
    setModified(true);
    emit featureUpdated(QString::fromStdString(featureId));
    return true;
}

bool Document::removeFeature(const std::string& featureId) {
    auto it = std::remove_if(features_.begin(), features_.end(),
                             [&](const FeatureRecord& feature) { return feature.featureId == featureId; });
    if (it == features_.end()) {
        return false;
    }
    features_.erase(it, features_.end());
    suppressedFeatures_.erase(featureId);
    featureFailures_.erase(featureId);
    setModified(true);
    emit featureRemoved(QString::fromStdString(featureId));
    return true;
}

int Document::featureIndex(const std::string& featureId) const {
    for (std::size_t i = 0; i < features_.size(); ++i) {
        if (features_[i].featureId == featureId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

FeatureRecord* Document::findFeature(const std::string& featureId) {
    for (auto& feature : features_) {
        if (feature.featureId == featureId) {
            return &feature;
        }
    }
    return nullptr;
}

const FeatureRecord* Document::findFeature(const std::string& featureId) const {
    for (const auto& feature : features_) {
        if (feature.featureId == featureId) {
            return &feature;
        }
    }
    return nullptr;
}

bool Document::setFeatureSuppressed(const std::string& featureId, bool suppressed) {
    if (!findFeature(featureId)) {
        return false;
    }
    const bool wasSuppressed = suppressedFeatures_.count(featureId) > 0;
    if (suppressed) {
        suppressedFeatures_.insert(featureId);
    } else {
        suppressedFeatures_.erase(featureId);
    }
    if (wasSuppressed != suppressed) {
        setModified(true);
        emit featureSuppressionChanged(QString::fromStdString(featureId), suppressed);
    }
    return true;
}

bool Document::isFeatureSuppressed(const std::string& featureId) const {
    return suppressedFeatures_.count(featureId) > 0;
}

std::unordered_map<std::string, bool> Document::featureSuppressionState() const {
    std::unordered_map<std::string, bool> state;
    state.reserve(features_.size());
    for (const auto& feature : features_) {
        state[feature.featureId] = suppressedFeatures_.count(feature.featureId) > 0;
    }
    return state;
}

void Document::setFeatureSuppressionState(const std::unordered_map<std::string, bool>& state) {
    suppressedFeatures_.clear();
    for (const auto& [featureId, suppressed] : state) {
        if (suppressed && findFeature(featureId)) {
            suppressedFeatures_.insert(featureId);
        }
    }
}

void Document::setFeatureFailed(const std::string& featureId, const std::string& reason) {
    if (!findFeature(featureId)) {
        return;
    }
    auto it = featureFailures_.find(featureId);
    if (it != featureFailures_.end() && it->second == reason) {
        return;
    }
    featureFailures_[featureId] = reason;
    emit featureFailed(QString::fromStdString(featureId), QString::fromStdString(reason));
}

void Document::clearFeatureFailed(const std::string& featureId) {
    auto it = featureFailures_.find(featureId);
    if (it == featureFailures_.end()) {
        return;
    }
    featureFailures_.erase(it);
    emit featureSucceeded(QString::fromStdString(featureId));
}

void Document::clearFeatureFailures() {
    for (const auto& [featureId, reason] : featureFailures_) {
        (void)reason;
        emit featureSucceeded(QString::fromStdString(featureId));
    }
    featureFailures_.clear();
}

bool Document::isFeatureFailed(const std::string& featureId) const {
    return featureFailures_.find(featureId) != featureFailures_.end();
}

std::string Document::featureFailureReason(const std::string& featureId) const {
    auto it = featureFailures_.find(featureId);
    if (it == featureFailures_.end()) {
        return {};
    }
    return it->second;
}

} // namespace boxjoint::app
