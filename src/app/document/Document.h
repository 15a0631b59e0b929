/**
 * @file Document.h
 * @brief Document model for bodies and the joint feature timeline
 */

#ifndef BOXJOINT_APP_DOCUMENT_DOCUMENT_H
#define BOXJOINT_APP_DOCUMENT_DOCUMENT_H

#include <QObject>
#include <QString>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <TopoDS_Shape.hxx>

#include "FeatureRecord.h"
#include "../../kernel/elementmap/ElementMap.h"

namespace boxjoint::app {

/**
 * @brief Central document model owning bodies and feature records
 *
 * Each body has an upstream shape (its leaf geometry, edited from outside the
 * timeline) and a current shape (after the features that rewrite it). Emits
 * signals when content changes.
 */
class Document : public QObject {
    Q_OBJECT

public:
    explicit Document(QObject* parent = nullptr);
    ~Document() override;

    // Document state
    bool isModified() const { return modified_; }
    void setModified(bool modified);
    void clear();

    // Body management
    std::string addBody(const TopoDS_Shape& shape, const std::string& name = {});
    bool addBodyWithId(const std::string& id, const TopoDS_Shape& shape, const std::string& name = {});

    /**
     * @brief Replace a body's upstream geometry and rebind its face names.
     *
     * The current shape is reset to the new upstream shape; features that
     * read the body need a regeneration afterwards.
     */
    bool setUpstreamShape(const std::string& id, const TopoDS_Shape& shape);
    const TopoDS_Shape* getUpstreamShape(const std::string& id) const;

    bool updateBodyShape(const std::string& id, const TopoDS_Shape& shape, bool emitSignal = true);
    const TopoDS_Shape* getBodyShape(const std::string& id) const;
    void resetBodiesToUpstream();

    /**
     * @brief Body IDs in ascending order
     */
    std::vector<std::string> getBodyIds() const;
    bool removeBody(const std::string& id);
    std::string getBodyName(const std::string& id) const;
    void setBodyName(const std::string& id, const std::string& name);
    size_t bodyCount() const { return bodies_.size(); }

    // Feature timeline
    void addFeature(const FeatureRecord& record);
    bool insertFeature(std::size_t index, const FeatureRecord& record);
    bool updateFeatureParams(const std::string& featureId, const core::joint::JointParameters& params);
    bool updateFeatureFaces(const std::string& featureId, const std::vector<FaceRef>& faces);
    bool removeFeature(const std::string& featureId);
    int featureIndex(const std::string& featureId) const;
    FeatureRecord* findFeature(const std::string& featureId);
    const FeatureRecord* findFeature(const std::string& featureId) const;
    bool setFeatureSuppressed(const std::string& featureId, bool suppressed);
    bool isFeatureSuppressed(const std::string& featureId) const;
    std::unordered_map<std::string, bool> featureSuppressionState() const;
    void setFeatureSuppressionState(const std::unordered_map<std::string, bool>& state);
    void setFeatureFailed(const std::string& featureId, const std::string& reason);
    void clearFeatureFailed(const std::string& featureId);
    void clearFeatureFailures();
    bool isFeatureFailed(const std::string& featureId) const;
    std::string featureFailureReason(const std::string& featureId) const;
    const std::unordered_map<std::string, std::string>& featureFailures() const {
        return featureFailures_;
    }
    const std::vector<FeatureRecord>& features() const { return features_; }

    kernel::elementmap::ElementMap& elementMap() { return elementMap_; }
    const kernel::elementmap::ElementMap& elementMap() const { return elementMap_; }

signals:
    void bodyAdded(const QString& id);
    void bodyRemoved(const QString& id);
    void bodyRenamed(const QString& id, const QString& newName);
    void bodyUpdated(const QString& id);
    void upstreamChanged(const QString& id);
    void modifiedChanged(bool modified);
    void documentCleared();
    void featureAdded(const QString& featureId);
    void featureRemoved(const QString& featureId);
    void featureUpdated(const QString& featureId);
    void featureSuppressionChanged(const QString& featureId, bool suppressed);
    void featureFailed(const QString& featureId, const QString& reason);
    void featureSucceeded(const QString& featureId);

private:
    struct BodyEntry {
        TopoDS_Shape upstream;
        TopoDS_Shape current;
    };

    static std::vector<std::string> bodiesOfFaces(const std::vector<FaceRef>& faces);

    std::unordered_map<std::string, BodyEntry> bodies_;
    std::unordered_map<std::string, std::string> bodyNames_;  // id -> display name
    std::vector<FeatureRecord> features_;
    std::unordered_set<std::string> suppressedFeatures_;
    std::unordered_map<std::string, std::string> featureFailures_;
    kernel::elementmap::ElementMap elementMap_;
    bool modified_ = false;
    unsigned int nextBodyNumber_ = 1;
};

} // namespace boxjoint::app

#endif // BOXJOINT_APP_DOCUMENT_DOCUMENT_H
