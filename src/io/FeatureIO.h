/**
 * @file FeatureIO.h
 * @brief Serialization of the joint feature timeline
 *
 * Files written to a feature directory:
 *   features.jsonl  one compact JSON object per feature, timeline order
 *   state.json      suppressed feature IDs
 */

#ifndef BOXJOINT_IO_FEATUREIO_H
#define BOXJOINT_IO_FEATUREIO_H

#include "../app/document/FeatureRecord.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace boxjoint::app {
class Document;
}

namespace boxjoint::io {

/**
 * @brief Read and write feature records as JSON.
 *
 * Only selections and parameters are durable; contact regions and finger
 * patterns are rebuilt on the next regeneration.
 */
class FeatureIO {
public:
    static bool saveFeatures(const QString& directory,
                             const std::vector<app::FeatureRecord>& features,
                             const std::unordered_map<std::string, bool>& suppressionState,
                             QString& errorMessage);

    /**
     * @brief Append the stored features to @p document and restore suppression.
     *
     * A missing feature file is an empty timeline, not an error.
     */
    static bool loadFeatures(const QString& directory,
                             app::Document* document,
                             QString& errorMessage);

    static QJsonObject serializeFeature(const app::FeatureRecord& feature);
    static std::optional<app::FeatureRecord> deserializeFeature(const QJsonObject& json,
                                                                QString& errorMessage);

    /**
     * @brief SHA-256 over the compact serialization, hex encoded.
     */
    static QString computeFeaturesHash(const std::vector<app::FeatureRecord>& features);

    static constexpr const char* kFeaturesFileName = "features.jsonl";
    static constexpr const char* kStateFileName = "state.json";
};

} // namespace boxjoint::io

#endif // BOXJOINT_IO_FEATUREIO_H
