/**
 * @file JointSettings.h
 * @brief Default joint parameters and runtime options from QSettings and the environment.
 */
#ifndef BOXJOINT_APP_SETTINGS_JOINTSETTINGS_H
#define BOXJOINT_APP_SETTINGS_JOINTSETTINGS_H

#include "../../core/joint/JointTypes.h"

namespace boxjoint::app {

/**
 * @brief Defaults used when a new Box Joint feature is created.
 *
 * load() reads QSettings("BoxJoint", "BoxJoint") and then applies BOXJOINT_*
 * environment overrides. Values that do not parse or are out of range fall
 * back to the built-in default and log a warning. The built-in defaults are
 * the JointParameters member initializers, shared with FeatureIO.
 */
class JointSettings {
public:
    JointSettings();

    static JointSettings load();
    static core::joint::JointParameters builtInParameters();

    /**
     * @brief Writes the current parameter defaults and runtime options.
     */
    void saveDefaults() const;

    const core::joint::JointParameters& parameters() const { return parameters_; }
    void setParameters(const core::joint::JointParameters& params) { parameters_ = params; }

    /// Worker threads for independent regions; 0 uses the global pool.
    int regionThreads() const { return regionThreads_; }
    void setRegionThreads(int threads) { regionThreads_ = threads; }

private:
    core::joint::JointParameters parameters_;
    int regionThreads_ = 0;
};

} // namespace boxjoint::app

#endif // BOXJOINT_APP_SETTINGS_JOINTSETTINGS_H
