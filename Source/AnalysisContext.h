#pragma once

#include "AmbientLevelTracker.h"
#include "SensitivitySettings.h"

// Per-analysis shared state: calibration and user settings. One context per
// concurrently running analysis; nothing here is global.
class AnalysisContext
{
public:
    AnalysisContext() = default;

    void setSensitivityOffset(float db)  { sensitivity.setSensitivityOffset(db); }
    void setCalibrationOffset(float db)  { sensitivity.setCalibrationOffset(db); }
    void resetAmbient()                   { ambient.reset(); }
    void resetSensitivity()               { sensitivity.resetSensitivity(); }
    void resetCalibration()               { sensitivity.resetCalibration(); }

    AmbientLevelTracker& getAmbientTracker()                    { return ambient; }
    const AmbientLevelTracker& getAmbientTracker() const        { return ambient; }
    SensitivitySettings& getSensitivitySettings()               { return sensitivity; }
    const SensitivitySettings& getSensitivitySettings() const   { return sensitivity; }

private:
    AmbientLevelTracker ambient;
    SensitivitySettings sensitivity;

    JUCE_DECLARE_NON_COPYABLE(AnalysisContext)
};
