#ifndef SETTINGS_HH_
#define SETTINGS_HH_

#include <cstdint>

class SettingsManager {
   public:
    enum LogLevel : uint16_t { kSilent = 0, kErrors, kWarnings, kInfo, kDebug, kNumLogLevels };
    static constexpr uint16_t kConsoleLogLevelStrMaxLen = 30;
    static const char kConsoleLogLevelStrs[LogLevel::kNumLogLevels][kConsoleLogLevelStrMaxLen];

    // Runtime settings for the tile inspection tool. Nothing is persisted.
    struct Settings {
        LogLevel log_level = LogLevel::kInfo;
        bool print_geojson = true;  // Print GeoJSON features for tile centers and bounding boxes.
    };

    /**
     * Looks up a log level by name. Matches the names in kConsoleLogLevelStrs without regard to case, and also accepts
     * the singular names "error" and "warning" as well as "critical" (treated as errors).
     * @param[in] str Name of the log level.
     * @param[out] level_out Matched log level. Untouched if no match was found.
     * @retval True if the name was recognized, false otherwise.
     */
    static bool LogLevelFromString(const char *str, LogLevel &level_out);

    /**
     * Prints the current settings to the console.
     */
    void Print();

    /**
     * Restores all settings to their default values.
     */
    void ResetToDefaults() { settings = Settings(); }

    Settings settings;
};

extern SettingsManager settings_manager;

#endif /* SETTINGS_HH_ */
