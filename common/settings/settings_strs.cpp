#include "settings.hh"

// These strings are initialized here since they can't be initialized in settings.hh because they are static.
const char SettingsManager::kConsoleLogLevelStrs[SettingsManager::LogLevel::kNumLogLevels]
                                                [SettingsManager::kConsoleLogLevelStrMaxLen] = {
                                                    "SILENT", "ERRORS", "WARNINGS", "INFO", "DEBUG"};
