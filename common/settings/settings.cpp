#include "settings.hh"

#include <strings.h>  // for strcasecmp

#include "comms.hh"

SettingsManager settings_manager = SettingsManager();

bool SettingsManager::LogLevelFromString(const char *str, LogLevel &level_out) {
    if (str == nullptr) {
        return false;
    }
    for (uint16_t i = 0; i < kNumLogLevels; i++) {
        if (strcasecmp(str, kConsoleLogLevelStrs[i]) == 0) {
            level_out = static_cast<LogLevel>(i);
            return true;
        }
    }
    // Singular spellings used by other tools.
    if (strcasecmp(str, "error") == 0 || strcasecmp(str, "critical") == 0) {
        level_out = kErrors;
        return true;
    }
    if (strcasecmp(str, "warning") == 0) {
        level_out = kWarnings;
        return true;
    }
    return false;
}

void SettingsManager::Print() {
    char print_buf[200];
    uint16_t print_buf_len = 0;

    print_buf_len += snprintf(print_buf + print_buf_len, sizeof(print_buf) - print_buf_len, "Settings Struct\r\n");
    print_buf_len += snprintf(print_buf + print_buf_len, sizeof(print_buf) - print_buf_len, "\tLog Level: %s\r\n",
                              kConsoleLogLevelStrs[settings.log_level]);
    print_buf_len += snprintf(print_buf + print_buf_len, sizeof(print_buf) - print_buf_len, "\tGeoJSON Output: %s\r\n",
                              settings.print_geojson ? "ENABLED" : "DISABLED");
    CONSOLE_PRINTF("%s", print_buf);
}
