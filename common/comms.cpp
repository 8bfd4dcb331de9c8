#include "comms.hh"

#include <cstdarg>  // For va_list.

static int console_vprintf(const char *format, va_list args) {
    char buf[kPrintfBufferMaxSize];

    // Formatted print to buffer.
    int res = vsnprintf(buf, kPrintfBufferMaxSize, format, args);
    if (res <= 0) {
        return res;  // vsnprintf failed.
    }
    fputs(buf, stdout);
    return res;
}

bool console_level_enabled(SettingsManager::LogLevel level) {
    return settings_manager.settings.log_level >= level;
}

int console_level_printf(SettingsManager::LogLevel level, const char *format, ...) {
    if (!console_level_enabled(level)) return 0;
    va_list args;
    va_start(args, format);
    int res = console_vprintf(format, args);
    va_end(args);
    return res;
}

int console_printf(const char *format, ...) {
    va_list args;
    va_start(args, format);
    int res = console_vprintf(format, args);
    va_end(args);
    return res;
}
