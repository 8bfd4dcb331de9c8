#ifndef COMMS_HH_
#define COMMS_HH_

#include <cstdio>

#include "settings.hh"

#define TEXT_COLOR_RED          "\033[31m"
#define TEXT_COLOR_GREEN        "\033[32m"
#define TEXT_COLOR_YELLOW       "\033[33m" /* orange on some systems */
#define TEXT_COLOR_DARK_GRAY    "\033[90m"

#define TEXT_COLOR_RESET        "\033[0m"

static constexpr uint16_t kPrintfBufferMaxSize = 1000;

/**
 * Prints a formatted message to the console if the configured log level is at least as verbose as level.
 * @param[in] level Log level of the message.
 * @param[in] format printf style format string.
 * @retval Number of characters printed, 0 if the message was filtered out, negative on a formatting error.
 */
int console_level_printf(SettingsManager::LogLevel level, const char *format, ...);

/**
 * Prints a formatted message to the console regardless of log level.
 */
int console_printf(const char *format, ...);

/**
 * Returns true if a message at the provided level would be printed. Used to skip expensive formatting of debug
 * messages.
 */
bool console_level_enabled(SettingsManager::LogLevel level);

#define CONSOLE_PRINTF(format, ...) console_printf(format __VA_OPT__(, ) __VA_ARGS__);
#define CONSOLE_DEBUG(tag, format, ...)                                                                              \
    console_level_printf(SettingsManager::LogLevel::kDebug,                                                          \
                         tag ": " TEXT_COLOR_DARK_GRAY format TEXT_COLOR_RESET "\r\n" __VA_OPT__(, ) __VA_ARGS__);
#define CONSOLE_INFO(tag, format, ...) \
    console_level_printf(SettingsManager::LogLevel::kInfo, tag ": " format "\r\n" __VA_OPT__(, ) __VA_ARGS__);
#define CONSOLE_WARNING(tag, format, ...)                                                                          \
    console_level_printf(SettingsManager::LogLevel::kWarnings,                                                     \
                         tag ": " TEXT_COLOR_YELLOW format TEXT_COLOR_RESET "\r\n" __VA_OPT__(, ) __VA_ARGS__);
#define CONSOLE_ERROR(tag, format, ...)                                                                        \
    console_level_printf(SettingsManager::LogLevel::kErrors,                                                   \
                         tag ": " TEXT_COLOR_RED format TEXT_COLOR_RESET "\r\n" __VA_OPT__(, ) __VA_ARGS__);

#endif /* COMMS_HH_ */
