#pragma once

#include <iostream>
#include <string>

namespace apigen::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Logger for CLI output with color support (termcolor).
 *
 * Output routing:
 * - Errors, warnings -> stderr
 * - Info, success, verbose, debug -> stdout
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto,
                   std::ostream& out = std::cout,
                   std::ostream& err = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Indented list item, shown from `min_level` up
    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

private:
    LogLevel level_;
    std::ostream& out_;
    std::ostream& err_;

    bool should_log(LogLevel required_level) const;
};

} // namespace apigen::driver
