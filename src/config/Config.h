#pragma once

#include <cstdint>
#include <string>

namespace gridimg::config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

// How an hour glyph outside the four known symbols is treated.
enum class SymbolPolicy { Coerce, Reject };

enum class Transport { Stdio, Http };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

struct Config {
    // IO / paths
    std::string inputPath        = "";
    std::string outputPath       = "grid_availability.png";
    std::string configFile       = "";
    bool base64Output            = false;

    // rendering
    std::string fontPath         = "";
    bool hourLabels              = true;
    SymbolPolicy symbolPolicy    = SymbolPolicy::Coerce;

    // server
    Transport transport          = Transport::Stdio;
    std::string host             = "0.0.0.0";
    std::uint16_t port           = 8000;
    int threads                  = 2;
    std::string corsOrigin       = "";

    // logs
    LogLevel logLevel            = LogLevel::Info;

    // util
    bool showHelp                = false;
    bool showVersion             = false;
};

}  // namespace gridimg::config
