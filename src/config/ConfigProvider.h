#pragma once

#include "config/Config.h"

#include <optional>
#include <string>
#include <vector>

namespace gridimg::config {

class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const { return cfg_; }

    // Positional arguments that were not consumed as option values.
    const std::vector<std::string>& positional() const { return positional_; }

    static LogLevel parseLogLevel(const std::string& s);
    static std::string logLevelToString(LogLevel l);
    static std::optional<SymbolPolicy> parseSymbolPolicy(const std::string& s);
    static std::string symbolPolicyToString(SymbolPolicy p);
    static std::optional<Transport> parseTransport(const std::string& s);
    static std::string transportToString(Transport t);

private:
    Config cfg_;
    std::vector<std::string> positional_;

    void parseCli_(int argc, const char* const* argv);
    void parseEnv_();
    void parseFile_(const std::string& path);

    void applySymbolPolicy_(const std::string& value);
    void applyTransport_(const std::string& value);
    void applyPort_(const std::string& value);
    void applyThreads_(const std::string& value);
    void applyHourLabels_(const std::string& value);

    static bool fileExists_(const std::string& path);
    static std::string trim_(const std::string& s);
    static bool parseBool_(const std::string& value, bool& out);
    static bool parseInt_(const std::string& value, int& out);
    static std::string lowercase_(std::string s);
};

}  // namespace gridimg::config
