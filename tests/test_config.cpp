#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "config/ConfigProvider.h"

using gridimg::config::Config;
using gridimg::config::ConfigProvider;
using gridimg::config::LogLevel;
using gridimg::config::SymbolPolicy;
using gridimg::config::Transport;

namespace {

struct EnvGuard {
    explicit EnvGuard(std::string name) : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

ConfigProvider runConfig(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return ConfigProvider(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

int main() {
    EnvGuard portEnv("GRIDIMG_PORT");
    EnvGuard outputEnv("GRIDIMG_OUTPUT");
    EnvGuard configEnv("GRIDIMG_CONFIG");
    EnvGuard levelEnv("GRIDIMG_LOG_LEVEL");
    EnvGuard policyEnv("GRIDIMG_SYMBOL_POLICY");
    for (auto* guard : {&portEnv, &outputEnv, &configEnv, &levelEnv, &policyEnv}) {
        guard->clear();
    }

    // Defaults.
    {
        const Config config = runConfig({"gridimg"}).get();
        if (config.port != 8000 || config.outputPath != "grid_availability.png" || !config.inputPath.empty()
            || config.symbolPolicy != SymbolPolicy::Coerce || config.transport != Transport::Stdio
            || config.logLevel != LogLevel::Info || !config.hourLabels || config.base64Output) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
    }

    // Positional input/output.
    {
        auto provider = runConfig({"gridimg", "day.json", "out.png", "--base64"});
        const Config& config = provider.get();
        if (config.inputPath != "day.json" || config.outputPath != "out.png" || !config.base64Output
            || provider.positional().size() != 2) {
            std::cerr << "Positional arguments not applied\n";
            return 1;
        }
        if (runConfig({"gridimg", "-"}).get().inputPath != "-") {
            std::cerr << "'-' must be accepted as the stdin input\n";
            return 1;
        }
    }

    // File < ENV < CLI.
    const auto filePath = std::filesystem::temp_directory_path() / "gridimg_test_config.conf";
    {
        std::ofstream file(filePath);
        file << "# test config\n"
             << "port = 9100\n"
             << "outputPath=from_file.png\n"
             << "symbolPolicy=reject\n"
             << "logLevel=debug\n"
             << "hourLabels=false\n";
    }
    configEnv.set(filePath.string());
    {
        const Config config = runConfig({"gridimg"}).get();
        if (config.port != 9100 || config.outputPath != "from_file.png" || config.symbolPolicy != SymbolPolicy::Reject
            || config.logLevel != LogLevel::Debug || config.hourLabels || config.configFile != filePath.string()) {
            std::cerr << "Config file values not applied\n";
            return 1;
        }
    }

    portEnv.set("9001");
    outputEnv.set("from_env.png");
    {
        const Config config = runConfig({"gridimg"}).get();
        if (config.port != 9001 || config.outputPath != "from_env.png") {
            std::cerr << "Environment must override the config file\n";
            return 1;
        }
    }

    {
        const Config config = runConfig({"gridimg", "--port=9200", "-o", "from_cli.png", "--symbol-policy", "coerce",
                                         "--hour-labels=yes", "--http"})
                                  .get();
        if (config.port != 9200 || config.outputPath != "from_cli.png" || config.symbolPolicy != SymbolPolicy::Coerce
            || !config.hourLabels || config.transport != Transport::Http) {
            std::cerr << "CLI must override environment and file\n";
            return 1;
        }
    }

    // Invalid values keep the previous value.
    {
        const Config config = runConfig({"gridimg", "--port", "70000", "--transport", "carrier-pigeon",
                                         "--threads", "abc"})
                                  .get();
        if (config.port != 9001 || config.transport != Transport::Stdio || config.threads != 2) {
            std::cerr << "Invalid values must not replace previous ones\n";
            return 1;
        }
    }

    std::filesystem::remove(filePath);

    if (ConfigProvider::parseSymbolPolicy("bogus") || ConfigProvider::parseTransport("") ||
        ConfigProvider::parseLogLevel("WARNING") != LogLevel::Warn) {
        std::cerr << "Value parsers are wrong\n";
        return 1;
    }

    std::cout << "test_config passed\n";
    return 0;
}
