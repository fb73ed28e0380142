#include "app/RenderService.h"
#include "config/ConfigProvider.h"
#include "domain/Errors.h"
#include "domain/InputValidator.h"
#include "logging/Log.h"
#include "ui/ResourceProvider.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <boost/json/value.hpp>

namespace gridimg::bootstrap {
namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Sample day rendered when no input is given.
constexpr const char* kSampleDay = R"({
  "T_00": "●", "T_01": "●", "T_02": "●", "T_03": "●", "T_04": "●", "T_05": "●",
  "T_06": "✕", "T_07": "✕", "T_08": "✕", "T_09": "✕", "T_10": "✕", "T_11": "✕",
  "T_12": "✕", "T_13": "●", "T_14": "●", "T_15": "●", "T_16": "%", "T_17": "✕",
  "T_18": "✕", "T_19": "✕", "T_20": "✕", "T_21": "✕", "T_22": "✕", "T_23": "%",
  "T_24": "-", "T_Date": "20-11-2025"
})";

void printHelp(const config::Config& defaults) {
    std::cout << "Usage: gridimg [input.json|-] [output.png] [options]\n"
              << "  input.json                  Day record (T_Date + T_00..T_23); '-' reads stdin\n"
              << "  output.png                  (default: " << defaults.outputPath << ")\n"
              << "  -o, --output PATH           Same as the second positional argument\n"
              << "      --base64                Print the PNG as base64 on stdout instead of writing a file\n"
              << "      --font PATH             Preferred TTF/OTF font\n"
              << "      --hour-labels=BOOL      (default: " << (defaults.hourLabels ? "true" : "false") << ")\n"
              << "      --no-hour-labels\n"
              << "      --symbol-policy POLICY  coerce|reject (default: "
              << config::ConfigProvider::symbolPolicyToString(defaults.symbolPolicy) << ")\n"
              << "      --config FILE           key=value file (outputPath=..., fontPath=..., etc.)\n"
              << "  -l, --log-level LEVEL       trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --help                  Show this help\n"
              << "      --version               Show the version\n"
              << "Environment: GRIDIMG_OUTPUT, GRIDIMG_FONT, GRIDIMG_HOUR_LABELS, GRIDIMG_SYMBOL_POLICY,\n"
              << "             GRIDIMG_LOG_LEVEL, GRIDIMG_CONFIG\n"
              << "Precedence: CLI > ENV > file > defaults\n";
}

void printVersion() {
#ifdef PROJECT_NAME
    std::cout << PROJECT_NAME;
#else
    std::cout << "gridimg";
#endif
#ifdef PROJECT_VERSION
    std::cout << ' ' << PROJECT_VERSION;
#endif
    std::cout << '\n';
}

std::string readInput(const std::string& source) {
    if (source.empty()) {
        LOG_INFO(logging::LogCategory::INPUT,
                 "Using example data. Provide a JSON file as argument or pipe JSON via stdin.");
        return kSampleDay;
    }
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw domain::RenderError(domain::ErrorKind::MalformedInput, "Cannot open input file: " + source);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        printHelp(config::Config{});
        return EXIT_SUCCESS;
    }

    if (config.showVersion) {
        printVersion();
        return EXIT_SUCCESS;
    }

    if (provider.positional().size() > 2) {
        std::cerr << "Too many arguments; see --help\n";
        return kExitUsage;
    }

    logging::Log::set_log_level(config.logLevel);
    LOG_DEBUG(logging::LogCategory::CONFIG,
              "Startup level=%s output=%s symbolPolicy=%s",
              logging::Log::level_to_string(config.logLevel),
              config.outputPath.c_str(),
              config::ConfigProvider::symbolPolicyToString(config.symbolPolicy).c_str());

    try {
        ui::ResourceProvider resources(config.fontPath);
        const app::RenderService service(config, resources);

        const boost::json::value input = domain::InputValidator::parseText(readInput(config.inputPath));

        if (config.base64Output) {
            std::cout << service.renderToBase64(input) << '\n';
            return EXIT_SUCCESS;
        }

        service.renderToFile(input, config.outputPath);
        std::cout << "Image saved to: " << config.outputPath << '\n';
        return EXIT_SUCCESS;
    }
    catch (const domain::RenderError& ex) {
        std::cerr << "Error (" << ex.code() << "): " << ex.what() << '\n';
        return kExitFailure;
    }
    catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return kExitFailure;
    }
}

}  // namespace gridimg::bootstrap

int main(int argc, char** argv) {
    return gridimg::bootstrap::run(argc, argv);
}
