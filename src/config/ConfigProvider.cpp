#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace gridimg::config {

namespace {
constexpr int kMaxThreads = 64;
}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    if (!cliConfigPath.empty()) {
        if (fileExists_(cliConfigPath)) {
            parseFile_(cliConfigPath);
            cfg_.configFile = cliConfigPath;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", cliConfigPath.c_str());
        }
    }
    else if (const char* envCfg = std::getenv("GRIDIMG_CONFIG")) {
        std::string path(envCfg);
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    switch (l) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

std::optional<SymbolPolicy> ConfigProvider::parseSymbolPolicy(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "coerce" || lower == "unknown") {
        return SymbolPolicy::Coerce;
    }
    if (lower == "reject" || lower == "strict") {
        return SymbolPolicy::Reject;
    }
    return std::nullopt;
}

std::string ConfigProvider::symbolPolicyToString(SymbolPolicy p) {
    switch (p) {
    case SymbolPolicy::Coerce:
        return "coerce";
    case SymbolPolicy::Reject:
        return "reject";
    }
    return "coerce";
}

std::optional<Transport> ConfigProvider::parseTransport(const std::string& value) {
    std::string lower = lowercase_(value);
    if (lower == "stdio") {
        return Transport::Stdio;
    }
    if (lower == "http") {
        return Transport::Http;
    }
    return std::nullopt;
}

std::string ConfigProvider::transportToString(Transport t) {
    switch (t) {
    case Transport::Stdio:
        return "stdio";
    case Transport::Http:
        return "http";
    }
    return "stdio";
}

void ConfigProvider::applySymbolPolicy_(const std::string& value) {
    if (auto policy = parseSymbolPolicy(value)) {
        cfg_.symbolPolicy = *policy;
    }
    else {
        std::fprintf(stderr, "Invalid symbol policy: %s (expected coerce|reject)\n", value.c_str());
    }
}

void ConfigProvider::applyTransport_(const std::string& value) {
    if (auto transport = parseTransport(value)) {
        cfg_.transport = *transport;
    }
    else {
        std::fprintf(stderr, "Invalid transport: %s (expected stdio|http)\n", value.c_str());
    }
}

void ConfigProvider::applyPort_(const std::string& value) {
    int port{};
    if (parseInt_(value, port) && port > 0 && port <= 65535) {
        cfg_.port = static_cast<std::uint16_t>(port);
    }
    else {
        std::fprintf(stderr, "Invalid port: %s\n", value.c_str());
    }
}

void ConfigProvider::applyThreads_(const std::string& value) {
    int threads{};
    if (parseInt_(value, threads) && threads > 0) {
        cfg_.threads = std::min(threads, kMaxThreads);
    }
    else {
        std::fprintf(stderr, "Invalid thread count: %s\n", value.c_str());
    }
}

void ConfigProvider::applyHourLabels_(const std::string& value) {
    bool flag{};
    if (parseBool_(value, flag)) {
        cfg_.hourLabels = flag;
    }
    else {
        std::fprintf(stderr, "Invalid value for hour labels: %s\n", value.c_str());
    }
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            cfg_.showHelp = true;
        }
        else if (arg == "--version") {
            cfg_.showVersion = true;
        }
        else if (arg == "--config") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.configFile = *next;
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cfg_.configFile = arg.substr(9);
        }
        else if (arg == "--input") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.inputPath = *next;
            }
        }
        else if (arg == "--output" || arg == "-o") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.outputPath = *next;
            }
        }
        else if (arg == "--base64") {
            cfg_.base64Output = true;
        }
        else if (arg == "--font") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.fontPath = *next;
            }
        }
        else if (arg == "--no-hour-labels") {
            cfg_.hourLabels = false;
        }
        else if (arg == "--symbol-policy") {
            if (auto next = takeNext(arg.c_str())) {
                applySymbolPolicy_(*next);
            }
        }
        else if (arg == "--transport") {
            if (auto next = takeNext(arg.c_str())) {
                applyTransport_(*next);
            }
        }
        else if (arg == "--http") {
            cfg_.transport = Transport::Http;
        }
        else if (arg == "--host") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.host = *next;
            }
        }
        else if (arg == "--port" || arg == "-p") {
            if (auto next = takeNext(arg.c_str())) {
                applyPort_(*next);
            }
        }
        else if (arg == "--threads" || arg == "-t") {
            if (auto next = takeNext(arg.c_str())) {
                applyThreads_(*next);
            }
        }
        else if (arg == "--cors-origin") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.corsOrigin = *next;
            }
        }
        else if (arg == "--log-level" || arg == "-l") {
            if (auto next = takeNext(arg.c_str())) {
                cfg_.logLevel = parseLogLevel(*next);
            }
        }
        else if (arg.rfind("--log-level=", 0) == 0) {
            cfg_.logLevel = parseLogLevel(arg.substr(12));
        }
        else if (arg.rfind("--input=", 0) == 0) {
            cfg_.inputPath = arg.substr(8);
        }
        else if (arg.rfind("--output=", 0) == 0) {
            cfg_.outputPath = arg.substr(9);
        }
        else if (arg.rfind("--font=", 0) == 0) {
            cfg_.fontPath = arg.substr(7);
        }
        else if (arg.rfind("--hour-labels=", 0) == 0) {
            applyHourLabels_(arg.substr(14));
        }
        else if (arg.rfind("--symbol-policy=", 0) == 0) {
            applySymbolPolicy_(arg.substr(16));
        }
        else if (arg.rfind("--transport=", 0) == 0) {
            applyTransport_(arg.substr(12));
        }
        else if (arg.rfind("--host=", 0) == 0) {
            cfg_.host = arg.substr(7);
        }
        else if (arg.rfind("--port=", 0) == 0) {
            applyPort_(arg.substr(7));
        }
        else if (arg.rfind("--threads=", 0) == 0) {
            applyThreads_(arg.substr(10));
        }
        else if (arg.rfind("--cors-origin=", 0) == 0) {
            cfg_.corsOrigin = arg.substr(14);
        }
        else if (arg == "-" || arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
        }
        else {
            std::fprintf(stderr, "Unknown option ignored: %s\n", arg.c_str());
        }
    }

    if (!positional_.empty()) {
        cfg_.inputPath = positional_[0];
    }
    if (positional_.size() > 1) {
        cfg_.outputPath = positional_[1];
    }
}

void ConfigProvider::parseEnv_() {
    if (const char* value = std::getenv("GRIDIMG_OUTPUT")) {
        cfg_.outputPath = value;
    }
    if (const char* value = std::getenv("GRIDIMG_FONT")) {
        cfg_.fontPath = value;
    }
    if (const char* value = std::getenv("GRIDIMG_HOUR_LABELS")) {
        applyHourLabels_(value);
    }
    if (const char* value = std::getenv("GRIDIMG_SYMBOL_POLICY")) {
        applySymbolPolicy_(value);
    }
    if (const char* value = std::getenv("GRIDIMG_TRANSPORT")) {
        applyTransport_(value);
    }
    if (const char* value = std::getenv("GRIDIMG_HOST")) {
        cfg_.host = value;
    }
    if (const char* value = std::getenv("GRIDIMG_PORT")) {
        applyPort_(value);
    }
    if (const char* value = std::getenv("GRIDIMG_THREADS")) {
        applyThreads_(value);
    }
    if (const char* value = std::getenv("GRIDIMG_CORS_ORIGIN")) {
        cfg_.corsOrigin = value;
    }
    if (const char* value = std::getenv("GRIDIMG_LOG_LEVEL")) {
        cfg_.logLevel = parseLogLevel(value);
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Unable to open config file: %s\n", path.c_str());
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim_(line.substr(0, pos));
        std::string value = trim_(line.substr(pos + 1));

        if (key == "outputPath") {
            cfg_.outputPath = value;
        }
        else if (key == "fontPath") {
            cfg_.fontPath = value;
        }
        else if (key == "hourLabels") {
            applyHourLabels_(value);
        }
        else if (key == "symbolPolicy") {
            applySymbolPolicy_(value);
        }
        else if (key == "transport") {
            applyTransport_(value);
        }
        else if (key == "host") {
            cfg_.host = value;
        }
        else if (key == "port") {
            applyPort_(value);
        }
        else if (key == "threads") {
            applyThreads_(value);
        }
        else if (key == "corsOrigin") {
            cfg_.corsOrigin = value;
        }
        else if (key == "logLevel") {
            cfg_.logLevel = parseLogLevel(value);
        }
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseBool_(const std::string& value, bool& out) {
    std::string lower = lowercase_(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::logic_error&) {
        std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
        return false;
    }
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace gridimg::config
