// WatchParty - Watch-party signaling and process supervision core
// Configuration Manager Implementation

#include "watchparty/core/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace watchparty {
namespace core {

namespace {

// =============================================================================
// Minimal YAML Reader (block mappings and scalars)
// =============================================================================

class YamlParser {
public:
    explicit YamlParser(const std::string& input) : input_(input) {}

    Result<JsonValue, ConfigError> parse() {
        lines_.clear();
        std::istringstream stream(input_);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines_.push_back(line);
        }

        JsonValue root = JsonValue::object();
        auto result = parseMapping(root, 0, 0, lines_.size());
        if (result.isError()) {
            return Result<JsonValue, ConfigError>::error(result.error());
        }
        return Result<JsonValue, ConfigError>::success(std::move(root));
    }

private:
    std::string input_;
    std::vector<std::string> lines_;

    static size_t getIndent(const std::string& line) {
        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            indent++;
        }
        return indent;
    }

    static std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(start, end - start);
    }

    static bool isBlankOrComment(const std::string& line) {
        std::string trimmed = trim(line);
        return trimmed.empty() || trimmed[0] == '#';
    }

    // Removes a trailing " # comment" outside of quotes
    static std::string stripComment(const std::string& value) {
        char quote = '\0';
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (quote != '\0') {
                if (c == quote) quote = '\0';
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(value[i - 1])))) {
                return trim(value.substr(0, i));
            }
        }
        return value;
    }

    Result<void, ConfigError> parseMapping(JsonValue& obj, size_t baseIndent,
                                           size_t startLine, size_t endLine) {
        size_t i = startLine;
        while (i < endLine) {
            if (isBlankOrComment(lines_[i])) {
                i++;
                continue;
            }

            size_t indent = getIndent(lines_[i]);
            if (indent < baseIndent) {
                break;
            }

            std::string line = trim(lines_[i]);
            size_t colonPos = line.find(':');
            if (colonPos == std::string::npos) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ParseError,
                                "Expected 'key: value'", "", static_cast<int>(i + 1)));
            }

            std::string key = trim(line.substr(0, colonPos));
            std::string valueStr = stripComment(trim(line.substr(colonPos + 1)));

            if (!valueStr.empty()) {
                obj.set(key, parseScalar(valueStr));
                i++;
                continue;
            }

            // Nested mapping: extends over the following deeper-indented lines
            size_t nestedEnd = i + 1;
            size_t nestedIndent = 0;
            while (nestedEnd < endLine) {
                if (isBlankOrComment(lines_[nestedEnd])) {
                    nestedEnd++;
                    continue;
                }
                size_t lineIndent = getIndent(lines_[nestedEnd]);
                if (lineIndent <= indent) {
                    break;
                }
                if (nestedIndent == 0) {
                    nestedIndent = lineIndent;
                }
                nestedEnd++;
            }

            JsonValue nested = JsonValue::object();
            if (nestedIndent > 0) {
                auto result = parseMapping(nested, nestedIndent, i + 1, nestedEnd);
                if (result.isError()) {
                    return result;
                }
            }
            obj.set(key, std::move(nested));
            i = nestedEnd;
        }

        return Result<void, ConfigError>::success();
    }

    static JsonValue parseScalar(const std::string& value) {
        // Quoted scalars are always strings
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return JsonValue(value.substr(1, value.size() - 2));
        }

        if (value == "true" || value == "True" || value == "TRUE") {
            return JsonValue(true);
        }
        if (value == "false" || value == "False" || value == "FALSE") {
            return JsonValue(false);
        }
        if (value == "null" || value == "~") {
            return JsonValue();
        }

        errno = 0;
        char* end = nullptr;
        double number = std::strtod(value.c_str(), &end);
        if (errno == 0 && end == value.c_str() + value.size() &&
            (std::isdigit(static_cast<unsigned char>(value[0])) || value[0] == '-')) {
            return JsonValue(number);
        }

        return JsonValue(value);
    }
};

// =============================================================================
// Field Readers
// =============================================================================

using VoidResult = Result<void, ConfigError>;

VoidResult validationError(const std::string& message, const std::string& field) {
    return VoidResult::error(ConfigError(ConfigError::Code::ValidationError, message, field));
}

VoidResult readPort(const JsonValue& section, const std::string& prefix,
                    const char* key, bool allowZero, uint16_t& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const JsonValue& value = section[key];
    int64_t port = value.isInteger() ? value.getInt() : -1;
    if (port < (allowZero ? 0 : 1) || port > 65535) {
        return validationError(prefix + "." + key + " must be between " +
                               (allowZero ? "0" : "1") + " and 65535",
                               prefix + "." + key);
    }
    out = static_cast<uint16_t>(port);
    return VoidResult::success();
}

VoidResult readUint(const JsonValue& section, const std::string& prefix,
                    const char* key, uint32_t& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const JsonValue& value = section[key];
    if (!value.isInteger() || value.getInt() < 0 || value.getInt() > UINT32_MAX) {
        return validationError(prefix + "." + key + " must be a non-negative integer",
                               prefix + "." + key);
    }
    out = static_cast<uint32_t>(value.getInt());
    return VoidResult::success();
}

// Numbers are accepted for string fields ("code: 114514" in YAML)
void readString(const JsonValue& section, const char* key, std::string& out) {
    if (!section.contains(key)) {
        return;
    }
    const JsonValue& value = section[key];
    if (value.isString()) {
        out = value.getString();
    } else if (value.isInteger()) {
        out = std::to_string(value.getInt());
    }
}

void readBool(const JsonValue& section, const char* key, bool& out) {
    if (section.contains(key) && section[key].isBool()) {
        out = section[key].getBool();
    }
}

VoidResult validateConfiguration(const Configuration& config) {
    const auto& net = config.network;
    if (net.srtInputPort == 0) {
        return validationError("network.srtInputPort must be between 1 and 65535",
                               "network.srtInputPort");
    }
    if (net.rtmpPort == 0) {
        return validationError("network.rtmpPort must be between 1 and 65535",
                               "network.rtmpPort");
    }
    if (net.srtBasePort == 0) {
        return validationError("network.srtBasePort must be between 1 and 65535",
                               "network.srtBasePort");
    }
    if (net.portSearchAttempts == 0) {
        return validationError("network.portSearchAttempts must be greater than 0",
                               "network.portSearchAttempts");
    }
    if (net.verificationCode.empty()) {
        return validationError("network.verificationCode must not be empty",
                               "network.verificationCode");
    }
    if (net.hostNickname.empty()) {
        return validationError("network.hostNickname must not be empty",
                               "network.hostNickname");
    }
    if (net.bindAddress.empty()) {
        return validationError("network.bindAddress must not be empty",
                               "network.bindAddress");
    }
    if (config.relay.ingestLatencyMs == 0 || config.relay.viewerLatencyMs == 0) {
        return validationError("relay latencies must be greater than 0",
                               config.relay.ingestLatencyMs == 0 ? "relay.ingestLatencyMs"
                                                                 : "relay.viewerLatencyMs");
    }
    if (config.logging.enableFile && config.logging.filePath.empty()) {
        return validationError("logging.filePath is required when file logging is enabled",
                               "logging.filePath");
    }
    return VoidResult::success();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t maxValue) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() || value > maxValue) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto format = detectFormat(filePath);
    if (!format) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::UnsupportedFormat,
                        "Unsupported configuration file format. Use .json, .yaml, or .yml"));
    }

    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }

    log("Loading configuration from " + filePath);
    return *format == ConfigFormat::JSON
        ? loadFromJsonString(contentResult.value())
        : loadFromYamlString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = parseJson(jsonContent);
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        parsed.error().message + " at offset " +
                            std::to_string(parsed.error().position)));
    }

    auto result = applyDocument(parsed.value());
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadFromYamlString(const std::string& yamlContent) {
    YamlParser parser(yamlContent);
    auto parsed = parser.parse();
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(parsed.error());
    }

    auto result = applyDocument(parsed.value());
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }

    log("Configuration loaded with default values");
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overridePort = [this](const char* name, uint16_t& target) {
        if (auto val = getEnvVar(name)) {
            auto port = parseUnsigned(*val, 65535);
            if (port && *port > 0) {
                target = static_cast<uint16_t>(*port);
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    auto overrideString = [this](const char* name, std::string& target) {
        if (auto val = getEnvVar(name)) {
            if (val->empty()) {
                log(std::string("Warning: Empty ") + name + " value ignored");
                return;
            }
            target = *val;
            log(std::string("Environment override: ") + name + "=" + *val);
        }
    };

    // Network settings
    overridePort("WATCHPARTY_WEBSOCKET_PORT", config_.network.websocketPort);
    overridePort("WATCHPARTY_SRT_INPUT_PORT", config_.network.srtInputPort);
    overridePort("WATCHPARTY_RTMP_PORT", config_.network.rtmpPort);
    overridePort("WATCHPARTY_SRT_BASE_PORT", config_.network.srtBasePort);
    overrideString("WATCHPARTY_BIND_ADDRESS", config_.network.bindAddress);
    overrideString("WATCHPARTY_HOST_NICKNAME", config_.network.hostNickname);

    if (auto val = getEnvVar("WATCHPARTY_VERIFICATION_CODE")) {
        if (val->empty()) {
            log("Warning: Empty WATCHPARTY_VERIFICATION_CODE value ignored");
        } else {
            config_.network.verificationCode = *val;
            log("Environment override: WATCHPARTY_VERIFICATION_CODE=<redacted>");
        }
    }

    // Program locations
    overrideString("WATCHPARTY_FFMPEG_PATH", config_.programs.ffmpegPath);
    overrideString("WATCHPARTY_MPV_PATH", config_.programs.mpvPath);
    overrideString("WATCHPARTY_NGINX_PATH", config_.programs.nginxPath);

    // Logging settings
    if (auto val = getEnvVar("WATCHPARTY_LOG_LEVEL")) {
        std::string lower = toLower(*val);
        if (lower == "debug" || lower == "info" || lower == "warning" ||
            lower == "warn" || lower == "error") {
            config_.logging.level = stringToLogLevel(lower);
            log("Environment override: WATCHPARTY_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid WATCHPARTY_LOG_LEVEL value: " + *val);
        }
    }

    overrideString("WATCHPARTY_LOG_FILE", config_.logging.filePath);

    if (auto val = getEnvVar("WATCHPARTY_LOG_JSON")) {
        std::string lower = toLower(*val);
        config_.logging.enableJson = (lower == "true" || lower == "1" || lower == "yes");
        log("Environment override: WATCHPARTY_LOG_JSON=" + *val);
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return validateConfiguration(config_);
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig(ConfigFormat format) const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    const auto& net = config_.network;
    const auto& programs = config_.programs;
    const auto& relay = config_.relay;
    const auto& logging = config_.logging;

    if (format == ConfigFormat::JSON) {
        JsonValue network = JsonValue::object();
        network.set("websocketPort", net.websocketPort)
               .set("srtInputPort", net.srtInputPort)
               .set("rtmpPort", net.rtmpPort)
               .set("srtBasePort", net.srtBasePort)
               .set("portSearchAttempts", static_cast<int64_t>(net.portSearchAttempts))
               .set("bindAddress", net.bindAddress)
               .set("hostNickname", net.hostNickname)
               .set("connectionTimeoutMs", static_cast<int64_t>(net.connectionTimeoutMs))
               .set("reconnectIntervalMs", static_cast<int64_t>(net.reconnectIntervalMs))
               .set("maxReconnectAttempts", static_cast<int64_t>(net.maxReconnectAttempts))
               .set("heartbeatIntervalMs", static_cast<int64_t>(net.heartbeatIntervalMs))
               .set("preferIpv6", net.preferIpv6);

        JsonValue programsJson = JsonValue::object();
        programsJson.set("ffmpegPath", programs.ffmpegPath)
                    .set("mpvPath", programs.mpvPath)
                    .set("nginxPath", programs.nginxPath);

        JsonValue relayJson = JsonValue::object();
        relayJson.set("ingestLatencyMs", static_cast<int64_t>(relay.ingestLatencyMs))
                 .set("viewerLatencyMs", static_cast<int64_t>(relay.viewerLatencyMs))
                 .set("restartDelayMs", static_cast<int64_t>(relay.restartDelayMs))
                 .set("stopTimeoutMs", static_cast<int64_t>(relay.stopTimeoutMs))
                 .set("rtmpApp", relay.rtmpApp)
                 .set("streamKey", relay.streamKey);

        JsonValue loggingJson = JsonValue::object();
        loggingJson.set("level", logLevelToString(logging.level))
                   .set("enableConsole", logging.enableConsole)
                   .set("enableFile", logging.enableFile)
                   .set("filePath", logging.filePath)
                   .set("logDirectory", logging.logDirectory)
                   .set("enableJson", logging.enableJson)
                   .set("maxFileSizeMB", static_cast<int64_t>(logging.maxFileSizeMB))
                   .set("maxFiles", static_cast<int64_t>(logging.maxFiles));

        JsonValue root = JsonValue::object();
        root.set("network", std::move(network))
            .set("programs", std::move(programsJson))
            .set("relay", std::move(relayJson))
            .set("logging", std::move(loggingJson));
        return root.dump();
    }

    std::ostringstream ss;
    ss << "network:\n";
    ss << "  websocketPort: " << net.websocketPort << "\n";
    ss << "  srtInputPort: " << net.srtInputPort << "\n";
    ss << "  rtmpPort: " << net.rtmpPort << "\n";
    ss << "  srtBasePort: " << net.srtBasePort << "\n";
    ss << "  portSearchAttempts: " << net.portSearchAttempts << "\n";
    ss << "  bindAddress: \"" << net.bindAddress << "\"\n";
    ss << "  hostNickname: \"" << net.hostNickname << "\"\n";
    ss << "  connectionTimeoutMs: " << net.connectionTimeoutMs << "\n";
    ss << "  reconnectIntervalMs: " << net.reconnectIntervalMs << "\n";
    ss << "  maxReconnectAttempts: " << net.maxReconnectAttempts << "\n";
    ss << "  heartbeatIntervalMs: " << net.heartbeatIntervalMs << "\n";
    ss << "  preferIpv6: " << boolText(net.preferIpv6) << "\n";
    ss << "programs:\n";
    ss << "  ffmpegPath: \"" << programs.ffmpegPath << "\"\n";
    ss << "  mpvPath: \"" << programs.mpvPath << "\"\n";
    ss << "  nginxPath: \"" << programs.nginxPath << "\"\n";
    ss << "relay:\n";
    ss << "  ingestLatencyMs: " << relay.ingestLatencyMs << "\n";
    ss << "  viewerLatencyMs: " << relay.viewerLatencyMs << "\n";
    ss << "  restartDelayMs: " << relay.restartDelayMs << "\n";
    ss << "  stopTimeoutMs: " << relay.stopTimeoutMs << "\n";
    ss << "  rtmpApp: \"" << relay.rtmpApp << "\"\n";
    ss << "  streamKey: \"" << relay.streamKey << "\"\n";
    ss << "logging:\n";
    ss << "  level: " << logLevelToString(logging.level) << "\n";
    ss << "  enableConsole: " << boolText(logging.enableConsole) << "\n";
    ss << "  enableFile: " << boolText(logging.enableFile) << "\n";
    ss << "  filePath: \"" << logging.filePath << "\"\n";
    ss << "  logDirectory: \"" << logging.logDirectory << "\"\n";
    ss << "  enableJson: " << boolText(logging.enableJson) << "\n";
    ss << "  maxFileSizeMB: " << logging.maxFileSizeMB << "\n";
    ss << "  maxFiles: " << logging.maxFiles << "\n";
    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::applyDocument(const JsonValue& root) {
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Configuration root must be an object"));
    }

    // Build on a copy so a rejected document leaves the current state intact
    Configuration next = getConfig();

    if (root.contains("network")) {
        const JsonValue& net = root["network"];
        const std::string p = "network";
        for (auto result : {
                 readPort(net, p, "websocketPort", true, next.network.websocketPort),
                 readPort(net, p, "srtInputPort", false, next.network.srtInputPort),
                 readPort(net, p, "rtmpPort", false, next.network.rtmpPort),
                 readPort(net, p, "srtBasePort", false, next.network.srtBasePort),
                 readUint(net, p, "portSearchAttempts", next.network.portSearchAttempts),
                 readUint(net, p, "connectionTimeoutMs", next.network.connectionTimeoutMs),
                 readUint(net, p, "reconnectIntervalMs", next.network.reconnectIntervalMs),
                 readUint(net, p, "maxReconnectAttempts", next.network.maxReconnectAttempts),
                 readUint(net, p, "heartbeatIntervalMs", next.network.heartbeatIntervalMs)}) {
            if (result.isError()) {
                return result;
            }
        }
        readString(net, "bindAddress", next.network.bindAddress);
        readString(net, "verificationCode", next.network.verificationCode);
        readString(net, "hostNickname", next.network.hostNickname);
        readBool(net, "preferIpv6", next.network.preferIpv6);
    }

    if (root.contains("programs")) {
        const JsonValue& programs = root["programs"];
        readString(programs, "ffmpegPath", next.programs.ffmpegPath);
        readString(programs, "mpvPath", next.programs.mpvPath);
        readString(programs, "nginxPath", next.programs.nginxPath);
    }

    if (root.contains("relay")) {
        const JsonValue& relay = root["relay"];
        const std::string p = "relay";
        for (auto result : {
                 readUint(relay, p, "ingestLatencyMs", next.relay.ingestLatencyMs),
                 readUint(relay, p, "viewerLatencyMs", next.relay.viewerLatencyMs),
                 readUint(relay, p, "restartDelayMs", next.relay.restartDelayMs),
                 readUint(relay, p, "stopTimeoutMs", next.relay.stopTimeoutMs)}) {
            if (result.isError()) {
                return result;
            }
        }
        readString(relay, "rtmpApp", next.relay.rtmpApp);
        readString(relay, "streamKey", next.relay.streamKey);
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        if (logging.contains("level")) {
            std::string levelStr = toLower(logging["level"].getString());
            if (levelStr != "debug" && levelStr != "info" &&
                levelStr != "warning" && levelStr != "error") {
                return validationError(
                    "Invalid logging.level: " + logging["level"].getString() +
                        ". Valid values: debug, info, warning, error",
                    "logging.level");
            }
            next.logging.level = stringToLogLevel(levelStr);
        }
        readBool(logging, "enableConsole", next.logging.enableConsole);
        readBool(logging, "enableFile", next.logging.enableFile);
        readString(logging, "filePath", next.logging.filePath);
        readString(logging, "logDirectory", next.logging.logDirectory);
        readBool(logging, "enableJson", next.logging.enableJson);
        for (auto result : {
                 readUint(logging, "logging", "maxFileSizeMB", next.logging.maxFileSizeMB),
                 readUint(logging, "logging", "maxFiles", next.logging.maxFiles)}) {
            if (result.isError()) {
                return result;
            }
        }
    }

    auto valid = validateConfiguration(next);
    if (valid.isError()) {
        return valid;
    }

    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = std::move(next);
    return Result<void, ConfigError>::success();
}

std::optional<ConfigFormat> ConfigManager::detectFormat(const std::string& filePath) const {
    size_t dotPos = filePath.rfind('.');
    if (dotPos == std::string::npos) {
        return ConfigFormat::JSON;
    }

    std::string ext = toLower(filePath.substr(dotPos));
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".yaml" || ext == ".yml") return ConfigFormat::YAML;
    return std::nullopt;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration config = getConfig();
    log("Effective configuration:");
    log("  network.websocketPort: " + std::to_string(config.network.websocketPort));
    log("  network.srtInputPort: " + std::to_string(config.network.srtInputPort));
    log("  network.rtmpPort: " + std::to_string(config.network.rtmpPort));
    log("  network.srtBasePort: " + std::to_string(config.network.srtBasePort));
    log("  network.bindAddress: " + config.network.bindAddress);
    log("  network.hostNickname: " + config.network.hostNickname);
    log("  network.maxReconnectAttempts: " + std::to_string(config.network.maxReconnectAttempts));
    log("  programs.ffmpegPath: " + config.programs.ffmpegPath);
    log("  programs.mpvPath: " + config.programs.mpvPath);
    log("  programs.nginxPath: " + config.programs.nginxPath);
    log("  relay.viewerLatencyMs: " + std::to_string(config.relay.viewerLatencyMs));
    log("  logging.level: " + logLevelToString(config.logging.level));
    log("  logging.filePath: " + config.logging.filePath);
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace core
} // namespace watchparty
