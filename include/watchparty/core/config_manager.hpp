// WatchParty - Watch-party signaling and process supervision core
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON and YAML configuration file formats
// - Support WATCHPARTY_* environment variable overrides
// - Validate configuration with detailed error messages
// - Apply defaults when no configuration file is present
// - Log effective configuration values during initialization

#ifndef WATCHPARTY_CORE_CONFIG_MANAGER_HPP
#define WATCHPARTY_CORE_CONFIG_MANAGER_HPP

#include "watchparty/core/json_value.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/structured_logger.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace watchparty {
namespace core {

// =============================================================================
// Configuration Format Enumeration
// =============================================================================

enum class ConfigFormat {
    JSON,
    YAML
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Signaling, stream port and reconnect settings.
 */
struct NetworkConfig {
    uint16_t websocketPort = 10086;          ///< Signaling port (0 = ephemeral)
    uint16_t srtInputPort = 9001;            ///< Host SRT ingest port
    uint16_t rtmpPort = 1935;                ///< Local distribution server port
    uint16_t srtBasePort = 10000;            ///< First candidate per-viewer port
    uint32_t portSearchAttempts = 100;       ///< Ports probed per allocation
    std::string bindAddress = "0.0.0.0";     ///< Listener bind address
    std::string verificationCode = "114514"; ///< Shared join code
    std::string hostNickname = "Host";       ///< Nickname of the sender
    uint32_t connectionTimeoutMs = 10000;    ///< Client connect/handshake timeout
    uint32_t reconnectIntervalMs = 3000;     ///< Delay between reconnect attempts
    uint32_t maxReconnectAttempts = 5;       ///< Consecutive reconnects before giving up
    uint32_t heartbeatIntervalMs = 30000;    ///< Client heartbeat period
    bool preferIpv6 = true;                  ///< Prefer IPv6 when resolving peers
};

/**
 * @brief External program locations.
 */
struct ProgramsConfig {
    std::string ffmpegPath = "./ffmpeg";
    std::string mpvPath = "./mpv";
    std::string nginxPath = "./rtmp/nginx";
};

/**
 * @brief Relay and supervision timing.
 */
struct RelayConfig {
    uint32_t ingestLatencyMs = 120;     ///< SRT latency of the host ingest listener
    uint32_t viewerLatencyMs = 3000;    ///< SRT latency of per-viewer listeners
    uint32_t restartDelayMs = 3000;     ///< Back-off before an automatic restart
    uint32_t stopTimeoutMs = 5000;      ///< Grace period before force-kill
    std::string rtmpApp = "live";       ///< Distribution server application
    std::string streamKey = "stream";   ///< Distribution stream key
};

struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool enableConsole = true;
    bool enableFile = true;
    std::string filePath = "logs/watchparty.log";
    std::string logDirectory = "logs";  ///< Root for per-relay logs
    bool enableJson = false;
    uint32_t maxFileSizeMB = 10;
    uint32_t maxFiles = 5;
};

struct Configuration {
    NetworkConfig network;
    ProgramsConfig programs;
    RelayConfig relay;
    LoggingConfig logging;
};

// =============================================================================
// Configuration Error
// =============================================================================

struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        UnsupportedFormat,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)
    int line = -1;            ///< Line number in config file (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
    ConfigError(Code c, std::string msg, std::string f, int l)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads, overrides, validates and exposes the configuration.
 *
 * Typical startup sequence:
 * @code
 * ConfigManager config;
 * config.setLogCallback([&](const std::string& m) { ... });
 * auto loaded = path.empty() ? config.loadDefaults() : config.loadFromFile(path);
 * config.applyEnvironmentOverrides();
 * auto valid = config.validate();
 * @endcode
 *
 * Missing keys keep their current value; unknown keys are ignored.
 *
 * Thread Safety: reads take a shared lock, loads take an exclusive lock.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load from a .json, .yaml or .yml file.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);
    Result<void, ConfigError> loadFromYamlString(const std::string& yamlContent);

    /**
     * @brief Reset every setting to its default.
     */
    Result<void, ConfigError> loadDefaults();

    // -------------------------------------------------------------------------
    // Environment Variable Overrides
    // -------------------------------------------------------------------------

    /**
     * @brief Apply WATCHPARTY_* environment variables on top of the
     *        current configuration. Invalid values are logged and skipped.
     */
    void applyEnvironmentOverrides();

    // -------------------------------------------------------------------------
    // Validation and Access
    // -------------------------------------------------------------------------

    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Serialize the effective configuration.
     */
    std::string dumpConfig(ConfigFormat format = ConfigFormat::JSON) const;

    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> applyDocument(const JsonValue& root);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    std::optional<ConfigFormat> detectFormat(const std::string& filePath) const;
    std::optional<std::string> getEnvVar(const std::string& name) const;

    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    Configuration config_;
    mutable std::shared_mutex configMutex_;

    ConfigLogCallback logCallback_;
    mutable std::mutex logMutex_;
};

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_CONFIG_MANAGER_HPP
