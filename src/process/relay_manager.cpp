// WatchParty - Watch-party signaling and process supervision core
// Relay Manager implementation

#include "watchparty/process/relay_manager.hpp"

#include "watchparty/net/address_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace watchparty {
namespace process {

namespace {

const std::vector<std::string> COMMON_ARGS = {
    "-hide_banner",
    "-loglevel", "warning",
    "-stats",
    "-nostdin"
};

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

/**
 * @brief Token following @p key, leading blanks skipped ("fps= 25" -> "25").
 */
std::optional<std::string> fieldValue(const std::string& line, const std::string& key) {
    size_t pos = line.find(key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += key.size();
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    size_t end = pos;
    while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return line.substr(pos, end - pos);
}

std::optional<double> leadingNumber(const std::string& token) {
    const char* begin = token.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    return value;
}

std::string srtListenerUrl(const std::string& bindAddress, uint16_t port, uint32_t latencyMs) {
    std::string host = bindAddress.empty() ? "0.0.0.0" : net::formatHostForUrl(bindAddress);
    return "srt://" + host + ":" + std::to_string(port) +
           "?mode=listener&latency=" + std::to_string(latencyMs);
}

// Nicknames end up in file names
std::string safeFileName(const std::string& name) {
    std::string result = name;
    for (char& c : result) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '-' && c != '.') {
            c = '_';
        }
    }
    return result;
}

} // anonymous namespace

const char* relayTypeToString(RelayType type) {
    switch (type) {
        case RelayType::Ingest: return "srt_to_rtmp";
        case RelayType::Viewer: return "rtmp_to_srt";
    }
    return "unknown";
}

RelaySettings RelaySettings::fromConfig(const core::Configuration& config) {
    RelaySettings settings;
    settings.ffmpegPath = config.programs.ffmpegPath;
    settings.rtmpUrl = "rtmp://127.0.0.1:" + std::to_string(config.network.rtmpPort) + "/" +
                       config.relay.rtmpApp + "/" + config.relay.streamKey;
    settings.ingestLatencyMs = config.relay.ingestLatencyMs;
    settings.viewerLatencyMs = config.relay.viewerLatencyMs;
    settings.stopTimeout = std::chrono::milliseconds(config.relay.stopTimeoutMs);
    settings.logDirectory = config.logging.logDirectory;
    return settings;
}

// =============================================================================
// Command Lines
// =============================================================================

std::vector<std::string> buildIngestCommand(const RelaySettings& settings,
                                            uint16_t srtPort,
                                            const std::string& bindAddress) {
    std::vector<std::string> command{settings.ffmpegPath};
    command.insert(command.end(), COMMON_ARGS.begin(), COMMON_ARGS.end());
    command.insert(command.end(), {
        "-analyzeduration", "10000000",
        "-probesize", "10000000",
        "-fflags", "+genpts",
        "-i", srtListenerUrl(bindAddress, srtPort, settings.ingestLatencyMs),
        "-c", "copy",
        "-f", "flv",
        "-flvflags", "no_duration_filesize",
        settings.rtmpUrl
    });
    return command;
}

std::vector<std::string> buildViewerCommand(const RelaySettings& settings,
                                            uint16_t srtPort,
                                            const std::string& bindAddress) {
    std::vector<std::string> command{settings.ffmpegPath};
    command.insert(command.end(), COMMON_ARGS.begin(), COMMON_ARGS.end());
    command.insert(command.end(), {
        "-analyzeduration", "5000000",
        "-probesize", "5000000",
        "-fflags", "+genpts",
        "-re",
        "-i", settings.rtmpUrl,
        "-c", "copy",
        "-f", "mpegts",
        srtListenerUrl(bindAddress, srtPort, settings.viewerLatencyMs)
    });
    return command;
}

// =============================================================================
// Output Parsing
// =============================================================================

std::optional<ProcessStats> parseProgressLine(const std::string& line) {
    auto fps = fieldValue(line, "fps=");
    if (!fps) {
        return std::nullopt;
    }

    ProcessStats stats;
    bool parsed = false;

    if (auto value = leadingNumber(*fps)) {
        stats.fps = *value;
        parsed = true;
    }
    if (auto bitrate = fieldValue(line, "bitrate=")) {
        if (auto value = leadingNumber(*bitrate)) {
            stats.bitrateKbps = *value;
            parsed = true;
        }
    }
    if (auto time = fieldValue(line, "time=")) {
        stats.time = *time;
        parsed = true;
    }

    if (!parsed) {
        return std::nullopt;
    }
    return stats;
}

OutputClassification classifyStderrLine(const std::string& line) {
    const std::string lower = toLower(line);
    if (!contains(lower, "error") && !contains(lower, "failed")) {
        return {};
    }

    if (contains(line, "Connection refused") || contains(line, "Connection reset")) {
        return {OutputSeverity::Error, "connection failed, may need restart"};
    }
    if (contains(line, "Invalid data")) {
        return {OutputSeverity::Warning, "received invalid data"};
    }
    if (contains(lower, "dimensions not set")) {
        return {};
    }
    return {OutputSeverity::Error, "ffmpeg error: " + line};
}

// =============================================================================
// RelayManager
// =============================================================================

RelayManager::RelayManager(std::shared_ptr<ProcessSupervisor> supervisor,
                           RelaySettings settings,
                           std::shared_ptr<pal::ILogPAL> logger)
    : supervisor_(std::move(supervisor))
    , settings_(std::move(settings))
    , logger_(std::move(logger))
{
}

RelayManager::~RelayManager() {
    stopAll();
}

std::string RelayManager::ingestRelayName(uint16_t srtPort) {
    return "srt_to_rtmp_" + std::to_string(srtPort);
}

std::string RelayManager::viewerRelayName(const std::string& nickname, uint16_t srtPort) {
    return "client_" + nickname + "_" + std::to_string(srtPort);
}

core::Result<std::string, core::Error> RelayManager::startIngestRelay(
    uint16_t srtPort, const std::string& bindAddress)
{
    return startRelay(ingestRelayName(srtPort), RelayType::Ingest,
                      buildIngestCommand(settings_, srtPort, bindAddress),
                      srtPort, bindAddress);
}

core::Result<std::string, core::Error> RelayManager::startViewerRelay(
    const std::string& nickname, uint16_t srtPort, const std::string& bindAddress)
{
    return startRelay(viewerRelayName(nickname, srtPort), RelayType::Viewer,
                      buildViewerCommand(settings_, srtPort, bindAddress),
                      srtPort, bindAddress);
}

core::Result<std::string, core::Error> RelayManager::startRelay(
    const std::string& name, RelayType type, std::vector<std::string> command,
    uint16_t srtPort, const std::string& bindAddress)
{
    using StartResult = core::Result<std::string, core::Error>;

    auto log = openRelayLog(name);

    Entry entry;
    entry.info.name = name;
    entry.info.type = type;
    entry.info.srtPort = srtPort;
    entry.info.rtmpUrl = settings_.rtmpUrl;
    entry.info.bindAddress = bindAddress;
    entry.info.startTime = core::SystemClock::now();
    entry.info.logFile = log ? log->getFilePath() : std::string();
    entry.log = log;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (relays_.count(name) != 0) {
            return StartResult::error(core::Error(core::ErrorCode::ProcessAlreadyRunning,
                                                  "relay already running", name));
        }
        // Registered before launch so an immediate exit finds it
        relays_[name] = entry;
    }

    LaunchSpec spec;
    spec.command = std::move(command);
    spec.onStdout = [this, name, log](const std::string& line) {
        handleStdout(name, line, log);
    };
    spec.onStderr = [this, name, log](const std::string& line) {
        handleStderr(name, line, log);
    };
    spec.onExit = [this, name](int exitStatus) { handleExit(name, exitStatus); };
    spec.restartOnExit = type == RelayType::Ingest;

    auto started = supervisor_->start(name, std::move(spec));
    if (started.isError()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            relays_.erase(name);
        }
        WATCHPARTY_LOG_ERROR(logger_, "Relay",
            "Failed to start " + name + ": " + started.error().toString());
        return StartResult::error(started.error());
    }

    WATCHPARTY_LOG_INFO(logger_, "Relay",
        std::string(type == RelayType::Ingest ? "SRT->RTMP" : "RTMP->SRT") +
        " relay started: " + name + " (port " + std::to_string(srtPort) + ")");
    return StartResult::success(name);
}

core::Result<void, core::Error> RelayManager::stopRelay(const std::string& relayName) {
    bool known;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        known = relays_.erase(relayName) != 0;
    }

    auto stopped = supervisor_->stop(relayName, settings_.stopTimeout);
    if (stopped.isError()) {
        if (known && stopped.error().code == core::ErrorCode::ProcessNotFound) {
            // Ended on its own before we got here
            return core::Result<void, core::Error>::success();
        }
        return stopped;
    }

    WATCHPARTY_LOG_INFO(logger_, "Relay", "Relay stopped: " + relayName);
    return core::Result<void, core::Error>::success();
}

void RelayManager::stopAll() {
    std::vector<std::string> names = activeRelays();
    for (const auto& name : names) {
        auto result = stopRelay(name);
        if (result.isError()) {
            WATCHPARTY_LOG_WARNING(logger_, "Relay",
                "Failed to stop " + name + ": " + result.error().toString());
        }
    }
}

bool RelayManager::isRunning(const std::string& relayName) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (relays_.count(relayName) == 0) {
            return false;
        }
    }
    return supervisor_->isRunning(relayName);
}

std::vector<std::string> RelayManager::activeRelays() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(relays_.size());
    for (const auto& entry : relays_) {
        names.push_back(entry.first);
    }
    return names;
}

std::optional<RelayInfo> RelayManager::relayInfo(const std::string& relayName) const {
    RelayInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = relays_.find(relayName);
        if (it == relays_.end()) {
            return std::nullopt;
        }
        info = it->second.info;
    }

    info.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        core::SystemClock::now() - info.startTime);

    if (auto process = supervisor_->info(relayName)) {
        info.running = process->running;
        info.pid = process->pid;
        info.restartCount = process->restartCount;
        info.stats = process->stats;
    }
    return info;
}

// =============================================================================
// Output Handling
// =============================================================================

std::shared_ptr<core::FileSink> RelayManager::openRelayLog(const std::string& name) const {
    if (settings_.logDirectory.empty()) {
        return nullptr;
    }

    std::string path = settings_.logDirectory + "/ffmpeg/" + safeFileName(name) + "_" +
                       core::fileTimestamp(core::SystemClock::now()) + ".log";
    auto sink = std::make_shared<core::FileSink>(path);
    if (!sink->isOpen()) {
        WATCHPARTY_LOG_WARNING(logger_, "Relay", "Cannot open relay log " + path);
        return nullptr;
    }
    return sink;
}

void RelayManager::handleStdout(const std::string& name, const std::string& line,
                                const std::shared_ptr<core::FileSink>& log) {
    if (log) {
        log->writeLine(core::iso8601Now() + " - [stdout] - " + line);
    }

    if (line.find("Stream #") != std::string::npos) {
        WATCHPARTY_LOG_DEBUG(logger_, "Relay", "[" + name + "] stream detected");
    } else if (auto stats = parseProgressLine(line)) {
        supervisor_->updateStats(name, *stats);
    }
}

void RelayManager::handleStderr(const std::string& name, const std::string& line,
                                const std::shared_ptr<core::FileSink>& log) {
    if (log) {
        log->writeLine(core::iso8601Now() + " - [stderr] - " + line);
    }

    // -stats progress goes to stderr
    if (auto stats = parseProgressLine(line)) {
        supervisor_->updateStats(name, *stats);
        return;
    }

    auto classification = classifyStderrLine(line);
    switch (classification.severity) {
        case OutputSeverity::Error:
            WATCHPARTY_LOG_ERROR(logger_, "Relay", "[" + name + "] " + classification.summary);
            break;
        case OutputSeverity::Warning:
            WATCHPARTY_LOG_WARNING(logger_, "Relay", "[" + name + "] " + classification.summary);
            break;
        case OutputSeverity::Debug:
            WATCHPARTY_LOG_DEBUG(logger_, "Relay", "[" + name + "] " + classification.summary);
            break;
        case OutputSeverity::Ignore:
            break;
    }
}

void RelayManager::handleExit(const std::string& name, int exitStatus) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        relays_.erase(name);
    }
    WATCHPARTY_LOG_WARNING(logger_, "Relay",
        "Relay " + name + " ended with status " + std::to_string(exitStatus));
}

} // namespace process
} // namespace watchparty
