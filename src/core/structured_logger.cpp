// WatchParty - Watch-party signaling and process supervision core
// Structured Logging Component Implementation

#include "watchparty/core/structured_logger.hpp"
#include "watchparty/core/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace watchparty {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug" || lower == "trace") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error" || lower == "critical") {
        return LogLevelConfig::Error;
    }

    return LogLevelConfig::Info;
}

pal::LogLevel toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

std::string sessionEventTypeToString(SessionEventType eventType) {
    switch (eventType) {
        case SessionEventType::Connected:
            return "connected";
        case SessionEventType::Authenticated:
            return "authenticated";
        case SessionEventType::AuthenticationFailed:
            return "authentication_failed";
        case SessionEventType::Disconnected:
            return "disconnected";
        case SessionEventType::RelayStarted:
            return "relay_started";
        case SessionEventType::RelayStopped:
            return "relay_stopped";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category);
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message,
                           const std::string& category)
{
    if (!isEnabled(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, nullptr, nullptr)
        : formatPlainText(level, message, category, nullptr);

    dispatch(toPalLogLevel(level), formatted, category, pal::LogContext{});
}

void StructuredLogger::logSessionEvent(
    SessionEventType eventType,
    const SessionLogContext& context)
{
    if (!isEnabled(LogLevelConfig::Info)) {
        return;
    }

    const std::string category = "Session";
    const std::string message = "Event: " + sessionEventTypeToString(eventType);
    std::string formatted;

    if (jsonFormat_.load()) {
        formatted = formatJson(LogLevelConfig::Info, message, category, &context, nullptr);
        // Promote the event name to its own field for aggregation queries
        formatted.pop_back();
        formatted += ",\"event\":\"" + sessionEventTypeToString(eventType) + "\"}";
    } else {
        formatted = formatPlainText(LogLevelConfig::Info, message, category, &context);
    }

    dispatch(pal::LogLevel::Info, formatted, category, pal::LogContext{});
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const SessionLogContext& context,
    const std::string& category)
{
    if (!isEnabled(LogLevelConfig::Error)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(LogLevelConfig::Error, message, category, &context, nullptr)
        : formatPlainText(LogLevelConfig::Error, message, category, &context);

    dispatch(pal::LogLevel::Error, formatted, category, pal::LogContext{});
}

void StructuredLogger::write(pal::LogLevel level, const std::string& message,
                             const std::string& category, const pal::LogContext& context)
{
    if (level == pal::LogLevel::Off) {
        return;
    }

    LogLevelConfig configLevel = fromPalLogLevel(level);
    if (!isEnabled(configLevel)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(configLevel, message, category, nullptr, &context)
        : formatPlainText(configLevel, message, category, nullptr);

    dispatch(level, formatted, category, context);
}

std::string StructuredLogger::getName() const {
    return "StructuredLogger";
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

void StructuredLogger::dispatch(pal::LogLevel level, const std::string& formatted,
                                const std::string& category, const pal::LogContext& context)
{
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->write(level, formatted, category, context);
        }
    }
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const SessionLogContext* session,
    const pal::LogContext* source) const
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << iso8601Now() << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJsonString(category) << "\"";
    oss << ",\"message\":\"" << escapeJsonString(message) << "\"";

    if (session) {
        if (!session->nickname.empty()) {
            oss << ",\"nickname\":\"" << escapeJsonString(session->nickname) << "\"";
        }
        if (!session->clientIP.empty()) {
            oss << ",\"client_ip\":\"" << escapeJsonString(session->clientIP) << "\"";
        }
        if (session->clientPort != 0) {
            oss << ",\"client_port\":" << session->clientPort;
        }
        if (session->streamPort != 0) {
            oss << ",\"stream_port\":" << session->streamPort;
        }
        if (!session->processName.empty()) {
            oss << ",\"process\":\"" << escapeJsonString(session->processName) << "\"";
        }
        if (session->errorCode != 0) {
            oss << ",\"error_code\":" << session->errorCode;
        }
    }

    if (source && source->file != nullptr) {
        oss << ",\"file\":\"" << escapeJsonString(source->file) << "\"";
        oss << ",\"line\":" << source->line;
        if (source->function != nullptr) {
            oss << ",\"function\":\"" << escapeJsonString(source->function) << "\"";
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const SessionLogContext* session) const
{
    std::ostringstream oss;
    oss << "[" << iso8601Now() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (session) {
        if (!session->nickname.empty()) {
            oss << ", Nickname: " << session->nickname;
        }
        if (!session->clientIP.empty()) {
            oss << ", Client: " << session->clientIP;
            if (session->clientPort != 0) {
                oss << ":" << session->clientPort;
            }
        }
        if (session->streamPort != 0) {
            oss << ", StreamPort: " << session->streamPort;
        }
        if (!session->processName.empty()) {
            oss << ", Process: " << session->processName;
        }
        if (session->errorCode != 0) {
            oss << ", ErrorCode: " << session->errorCode;
        }
    }

    return oss.str();
}

LogLevelConfig StructuredLogger::fromPalLogLevel(pal::LogLevel level) {
    switch (level) {
        case pal::LogLevel::Trace:
        case pal::LogLevel::Debug:
            return LogLevelConfig::Debug;
        case pal::LogLevel::Info:
            return LogLevelConfig::Info;
        case pal::LogLevel::Warning:
            return LogLevelConfig::Warning;
        case pal::LogLevel::Error:
        case pal::LogLevel::Critical:
        default:
            return LogLevelConfig::Error;
    }
}

} // namespace core
} // namespace watchparty
