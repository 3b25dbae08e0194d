// WatchParty - Watch-party signaling and process supervision core
// Session Client implementation
//
// Every attempt gets a fresh WebSocket stream and a generation number;
// completions carrying an older generation are ignored.

#include "watchparty/signaling/session_client.hpp"

#include "watchparty/net/address_utils.hpp"
#include "watchparty/signaling/message.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace watchparty {
namespace signaling {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* CATEGORY = "Client";
constexpr const char* SYSTEM_NICKNAME = "System";

std::string stripBrackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool isWildcard(const std::string& address) {
    std::string bare = stripBrackets(address);
    return bare.empty() || bare == "0.0.0.0" || bare == "::";
}

} // anonymous namespace

const char* clientStateToString(ClientState state) {
    switch (state) {
        case ClientState::Idle:           return "Idle";
        case ClientState::Connecting:     return "Connecting";
        case ClientState::Connected:      return "Connected";
        case ClientState::Authenticating: return "Authenticating";
        case ClientState::Authenticated:  return "Authenticated";
        case ClientState::Reconnecting:   return "Reconnecting";
        case ClientState::Disconnected:   return "Disconnected";
        default:                          return "Unknown";
    }
}

ClientSettings ClientSettings::fromConfig(const core::Configuration& config) {
    ClientSettings settings;
    settings.connectTimeout = std::chrono::milliseconds(config.network.connectionTimeoutMs);
    settings.reconnectInterval = std::chrono::milliseconds(config.network.reconnectIntervalMs);
    settings.maxReconnectAttempts = config.network.maxReconnectAttempts;
    settings.heartbeatInterval = std::chrono::milliseconds(config.network.heartbeatIntervalMs);
    settings.preferIpv6 = config.network.preferIpv6;
    return settings;
}

// =============================================================================
// Impl
// =============================================================================

struct SessionClient::Impl {
    Impl(ClientSettings s, std::shared_ptr<pal::ILogPAL> l)
        : settings(std::move(s))
        , logger(std::move(l))
    {
    }

    bool onLoopThread() const {
        return std::this_thread::get_id() == loopThread.get_id();
    }

    std::string url() const {
        return "ws://" + net::formatHostForUrl(host) + ":" + std::to_string(port) + "/";
    }

    // Connection attempts
    void attemptConnect();
    void onResolve(uint64_t gen, beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(uint64_t gen, beast::error_code ec);
    void onHandshake(uint64_t gen, beast::error_code ec);
    void connectFailed(const std::string& message);
    void scheduleReconnect();
    void finish();

    // Established connection
    void doRead(uint64_t gen);
    void onRead(uint64_t gen, beast::error_code ec);
    void handleFrame(const std::string& text);
    void onConnectionLost(beast::error_code ec);
    void send(const Message& message);
    void doWrite(uint64_t gen);
    void closeConnection();
    void closeFromUser();
    void scheduleHeartbeat(uint64_t gen);

    void setState(ClientState next);
    void notifyError(core::ErrorCode code, const std::string& message);

    template <typename Callback, typename... Args>
    void invoke(const Callback& callback, const char* name, Args&&... args) {
        if (!callback) {
            return;
        }
        try {
            callback(std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            WATCHPARTY_LOG_ERROR(logger, CATEGORY,
                std::string(name) + " callback failed: " + e.what());
        }
    }

    template <typename Callback>
    Callback copyCallback(const Callback& callback) {
        std::lock_guard<std::mutex> lock(callbackMutex);
        return callback;
    }

    ClientSettings settings;
    std::shared_ptr<pal::ILogPAL> logger;

    // Target of the current session
    std::string host;
    uint16_t port = 0;
    std::string requestedNickname;
    std::string code;

    // Loop-owned
    uint64_t generation = 0;
    beast::flat_buffer buffer;
    std::deque<std::shared_ptr<const std::string>> outbox;
    bool writing = false;
    bool closeRequested = false;
    bool closing = false;
    bool rejectionPending = false;
    bool terminal = false;

    std::atomic<ClientState> state{ClientState::Idle};
    std::atomic<bool> authenticated{false};
    std::atomic<bool> userClosed{false};
    std::atomic<uint32_t> attempts{0};

    mutable std::mutex infoMutex;
    std::string assignedNickname;
    uint16_t assignedPort = 0;
    std::string assignedServer;

    std::mutex callbackMutex;
    AuthenticatedCallback authenticatedCallback;
    ChatCallback chatCallback;
    MemberListCallback memberListCallback;
    ClientErrorCallback errorCallback;
    ClientStateCallback stateCallback;

    std::mutex lifecycleMutex;
    std::thread loopThread;

    // I/O objects are declared after the context so they are destroyed first
    std::unique_ptr<asio::io_context> ioc;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
    std::unique_ptr<tcp::resolver> resolver;
    std::unique_ptr<asio::steady_timer> reconnectTimer;
    std::unique_ptr<asio::steady_timer> heartbeatTimer;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
};

// =============================================================================
// Connection Attempts
// =============================================================================

void SessionClient::Impl::attemptConnect() {
    if (userClosed) {
        finish();
        return;
    }

    uint64_t gen = ++generation;
    setState(ClientState::Connecting);

    ws = std::make_unique<websocket::stream<beast::tcp_stream>>(*ioc);
    buffer.consume(buffer.size());
    outbox.clear();
    writing = false;
    closeRequested = false;
    closing = false;
    rejectionPending = false;

    WATCHPARTY_LOG_DEBUG(logger, CATEGORY, "Connecting to " + url());
    resolver->async_resolve(host, std::to_string(port),
        [this, gen](beast::error_code ec, tcp::resolver::results_type results) {
            onResolve(gen, ec, std::move(results));
        });
}

void SessionClient::Impl::onResolve(uint64_t gen, beast::error_code ec,
                                    tcp::resolver::results_type results) {
    if (gen != generation) {
        return;
    }
    if (ec) {
        connectFailed("Cannot resolve " + host + ": " + ec.message());
        return;
    }

    std::vector<tcp::endpoint> endpoints;
    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }
    bool v6First = settings.preferIpv6;
    std::stable_partition(endpoints.begin(), endpoints.end(), [v6First](const tcp::endpoint& e) {
        return e.address().is_v6() == v6First;
    });

    auto& stream = beast::get_lowest_layer(*ws);
    stream.expires_after(settings.connectTimeout);
    stream.async_connect(endpoints, [this, gen](beast::error_code connectEc, const tcp::endpoint&) {
        onConnect(gen, connectEc);
    });
}

void SessionClient::Impl::onConnect(uint64_t gen, beast::error_code ec) {
    if (gen != generation) {
        return;
    }
    if (ec) {
        connectFailed("Cannot connect to " + url() + ": " + ec.message());
        return;
    }

    // The WebSocket layer takes over timeouts from here
    beast::get_lowest_layer(*ws).expires_never();
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = settings.connectTimeout;
    ws->set_option(timeouts);
    ws->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& request) {
            request.set(beast::http::field::user_agent, "watchparty-client");
        }));

    ws->async_handshake(net::formatHostForUrl(host) + ":" + std::to_string(port), "/",
        [this, gen](beast::error_code handshakeEc) { onHandshake(gen, handshakeEc); });
}

void SessionClient::Impl::onHandshake(uint64_t gen, beast::error_code ec) {
    if (gen != generation) {
        return;
    }
    if (ec) {
        connectFailed("WebSocket handshake with " + url() + " failed: " + ec.message());
        return;
    }

    attempts = 0;
    setState(ClientState::Connected);
    WATCHPARTY_LOG_INFO(logger, CATEGORY, "Connected to " + url());

    send(AuthRequest{code, requestedNickname});
    setState(ClientState::Authenticating);
    doRead(gen);
}

void SessionClient::Impl::connectFailed(const std::string& message) {
    if (userClosed) {
        finish();
        return;
    }
    WATCHPARTY_LOG_WARNING(logger, CATEGORY, message);
    notifyError(core::ErrorCode::ConnectionFailed, message);
    scheduleReconnect();
}

void SessionClient::Impl::scheduleReconnect() {
    if (userClosed) {
        finish();
        return;
    }
    if (attempts >= settings.maxReconnectAttempts) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
            "Giving up on " + url() + " after " + std::to_string(attempts.load()) + " attempts");
        notifyError(core::ErrorCode::ReconnectLimitReached,
            "Reconnect limit of " + std::to_string(settings.maxReconnectAttempts) + " reached");
        finish();
        return;
    }

    ++attempts;
    setState(ClientState::Reconnecting);
    WATCHPARTY_LOG_INFO(logger, CATEGORY,
        "Reconnecting in " + std::to_string(settings.reconnectInterval.count()) +
        " ms (attempt " + std::to_string(attempts.load()) + "/" +
        std::to_string(settings.maxReconnectAttempts) + ")");

    reconnectTimer->expires_after(settings.reconnectInterval);
    reconnectTimer->async_wait([this](beast::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        attemptConnect();
    });
}

void SessionClient::Impl::finish() {
    ++generation;
    authenticated = false;
    reconnectTimer->cancel();
    heartbeatTimer->cancel();
    resolver->cancel();
    if (ws) {
        beast::error_code ec;
        beast::get_lowest_layer(*ws).socket().close(ec);
    }
    work.reset();

    if (state != ClientState::Disconnected) {
        setState(ClientState::Disconnected);
    }
}

// =============================================================================
// Established Connection
// =============================================================================

void SessionClient::Impl::doRead(uint64_t gen) {
    ws->async_read(buffer, [this, gen](beast::error_code ec, std::size_t) {
        onRead(gen, ec);
    });
}

void SessionClient::Impl::onRead(uint64_t gen, beast::error_code ec) {
    if (gen != generation) {
        return;
    }
    if (ec) {
        onConnectionLost(ec);
        return;
    }

    std::string text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    handleFrame(text);

    if (gen == generation) {
        doRead(gen);
    }
}

void SessionClient::Impl::handleFrame(const std::string& text) {
    auto parsed = parseMessage(text);
    if (parsed.isError()) {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY,
            "Ignoring frame from server: " + parsed.error().toString());
        return;
    }
    const Message& message = parsed.value();

    if (auto* success = std::get_if<AuthSuccess>(&message)) {
        std::string address = isWildcard(success->serverIp) ? host
                                                            : stripBrackets(success->serverIp);
        {
            std::lock_guard<std::mutex> lock(infoMutex);
            assignedNickname = success->nickname;
            assignedPort = success->srtPort;
            assignedServer = address;
        }
        authenticated = true;
        setState(ClientState::Authenticated);
        WATCHPARTY_LOG_INFO(logger, CATEGORY,
            "Authenticated as " + success->nickname + ", stream port " +
            std::to_string(success->srtPort));
        scheduleHeartbeat(generation);
        invoke(copyCallback(authenticatedCallback), "Authenticated", address, success->srtPort);
    } else if (auto* failed = std::get_if<AuthFailed>(&message)) {
        terminal = true;
        std::string reason = failed->message.empty() ? "invalid verification code" : failed->message;
        WATCHPARTY_LOG_WARNING(logger, CATEGORY, "Authentication failed: " + reason);
        notifyError(core::ErrorCode::AuthenticationFailed, reason);
        closeConnection();
    } else if (auto* chat = std::get_if<ChatMessage>(&message)) {
        invoke(copyCallback(chatCallback), "Chat", chat->nickname, chat->message);
    } else if (auto* join = std::get_if<JoinNotice>(&message)) {
        invoke(copyCallback(chatCallback), "Chat", std::string(SYSTEM_NICKNAME), join->message);
    } else if (auto* leave = std::get_if<LeaveNotice>(&message)) {
        invoke(copyCallback(chatCallback), "Chat", std::string(SYSTEM_NICKNAME), leave->message);
    } else if (auto* list = std::get_if<MemberList>(&message)) {
        invoke(copyCallback(memberListCallback), "Member list", list->members);
    } else if (auto* error = std::get_if<ErrorMessage>(&message)) {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY, "Server error: " + error->message);
        if (!authenticated) {
            rejectionPending = true;
        }
        notifyError(core::ErrorCode::ServerRejected, error->message);
    } else if (auto* notice = std::get_if<SrtPortNotice>(&message)) {
        std::lock_guard<std::mutex> lock(infoMutex);
        assignedPort = notice->srtPort;
    } else if (std::holds_alternative<Heartbeat>(message)) {
        WATCHPARTY_LOG_DEBUG(logger, CATEGORY, "Heartbeat acknowledged");
    } else {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY,
            std::string("Unexpected '") + messageTypeToString(messageType(message)) +
            "' from server");
    }
}

void SessionClient::Impl::onConnectionLost(beast::error_code ec) {
    heartbeatTimer->cancel();
    bool wasAuthenticated = authenticated.exchange(false);

    if (userClosed || terminal) {
        finish();
        return;
    }
    if (rejectionPending) {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY, "Rejected by " + url());
        finish();
        return;
    }

    std::string reason = ec == websocket::error::closed ? "closed by server" : ec.message();
    WATCHPARTY_LOG_WARNING(logger, CATEGORY, "Connection to " + url() + " lost: " + reason);
    notifyError(wasAuthenticated ? core::ErrorCode::TransportDisconnected
                                 : core::ErrorCode::ConnectionFailed,
                "Connection lost: " + reason);
    scheduleReconnect();
}

void SessionClient::Impl::send(const Message& message) {
    if (!ws || closing) {
        return;
    }
    outbox.push_back(std::make_shared<const std::string>(serialize(message)));
    if (!writing) {
        writing = true;
        doWrite(generation);
    }
}

void SessionClient::Impl::doWrite(uint64_t gen) {
    if (outbox.empty()) {
        writing = false;
        if (closeRequested && !closing) {
            closing = true;
            ws->async_close(websocket::close_code::normal, [this](beast::error_code ec) {
                if (ec) {
                    WATCHPARTY_LOG_DEBUG(logger, CATEGORY, "Close failed: " + ec.message());
                }
            });
        }
        return;
    }

    auto text = outbox.front();
    ws->text(true);
    ws->async_write(asio::buffer(*text), [this, gen, text](beast::error_code ec, std::size_t) {
        if (gen != generation) {
            return;
        }
        if (ec) {
            // Reported by the pending read
            WATCHPARTY_LOG_DEBUG(logger, CATEGORY, "Write failed: " + ec.message());
            outbox.clear();
            writing = false;
            return;
        }
        outbox.pop_front();
        doWrite(gen);
    });
}

void SessionClient::Impl::closeConnection() {
    closeRequested = true;
    if (!writing) {
        writing = true;
        doWrite(generation);
    }
}

void SessionClient::Impl::closeFromUser() {
    reconnectTimer->cancel();
    heartbeatTimer->cancel();

    if (ws && ws->is_open()) {
        // The read completion finishes the session
        closeConnection();
        return;
    }
    finish();
}

void SessionClient::Impl::scheduleHeartbeat(uint64_t gen) {
    heartbeatTimer->expires_after(settings.heartbeatInterval);
    heartbeatTimer->async_wait([this, gen](beast::error_code ec) {
        if (ec || gen != generation || !authenticated) {
            return;
        }
        send(Heartbeat{});
        scheduleHeartbeat(gen);
    });
}

void SessionClient::Impl::setState(ClientState next) {
    state = next;
    invoke(copyCallback(stateCallback), "State", next);
}

void SessionClient::Impl::notifyError(core::ErrorCode code, const std::string& message) {
    invoke(copyCallback(errorCallback), "Error", core::Error(code, message, url()));
}

// =============================================================================
// SessionClient
// =============================================================================

SessionClient::SessionClient(ClientSettings settings, std::shared_ptr<pal::ILogPAL> logger)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(logger)))
{
}

SessionClient::~SessionClient() {
    impl_->userClosed = true;
    std::lock_guard<std::mutex> lock(impl_->lifecycleMutex);
    if (impl_->ioc) {
        impl_->ioc->stop();
    }
    if (impl_->loopThread.joinable()) {
        impl_->loopThread.join();
    }
}

core::Result<void, core::Error> SessionClient::connect(const std::string& host,
                                                       uint16_t port,
                                                       const std::string& nickname,
                                                       const std::string& code) {
    if (stripBrackets(host).empty() || port == 0) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "Server address required"));
    }
    if (nickname.empty()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "Nickname required"));
    }

    std::lock_guard<std::mutex> lock(impl_->lifecycleMutex);
    if (impl_->onLoopThread()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "connect() called from a client callback"));
    }
    ClientState current = impl_->state;
    if (current != ClientState::Idle && current != ClientState::Disconnected) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::InvalidState, "Client is already connected",
            clientStateToString(current)));
    }

    // The previous session's loop has run out of work by now
    if (impl_->loopThread.joinable()) {
        impl_->loopThread.join();
    }
    impl_->ws.reset();
    impl_->heartbeatTimer.reset();
    impl_->reconnectTimer.reset();
    impl_->resolver.reset();
    impl_->work.reset();
    impl_->ioc.reset();

    impl_->host = stripBrackets(host);
    impl_->port = port;
    impl_->requestedNickname = nickname;
    impl_->code = code;
    impl_->terminal = false;
    impl_->userClosed = false;
    impl_->authenticated = false;
    impl_->attempts = 0;
    {
        std::lock_guard<std::mutex> infoLock(impl_->infoMutex);
        impl_->assignedNickname.clear();
        impl_->assignedPort = 0;
        impl_->assignedServer.clear();
    }

    impl_->ioc = std::make_unique<asio::io_context>(1);
    impl_->work.emplace(asio::make_work_guard(*impl_->ioc));
    impl_->resolver = std::make_unique<tcp::resolver>(*impl_->ioc);
    impl_->reconnectTimer = std::make_unique<asio::steady_timer>(*impl_->ioc);
    impl_->heartbeatTimer = std::make_unique<asio::steady_timer>(*impl_->ioc);
    impl_->state = ClientState::Connecting;

    Impl* impl = impl_.get();
    asio::post(*impl->ioc, [impl]() { impl->attemptConnect(); });
    impl->loopThread = std::thread([impl]() {
        try {
            impl->ioc->run();
        } catch (const std::exception& e) {
            WATCHPARTY_LOG_CRITICAL(impl->logger, CATEGORY,
                std::string("Event loop failed: ") + e.what());
        }
    });

    return core::Result<void, core::Error>::success();
}

void SessionClient::disconnect() {
    if (impl_->userClosed.exchange(true)) {
        return;
    }
    std::unique_lock<std::mutex> lock(impl_->lifecycleMutex, std::defer_lock);
    if (!impl_->onLoopThread()) {
        lock.lock();
    }
    if (!impl_->ioc) {
        return;
    }

    WATCHPARTY_LOG_INFO(impl_->logger, CATEGORY, "Disconnecting from " + impl_->url());
    Impl* impl = impl_.get();
    asio::post(*impl->ioc, [impl]() { impl->closeFromUser(); });
}

core::Result<void, core::Error> SessionClient::sendChat(const std::string& message) {
    if (!impl_->authenticated) {
        WATCHPARTY_LOG_WARNING(impl_->logger, CATEGORY, "Not authenticated, chat not sent");
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::NotAuthenticated, "Not authenticated"));
    }
    if (message.empty()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "Empty chat message"));
    }

    // connect() may be replacing the event loop on another thread
    std::unique_lock<std::mutex> lock(impl_->lifecycleMutex, std::defer_lock);
    if (!impl_->onLoopThread()) {
        lock.lock();
    }
    if (!impl_->ioc) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::NotAuthenticated, "Not connected"));
    }

    Impl* impl = impl_.get();
    asio::post(*impl->ioc, [impl, message]() {
        if (impl->authenticated) {
            impl->send(ChatMessage{"", message, ""});
        }
    });
    return core::Result<void, core::Error>::success();
}

ClientState SessionClient::state() const {
    return impl_->state;
}

bool SessionClient::isAuthenticated() const {
    return impl_->authenticated;
}

std::string SessionClient::nickname() const {
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->assignedNickname;
}

uint16_t SessionClient::srtPort() const {
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->assignedPort;
}

std::string SessionClient::serverAddress() const {
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->assignedServer;
}

uint32_t SessionClient::reconnectAttempts() const {
    return impl_->attempts;
}

void SessionClient::setAuthenticatedCallback(AuthenticatedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->authenticatedCallback = std::move(callback);
}

void SessionClient::setChatCallback(ChatCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->chatCallback = std::move(callback);
}

void SessionClient::setMemberListCallback(MemberListCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->memberListCallback = std::move(callback);
}

void SessionClient::setErrorCallback(ClientErrorCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->errorCallback = std::move(callback);
}

void SessionClient::setStateCallback(ClientStateCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->stateCallback = std::move(callback);
}

} // namespace signaling
} // namespace watchparty
