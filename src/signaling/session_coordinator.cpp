// WatchParty - Watch-party signaling and process supervision core
// Session Coordinator implementation
//
// One io_context driven by one thread. Connections, the nickname set and
// the port cursor are touched only from handlers running on that thread.

#include "watchparty/signaling/session_coordinator.hpp"

#include "watchparty/net/address_utils.hpp"
#include "watchparty/signaling/message.hpp"
#include "watchparty/signaling/nickname_resolver.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace watchparty {
namespace signaling {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* CATEGORY = "Coordinator";
constexpr size_t MAX_MESSAGE_BYTES = 64 * 1024;

std::string stripBrackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

core::ClientInfo describeRemote(const tcp::socket& socket) {
    core::ClientInfo info;
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        info.ip = "unknown";
        return info;
    }
    auto address = endpoint.address();
    if (address.is_v6() && address.to_v6().is_v4_mapped()) {
        address = asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());
    }
    info.ip = address.to_string();
    info.port = endpoint.port();
    return info;
}

std::string describe(const core::ClientInfo& remote) {
    return net::formatHostForUrl(remote.ip) + ":" + std::to_string(remote.port);
}

} // anonymous namespace

// =============================================================================
// Impl
// =============================================================================

struct SessionCoordinator::Impl {
    struct ClientRecord {
        std::shared_ptr<Connection> connection;
        core::ClientInfo remote;
        core::SteadyClock::time_point connectedAt;
        bool authenticated = false;
        bool rejected = false;
        uint64_t joinSequence = 0;
        std::string nickname;
        uint16_t srtPort = 0;
        std::string relayName;
    };

    Impl(const CoordinatorSettings& s,
         std::shared_ptr<IRelayLauncher> r,
         std::shared_ptr<net::PortAllocator> p,
         std::shared_ptr<pal::ILogPAL> l,
         std::shared_ptr<core::StructuredLogger> sl)
        : settings(s)
        , relays(std::move(r))
        , ports(std::move(p))
        , logger(std::move(l))
        , sessionLog(std::move(sl))
    {
    }

    // Lifecycle (foreign threads)
    core::Result<void, core::Error> start();
    void stop();
    void reap();

    // Event loop
    void doAccept();
    void onAccept(boost::system::error_code ec, tcp::socket socket);
    void onOpened(const std::shared_ptr<Connection>& connection);
    void onText(core::ConnectionId id, const std::string& text);
    void onClosed(core::ConnectionId id);
    void handleAuth(core::ConnectionId id, const AuthRequest& request);
    void handleChat(core::ConnectionId id, const ChatMessage& chat);
    void shutdownOnLoop();

    core::Result<uint16_t, core::Error> allocatePort();
    void reject(ClientRecord& record, const std::string& message);
    void sendTo(ClientRecord& record, const Message& message);
    void broadcast(const Message& message, core::ConnectionId except = core::INVALID_CONNECTION_ID);
    std::vector<core::Member> buildMemberList() const;
    void publishMembers(bool notify);
    void stopRelayAsync(const ClientRecord& record);

    // Notifications
    void emitEvent(core::SessionEventType type, const core::SessionLogContext& context);
    void notifyChat(const std::string& nickname, const std::string& message);
    void notifyMembers(const std::vector<core::Member>& members);
    core::SessionLogContext contextFor(const ClientRecord& record) const;

    bool onLoopThread() const {
        return std::this_thread::get_id() == loopThread.get_id();
    }

    const CoordinatorSettings& settings;
    std::shared_ptr<IRelayLauncher> relays;
    std::shared_ptr<net::PortAllocator> ports;
    std::shared_ptr<pal::ILogPAL> logger;
    std::shared_ptr<core::StructuredLogger> sessionLog;

    // Loop-owned state
    std::map<core::ConnectionId, ClientRecord> clients;
    std::set<std::string> nicknames;
    uint32_t nextPort = 0;
    core::ConnectionId nextId = 1;
    uint64_t nextJoinSequence = 1;

    // Published snapshot
    mutable std::mutex membersMutex;
    std::vector<core::Member> members;

    std::mutex callbackMutex;
    ChatCallback chatCallback;
    MemberListCallback memberListCallback;
    SessionEventCallback sessionEventCallback;

    std::mutex lifecycleMutex;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::thread loopThread;

    // Declared last: destroyed first, before anything its handlers reference
    std::unique_ptr<asio::thread_pool> stopPool;
    std::unique_ptr<asio::io_context> ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
};

// =============================================================================
// Connection
// =============================================================================

/**
 * @brief One accepted WebSocket with its outbound queue.
 *
 * Writes are serialized through outbox_ so messages reach the peer in the
 * order they were queued.
 */
class SessionCoordinator::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, Impl& owner, core::ConnectionId id)
        : remote_(describeRemote(socket))
        , ws_(std::move(socket))
        , owner_(owner)
        , id_(id)
    {
    }

    core::ConnectionId id() const { return id_; }
    const core::ClientInfo& remote() const { return remote_; }

    void start() {
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.handshake_timeout = owner_.settings.handshakeTimeout;
        timeouts.idle_timeout = owner_.settings.idleTimeout;
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& response) {
                response.set(beast::http::field::server, "watchparty");
            }));
        ws_.read_message_max(MAX_MESSAGE_BYTES);

        ws_.async_accept(beast::bind_front_handler(&Connection::onAccept, shared_from_this()));
    }

    void send(std::shared_ptr<const std::string> text) {
        if (closing_) {
            return;
        }
        outbox_.push_back(std::move(text));
        if (!writing_) {
            writing_ = true;
            doWrite();
        }
    }

    /**
     * @brief Send what is queued, then perform the closing handshake.
     */
    void closeAfterFlush() {
        closeRequested_ = true;
        if (!writing_) {
            doClose();
        }
    }

    /**
     * @brief Drop the transport immediately.
     */
    void abort() {
        closing_ = true;
        outbox_.clear();
        boost::system::error_code ec;
        auto& socket = beast::get_lowest_layer(ws_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            WATCHPARTY_LOG_DEBUG(owner_.logger, CATEGORY,
                "Handshake with " + describe(remote_) + " failed: " + ec.message());
            return;
        }
        owner_.onOpened(shared_from_this());
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Connection::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                WATCHPARTY_LOG_DEBUG(owner_.logger, CATEGORY,
                    "Read from " + describe(remote_) + " ended: " + ec.message());
            }
            closing_ = true;
            owner_.onClosed(id_);
            return;
        }

        if (!ws_.got_text()) {
            buffer_.consume(buffer_.size());
            WATCHPARTY_LOG_WARNING(owner_.logger, CATEGORY,
                "Ignoring binary frame from " + describe(remote_));
            doRead();
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        // Frames pipelined behind a rejection are dropped unseen
        if (!closeRequested_ && !closing_) {
            owner_.onText(id_, text);
        }

        // Keep reading until the transport reports the closure
        doRead();
    }

    void doWrite() {
        if (outbox_.empty()) {
            writing_ = false;
            if (closeRequested_) {
                doClose();
            }
            return;
        }

        auto text = outbox_.front();
        ws_.text(true);
        ws_.async_write(
            asio::buffer(*text),
            [self = shared_from_this(), text](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            // The pending read reports the closure
            WATCHPARTY_LOG_DEBUG(owner_.logger, CATEGORY,
                "Write to " + describe(remote_) + " failed: " + ec.message());
            outbox_.clear();
            writing_ = false;
            return;
        }
        if (!outbox_.empty()) {
            outbox_.pop_front();
        }
        doWrite();
    }

    void doClose() {
        if (closing_) {
            return;
        }
        closing_ = true;
        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    WATCHPARTY_LOG_DEBUG(self->owner_.logger, CATEGORY,
                        "Close of " + describe(self->remote_) + " failed: " + ec.message());
                }
            });
    }

    core::ClientInfo remote_;
    websocket::stream<beast::tcp_stream> ws_;
    Impl& owner_;
    core::ConnectionId id_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> outbox_;
    bool writing_ = false;
    bool closeRequested_ = false;
    bool closing_ = false;
};

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<void, core::Error> SessionCoordinator::Impl::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    if (running) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "Coordinator is already running"));
    }
    reap();

    boost::system::error_code ec;
    const std::string host = stripBrackets(settings.bindAddress);
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidAddress, "Invalid bind address", settings.bindAddress));
    }

    ioc = std::make_unique<asio::io_context>(1);
    acceptor = std::make_unique<tcp::acceptor>(*ioc);
    tcp::endpoint endpoint(address, settings.port);
    const std::string where = net::formatHostForUrl(host) + ":" + std::to_string(settings.port);

    acceptor->open(endpoint.protocol(), ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::BindFailed, "Cannot open listener: " + ec.message(), where));
    }
    acceptor->set_option(asio::socket_base::reuse_address(true), ec);
    if (address.is_v6() && address.to_v6().is_unspecified()) {
        // Accept IPv4 peers on the IPv6 wildcard as well
        acceptor->set_option(asio::ip::v6_only(false), ec);
    }
    acceptor->bind(endpoint, ec);
    if (ec) {
        auto code = ec == asio::error::address_in_use ? core::ErrorCode::AddressInUse
                                                      : core::ErrorCode::BindFailed;
        return core::Result<void, core::Error>::error(
            core::Error(code, "Cannot bind listener: " + ec.message(), where));
    }
    acceptor->listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::ListenFailed, "Cannot listen: " + ec.message(), where));
    }
    boundPort = acceptor->local_endpoint().port();

    stopPool = std::make_unique<asio::thread_pool>(std::max<uint32_t>(1, settings.relayStopWorkers));
    clients.clear();
    nicknames = {settings.hostNickname};
    nextPort = settings.srtBasePort;
    publishMembers(false);

    doAccept();
    loopThread = std::thread([this]() {
        try {
            ioc->run();
        } catch (const std::exception& e) {
            WATCHPARTY_LOG_CRITICAL(logger, CATEGORY, std::string("Event loop failed: ") + e.what());
        }
    });
    running = true;

    WATCHPARTY_LOG_INFO(logger, CATEGORY,
        "Signaling server listening on " + net::formatHostForUrl(host) + ":" +
        std::to_string(boundPort.load()));
    return core::Result<void, core::Error>::success();
}

void SessionCoordinator::Impl::stop() {
    if (!running.exchange(false)) {
        return;
    }

    if (onLoopThread()) {
        // Finishing the joins is left to the next start() or the destructor
        shutdownOnLoop();
        boundPort = 0;
        return;
    }

    asio::post(*ioc, [this]() { shutdownOnLoop(); });
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    if (loopThread.joinable()) {
        loopThread.join();
    }
    if (stopPool) {
        stopPool->join();
    }
    boundPort = 0;
    WATCHPARTY_LOG_INFO(logger, CATEGORY, "Signaling server stopped");
}

void SessionCoordinator::Impl::reap() {
    if (loopThread.joinable() && !onLoopThread()) {
        loopThread.join();
    }
    if (stopPool) {
        stopPool->join();
        stopPool.reset();
    }
    acceptor.reset();
    ioc.reset();
}

void SessionCoordinator::Impl::shutdownOnLoop() {
    boost::system::error_code ec;
    acceptor->close(ec);

    for (auto& entry : clients) {
        entry.second.connection->abort();
        if (entry.second.authenticated) {
            stopRelayAsync(entry.second);
        }
    }
    clients.clear();
    nicknames = {settings.hostNickname};
    publishMembers(false);

    ioc->stop();
}

// =============================================================================
// Event Loop
// =============================================================================

void SessionCoordinator::Impl::doAccept() {
    acceptor->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
    });
}

void SessionCoordinator::Impl::onAccept(boost::system::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor->is_open()) {
        return;
    }
    if (ec) {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY, "Accept failed: " + ec.message());
    } else {
        std::make_shared<Connection>(std::move(socket), *this, nextId++)->start();
    }
    doAccept();
}

void SessionCoordinator::Impl::onOpened(const std::shared_ptr<Connection>& connection) {
    ClientRecord record;
    record.connection = connection;
    record.remote = connection->remote();
    record.connectedAt = core::SteadyClock::now();
    auto context = contextFor(record);
    clients.emplace(connection->id(), std::move(record));

    WATCHPARTY_LOG_INFO(logger, CATEGORY, "Client connected: " + describe(connection->remote()));
    emitEvent(core::SessionEventType::Connected, context);
}

void SessionCoordinator::Impl::onText(core::ConnectionId id, const std::string& text) {
    auto it = clients.find(id);
    if (it == clients.end()) {
        return;
    }
    ClientRecord& record = it->second;
    if (record.rejected) {
        return;
    }

    auto parsed = parseMessage(text);
    if (parsed.isError()) {
        const auto& error = parsed.error();
        if (error.code == core::ErrorCode::UnknownMessageType) {
            if (!record.authenticated) {
                sendTo(record, ErrorMessage{"authentication required"});
            } else {
                WATCHPARTY_LOG_WARNING(logger, CATEGORY,
                    "Unknown message type '" + error.context + "' from " + record.nickname);
            }
            return;
        }
        WATCHPARTY_LOG_WARNING(logger, CATEGORY,
            "Malformed message from " + describe(record.remote) + ": " + error.toString());
        sendTo(record, ErrorMessage{"malformed message"});
        return;
    }

    const Message& message = parsed.value();
    if (auto* auth = std::get_if<AuthRequest>(&message)) {
        handleAuth(id, *auth);
        return;
    }
    if (!record.authenticated) {
        sendTo(record, ErrorMessage{"authentication required"});
        return;
    }

    switch (messageType(message)) {
        case MessageType::Chat:
            handleChat(id, std::get<ChatMessage>(message));
            break;
        case MessageType::Heartbeat:
            record.connection->send(std::make_shared<const std::string>(text));
            break;
        default:
            WATCHPARTY_LOG_WARNING(logger, CATEGORY,
                std::string("Ignoring '") + messageTypeToString(messageType(message)) +
                "' from " + record.nickname);
            break;
    }
}

void SessionCoordinator::Impl::handleAuth(core::ConnectionId id, const AuthRequest& request) {
    ClientRecord& record = clients.at(id);

    if (record.authenticated) {
        sendTo(record, ErrorMessage{"already authenticated"});
        return;
    }

    if (request.code != settings.verificationCode) {
        WATCHPARTY_LOG_WARNING(logger, CATEGORY,
            "Wrong verification code from " + describe(record.remote));
        sendTo(record, AuthFailed{"invalid verification code"});
        record.rejected = true;
        record.connection->closeAfterFlush();

        auto context = contextFor(record);
        context.nickname = request.nickname;
        context.errorCode = static_cast<int32_t>(core::ErrorCode::AuthenticationFailed);
        emitEvent(core::SessionEventType::AuthenticationFailed, context);
        return;
    }

    std::string requested = normalizeNickname(request.nickname);
    if (requested.empty()) {
        reject(record, "nickname required");
        return;
    }
    std::string nickname = resolveNickname(requested, nicknames);
    if (nickname != requested) {
        WATCHPARTY_LOG_INFO(logger, CATEGORY,
            "Nickname '" + requested + "' is taken, assigned '" + nickname + "'");
    }

    auto port = allocatePort();
    if (port.isError()) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
            "No stream port for " + nickname + ": " + port.error().toString());
        reject(record, "no stream port available");
        return;
    }

    auto relay = relays->startViewerRelay(nickname, port.value(), settings.bindAddress);
    if (relay.isError()) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
            "Relay for " + nickname + " failed to start: " + relay.error().toString());
        reject(record, "failed to start stream relay");
        return;
    }

    // Commit
    record.authenticated = true;
    record.joinSequence = nextJoinSequence++;
    record.nickname = nickname;
    record.srtPort = port.value();
    record.relayName = relay.value();
    nicknames.insert(nickname);
    nextPort = static_cast<uint32_t>(port.value()) + 1;

    WATCHPARTY_LOG_INFO(logger, CATEGORY,
        nickname + " joined from " + describe(record.remote) +
        ", stream port " + std::to_string(record.srtPort));

    auto context = contextFor(record);
    sendTo(record, AuthSuccess{nickname, record.srtPort, settings.bindAddress});
    broadcast(JoinNotice{nickname, nickname + " joined"}, id);
    publishMembers(true);

    // Callbacks last: one of them may stop the coordinator
    emitEvent(core::SessionEventType::RelayStarted, context);
    if (running) {
        emitEvent(core::SessionEventType::Authenticated, context);
    }
}

void SessionCoordinator::Impl::handleChat(core::ConnectionId id, const ChatMessage& chat) {
    const std::string nickname = clients.at(id).nickname;
    broadcast(ChatMessage{nickname, chat.message, core::iso8601Now()});
    notifyChat(nickname, chat.message);
}

void SessionCoordinator::Impl::onClosed(core::ConnectionId id) {
    auto it = clients.find(id);
    if (it == clients.end()) {
        return;
    }
    ClientRecord record = std::move(it->second);
    clients.erase(it);

    auto connectedFor = std::chrono::duration_cast<std::chrono::seconds>(
        core::SteadyClock::now() - record.connectedAt);
    auto context = contextFor(record);

    if (!record.authenticated) {
        WATCHPARTY_LOG_DEBUG(logger, CATEGORY,
            "Unauthenticated client disconnected: " + describe(record.remote));
        emitEvent(core::SessionEventType::Disconnected, context);
        return;
    }

    WATCHPARTY_LOG_INFO(logger, CATEGORY,
        record.nickname + " left after " + std::to_string(connectedFor.count()) + " s");

    stopRelayAsync(record);
    nicknames.erase(record.nickname);
    broadcast(LeaveNotice{record.nickname, record.nickname + " left"});
    publishMembers(true);

    if (running) {
        emitEvent(core::SessionEventType::Disconnected, context);
    }
}

// =============================================================================
// Helpers
// =============================================================================

core::Result<uint16_t, core::Error> SessionCoordinator::Impl::allocatePort() {
    // Ports below the cursor were claimed earlier in this session
    if (nextPort > 65535) {
        return core::Result<uint16_t, core::Error>::error(core::Error(
            core::ErrorCode::PortExhausted, "Stream port range used up",
            "from " + std::to_string(nextPort)));
    }

    auto found = ports->findAvailable(static_cast<uint16_t>(nextPort),
                                      settings.portSearchAttempts);
    if (found.isError()) {
        return core::Result<uint16_t, core::Error>::error(core::Error(
            core::ErrorCode::PortExhausted, "No free stream port",
            "from " + std::to_string(nextPort)));
    }
    return found;
}

void SessionCoordinator::Impl::reject(ClientRecord& record, const std::string& message) {
    sendTo(record, ErrorMessage{message});
    record.rejected = true;
    record.connection->closeAfterFlush();
}

void SessionCoordinator::Impl::sendTo(ClientRecord& record, const Message& message) {
    record.connection->send(std::make_shared<const std::string>(serialize(message)));
}

void SessionCoordinator::Impl::broadcast(const Message& message, core::ConnectionId except) {
    auto text = std::make_shared<const std::string>(serialize(message));
    for (auto& entry : clients) {
        if (entry.second.authenticated && entry.first != except) {
            entry.second.connection->send(text);
        }
    }
}

std::vector<core::Member> SessionCoordinator::Impl::buildMemberList() const {
    std::vector<const ClientRecord*> viewers;
    for (const auto& entry : clients) {
        if (entry.second.authenticated) {
            viewers.push_back(&entry.second);
        }
    }
    std::sort(viewers.begin(), viewers.end(), [](const ClientRecord* a, const ClientRecord* b) {
        return a->joinSequence < b->joinSequence;
    });

    std::vector<core::Member> list;
    list.emplace_back(settings.hostNickname, core::Role::Sender);
    for (const auto* viewer : viewers) {
        list.emplace_back(viewer->nickname, core::Role::Receiver);
    }
    return list;
}

void SessionCoordinator::Impl::publishMembers(bool notify) {
    auto list = buildMemberList();
    {
        std::lock_guard<std::mutex> lock(membersMutex);
        members = list;
    }
    if (!notify) {
        return;
    }
    broadcast(MemberList{list});
    notifyMembers(list);
}

void SessionCoordinator::Impl::stopRelayAsync(const ClientRecord& record) {
    auto context = contextFor(record);
    auto relayName = record.relayName;
    auto launcher = relays;
    auto log = logger;
    auto* loop = ioc.get();

    asio::post(*stopPool, [this, launcher, log, relayName, context, loop]() {
        auto stopped = launcher->stopRelay(relayName);
        if (stopped.isError() && stopped.error().code != core::ErrorCode::ProcessNotFound) {
            WATCHPARTY_LOG_WARNING(log, CATEGORY,
                "Failed to stop relay " + relayName + ": " + stopped.error().toString());
        }
        if (sessionLog) {
            sessionLog->logSessionEvent(core::SessionEventType::RelayStopped, context);
        }
        if (running) {
            asio::post(*loop, [this, context]() {
                SessionEventCallback callback;
                {
                    std::lock_guard<std::mutex> lock(callbackMutex);
                    callback = sessionEventCallback;
                }
                if (callback) {
                    try {
                        callback(core::SessionEventType::RelayStopped, context);
                    } catch (const std::exception& e) {
                        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
                            std::string("Session event callback failed: ") + e.what());
                    }
                }
            });
        }
    });
}

core::SessionLogContext SessionCoordinator::Impl::contextFor(const ClientRecord& record) const {
    core::SessionLogContext context;
    context.nickname = record.nickname;
    context.clientIP = record.remote.ip;
    context.clientPort = record.remote.port;
    context.streamPort = record.srtPort;
    context.processName = record.relayName;
    return context;
}

void SessionCoordinator::Impl::emitEvent(core::SessionEventType type,
                                         const core::SessionLogContext& context) {
    if (sessionLog) {
        sessionLog->logSessionEvent(type, context);
    }

    SessionEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = sessionEventCallback;
    }
    if (!callback) {
        return;
    }
    try {
        callback(type, context);
    } catch (const std::exception& e) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
            std::string("Session event callback failed: ") + e.what());
    }
}

void SessionCoordinator::Impl::notifyChat(const std::string& nickname, const std::string& message) {
    ChatCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = chatCallback;
    }
    if (!callback) {
        return;
    }
    try {
        callback(nickname, message);
    } catch (const std::exception& e) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY, std::string("Chat callback failed: ") + e.what());
    }
}

void SessionCoordinator::Impl::notifyMembers(const std::vector<core::Member>& list) {
    MemberListCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = memberListCallback;
    }
    if (!callback) {
        return;
    }
    try {
        callback(list);
    } catch (const std::exception& e) {
        WATCHPARTY_LOG_ERROR(logger, CATEGORY,
            std::string("Member list callback failed: ") + e.what());
    }
}

// =============================================================================
// SessionCoordinator
// =============================================================================

CoordinatorSettings CoordinatorSettings::fromConfig(const core::Configuration& config) {
    CoordinatorSettings settings;
    settings.bindAddress = config.network.bindAddress;
    settings.port = config.network.websocketPort;
    settings.verificationCode = config.network.verificationCode;
    settings.hostNickname = config.network.hostNickname;
    settings.srtBasePort = config.network.srtBasePort;
    settings.portSearchAttempts = config.network.portSearchAttempts;
    settings.handshakeTimeout = std::chrono::milliseconds(config.network.connectionTimeoutMs);
    return settings;
}

SessionCoordinator::SessionCoordinator(CoordinatorSettings settings,
                                       std::shared_ptr<IRelayLauncher> relays,
                                       std::shared_ptr<net::PortAllocator> ports,
                                       std::shared_ptr<pal::ILogPAL> logger,
                                       std::shared_ptr<core::StructuredLogger> sessionLog)
    : settings_(std::move(settings))
    , impl_(std::make_unique<Impl>(settings_, std::move(relays), std::move(ports),
                                   std::move(logger), std::move(sessionLog)))
{
}

SessionCoordinator::~SessionCoordinator() {
    impl_->stop();
    std::lock_guard<std::mutex> lock(impl_->lifecycleMutex);
    impl_->reap();
}

core::Result<void, core::Error> SessionCoordinator::start() {
    return impl_->start();
}

void SessionCoordinator::stop() {
    impl_->stop();
}

bool SessionCoordinator::isRunning() const {
    return impl_->running;
}

uint16_t SessionCoordinator::boundPort() const {
    return impl_->boundPort;
}

core::Result<void, core::Error> SessionCoordinator::sendChat(const std::string& message) {
    if (message.empty()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "Empty chat message"));
    }
    if (!impl_->running) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "Coordinator is not running"));
    }

    Impl* impl = impl_.get();
    asio::post(*impl->ioc, [impl, message]() {
        const std::string& host = impl->settings.hostNickname;
        impl->broadcast(ChatMessage{host, message, core::iso8601Now()});
        impl->notifyChat(host, message);
    });
    return core::Result<void, core::Error>::success();
}

std::vector<core::Member> SessionCoordinator::onlineMembers() const {
    std::lock_guard<std::mutex> lock(impl_->membersMutex);
    if (impl_->members.empty()) {
        return {core::Member(settings_.hostNickname, core::Role::Sender)};
    }
    return impl_->members;
}

void SessionCoordinator::setChatCallback(ChatCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->chatCallback = std::move(callback);
}

void SessionCoordinator::setMemberListCallback(MemberListCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->memberListCallback = std::move(callback);
}

void SessionCoordinator::setSessionEventCallback(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->sessionEventCallback = std::move(callback);
}

} // namespace signaling
} // namespace watchparty
