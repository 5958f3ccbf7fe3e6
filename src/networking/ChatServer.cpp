#include "ChatServer.h"

#include "chat/Protocol.h"
#include "chat/Validation.h"
#include "common/Errors.h"
#include "common/Logging.h"
#include "security/RateLimiter.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace termchat::networking {

namespace beast = boost::beast;
namespace asio = boost::asio;
namespace protocol = chat::protocol;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kHelpText = "Commands: /help, /users, /nick <name>, /quit";

std::string format_endpoint(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

} // namespace

class ChatServer::Impl : public std::enable_shared_from_this<ChatServer::Impl> {
public:
    Impl(asio::io_context& ioc, ServerConfig config, std::shared_ptr<EventSink> events)
        : ioc_(ioc),
          config_(std::move(config)),
          events_(events ? std::move(events) : std::make_shared<LoggingEventSink>()),
          gate_(static_cast<std::size_t>(config_.max_clients),
                static_cast<std::size_t>(config_.max_connections_per_ip)),
          limiter_(security::RateLimitPolicy{static_cast<double>(config_.burst_capacity()),
                                             config_.refill_per_second()}),
          registry_(chat::InputValidator(static_cast<std::size_t>(config_.max_username_length),
                                         static_cast<std::size_t>(config_.max_message_length))),
          broker_(registry_, static_cast<std::size_t>(config_.message_history_size)),
          strand_(asio::make_strand(ioc)),
          acceptor_(ioc),
          shutdown_timer_(ioc) {}

    void start() {
        ServerState expected = ServerState::Init;
        if (!state_.compare_exchange_strong(expected, ServerState::Listening)) {
            throw StartupError("server already started");
        }

        beast::error_code ec;
        const auto address = asio::ip::make_address(config_.host, ec);
        if (ec) {
            state_ = ServerState::Stopped;
            throw StartupError("invalid listen address '" + config_.host + "': " + ec.message());
        }
        const tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));

        auto fail = [&](const char* what) {
            beast::error_code ignored;
            acceptor_.close(ignored);
            state_ = ServerState::Stopped;
            throw StartupError(std::string(what) + " " + format_endpoint(endpoint) + ": " + ec.message());
        };

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) fail("cannot open");
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) fail("cannot configure");
        acceptor_.bind(endpoint, ec);
        if (ec) fail("cannot bind");
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) fail("cannot listen on");

        const tcp::endpoint local = acceptor_.local_endpoint(ec);
        const std::string bound = format_endpoint(local);
        {
            std::lock_guard<std::mutex> lk(mu_);
            local_endpoint_ = bound;
            port_ = local.port();
        }
        TERMCHAT_LOG_INFO("listening on {} (max_clients={}, per_ip={}, history={})", bound,
                          config_.max_clients, config_.max_connections_per_ip, config_.message_history_size);
        do_accept();
    }

    void stop(OnStopped on_complete) {
        ServerState prev = state_.load();
        if (prev == ServerState::Init) {
            state_ = ServerState::Stopped;
            if (on_complete) on_complete();
            return;
        }
        if (prev != ServerState::Listening ||
            !state_.compare_exchange_strong(prev, ServerState::ShuttingDown)) {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ == ServerState::Stopped) {
                if (on_complete) asio::post(ioc_, std::move(on_complete));
            } else if (on_complete) {
                on_stopped_.push_back(std::move(on_complete));
            }
            return;
        }

        TERMCHAT_LOG_INFO("shutting down ({} sessions)", registry_.size());
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (on_complete) on_stopped_.push_back(std::move(on_complete));
        }

        asio::dispatch(strand_, [self = shared_from_this()] { self->begin_shutdown(); });
    }

    ServerState state() const noexcept { return state_.load(); }

    std::string local_endpoint() const {
        std::lock_guard<std::mutex> lk(mu_);
        return local_endpoint_;
    }

    unsigned short port() const {
        std::lock_guard<std::mutex> lk(mu_);
        return port_;
    }

    const ServerConfig& config() const noexcept { return config_; }
    const chat::ClientRegistry& registry() const noexcept { return registry_; }
    chat::MessageBroker::Stats broker_stats() const { return broker_.stats(); }
    security::ConnectionGate::Stats connection_stats() const { return gate_.stats(); }

private:
    class Session : public chat::Participant, public std::enable_shared_from_this<Session> {
    public:
        Session(std::shared_ptr<Impl> server, tcp::socket socket, security::ConnectionSlot slot,
                std::string address)
            : server_(std::move(server)),
              address_(std::move(address)),
              slot_(std::move(slot)),
              stream_(std::move(socket)),
              strand_(asio::make_strand(server_->ioc_)),
              max_pending_(static_cast<std::size_t>(server_->config_.max_pending_frames)) {}

        void start() {
            asio::dispatch(strand_, [self = shared_from_this()] { self->on_start(); });
        }

        // A gracefully closing session accepts and discards frames; only a
        // torn-down session or a full queue reports failure.
        bool deliver(const std::string& frame) override {
            if (closed_.load()) return false;
            if (closing_.load()) return true;
            if (pending_.fetch_add(1) >= max_pending_) {
                pending_.fetch_sub(1);
                return false;
            }
            asio::post(strand_, [self = shared_from_this(), frame] { self->enqueue(frame); });
            return true;
        }

        void close() override {
            asio::post(strand_, [self = shared_from_this()] { self->teardown("closed by server"); });
        }

        // Flushes queued frames, then half-closes and waits for the peer.
        void shutdown() {
            asio::post(strand_, [self = shared_from_this()] { self->close_gracefully(); });
        }

        void force_close(const std::string& reason) {
            asio::post(strand_, [self = shared_from_this(), reason] { self->teardown(reason); });
        }

        chat::SessionId id() const noexcept { return id_.load(); }
        const std::string& address() const noexcept { return address_; }

    private:
        void on_start() {
            if (server_->state() != ServerState::Listening) return teardown("server stopping");

            const chat::SessionId id = server_->broker_.join(shared_from_this(), address_);
            id_ = id;
            server_->limiter_.add(id);
            state_ = SessionState::Authenticating;
            server_->emit(EventKind::Connect, id, address_, "");

            last_valid_ = std::chrono::steady_clock::now();
            do_read();
        }

        void do_read() {
            if (torn_down_) return;

            if (closing_) {
                stream_.expires_after(server_->config_.write_timeout());
                stream_.async_read_some(
                    asio::buffer(drain_buf_),
                    asio::bind_executor(
                        strand_,
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            if (ec) return self->teardown("closed");
                            self->do_read();
                        }));
                return;
            }

            stream_.expires_at(last_valid_ + server_->config_.idle_timeout());
            asio::async_read_until(
                stream_,
                asio::dynamic_buffer(read_buf_, static_cast<std::size_t>(server_->config_.max_frame_bytes)),
                protocol::kDelimiter,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                        self->on_read(ec, n);
                    }));
        }

        void on_read(beast::error_code ec, std::size_t n) {
            if (torn_down_) return;

            if (ec == asio::error::not_found) {
                server_->emit(EventKind::ProtocolError, id(), address_, "frame exceeds max_frame_bytes");
                notify("Message too long.");
                read_buf_.clear();
                close_gracefully();
                return do_read();
            }
            if (ec == beast::error::timeout && !closing_) return teardown("idle timeout");
            if (ec == asio::error::eof) return teardown("client disconnected");
            if (ec) return teardown(ec.message());

            std::string line = read_buf_.substr(0, n);
            read_buf_.erase(0, n);

            if (!closing_) handle_line(line);
            do_read();
        }

        void handle_line(const std::string& line) {
            if (is_blank(line)) return;

            const chat::SessionId id = this->id();
            last_valid_ = std::chrono::steady_clock::now();
            server_->registry_.touch(id);

            switch (server_->limiter_.admit(id)) {
                case security::RateLimiter::Verdict::Allowed:
                    break;
                case security::RateLimiter::Verdict::Throttled:
                    server_->emit(EventKind::Throttle, id, address_, "rate limit exceeded");
                    notify("You are sending messages too fast. Slow down.");
                    return;
                case security::RateLimiter::Verdict::Dropped:
                    TERMCHAT_LOG_TRACE("session {}: dropped throttled frame", id);
                    return;
            }

            protocol::Frame frame = protocol::decode(line);
            switch (frame.type) {
                case protocol::FrameType::Chat:
                    return handle_chat(frame.payload);
                case protocol::FrameType::UserCommand:
                    return handle_nick(frame.payload);
                case protocol::FrameType::Command:
                    return handle_command(frame.payload);
                case protocol::FrameType::Server:
                case protocol::FrameType::UserList:
                    server_->emit(EventKind::ValidationError, id, address_,
                                  "client sent " + std::string(protocol::tag_of(frame.type)) + " frame");
                    return notify("Unsupported frame type.");
            }
        }

        void handle_chat(const std::string& payload) {
            const chat::SessionId id = this->id();
            auto record = server_->registry_.find(id);
            if (!record) return;
            const std::string name = record->display_name();

            auto result = server_->registry_.validator().validate_message(payload);
            if (result.ok) {
                const std::string prefix = name + ": ";
                if (result.value.compare(0, prefix.size(), prefix) == 0) {
                    result = server_->registry_.validator().validate_message(result.value.substr(prefix.size()));
                }
            }
            if (!result.ok) {
                server_->emit(EventKind::ValidationError, id, address_, result.reason);
                return notify("Message rejected: " + result.reason);
            }

            server_->registry_.record_message(id);
            server_->broker_.publish(chat::Message::chat(name, std::move(result.value)), id);
        }

        void handle_nick(const std::string& requested) {
            const chat::SessionId id = this->id();
            const auto result = server_->registry_.set_username(id, requested);

            switch (result.status) {
                case chat::UsernameStatus::Ok:
                    state_ = SessionState::Active;
                    TERMCHAT_LOG_INFO("session {} ({}) is now '{}'", id, address_, result.username);
                    server_->broker_.broadcast_notice(result.previous + " is now known as " + result.username + ".");
                    server_->broker_.broadcast_roster();
                    return;
                case chat::UsernameStatus::Unchanged:
                    return notify("You are already known as " + result.username + ".");
                case chat::UsernameStatus::Duplicate:
                    server_->emit(EventKind::ValidationError, id, address_, "duplicate username " + result.username);
                    return notify("Username '" + result.username + "' is already taken.");
                case chat::UsernameStatus::InvalidFormat:
                    server_->emit(EventKind::ValidationError, id, address_, result.reason);
                    return notify("Invalid username: " + result.reason);
                case chat::UsernameStatus::UnknownSession:
                    return;
            }
        }

        void handle_command(const std::string& payload) {
            const std::string text = chat::InputValidator::trim_copy(payload);
            const auto space = text.find_first_of(" \t");
            const std::string command = text.substr(0, space);
            const std::string argument =
                space == std::string::npos ? std::string{} : chat::InputValidator::trim_copy(text.substr(space + 1));

            if (command == "/quit") {
                notify("Goodbye.");
                return close_gracefully();
            }
            if (command == "/help") return notify(kHelpText);
            if (command == "/users") {
                server_->broker_.send_roster(id());
                return;
            }
            if (command == "/nick") return handle_nick(argument);

            server_->emit(EventKind::ValidationError, id(), address_, "unknown command " + command);
            notify("Unknown command: " + command);
        }

        // Session-local notice, queued directly on the strand.
        void notify(const std::string& text) {
            if (closing_) return;
            pending_.fetch_add(1);
            enqueue(protocol::encode(protocol::FrameType::Server, text));
        }

        void enqueue(std::string frame) {
            if (torn_down_) {
                pending_.fetch_sub(1);
                return;
            }
            bool writing = !write_queue_.empty();
            write_queue_.push_back(std::move(frame));
            if (!writing) do_write();
        }

        void do_write() {
            stream_.expires_after(server_->config_.write_timeout());
            asio::async_write(
                stream_,
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (self->torn_down_) return;
                        if (ec == beast::error::timeout) return self->teardown("write timeout");
                        if (ec) return self->teardown("write failed: " + ec.message());

                        self->write_queue_.pop_front();
                        self->pending_.fetch_sub(1);
                        if (!self->write_queue_.empty()) return self->do_write();
                        if (self->closing_) self->half_close();
                    }));
        }

        void close_gracefully() {
            if (torn_down_ || closing_) return;
            closing_ = true;
            state_ = SessionState::Closing;
            if (write_queue_.empty()) half_close();
        }

        void half_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            if (ec) teardown("shutdown failed: " + ec.message());
        }

        void teardown(const std::string& reason) {
            if (torn_down_) return;
            TERMCHAT_LOG_DEBUG("session {} ({}) {} -> closed: {}", id(), address_, to_string(state_), reason);
            torn_down_ = true;
            closed_ = true;
            closing_ = true;
            state_ = SessionState::Closing;

            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.close();
            pending_.fetch_sub(write_queue_.size());
            write_queue_.clear();

            const chat::SessionId id = this->id();
            if (id != 0) {
                server_->broker_.leave(id);
                server_->limiter_.remove(id);
                server_->emit(EventKind::Disconnect, id, address_, reason);
            }
            slot_.release();
            server_->remove_session(this);
        }

        std::shared_ptr<Impl> server_;
        std::string address_;
        security::ConnectionSlot slot_;

        beast::tcp_stream stream_;
        asio::strand<asio::io_context::executor_type> strand_;

        std::atomic<chat::SessionId> id_{0};
        SessionState state_ = SessionState::Admitted;
        std::chrono::steady_clock::time_point last_valid_{};

        std::string read_buf_;
        std::array<char, 1024> drain_buf_{};
        std::deque<std::string> write_queue_;

        const std::size_t max_pending_;
        std::atomic<std::size_t> pending_{0};
        std::atomic<bool> closing_{false};
        std::atomic<bool> closed_{false};
        bool torn_down_ = false;
    };

    // Acceptor and shutdown timer are only touched on strand_.
    void do_accept() {
        acceptor_.async_accept(
            asio::bind_executor(strand_, [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted || self->state() != ServerState::Listening) return;
                    TERMCHAT_LOG_WARN("accept failed: {}", ec.message());
                    return self->do_accept();
                }
                if (self->state() != ServerState::Listening) {
                    socket.close(ec);
                    return;
                }
                self->on_accept(std::move(socket));
                self->do_accept();
            }));
    }

    void on_accept(tcp::socket socket) {
        beast::error_code ec;
        const auto remote = socket.remote_endpoint(ec);
        if (ec) {
            TERMCHAT_LOG_DEBUG("dropping connection without peer address: {}", ec.message());
            socket.close(ec);
            return;
        }

        const std::string ip = remote.address().to_string();
        const std::string address = format_endpoint(remote);

        security::ConnectionGate::RejectReason reason = security::ConnectionGate::RejectReason::None;
        auto slot = gate_.acquire(ip, &reason);
        if (!slot) {
            emit(EventKind::Reject, 0, address, security::to_string(reason));
            socket.close(ec);
            return;
        }

        auto session = std::make_shared<Session>(shared_from_this(), std::move(socket), std::move(*slot), address);
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_[session.get()] = session;
        }
        session->start();
    }

    void begin_shutdown() {
        beast::error_code ec;
        acceptor_.close(ec);
        gate_.close();

        broker_.broadcast_notice("Server is shutting down.");

        std::vector<std::shared_ptr<Session>> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [ptr, s] : sessions_) open.push_back(s);
        }
        if (open.empty()) return finish();

        for (auto& s : open) s->shutdown();

        shutdown_timer_.expires_after(config_.shutdown_timeout());
        shutdown_timer_.async_wait(
            asio::bind_executor(strand_, [self = shared_from_this()](beast::error_code ec) {
                if (ec == asio::error::operation_aborted) return;
                self->force_close_remaining();
            }));
    }

    // The last teardown finishes the shutdown through remove_session; the
    // timer is re-armed only as a backstop for teardowns that never run.
    void force_close_remaining() {
        std::vector<std::shared_ptr<Session>> stragglers;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [ptr, s] : sessions_) stragglers.push_back(s);
        }
        if (stragglers.empty()) return finish();

        for (auto& s : stragglers) {
            emit(EventKind::ShutdownError, s->id(), s->address(), "session still open after shutdown timeout");
            s->force_close("shutdown timeout");
        }

        shutdown_timer_.expires_after(config_.shutdown_timeout());
        shutdown_timer_.async_wait(
            asio::bind_executor(strand_, [self = shared_from_this()](beast::error_code ec) {
                if (ec == asio::error::operation_aborted) return;
                TERMCHAT_LOG_WARN("forced teardown did not complete, stopping anyway");
                self->finish();
            }));
    }

    void remove_session(Session* session) {
        bool drained = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_.erase(session);
            drained = sessions_.empty() && state_ == ServerState::ShuttingDown;
        }
        if (drained) finish();
    }

    void finish() {
        if (finished_.exchange(true)) return;
        asio::dispatch(strand_, [self = shared_from_this()] { self->on_finished(); });
    }

    void on_finished() {
        beast::error_code ec;
        shutdown_timer_.cancel();
        acceptor_.close(ec);

        std::vector<OnStopped> callbacks;
        std::unordered_map<Session*, std::shared_ptr<Session>> orphaned;
        {
            std::lock_guard<std::mutex> lk(mu_);
            state_ = ServerState::Stopped;
            callbacks.swap(on_stopped_);
            orphaned.swap(sessions_);
        }
        // Sessions and the registry both hold the server; drop what is left.
        for (auto& [ptr, s] : orphaned) {
            if (s->id() == 0) continue;
            registry_.unregister(s->id());
            limiter_.remove(s->id());
        }
        if (!orphaned.empty()) TERMCHAT_LOG_WARN("{} sessions abandoned at stop", orphaned.size());
        orphaned.clear();

        TERMCHAT_LOG_INFO("server stopped");
        for (auto& cb : callbacks) cb();
    }

    void emit(EventKind kind, chat::SessionId id, const std::string& address, std::string detail) {
        events_->emit(ServerEvent{kind, id, address, std::move(detail)});
    }

    asio::io_context& ioc_;
    const ServerConfig config_;
    std::shared_ptr<EventSink> events_;

    security::ConnectionGate gate_;
    security::RateLimiter limiter_;
    chat::ClientRegistry registry_;
    chat::MessageBroker broker_;

    asio::strand<asio::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    asio::steady_timer shutdown_timer_;

    std::atomic<ServerState> state_{ServerState::Init};
    std::atomic<bool> finished_{false};

    mutable std::mutex mu_;
    std::string local_endpoint_;
    unsigned short port_ = 0;
    std::unordered_map<Session*, std::shared_ptr<Session>> sessions_;
    std::vector<OnStopped> on_stopped_;
};

// ---- ChatServer wrapper ----

ChatServer::ChatServer(asio::io_context& ioc, ServerConfig config, std::shared_ptr<EventSink> events)
    : impl_(std::make_shared<Impl>(ioc, std::move(config), std::move(events))) {}

ChatServer::~ChatServer() = default;

void ChatServer::start() { impl_->start(); }
void ChatServer::stop(OnStopped on_complete) { impl_->stop(std::move(on_complete)); }

std::string ChatServer::local_endpoint() const { return impl_->local_endpoint(); }
unsigned short ChatServer::port() const { return impl_->port(); }

ServerState ChatServer::state() const noexcept { return impl_->state(); }
const ServerConfig& ChatServer::config() const noexcept { return impl_->config(); }

const chat::ClientRegistry& ChatServer::registry() const noexcept { return impl_->registry(); }
chat::MessageBroker::Stats ChatServer::broker_stats() const { return impl_->broker_stats(); }
security::ConnectionGate::Stats ChatServer::connection_stats() const { return impl_->connection_stats(); }

} // namespace termchat::networking
