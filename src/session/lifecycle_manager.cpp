/**
 * @file lifecycle_manager.cpp
 * @brief LifecycleManager 实现
 */

#include "session/lifecycle_manager.hpp"

#include <stdexcept>
#include <vector>

#include "base/logger.hpp"

namespace ironlink {

namespace {

// 当前线程正在执行读循环回调
thread_local bool t_in_read_loop = false;

struct ReadLoopScope {
    ReadLoopScope() { t_in_read_loop = true; }
    ~ReadLoopScope() { t_in_read_loop = false; }
};

} // namespace

LifecycleManager::LifecycleManager(SessionOptions options, TransportFactory factory,
                                   CorrelationTable& table, SubscriptionRegistry& registry,
                                   EventDispatcher& dispatcher)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      table_(table),
      registry_(registry),
      dispatcher_(dispatcher) {
    if (!factory_) {
        throw std::invalid_argument("LifecycleManager requires a transport factory");
    }
    if (options_.reconnect.max_attempts < 1) {
        throw std::invalid_argument("reconnect.max_attempts must be at least 1");
    }
    if (options_.reconnect.base_delay.count() < 0 || options_.reconnect.max_delay.count() < 0) {
        throw std::invalid_argument("reconnect delays must not be negative");
    }
}

LifecycleManager::~LifecycleManager() {
    disconnect();
}

// ============================================================================
// 状态
// ============================================================================

ConnectionState LifecycleManager::state() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return state_;
}

bool LifecycleManager::wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(session_mutex_);
    return state_cv_.wait_for(lock, timeout, [this, target] { return state_ == target; });
}

void LifecycleManager::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void LifecycleManager::set_state(ConnectionState next, const std::string& reason) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        previous = state_;
        state_ = next;
    }
    announce(previous, next, reason);
}

bool LifecycleManager::enter_ready(const std::string& reason) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!transport_ || !transport_->is_open() || lost_generation_ == generation_) {
            return false;
        }
        previous = state_;
        state_ = ConnectionState::READY;
    }
    announce(previous, ConnectionState::READY, reason);
    return true;
}

void LifecycleManager::announce(ConnectionState previous, ConnectionState next, const std::string& reason) {
    state_cv_.notify_all();

    if (previous == next) {
        return;
    }
    if (next == ConnectionState::FAILED) {
        LOG_ERROR() << "[Lifecycle] " << to_string(previous) << " -> " << to_string(next) << ": " << reason;
    } else {
        LOG() << "[Lifecycle] " << to_string(previous) << " -> " << to_string(next)
              << (reason.empty() ? "" : ": ") << reason;
    }

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        try {
            listener(next, reason);
        } catch (const std::exception& e) {
            LOG_ERROR() << "[Lifecycle] State listener threw: " << e.what();
        }
    }
}

// ============================================================================
// 连接
// ============================================================================

bool LifecycleManager::connect() {
    if (lifecycle_.in_worker_thread() || t_in_read_loop) {
        LOG_ERROR() << "[Lifecycle] connect() must not be called from a session callback";
        return false;
    }
    stop_requested_ = false;
    auto ready = lifecycle_.enqueue([this] { return run_connect_loop(false); });
    return ready.get();
}

bool LifecycleManager::run_connect_loop(bool reconnecting) {
    if (state() == ConnectionState::READY) {
        return true;
    }

    const ReconnectPolicy& policy = options_.reconnect;
    attempts_ = 0;
    if (reconnecting) {
        set_state(ConnectionState::RECONNECTING, "connection lost");
    }

    for (int attempt = 1; ; ++attempt) {
        if (stop_requested_) {
            LOG() << "[Lifecycle] Connect loop stopped";
            return false;
        }

        set_state(ConnectionState::CONNECTING,
                  "attempt " + std::to_string(attempt) + "/" + std::to_string(policy.max_attempts));
        LOG() << "[Lifecycle] Connecting to " << options_.endpoint.url
              << " (attempt " << attempt << "/" << policy.max_attempts << ")";

        std::string failure;
        if (try_connect_once(failure)) {
            if (enter_ready(reconnecting ? "reconnected" : "authenticated")) {
                attempts_ = 0;
                resubscribe_all();
                return true;
            }
            failure = "connection lost before the session became ready";
            release_transport();
        }

        attempts_ = attempt;
        LOG_WARN() << "[Lifecycle] Connect attempt " << attempt << " failed: " << failure;

        if (stop_requested_) {
            return false;
        }
        if (attempt >= policy.max_attempts) {
            ConnectionState previous;
            {
                // 与 commit_subscription 互斥，FAILED 之后登记表保持为空
                std::lock_guard<std::mutex> lock(session_mutex_);
                registry_.clear();
                previous = state_;
                state_ = ConnectionState::FAILED;
            }
            announce(previous, ConnectionState::FAILED,
                     "giving up after " + std::to_string(attempt) + " attempts, last error: " + failure);
            return false;
        }

        const auto delay = policy.delay_for(attempt);
        set_state(ConnectionState::RECONNECTING, "retry in " + std::to_string(delay.count()) + "ms");
        LOG() << "[Lifecycle] Retrying in " << delay.count() << "ms";

        std::unique_lock<std::mutex> lock(session_mutex_);
        if (state_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); })) {
            LOG() << "[Lifecycle] Backoff interrupted by disconnect";
            return false;
        }
    }
}

bool LifecycleManager::try_connect_once(std::string& failure) {
    std::unique_ptr<Transport> transport = factory_();
    if (!transport) {
        failure = "transport factory returned no transport";
        return false;
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        generation = ++generation_;
    }

    const bool opened = transport->open(
        options_.endpoint,
        [this, generation](const std::string& frame) { on_frame(generation, frame); },
        [this, generation](const std::string& reason) { on_transport_closed(generation, reason); });
    if (!opened) {
        failure = "could not open " + options_.endpoint.url;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        transport_ = std::move(transport);
    }

    set_state(ConnectionState::AUTHENTICATING, "");
    if (!authenticate(failure)) {
        release_transport();
        return false;
    }
    return true;
}

bool LifecycleManager::authenticate(std::string& failure) {
    WireMessage msg;
    msg.set(fields::Action, actions::Authenticate);
    msg.set(fields::ApiKey, options_.api_key);
    msg.set(fields::Secret, options_.api_secret);

    if (!options_.require_auth_ack) {
        msg.set(fields::RequestId, ids_.next());
        if (send_frame(codec_.encode(msg), false, nullptr) != RequestStatus::OK) {
            failure = "authentication frame could not be sent";
            return false;
        }
        LOG() << "[Lifecycle] Authentication sent (no acknowledgement expected)";
        return true;
    }

    RequestOutcome outcome = exchange(std::move(msg), options_.auth_timeout, false, nullptr);
    switch (outcome.status) {
        case RequestStatus::OK:
            LOG() << "[Lifecycle] Authenticated as " << options_.api_key;
            return true;
        case RequestStatus::REJECTED:
            LOG_ERROR() << "[Lifecycle] Authentication rejected by broker: " << outcome.message;
            failure = "authentication rejected: " + outcome.message;
            return false;
        case RequestStatus::TIMEOUT:
            LOG_ERROR() << "[Lifecycle] Authentication not acknowledged within "
                        << options_.auth_timeout.count() << "ms";
            failure = "authentication timed out";
            return false;
        default:
            LOG_ERROR() << "[Lifecycle] Authentication failed: " << outcome.message;
            failure = "authentication failed: " + outcome.message;
            return false;
    }
}

void LifecycleManager::resubscribe_all() {
    std::vector<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        symbols = registry_.current();
        snapshot_generation_ = generation_;
    }
    if (symbols.empty()) {
        return;
    }
    LOG() << "[Lifecycle] Resubscribing " << symbols.size() << " symbol(s)";

    for (const auto& symbol : symbols) {
        if (!resubscribe(symbol)) {
            LOG_WARN() << "[Lifecycle] Resubscribe aborted, session no longer ready";
            return;
        }
    }
}

bool LifecycleManager::resubscribe(const std::string& symbol) {
    if (state() != ConnectionState::READY) {
        return false;
    }
    WireMessage msg;
    msg.set(fields::Action, actions::Subscribe);
    msg.set(fields::Symbol, symbol);
    RequestOutcome outcome = exchange(std::move(msg), options_.subscribe_timeout, false, nullptr);

    if (outcome.status == RequestStatus::OK) {
        LOG() << "[Lifecycle] Resubscribed " << symbol;
    } else if (outcome.status == RequestStatus::REJECTED) {
        registry_.remove(symbol);
        LOG_WARN() << "[Lifecycle] Resubscribe " << symbol << " rejected, dropped from registry: "
                   << outcome.message;
    } else {
        LOG_WARN() << "[Lifecycle] Resubscribe " << symbol << " failed ("
                   << to_string(outcome.status) << "): " << outcome.message;
    }
    return true;
}

bool LifecycleManager::commit_subscription(const std::string& symbol, uint64_t generation) {
    bool replay = false;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (stop_requested_ || state_ == ConnectionState::FAILED) {
            return false;
        }
        registry_.add(symbol);
        // 确认来自已被替换的连接，且当前连接的重新订阅快照已取过
        replay = generation != generation_ && state_ == ConnectionState::READY &&
                 snapshot_generation_ == generation_;
    }
    if (replay) {
        LOG() << "[Lifecycle] Subscribe " << symbol << " acknowledged on a previous connection, replaying";
        const bool queued = lifecycle_.enqueue_to(0, [this, symbol] {
            if (registry_.contains(symbol) && !resubscribe(symbol)) {
                LOG_DEBUG() << "[Lifecycle] Session left READY, " << symbol
                            << " waits for the next resubscribe";
            }
        });
        if (!queued) {
            LOG_WARN() << "[Lifecycle] Lifecycle thread stopped, " << symbol << " not replayed";
        }
    }
    return true;
}

// ============================================================================
// 断开
// ============================================================================

void LifecycleManager::disconnect() {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        stop_requested_ = true;
    }
    state_cv_.notify_all();

    const size_t failed = table_.fail_all(RequestStatus::SHUTTING_DOWN, "client is shutting down");
    if (failed > 0) {
        LOG() << "[Lifecycle] Cancelled " << failed << " pending request(s)";
    }

    if (lifecycle_.in_worker_thread()) {
        teardown();
        return;
    }
    if (t_in_read_loop) {
        // 在读循环中不能等待传输层关闭
        lifecycle_.enqueue_to(0, [this] { teardown(); });
        return;
    }
    try {
        lifecycle_.enqueue([this] { teardown(); }).wait();
    } catch (const std::runtime_error& e) {
        LOG_DEBUG() << "[Lifecycle] Teardown skipped: " << e.what();
    }
}

void LifecycleManager::teardown() {
    release_transport();
    registry_.clear();
    table_.fail_all(RequestStatus::SHUTTING_DOWN, "client is shutting down");
    set_state(ConnectionState::DISCONNECTED, "disconnected by owner");
}

void LifecycleManager::release_transport() {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        transport = std::move(transport_);
        ++generation_;
    }
    if (transport) {
        transport->close();
    }
}

// ============================================================================
// 请求
// ============================================================================

RequestOutcome LifecycleManager::request(WireMessage msg, std::chrono::milliseconds timeout,
                                         uint64_t* generation) {
    if (t_in_read_loop) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST,
                              "requests cannot be issued from an event handler");
    }
    const ConnectionState current = state();
    if (current != ConnectionState::READY) {
        return RequestOutcome(RequestStatus::NOT_CONNECTED,
                              std::string("session is ") + to_string(current));
    }
    return exchange(std::move(msg), timeout, true, generation);
}

RequestOutcome LifecycleManager::exchange(WireMessage msg, std::chrono::milliseconds timeout,
                                          bool require_ready, uint64_t* generation) {
    const std::string id = ids_.next();
    const std::string action = msg.get_string(fields::Action, "");
    msg.set(fields::RequestId, id);
    const std::string frame = codec_.encode(msg);

    ResultHandle handle = table_.register_request(id, timeout);
    if (!handle) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST, "duplicate request id " + id);
    }
    const RequestStatus sent = send_frame(frame, require_ready, generation);
    if (sent != RequestStatus::OK) {
        table_.fail(id, sent, sent == RequestStatus::NOT_CONNECTED ? "session is no longer ready"
                                                                   : "not connected");
    }

    RequestOutcome outcome = table_.await(handle);
    if (outcome.status == RequestStatus::TIMEOUT) {
        LOG_WARN() << "[Lifecycle] " << action << " " << id << " timed out after " << timeout.count() << "ms";
    } else if (!outcome.ok()) {
        LOG_DEBUG() << "[Lifecycle] " << action << " " << id << " -> "
                    << to_string(outcome.status) << ": " << outcome.message;
    }
    return outcome;
}

RequestStatus LifecycleManager::send_frame(const std::string& frame, bool require_ready, uint64_t* generation) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (require_ready && state_ != ConnectionState::READY) {
        return RequestStatus::NOT_CONNECTED;
    }
    if (!transport_ || !transport_->is_open() || !transport_->send(frame)) {
        return RequestStatus::CONNECTION_LOST;
    }
    if (generation) {
        *generation = generation_;
    }
    return RequestStatus::OK;
}

// ============================================================================
// 读循环回调
// ============================================================================

void LifecycleManager::on_frame(uint64_t generation, const std::string& frame) {
    ReadLoopScope scope;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (generation != generation_) {
            return;
        }
    }

    WireMessage msg;
    try {
        msg = codec_.decode(frame);
    } catch (const DecodeError& e) {
        LOG_WARN() << "[Lifecycle] Dropped inbound frame: " << e.what();
        return;
    }

    if (msg.has(fields::RequestId)) {
        const std::string id = msg.get_string(fields::RequestId);
        if (table_.resolve(id, msg)) {
            return;
        }
        InboundEvent push;
        if (!InboundEvent::from_message(msg, push)) {
            LOG_DEBUG() << "[Lifecycle] Late or unknown response " << id << " ignored";
            return;
        }
    }

    InboundEvent event;
    if (!InboundEvent::from_message(msg, event)) {
        LOG_DEBUG() << "[Lifecycle] Unhandled message type '" << msg.get_string(fields::Type, "")
                    << "': " << frame;
        return;
    }
    if (event.kind == EventKind::ERROR) {
        LOG_ERROR() << "[Lifecycle] Broker error: "
                    << (event.message.empty() ? std::string("Unknown error") : event.message);
    }
    dispatcher_.dispatch(event);
}

void LifecycleManager::on_transport_closed(uint64_t generation, const std::string& reason) {
    ReadLoopScope scope;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (generation != generation_) {
            return;
        }
        // 就绪前的断线由 enter_ready 发现，本次尝试按失败处理
        lost_generation_ = generation;
        previous = state_;
        if (previous == ConnectionState::READY) {
            state_ = ConnectionState::DISCONNECTED;
        }
    }

    const size_t failed = table_.fail_all(RequestStatus::CONNECTION_LOST, "connection lost: " + reason);
    if (failed > 0) {
        LOG_WARN() << "[Lifecycle] Failed " << failed << " pending request(s) after connection loss";
    }
    if (previous != ConnectionState::READY) {
        return;
    }

    announce(previous, ConnectionState::DISCONNECTED, reason);
    if (stop_requested_) {
        return;
    }
    const bool queued = lifecycle_.enqueue_to(0, [this] {
        release_transport();
        if (!stop_requested_) {
            run_connect_loop(true);
        }
    });
    if (!queued) {
        LOG_WARN() << "[Lifecycle] Lifecycle thread stopped, not reconnecting";
    }
}

} // namespace ironlink
