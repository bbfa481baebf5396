/**
 * @file broker_client.cpp
 * @brief BrokerClient 实现
 */

#include "client/broker_client.hpp"

#include "base/logger.hpp"
#include "core/websocket_transport.hpp"

namespace ironlink {

BrokerClient::BrokerClient(ClientOptions options, TransportFactory factory)
    : options_(std::move(options)) {
    SessionOptions session = options_.to_session_options();

    if (!factory) {
        TransportOptions transport = options_.transport;
        transport.connect_timeout = options_.connect_timeout;
        factory = [transport]() -> std::unique_ptr<Transport> {
            return std::make_unique<WebSocketTransport>(transport);
        };
    }
    lifecycle_ = std::make_unique<LifecycleManager>(std::move(session), std::move(factory),
                                                    table_, registry_, dispatcher_);
}

BrokerClient::~BrokerClient() {
    lifecycle_.reset();
}

bool BrokerClient::connect() {
    return lifecycle_->connect();
}

void BrokerClient::disconnect() {
    lifecycle_->disconnect();
}

ConnectionState BrokerClient::state() const {
    return lifecycle_->state();
}

bool BrokerClient::wait_until_ready(std::chrono::milliseconds timeout) const {
    return lifecycle_->wait_for_state(ConnectionState::READY, timeout);
}

ConnectionStats BrokerClient::get_connection_stats() const {
    ConnectionStats stats;
    stats.state = lifecycle_->state();
    stats.connected = stats.state == ConnectionState::READY;
    stats.reconnect_attempts = lifecycle_->reconnect_attempts();
    stats.subscriptions = registry_.current();
    stats.active_subscription_count = stats.subscriptions.size();
    stats.pending_request_ids = table_.pending_ids();
    stats.pending_request_count = stats.pending_request_ids.size();
    return stats;
}

// ============================================================================
// 订阅
// ============================================================================

RequestOutcome BrokerClient::subscribe(const std::string& symbol,
                                       std::optional<std::chrono::milliseconds> timeout) {
    if (symbol.empty()) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST, "symbol is required");
    }
    if (registry_.contains(symbol)) {
        return RequestOutcome(RequestStatus::ALREADY_SUBSCRIBED, symbol + " already subscribed");
    }

    WireMessage msg;
    msg.set(fields::Action, actions::Subscribe);
    msg.set(fields::Symbol, symbol);
    uint64_t generation = 0;
    RequestOutcome outcome = lifecycle_->request(std::move(msg), timeout.value_or(options_.subscribe_timeout),
                                                 &generation);

    if (outcome.status == RequestStatus::OK) {
        if (lifecycle_->commit_subscription(symbol, generation)) {
            LOG() << "[Client] Subscribed to market data: " << symbol;
        } else {
            LOG_WARN() << "[Client] Subscribe " << symbol
                       << " acknowledged after the session ended, not recorded";
        }
    } else {
        LOG_WARN() << "[Client] Subscribe " << symbol << " failed (" << to_string(outcome.status)
                   << "): " << outcome.message;
    }
    return outcome;
}

RequestOutcome BrokerClient::unsubscribe(const std::string& symbol,
                                         std::optional<std::chrono::milliseconds> timeout) {
    if (symbol.empty()) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST, "symbol is required");
    }
    if (!registry_.contains(symbol)) {
        return RequestOutcome(RequestStatus::NOT_SUBSCRIBED, symbol + " is not subscribed");
    }

    WireMessage msg;
    msg.set(fields::Action, actions::Unsubscribe);
    msg.set(fields::Symbol, symbol);
    RequestOutcome outcome = lifecycle_->request(std::move(msg), timeout.value_or(options_.subscribe_timeout));

    if (outcome.status == RequestStatus::OK) {
        if (registry_.remove(symbol)) {
            LOG() << "[Client] Unsubscribed from: " << symbol;
        }
    } else {
        LOG_WARN() << "[Client] Unsubscribe " << symbol << " failed (" << to_string(outcome.status)
                   << "): " << outcome.message;
    }
    return outcome;
}

// ============================================================================
// 交易与查询
// ============================================================================

RequestOutcome BrokerClient::place_order(const OrderSpec& order,
                                         std::optional<std::chrono::milliseconds> timeout) {
    std::string error;
    if (!order.validate(error)) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST, error);
    }

    WireMessage msg;
    msg.set(fields::Action, actions::PlaceOrder);
    msg.set(fields::Symbol, order.symbol);
    msg.set(fields::Side, to_string(order.side));
    msg.set(fields::OrderType, to_string(order.type));
    msg.set(fields::Quantity, order.quantity);
    if (order.price) {
        msg.set(fields::Price, *order.price);
    }
    if (order.stop_price) {
        msg.set(fields::StopPrice, *order.stop_price);
    }
    if (order.time_in_force) {
        msg.set(fields::TimeInForce, *order.time_in_force);
    }
    if (order.client_order_id) {
        msg.set(fields::ClientOrderId, *order.client_order_id);
    }

    RequestOutcome outcome = lifecycle_->request(std::move(msg), timeout.value_or(options_.request_timeout));
    if (outcome.status == RequestStatus::OK) {
        LOG() << "[Client] Placed order: " << order.symbol << " " << to_string(order.side) << " "
              << order.quantity << " @ "
              << (order.price ? std::to_string(*order.price) : std::string(to_string(order.type)));
    } else {
        LOG_WARN() << "[Client] Place order " << order.symbol << " failed ("
                   << to_string(outcome.status) << "): " << outcome.message;
    }
    return outcome;
}

RequestOutcome BrokerClient::cancel_order(const std::string& order_id,
                                          std::optional<std::chrono::milliseconds> timeout) {
    if (order_id.empty()) {
        return RequestOutcome(RequestStatus::INVALID_REQUEST, "order_id is required");
    }

    WireMessage msg;
    msg.set(fields::Action, actions::CancelOrder);
    msg.set(fields::OrderId, order_id);
    RequestOutcome outcome = lifecycle_->request(std::move(msg), timeout.value_or(options_.request_timeout));
    if (outcome.status == RequestStatus::OK) {
        LOG() << "[Client] Cancelled order: " << order_id;
    } else {
        LOG_WARN() << "[Client] Cancel " << order_id << " failed (" << to_string(outcome.status)
                   << "): " << outcome.message;
    }
    return outcome;
}

RequestOutcome BrokerClient::query_positions(std::optional<std::chrono::milliseconds> timeout) {
    return simple_request(actions::GetPositions, timeout.value_or(options_.request_timeout));
}

RequestOutcome BrokerClient::query_account_info(std::optional<std::chrono::milliseconds> timeout) {
    return simple_request(actions::GetAccountInfo, timeout.value_or(options_.request_timeout));
}

RequestOutcome BrokerClient::simple_request(const char* action, std::chrono::milliseconds timeout) {
    WireMessage msg;
    msg.set(fields::Action, action);
    RequestOutcome outcome = lifecycle_->request(std::move(msg), timeout);
    if (!outcome.ok()) {
        LOG_WARN() << "[Client] " << action << " failed (" << to_string(outcome.status)
                   << "): " << outcome.message;
    }
    return outcome;
}

// ============================================================================
// 回调
// ============================================================================

HandlerId BrokerClient::on_market_data(EventHandler handler) {
    return dispatcher_.register_handler(EventKind::MARKET_DATA, std::move(handler));
}

HandlerId BrokerClient::on_order_update(EventHandler handler) {
    return dispatcher_.register_handler(EventKind::ORDER_UPDATE, std::move(handler));
}

HandlerId BrokerClient::on_position_update(EventHandler handler) {
    return dispatcher_.register_handler(EventKind::POSITION_UPDATE, std::move(handler));
}

HandlerId BrokerClient::on_error(EventHandler handler) {
    return dispatcher_.register_handler(EventKind::ERROR, std::move(handler));
}

bool BrokerClient::remove_handler(HandlerId id) {
    return dispatcher_.unregister_handler(id);
}

void BrokerClient::on_state_change(StateListener listener) {
    lifecycle_->set_state_listener(std::move(listener));
}

} // namespace ironlink
