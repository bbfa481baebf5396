#include <catch2/catch.hpp>
#include "client/broker_client.hpp"
#include "base/logger.hpp"
#include "mock/mock_broker.hpp"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace ironlink;
using namespace std::chrono_literals;
using mock::MockBroker;
using mock::eventually;

namespace {

ClientOptions make_client_options() {
    ClientOptions options;
    options.url = "ws://mock/socket";
    options.api_key = "test-key";
    options.api_secret = "test-secret";
    options.request_timeout = 300ms;
    options.subscribe_timeout = 300ms;
    options.auth_timeout = 300ms;
    options.reconnect.max_attempts = 3;
    options.reconnect.base_delay = 10ms;
    options.reconnect.max_delay = 30ms;
    return options;
}

OrderSpec market_order(const std::string& symbol, Side side, int64_t quantity) {
    OrderSpec order;
    order.symbol = symbol;
    order.side = side;
    order.quantity = quantity;
    return order;
}

} // namespace

TEST_CASE("BrokerClient rejects invalid url", "[client]") {
    ClientOptions options = make_client_options();
    options.url = "http://example.com";
    auto broker = std::make_shared<MockBroker>();
    REQUIRE_THROWS_AS(BrokerClient(options, broker->factory()), std::invalid_argument);
}

TEST_CASE("BrokerClient requests before connect", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());

    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.subscribe("MES").status == RequestStatus::NOT_CONNECTED);
    REQUIRE(client.place_order(market_order("MES", Side::BUY, 1)).status == RequestStatus::NOT_CONNECTED);
    REQUIRE(client.query_positions().status == RequestStatus::NOT_CONNECTED);
    REQUIRE(broker->open_attempts() == 0);
    REQUIRE(broker->sent().empty());
}

TEST_CASE("BrokerClient subscribe and unsubscribe", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    SECTION("subscribe adds to registry") {
        RequestOutcome outcome = client.subscribe("MES");
        REQUIRE(outcome.ok());
        REQUIRE(outcome.response.data()["symbol"] == "MES");
        REQUIRE(client.get_connection_stats().subscriptions == std::vector<std::string>{"MES"});

        auto sent = broker->sent();
        REQUIRE(sent.back()["action"] == "subscribe");
        REQUIRE(sent.back()["symbol"] == "MES");
    }

    SECTION("second subscribe is not sent") {
        REQUIRE(client.subscribe("MES").ok());
        REQUIRE(client.subscribe("MES").status == RequestStatus::ALREADY_SUBSCRIBED);
        REQUIRE(broker->count_sent("subscribe") == 1);
    }

    SECTION("unsubscribe removes from registry") {
        REQUIRE(client.subscribe("MES").ok());
        REQUIRE(client.unsubscribe("MES").ok());
        REQUIRE(client.get_connection_stats().active_subscription_count == 0);
        REQUIRE(client.unsubscribe("MES").status == RequestStatus::NOT_SUBSCRIBED);
        REQUIRE(broker->count_sent("unsubscribe") == 1);
    }

    SECTION("empty symbol") {
        REQUIRE(client.subscribe("").status == RequestStatus::INVALID_REQUEST);
        REQUIRE(client.unsubscribe("").status == RequestStatus::INVALID_REQUEST);
        REQUIRE(broker->count_sent("subscribe") == 0);
    }

    SECTION("rejected subscribe leaves registry unchanged") {
        broker->reject_symbol("ZZZ", "unknown symbol");
        RequestOutcome outcome = client.subscribe("ZZZ");
        REQUIRE(outcome.status == RequestStatus::REJECTED);
        REQUIRE(outcome.message == "unknown symbol");
        REQUIRE(client.get_connection_stats().active_subscription_count == 0);
    }

    SECTION("failed unsubscribe keeps registry") {
        REQUIRE(client.subscribe("MES").ok());
        broker->ignore_action("unsubscribe");
        REQUIRE(client.unsubscribe("MES", 50ms).status == RequestStatus::TIMEOUT);
        REQUIRE(client.get_connection_stats().subscriptions == std::vector<std::string>{"MES"});
    }
}

TEST_CASE("BrokerClient concurrent subscribe to the same symbol", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    auto first = std::async(std::launch::async, [&] { return client.subscribe("MES"); });
    auto second = std::async(std::launch::async, [&] { return client.subscribe("MES"); });
    RequestOutcome a = first.get();
    RequestOutcome b = second.get();

    REQUIRE((a.ok() || a.status == RequestStatus::ALREADY_SUBSCRIBED));
    REQUIRE((b.ok() || b.status == RequestStatus::ALREADY_SUBSCRIBED));
    REQUIRE((a.ok() || b.ok()));
    REQUIRE(client.get_connection_stats().subscriptions == std::vector<std::string>{"MES"});
}

TEST_CASE("BrokerClient place order", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->set_response_data("place_order", {{"order_id", "ORD-1"}, {"status", "working"}});
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    SECTION("limit order fields on the wire") {
        OrderSpec order = market_order("MES", Side::SELL, 3);
        order.type = OrderType::LIMIT;
        order.price = 5001.5;
        order.time_in_force = "day";

        RequestOutcome outcome = client.place_order(order);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.response.data()["order_id"] == "ORD-1");

        auto sent = broker->sent().back();
        REQUIRE(sent["action"] == "place_order");
        REQUIRE(sent["symbol"] == "MES");
        REQUIRE(sent["side"] == "sell");
        REQUIRE(sent["order_type"] == "limit");
        REQUIRE(sent["quantity"] == 3);
        REQUIRE(sent["price"] == 5001.5);
        REQUIRE(sent["time_in_force"] == "day");
        REQUIRE_FALSE(sent.contains("stop_price"));
        REQUIRE(sent["request_id"].get<std::string>().rfind("req_", 0) == 0);
    }

    SECTION("invalid orders are not sent") {
        REQUIRE(client.place_order(market_order("MES", Side::BUY, 0)).status == RequestStatus::INVALID_REQUEST);
        REQUIRE(client.place_order(market_order("", Side::BUY, 1)).status == RequestStatus::INVALID_REQUEST);

        OrderSpec limit = market_order("MES", Side::BUY, 1);
        limit.type = OrderType::LIMIT;
        REQUIRE(client.place_order(limit).status == RequestStatus::INVALID_REQUEST);

        OrderSpec stop = market_order("MES", Side::BUY, 1);
        stop.type = OrderType::STOP_LIMIT;
        stop.price = 5000.0;
        REQUIRE(client.place_order(stop).status == RequestStatus::INVALID_REQUEST);

        REQUIRE(broker->count_sent("place_order") == 0);
    }

    SECTION("rejected order") {
        broker->reject_action("place_order", "insufficient margin");
        RequestOutcome outcome = client.place_order(market_order("MES", Side::BUY, 2));
        REQUIRE(outcome.status == RequestStatus::REJECTED);
        REQUIRE(outcome.message == "insufficient margin");
    }

    SECTION("cancel order") {
        REQUIRE(client.cancel_order("ORD-1").ok());
        REQUIRE(broker->sent().back()["order_id"] == "ORD-1");
        REQUIRE(client.cancel_order("").status == RequestStatus::INVALID_REQUEST);
    }
}

TEST_CASE("BrokerClient order timeout clears the pending entry", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->ignore_action("place_order");
    BrokerClient client(make_client_options(), broker->factory());
    std::atomic<int> updates{0};
    client.on_order_update([&](const InboundEvent&) { ++updates; });
    REQUIRE(client.connect());

    const auto start = std::chrono::steady_clock::now();
    RequestOutcome outcome = client.place_order(market_order("MES", Side::BUY, 2), 100ms);
    REQUIRE(outcome.status == RequestStatus::TIMEOUT);
    REQUIRE(std::chrono::steady_clock::now() - start >= 100ms);
    REQUIRE(client.get_connection_stats().pending_request_count == 0);

    // 超时后到达的响应被丢弃
    const std::string id = broker->sent().back()["request_id"].get<std::string>();
    broker->push_raw(nlohmann::json{
        {"type", "place_order_response"}, {"request_id", id}, {"status", "ok"}}.dump());
    broker->push_event("order_update", {{"order_id", "ORD-2"}});
    REQUIRE(eventually([&] { return updates.load() == 1; }));
    REQUIRE(client.is_connected());
}

TEST_CASE("BrokerClient queries", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->set_response_data("get_positions", nlohmann::json::array({{{"symbol", "MES"}, {"quantity", 2}}}));
    broker->set_response_data("get_account_info", {{"balance", 25000.0}});
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    RequestOutcome positions = client.query_positions();
    REQUIRE(positions.ok());
    REQUIRE(positions.response.data()[0]["symbol"] == "MES");

    RequestOutcome account = client.query_account_info();
    REQUIRE(account.ok());
    REQUIRE(account.response.data()["balance"] == 25000.0);
}

TEST_CASE("BrokerClient routes push events to the matching handlers", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());

    std::atomic<int> market{0};
    std::atomic<int> orders{0};
    std::atomic<int> positions{0};
    std::atomic<int> errors{0};
    std::string last_error;
    client.on_market_data([&](const InboundEvent& e) {
        if (e.data.value("symbol", "") == "MES") ++market;
    });
    client.on_order_update([&](const InboundEvent&) { ++orders; });
    client.on_position_update([&](const InboundEvent&) { ++positions; });
    client.on_error([&](const InboundEvent& e) {
        last_error = e.message;
        ++errors;
    });
    REQUIRE(client.connect());

    broker->push_event("market_data", {{"symbol", "MES"}, {"bid", 5000.0}, {"ask", 5000.25}});
    REQUIRE(eventually([&] { return market.load() == 1; }));

    broker->push_event("position_update", {{"symbol", "MES"}, {"quantity", 2}});
    broker->push_raw(R"({"type":"error","message":"rate limited"})");
    REQUIRE(eventually([&] { return errors.load() == 1; }));

    REQUIRE(market.load() == 1);
    REQUIRE(orders.load() == 0);
    REQUIRE(positions.load() == 1);
    REQUIRE(last_error == "rate limited");
}

TEST_CASE("BrokerClient survives malformed frames", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    std::atomic<int> market{0};
    client.on_market_data([&](const InboundEvent&) { ++market; });
    REQUIRE(client.connect());

    broker->push_raw("not json at all");
    broker->push_raw("[1, 2, 3]");
    broker->push_raw(R"({"status":"ok"})");
    broker->push_raw(R"({"type":"heartbeat"})");
    broker->push_event("market_data", {{"symbol", "MES"}});

    REQUIRE(eventually([&] { return market.load() == 1; }));
    REQUIRE(client.is_connected());
    REQUIRE(client.subscribe("MES").ok());
}

TEST_CASE("BrokerClient handler exceptions do not stop dispatch", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    std::atomic<int> calls{0};
    client.on_market_data([](const InboundEvent&) { throw std::runtime_error("bad handler"); });
    client.on_market_data([&](const InboundEvent&) { ++calls; });
    REQUIRE(client.connect());

    broker->push_event("market_data", {{"symbol", "MES"}});
    broker->push_event("market_data", {{"symbol", "MES"}});
    REQUIRE(eventually([&] { return calls.load() == 2; }));
    REQUIRE(client.is_connected());
}

TEST_CASE("BrokerClient remove handler", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    std::atomic<int> removed{0};
    std::atomic<int> kept{0};
    HandlerId id = client.on_market_data([&](const InboundEvent&) { ++removed; });
    client.on_market_data([&](const InboundEvent&) { ++kept; });
    REQUIRE(client.connect());

    REQUIRE(client.remove_handler(id));
    broker->push_event("market_data", {{"symbol", "MES"}});
    REQUIRE(eventually([&] { return kept.load() == 1; }));
    REQUIRE(removed.load() == 0);
}

TEST_CASE("BrokerClient requests from a handler are refused", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    std::promise<RequestStatus> status;
    auto result = status.get_future();
    client.on_market_data([&](const InboundEvent&) {
        status.set_value(client.query_positions().status);
    });
    REQUIRE(client.connect());

    broker->push_event("market_data", {{"symbol", "MES"}});
    REQUIRE(result.wait_for(2s) == std::future_status::ready);
    REQUIRE(result.get() == RequestStatus::INVALID_REQUEST);
    REQUIRE(broker->count_sent("get_positions") == 0);
}

TEST_CASE("BrokerClient connection loss fails every pending request", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->ignore_action("get_positions");
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    constexpr int kPending = 4;
    std::vector<std::future<RequestOutcome>> pending;
    for (int i = 0; i < kPending; ++i) {
        pending.push_back(std::async(std::launch::async, [&] { return client.query_positions(5s); }));
    }
    REQUIRE(broker->wait_for_sent("get_positions", kPending, 2s));
    REQUIRE(eventually([&] { return client.get_connection_stats().pending_request_count == static_cast<size_t>(kPending); }));

    broker->drop_connection("network down");

    for (auto& f : pending) {
        REQUIRE(f.wait_for(2s) == std::future_status::ready);
        RequestOutcome outcome = f.get();
        REQUIRE(outcome.status == RequestStatus::CONNECTION_LOST);
    }
    REQUIRE(client.wait_until_ready(2s));
}

TEST_CASE("BrokerClient restores subscriptions after reconnect", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());
    REQUIRE(client.subscribe("MES").ok());
    REQUIRE(client.subscribe("MNQ").ok());
    broker->clear_sent();

    broker->drop_connection();

    REQUIRE(broker->wait_for_sent("subscribe", 2, 2s));
    REQUIRE(client.wait_until_ready(2s));
    REQUIRE(broker->count_sent("authenticate") == 1);
    REQUIRE(broker->count_sent("subscribe") == 2);

    ConnectionStats stats = client.get_connection_stats();
    REQUIRE(stats.connected);
    REQUIRE(stats.reconnect_attempts == 0);
    REQUIRE(stats.subscriptions == std::vector<std::string>{"MES", "MNQ"});
}

TEST_CASE("BrokerClient reports FAILED through the state listener", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->fail_all_opens(true);
    BrokerClient client(make_client_options(), broker->factory());

    std::atomic<bool> failed{false};
    client.on_state_change([&](ConnectionState state, const std::string&) {
        if (state == ConnectionState::FAILED) failed = true;
    });

    REQUIRE_FALSE(client.connect());
    REQUIRE(failed.load());
    ConnectionStats stats = client.get_connection_stats();
    REQUIRE(stats.state == ConnectionState::FAILED);
    REQUIRE_FALSE(stats.connected);
    REQUIRE(stats.reconnect_attempts == 3);
    REQUIRE(broker->open_attempts() == 3);
}

TEST_CASE("BrokerClient disconnect", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());
    REQUIRE(client.subscribe("MES").ok());

    client.disconnect();
    client.disconnect();

    ConnectionStats stats = client.get_connection_stats();
    REQUIRE(stats.state == ConnectionState::DISCONNECTED);
    REQUIRE(stats.active_subscription_count == 0);
    REQUIRE(stats.pending_request_count == 0);
    REQUIRE_FALSE(broker->has_connection());
    REQUIRE(client.subscribe("MES").status == RequestStatus::NOT_CONNECTED);

    REQUIRE(client.connect());
    REQUIRE(broker->successful_opens() == 2);
}

TEST_CASE("BrokerClient never sends caller requests before authentication", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    ClientOptions options = make_client_options();
    options.reconnect.max_attempts = 50;
    BrokerClient client(options, broker->factory());
    REQUIRE(client.connect());

    Logger& logger = Logger::instance();
    const LogLevel saved = logger.level();
    logger.set_level(LogLevel::ERROR);

    std::atomic<bool> stop{false};
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&] {
            while (!stop) {
                client.query_positions(50ms);
                std::this_thread::yield();
            }
        });
    }
    for (int i = 0; i < 15; ++i) {
        std::this_thread::sleep_for(10ms);
        broker->drop_connection();
    }
    stop = true;
    for (auto& t : callers) {
        t.join();
    }
    logger.set_level(saved);

    REQUIRE(client.wait_until_ready(2s));
    REQUIRE(broker->premature_requests() == 0);
    REQUIRE(broker->count_sent("get_positions") > 0);
}

TEST_CASE("BrokerClient stats list pending request ids", "[client]") {
    auto broker = std::make_shared<MockBroker>();
    broker->ignore_action("get_account_info");
    BrokerClient client(make_client_options(), broker->factory());
    REQUIRE(client.connect());

    auto pending = std::async(std::launch::async, [&] { return client.query_account_info(2s); });
    REQUIRE(broker->wait_for_sent("get_account_info", 1, 1s));
    REQUIRE(eventually([&] { return client.get_connection_stats().pending_request_count == 1; }));

    ConnectionStats stats = client.get_connection_stats();
    const std::string id = broker->sent().back()["request_id"].get<std::string>();
    REQUIRE(stats.pending_request_ids == std::vector<std::string>{id});

    client.disconnect();
    REQUIRE(pending.get().status == RequestStatus::SHUTTING_DOWN);
    REQUIRE(client.get_connection_stats().pending_request_ids.empty());
}
