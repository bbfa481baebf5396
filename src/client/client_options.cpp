#include "client/client_options.hpp"

#include <cstdlib>
#include <stdexcept>

namespace ironlink {

namespace {

void override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        target = value;
    }
}

} // namespace

ClientOptions ClientOptions::from_config(Config& config) {
    ClientOptions options;
    options.url = config.get("broker", "url", options.url);
    options.api_key = config.get("broker", "api_key", options.api_key);
    options.api_secret = config.get("broker", "api_secret", options.api_secret);
    options.request_timeout = config.get_duration("broker", "request_timeout_ms", options.request_timeout);
    options.subscribe_timeout = config.get_duration("broker", "subscribe_timeout_ms", options.subscribe_timeout);
    options.auth_timeout = config.get_duration("broker", "auth_timeout_ms", options.auth_timeout);
    options.connect_timeout = config.get_duration("broker", "connect_timeout_ms", options.connect_timeout);
    options.require_auth_ack = config.get_bool("broker", "require_auth_ack", options.require_auth_ack);

    options.reconnect.max_attempts = config.get_int("reconnect", "max_attempts", options.reconnect.max_attempts);
    options.reconnect.base_delay = config.get_duration("reconnect", "base_delay_ms", options.reconnect.base_delay);
    options.reconnect.max_delay = config.get_duration("reconnect", "max_delay_ms", options.reconnect.max_delay);

    options.apply_environment();
    return options;
}

void ClientOptions::apply_environment() {
    override_from_env("BASE_URL", url);
    override_from_env("API_KEY", api_key);
    override_from_env("API_SECRET", api_secret);
}

SessionOptions ClientOptions::to_session_options() const {
    if (request_timeout.count() <= 0 || subscribe_timeout.count() <= 0 ||
        auth_timeout.count() <= 0 || connect_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }

    SessionOptions session;
    session.endpoint = parse_endpoint(url);
    session.api_key = api_key;
    session.api_secret = api_secret;
    session.auth_timeout = auth_timeout;
    session.subscribe_timeout = subscribe_timeout;
    session.require_auth_ack = require_auth_ack;
    session.reconnect = reconnect;
    return session;
}

bool OrderSpec::validate(std::string& error) const {
    if (symbol.empty()) {
        error = "symbol is required";
        return false;
    }
    if (quantity <= 0) {
        error = "quantity must be positive";
        return false;
    }
    const bool needs_price = type == OrderType::LIMIT || type == OrderType::STOP_LIMIT;
    const bool needs_stop = type == OrderType::STOP || type == OrderType::STOP_LIMIT;
    if (needs_price && !price) {
        error = std::string("price is required for ") + to_string(type) + " orders";
        return false;
    }
    if (needs_stop && !stop_price) {
        error = std::string("stop_price is required for ") + to_string(type) + " orders";
        return false;
    }
    if ((price && *price <= 0.0) || (stop_price && *stop_price <= 0.0)) {
        error = "prices must be positive";
        return false;
    }
    return true;
}

} // namespace ironlink
