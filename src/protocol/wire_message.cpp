/**
 * @file wire_message.cpp
 * @brief WireMessage 与 MessageCodec 实现
 */

#include "protocol/wire_message.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ironlink {

namespace {

const nlohmann::json& empty_object() {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    return kEmpty;
}

} // namespace

WireMessage::WireMessage() : body_(nlohmann::json::object()) {}

WireMessage::WireMessage(nlohmann::json body) : body_(std::move(body)) {
    if (!body_.is_object()) {
        throw std::invalid_argument("WireMessage body must be a JSON object");
    }
}

void WireMessage::set(const std::string& field, const std::string& value) { body_[field] = value; }

void WireMessage::set(const std::string& field, const char* value) { body_[field] = std::string(value); }

void WireMessage::set(const std::string& field, int value) { body_[field] = value; }

void WireMessage::set(const std::string& field, int64_t value) { body_[field] = value; }

void WireMessage::set(const std::string& field, double value) { body_[field] = value; }

void WireMessage::set(const std::string& field, bool value) { body_[field] = value; }

void WireMessage::set_json(const std::string& field, nlohmann::json value) { body_[field] = std::move(value); }

std::string WireMessage::get_string(const std::string& field) const {
    const nlohmann::json& value = get_json(field);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string WireMessage::get_string(const std::string& field, const std::string& default_value) const {
    if (!has(field)) {
        return default_value;
    }
    return get_string(field);
}

int64_t WireMessage::get_int(const std::string& field) const {
    const nlohmann::json& value = get_json(field);
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            // 落到下面统一抛出
        }
    }
    throw std::runtime_error("Field is not an integer: " + field);
}

double WireMessage::get_double(const std::string& field) const {
    const nlohmann::json& value = get_json(field);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        } catch (const std::exception&) {
            // 落到下面统一抛出
        }
    }
    throw std::runtime_error("Field is not a number: " + field);
}

const nlohmann::json& WireMessage::get_json(const std::string& field) const {
    auto it = body_.find(field);
    if (it == body_.end() || it->is_null()) {
        throw std::runtime_error("Field not found: " + field);
    }
    return *it;
}

bool WireMessage::has(const std::string& field) const {
    auto it = body_.find(field);
    return it != body_.end() && !it->is_null();
}

void WireMessage::erase(const std::string& field) { body_.erase(field); }

const nlohmann::json& WireMessage::data() const {
    auto it = body_.find(fields::Data);
    if (it == body_.end() || it->is_null()) {
        return empty_object();
    }
    return *it;
}

bool WireMessage::is_rejection() const {
    if (get_string(fields::Type, "") == types::Error) {
        return true;
    }
    const std::string status = get_string(fields::Status, "");
    return status == "error" || status == "rejected";
}

std::string WireMessage::reason() const {
    if (has(fields::Message)) {
        return get_string(fields::Message);
    }
    const nlohmann::json& payload = data();
    if (payload.is_object()) {
        auto it = payload.find(fields::Message);
        if (it != payload.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

// ============================================================================
// MessageCodec
// ============================================================================

std::string MessageCodec::encode(WireMessage& msg) const {
    if (!msg.has(fields::Timestamp)) {
        msg.set(fields::Timestamp, utc_timestamp());
    }
    return msg.body_.dump();
}

WireMessage MessageCodec::decode(const std::string& raw) const {
    if (raw.size() > max_frame_size_) {
        throw DecodeError("Frame too large: " + std::to_string(raw.size()) + " bytes");
    }

    nlohmann::json body = nlohmann::json::parse(raw, nullptr, false);
    if (body.is_discarded()) {
        throw DecodeError("Malformed JSON frame");
    }
    if (!body.is_object()) {
        throw DecodeError("Frame is not a JSON object");
    }

    auto type_it = body.find(fields::Type);
    auto id_it = body.find(fields::RequestId);
    const bool has_type = type_it != body.end() && type_it->is_string();
    const bool has_id = id_it != body.end() && !id_it->is_null();
    if (!has_type && !has_id) {
        throw DecodeError("Frame carries neither type nor request_id");
    }
    if (has_id && !id_it->is_string()) {
        // 关联表以字符串为键，数值型 ID 统一转换
        *id_it = id_it->dump();
    }

    return WireMessage(std::move(body));
}

std::string MessageCodec::utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

} // namespace ironlink
