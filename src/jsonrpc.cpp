#include "jsonrpc.hpp"
#include <cmath>
#include <limits>

namespace mcplink {

// Bounds as doubles: -2^63 is exact, 2^63 is the first value past INT64_MAX
static constexpr double kMinIdDouble = -9223372036854775808.0;
static constexpr double kMaxIdDouble = 9223372036854775808.0;

std::optional<RequestId> id_from_json(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        uint64_t u = j.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return RequestId{static_cast<int64_t>(u)};
    }
    if (j.is_number_integer()) {
        return RequestId{j.get<int64_t>()};
    }
    if (j.is_number_float()) {
        // Only integral values that fit, e.g. 12.0 echoed back for 12
        double d = j.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
        if (d < kMinIdDouble || d >= kMaxIdDouble) return std::nullopt;
        return RequestId{static_cast<int64_t>(d)};
    }
    if (j.is_string()) {
        return RequestId{j.get<std::string>()};
    }
    return std::nullopt;
}

nlohmann::json id_to_json(const RequestId& id) {
    if (auto n = std::get_if<int64_t>(&id)) return *n;
    return std::get<std::string>(id);
}

std::string id_to_string(const RequestId& id) {
    if (auto n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return "\"" + std::get<std::string>(id) + "\"";
}

static RequestId require_id(const nlohmann::json& j) {
    auto id = id_from_json(j.at("id"));
    if (!id) {
        throw DecodeError("id must be a number or string, got " + j.at("id").dump());
    }
    return *id;
}

static std::string require_method(const nlohmann::json& j) {
    const auto& m = j.at("method");
    if (!m.is_string()) {
        throw DecodeError("method must be a string");
    }
    return m.get<std::string>();
}

// Codes outside int, or not integral, cannot be reported faithfully
static int error_code_from_json(const nlohmann::json& c) {
    constexpr int64_t lo = std::numeric_limits<int>::min();
    constexpr int64_t hi = std::numeric_limits<int>::max();
    if (c.is_number_unsigned()) {
        uint64_t u = c.get<uint64_t>();
        return u <= static_cast<uint64_t>(hi) ? static_cast<int>(u) : kInternalError;
    }
    if (c.is_number_integer()) {
        int64_t v = c.get<int64_t>();
        return (v >= lo && v <= hi) ? static_cast<int>(v) : kInternalError;
    }
    if (c.is_number_float()) {
        double d = c.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(lo) && d <= static_cast<double>(hi)) {
            return static_cast<int>(d);
        }
        return kInternalError;
    }
    return 0;
}

static JsonRpcError parse_error_object(const nlohmann::json& e) {
    JsonRpcError err;
    if (e.is_object()) {
        if (e.contains("code")) err.code = error_code_from_json(e["code"]);
        err.message = e.value("message", "");
        if (e.contains("data")) err.data = e["data"];
    } else if (e.is_string()) {
        err.message = e.get<std::string>();
    } else {
        err.message = e.dump();
    }
    if (err.message.empty()) err.message = "unknown server error";
    return err;
}

Message parse_message(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("frame is not a JSON object");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_id && has_method) {
        Request req;
        req.id = require_id(j);
        req.method = require_method(j);
        if (j.contains("params")) req.params = j["params"];
        return req;
    }

    if (has_id) {
        Response resp;
        resp.id = require_id(j);
        if (j.contains("error") && !j["error"].is_null()) {
            resp.error = parse_error_object(j["error"]);
        } else if (j.contains("result")) {
            resp.result = j["result"];
        }
        return resp;
    }

    if (has_method) {
        Notification notif;
        notif.method = require_method(j);
        if (j.contains("params")) notif.params = j["params"];
        return notif;
    }

    throw DecodeError("frame has neither id nor method");
}

std::string serialize(const Message& msg) {
    nlohmann::json j = {{"jsonrpc", "2.0"}};

    if (auto req = std::get_if<Request>(&msg)) {
        j["id"] = id_to_json(req->id);
        j["method"] = req->method;
        j["params"] = req->params.is_null() ? nlohmann::json::object() : req->params;
    } else if (auto resp = std::get_if<Response>(&msg)) {
        j["id"] = id_to_json(resp->id);
        if (resp->error) {
            nlohmann::json e = {{"code", resp->error->code}, {"message", resp->error->message}};
            if (!resp->error->data.is_null()) e["data"] = resp->error->data;
            j["error"] = std::move(e);
        } else {
            j["result"] = resp->result.is_null() ? nlohmann::json::object() : resp->result;
        }
    } else {
        const auto& notif = std::get<Notification>(msg);
        j["method"] = notif.method;
        if (!notif.params.is_null() && !notif.params.empty()) {
            j["params"] = notif.params;
        }
    }

    return j.dump();
}

} // namespace mcplink
