#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcplink {

// ── Request ids ─────────────────────────────────────────────────────
// Servers may echo an integer id back as 1.0 or as an unsigned value;
// every id is normalized into this closed variant before comparison.
using RequestId = std::variant<int64_t, std::string>;

std::optional<RequestId> id_from_json(const nlohmann::json& j);
nlohmann::json id_to_json(const RequestId& id);
std::string id_to_string(const RequestId& id);

// ── Frames ──────────────────────────────────────────────────────────

struct JsonRpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent
};

struct Request {
    RequestId id;
    std::string method;
    nlohmann::json params;  // null when absent
};

struct Response {
    RequestId id;
    nlohmann::json result;  // null when error is set
    std::optional<JsonRpcError> error;

    bool ok() const { return !error.has_value(); }
};

struct Notification {
    std::string method;
    nlohmann::json params;  // null when absent
};

using Message = std::variant<Request, Response, Notification>;

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Classifies one line by field presence: id+method is a request, id alone
// a response, method alone a notification. Throws DecodeError.
Message parse_message(const std::string& line);

// Single-line JSON without the trailing newline
std::string serialize(const Message& msg);

// Standard JSON-RPC error codes
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;

} // namespace mcplink
