#pragma once

/**
 * JSON-RPC 2.0 request body
 *
 * Wire format:
 *   {"jsonrpc": "2.0", "id": <id>, "method": <method>, "params": <params>}
 *
 * Bodies are immutable once built: one body per request, serialized afresh for
 * every attempt.
 */

#include <cstdint>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace das_integrity {

constexpr const char* JSONRPC_VERSION = "2.0";

class RequestBody {
public:
    RequestBody(std::string method, nlohmann::json params, uint64_t id = 0)
        : id_(id), method_(std::move(method)), params_(std::move(params)) {}

    uint64_t id() const { return id_; }
    const std::string& method() const { return method_; }
    const nlohmann::json& params() const { return params_; }

    nlohmann::json to_json() const;

    // Compact serialization, the bytes that go on the wire
    std::string to_string() const { return to_json().dump(); }

    // Multi-line form for diff logs
    std::string to_pretty_string() const { return to_json().dump(2); }

private:
    const uint64_t id_;
    const std::string method_;
    const nlohmann::json params_;
};

} // namespace das_integrity
