#include "rpc/request_body.hpp"

namespace das_integrity {

nlohmann::json RequestBody::to_json() const {
    nlohmann::json body;
    body["jsonrpc"] = JSONRPC_VERSION;
    body["id"] = id_;
    body["method"] = method_;
    body["params"] = params_;
    return body;
}

} // namespace das_integrity
