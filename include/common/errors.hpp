#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace das_integrity {

/**
 * Base class of every error raised by the verification harness.
 */
class VerificationError : public std::runtime_error {
public:
    explicit VerificationError(const std::string& what) : std::runtime_error(what) {}
};

// Startup configuration could not be read or failed validation
class ConfigError : public VerificationError {
public:
    explicit ConfigError(const std::string& what)
        : VerificationError("ValidateConfig: " + what) {}
};

// A category's key source is unavailable or malformed
class KeysFetchError : public VerificationError {
public:
    explicit KeysFetchError(const std::string& what)
        : VerificationError("FetchKeys " + what) {}
};

/**
 * Errors of a single API call. The comparison engine treats all of them the same
 * way (the attempt is skipped), the subclasses only sharpen the log message.
 */
class ApiError : public VerificationError {
public:
    using VerificationError::VerificationError;
};

class ApiTransportError : public ApiError {
public:
    explicit ApiTransportError(const std::string& what) : ApiError("Transport " + what) {}
};

class ApiStatusError : public ApiError {
public:
    explicit ApiStatusError(uint32_t status)
        : ApiError("ResponseStatusCode: " + std::to_string(status)), status_(status) {}

    uint32_t status() const { return status_; }

private:
    uint32_t status_;
};

class ApiDecodeError : public ApiError {
public:
    explicit ApiDecodeError(const std::string& what) : ApiError("Json " + what) {}
};

// The chain RPC answered with a JSON-RPC error object
class ChainRpcError : public VerificationError {
public:
    explicit ChainRpcError(const std::string& what) : VerificationError("RPC " + what) {}
};

// A field needed for proof verification is missing from a response
class ProofExtractionError : public VerificationError {
public:
    explicit ProofExtractionError(const std::string& field)
        : VerificationError("Cannot get response field " + field), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Tree account bytes or proof inputs are structurally invalid
class ProofStructureError : public VerificationError {
public:
    explicit ProofStructureError(const std::string& what) : VerificationError(what) {}
};

} // namespace das_integrity
