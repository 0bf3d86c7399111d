#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace didwebvh {

    // ===========================================
    // didwebvh-specific error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_CHAIN_INTEGRITY = 200;
    constexpr dp::u32 ERR_PARAMETERS = 201;
    constexpr dp::u32 ERR_SIGNATURE = 202;
    constexpr dp::u32 ERR_WITNESS_THRESHOLD = 203;
    constexpr dp::u32 ERR_TRANSPORT = 204;
    constexpr dp::u32 ERR_TIMEOUT = 205;
    constexpr dp::u32 ERR_VALIDATION = 206;
    constexpr dp::u32 ERR_LOG_ENTRY = 207;
    constexpr dp::u32 ERR_WITNESS_PROOF = 208;
    constexpr dp::u32 ERR_INVALID_METHOD_IDENTIFIER = 209;
    constexpr dp::u32 ERR_UNSUPPORTED_METHOD = 210;
    constexpr dp::u32 ERR_SCID = 211;
    constexpr dp::u32 ERR_STATUS_TRANSITION = 212;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 213;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 214;
    constexpr dp::u32 ERR_DEACTIVATED = 215;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error chain_integrity_error(const std::string &msg = "LogEntry chain integrity failure") {
        return dp::Error{ERR_CHAIN_INTEGRITY, dp::String(msg.c_str())};
    }

    inline dp::Error parameters_error(const std::string &msg = "Invalid parameters") {
        return dp::Error{ERR_PARAMETERS, dp::String(msg.c_str())};
    }

    inline dp::Error signature_error(const std::string &msg = "Signature verification failed") {
        return dp::Error{ERR_SIGNATURE, dp::String(msg.c_str())};
    }

    inline dp::Error witness_threshold_error(const std::string &msg = "Witness threshold not met") {
        return dp::Error{ERR_WITNESS_THRESHOLD, dp::String(msg.c_str())};
    }

    inline dp::Error transport_error(const std::string &msg = "Transport failure") {
        return dp::Error{ERR_TRANSPORT, dp::String(msg.c_str())};
    }

    inline dp::Error timeout_error(const std::string &msg = "Operation timed out") {
        return dp::Error{ERR_TIMEOUT, dp::String(msg.c_str())};
    }

    inline dp::Error validation_error(const std::string &msg = "Validation failed") {
        return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())};
    }

    inline dp::Error log_entry_error(const std::string &msg = "Invalid LogEntry") {
        return dp::Error{ERR_LOG_ENTRY, dp::String(msg.c_str())};
    }

    inline dp::Error witness_proof_error(const std::string &msg = "Invalid witness proof") {
        return dp::Error{ERR_WITNESS_PROOF, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_method_identifier(const std::string &msg = "Invalid method identifier") {
        return dp::Error{ERR_INVALID_METHOD_IDENTIFIER, dp::String(msg.c_str())};
    }

    inline dp::Error unsupported_method(const std::string &msg = "Unsupported DID method") {
        return dp::Error{ERR_UNSUPPORTED_METHOD, dp::String(msg.c_str())};
    }

    inline dp::Error scid_error(const std::string &msg = "SCID mismatch") {
        return dp::Error{ERR_SCID, dp::String(msg.c_str())};
    }

    inline dp::Error status_transition_error(const std::string &msg = "Illegal validation status transition") {
        return dp::Error{ERR_STATUS_TRANSITION, dp::String(msg.c_str())};
    }

    inline dp::Error serialization_failed(const std::string &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error deserialization_failed(const std::string &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error deactivated_error(const std::string &msg = "DID has been deactivated") {
        return dp::Error{ERR_DEACTIVATED, dp::String(msg.c_str())};
    }

    /// Render an error for log output
    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

    inline dp::u32 errorCode(const dp::Error &error) { return error.code; }

} // namespace didwebvh
