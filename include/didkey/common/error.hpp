#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace didkey {

    // ===========================================
    // didkey-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_UNSUPPORTED_KEY_TYPE = 100;
    constexpr dp::u32 ERR_UNSUPPORTED_CRYPTOSUITE = 101;
    constexpr dp::u32 ERR_MISMATCHED_KEY = 102;
    constexpr dp::u32 ERR_MALFORMED_DID = 103;
    constexpr dp::u32 ERR_SELECTIVE_DISCLOSURE_REQUIRED = 104;
    constexpr dp::u32 ERR_SELECTIVE_DISCLOSURE_UNSUPPORTED = 105;
    constexpr dp::u32 ERR_DOCUMENT_RESOLUTION_FAILURE = 106;
    constexpr dp::u32 ERR_SIGNING_FAILED = 107;
    constexpr dp::u32 ERR_INVALID_DOCUMENT = 108;
    constexpr dp::u32 ERR_INVALID_POINTER = 109;
    constexpr dp::u32 ERR_KEY_GENERATION_FAILED = 110;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error unsupported_key_type(const dp::String &msg = "Unsupported key type") {
        return dp::Error{ERR_UNSUPPORTED_KEY_TYPE, msg};
    }

    inline dp::Error unsupported_cryptosuite(const dp::String &msg = "Unsupported cryptosuite") {
        return dp::Error{ERR_UNSUPPORTED_CRYPTOSUITE, msg};
    }

    inline dp::Error mismatched_key(const dp::String &msg = "Mismatched DID") {
        return dp::Error{ERR_MISMATCHED_KEY, msg};
    }

    inline dp::Error malformed_did(const dp::String &msg = "Malformed DID") {
        return dp::Error{ERR_MALFORMED_DID, msg};
    }

    inline dp::Error selective_disclosure_required(
        const dp::String &msg = "Key type requires selective disclosure (mandatory pointers)") {
        return dp::Error{ERR_SELECTIVE_DISCLOSURE_REQUIRED, msg};
    }

    inline dp::Error selective_disclosure_unsupported(
        const dp::String &msg = "Key type does not support selective disclosure") {
        return dp::Error{ERR_SELECTIVE_DISCLOSURE_UNSUPPORTED, msg};
    }

    inline dp::Error document_resolution_failure(const dp::String &msg = "Document could not be resolved") {
        return dp::Error{ERR_DOCUMENT_RESOLUTION_FAILURE, msg};
    }

    inline dp::Error signing_failed(const dp::String &msg = "Signing operation failed") {
        return dp::Error{ERR_SIGNING_FAILED, msg};
    }

    inline dp::Error invalid_document(const dp::String &msg = "Invalid document") {
        return dp::Error{ERR_INVALID_DOCUMENT, msg};
    }

    inline dp::Error invalid_pointer(const dp::String &msg = "Invalid JSON pointer") {
        return dp::Error{ERR_INVALID_POINTER, msg};
    }

    inline dp::Error key_generation_failed(const dp::String &msg = "Key generation failed") {
        return dp::Error{ERR_KEY_GENERATION_FAILED, msg};
    }

    /// Build an error from a std::string message
    inline dp::Error make_error(dp::u32 code, const std::string &msg) {
        return dp::Error{code, dp::String(msg.c_str())};
    }

    /// Check whether an error carries the given code
    inline bool isError(const dp::Error &error, dp::u32 code) { return error.code == code; }

    /// Error message as std::string
    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

} // namespace didkey
