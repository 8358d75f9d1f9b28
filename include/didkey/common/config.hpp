#pragma once

#include <cstddef>
#include <string>

namespace didkey {

    constexpr const char *CREDENTIALS_V1_CONTEXT = "https://www.w3.org/2018/credentials/v1";
    constexpr const char *CREDENTIALS_V2_CONTEXT = "https://www.w3.org/ns/credentials/v2";
    constexpr const char *DID_V1_CONTEXT = "https://www.w3.org/ns/did/v1";
    constexpr const char *DATA_INTEGRITY_V2_CONTEXT = "https://w3id.org/security/data-integrity/v2";
    constexpr const char *MULTIKEY_V1_CONTEXT = "https://w3id.org/security/multikey/v1";

    /// Library-wide settings, passed by value at construction
    struct Config {
        // Presentations
        std::size_t challenge_length = 32;                         // Generated challenge length
        std::string presentation_context = CREDENTIALS_V2_CONTEXT; // Context of wrapped presentations

        // Issuance
        bool stamp_issuance_date = true; // Add issuanceDate to credentials-v1 documents lacking one

        // Every @context URL must resolve through the loader before signing or verifying
        bool resolve_contexts = true;

        // Print a line for each fetched-and-cached document
        bool log_fetches = true;
    };

} // namespace didkey
