#pragma once

#include <datapod/datapod.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace didkey {

    using json = nlohmann::json;

    /// Deterministic serialization: object members sorted by key, no whitespace.
    /// Used as the canonical form for every hashed document.
    std::string canonicalize(const json &document);

    /// RFC 6901 token escaping ('~' -> "~0", '/' -> "~1")
    std::string escapePointerToken(const std::string &token);
    std::string unescapePointerToken(const std::string &token);

    /// Split a JSON pointer into unescaped reference tokens. "" is the whole document.
    dp::Result<std::vector<std::string>, dp::Error> splitPointer(const std::string &pointer);

    /// Join unescaped tokens into a JSON pointer
    std::string joinPointer(const std::vector<std::string> &tokens);

    /// Current UTC time as an ISO-8601 string with second precision (2024-01-01T00:00:00Z)
    std::string currentTimestamp();

    /// The "@context" entries of a document that are URLs (inline context objects are skipped)
    std::vector<std::string> contextUrls(const json &document);

    /// Whether the document lists the given context URL
    bool hasContext(const json &document, const std::string &url);

    /// Read a string-or-object identifier ("issuer": "did:..." or "issuer": {"id": "did:..."})
    std::string identifierOf(const json &value);

} // namespace didkey
