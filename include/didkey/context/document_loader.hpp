#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/json.hpp>
#include <didkey/context/context_store.hpp>
#include <memory>
#include <string>

namespace didkey {

    /// Resolves URLs to documents.
    /// did:key URLs yield a synthesized DID document; other URLs are served from the
    /// ContextStore, falling back to the fetcher (results are cached by URL).
    class DocumentLoader {
      public:
        explicit DocumentLoader(std::shared_ptr<ContextStore> store, Fetcher fetcher = nullptr,
                                bool log_fetches = true);

        /// Load any URL. Failures are ERR_DOCUMENT_RESOLUTION_FAILURE (or ERR_MALFORMED_DID for a bad did:key).
        dp::Result<json, dp::Error> load(const std::string &url) const;

        /// Synthesize the DID document of a did:key URL (fragment ignored)
        dp::Result<json, dp::Error> resolveDidDocument(const std::string &did_url) const;

        /// Load every "@context" URL of a document
        dp::Result<void, dp::Error> resolveContexts(const json &document) const;

        inline const std::shared_ptr<ContextStore> &store() const { return store_; }

      private:
        std::shared_ptr<ContextStore> store_;
        Fetcher fetcher_;
        bool log_fetches_;
    };

} // namespace didkey
