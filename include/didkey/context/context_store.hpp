#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/json.hpp>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace didkey {

    /// Retrieves a remote document (JSON-LD context or other URL). Supplied by the caller.
    using Fetcher = std::function<dp::Result<json, dp::Error>(const std::string &url)>;

    /// Well-known contexts every store is seeded with
    const std::map<std::string, json> &defaultContexts();

    /// URL -> document cache.
    /// Seeded at construction, grows monotonically, and de-duplicates concurrent fetches of
    /// the same URL so that only one fetch is in flight per URL.
    class ContextStore {
      public:
        /// Store seeded with the default contexts
        ContextStore();

        /// Store seeded with the given documents (and the defaults when include_defaults is set)
        explicit ContextStore(const std::map<std::string, json> &seed, bool include_defaults = true);

        ContextStore(const ContextStore &) = delete;
        ContextStore &operator=(const ContextStore &) = delete;

        /// Cached document, if any
        std::optional<json> get(const std::string &url) const;

        /// Add or replace a document
        void put(const std::string &url, const json &document);

        bool contains(const std::string &url) const;

        size_t size() const;

        std::vector<std::string> urls() const;

        /// Cached document, or the fetcher's result for url (cached on success).
        /// Concurrent callers for the same missing url share one fetch.
        dp::Result<json, dp::Error> getOrFetch(const std::string &url, const Fetcher &fetcher);

        /// Number of fetches this store has started
        size_t fetchCount() const;

      private:
        using FetchResult = dp::Result<json, dp::Error>;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, json> documents_;

        mutable std::mutex inflight_mutex_;
        std::unordered_map<std::string, std::shared_future<FetchResult>> inflight_;
        size_t fetch_count_ = 0;
    };

} // namespace didkey
