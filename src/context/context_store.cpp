#include <didkey/common/error.hpp>
#include <didkey/context/context_store.hpp>

namespace didkey {

    ContextStore::ContextStore() : ContextStore(std::map<std::string, json>{}, true) {}

    ContextStore::ContextStore(const std::map<std::string, json> &seed, bool include_defaults) {
        if (include_defaults) {
            for (const auto &[url, document] : defaultContexts())
                documents_[url] = document;
        }
        for (const auto &[url, document] : seed)
            documents_[url] = document;
    }

    std::optional<json> ContextStore::get(const std::string &url) const {
        std::shared_lock lock(mutex_);
        auto it = documents_.find(url);
        if (it == documents_.end())
            return std::nullopt;
        return it->second;
    }

    void ContextStore::put(const std::string &url, const json &document) {
        std::unique_lock lock(mutex_);
        documents_[url] = document;
    }

    bool ContextStore::contains(const std::string &url) const {
        std::shared_lock lock(mutex_);
        return documents_.find(url) != documents_.end();
    }

    size_t ContextStore::size() const {
        std::shared_lock lock(mutex_);
        return documents_.size();
    }

    std::vector<std::string> ContextStore::urls() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(documents_.size());
        for (const auto &entry : documents_)
            result.push_back(entry.first);
        return result;
    }

    size_t ContextStore::fetchCount() const {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        return fetch_count_;
    }

    dp::Result<json, dp::Error> ContextStore::getOrFetch(const std::string &url, const Fetcher &fetcher) {
        if (auto cached = get(url))
            return FetchResult::ok(*cached);

        std::promise<FetchResult> promise;
        {
            std::unique_lock<std::mutex> lock(inflight_mutex_);

            // A fetch may have completed between the cache check and taking the lock
            if (auto cached = get(url))
                return FetchResult::ok(*cached);

            auto it = inflight_.find(url);
            if (it != inflight_.end()) {
                auto pending = it->second;
                lock.unlock();
                return pending.get();
            }

            inflight_[url] = promise.get_future().share();
            ++fetch_count_;
        }

        auto fetch = [&]() -> FetchResult {
            if (!fetcher) {
                return FetchResult::err(make_error(ERR_DOCUMENT_RESOLUTION_FAILURE,
                                                   "Document loader unable to load URL \"" + url + "\""));
            }
            try {
                return fetcher(url);
            } catch (const std::exception &e) {
                return FetchResult::err(make_error(ERR_DOCUMENT_RESOLUTION_FAILURE,
                                                   "Cannot resolve document for: " + url + ". Error: " + e.what()));
            }
        };
        FetchResult result = fetch();

        if (result.is_ok())
            put(url, result.value());

        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            inflight_.erase(url);
        }
        promise.set_value(result);
        return result;
    }

} // namespace didkey
