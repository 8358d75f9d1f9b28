#include <didkey/common/config.hpp>
#include <didkey/common/error.hpp>
#include <didkey/context/document_loader.hpp>
#include <didkey/identity/did_key.hpp>

#include <iostream>

namespace didkey {

    DocumentLoader::DocumentLoader(std::shared_ptr<ContextStore> store, Fetcher fetcher, bool log_fetches)
        : store_(store ? std::move(store) : std::make_shared<ContextStore>()), fetcher_(std::move(fetcher)),
          log_fetches_(log_fetches) {}

    dp::Result<json, dp::Error> DocumentLoader::load(const std::string &url) const {
        if (auto cached = store_->get(url))
            return dp::Result<json, dp::Error>::ok(*cached);

        if (url.compare(0, std::string(DID_KEY_PREFIX).size(), DID_KEY_PREFIX) == 0)
            return resolveDidDocument(url);

        bool fetched_now = false;
        auto counting_fetcher = [&](const std::string &u) -> dp::Result<json, dp::Error> {
            fetched_now = true;
            return fetcher_(u);
        };

        auto result = store_->getOrFetch(url, fetcher_ ? Fetcher(counting_fetcher) : Fetcher());
        if (result.is_err()) {
            if (log_fetches_)
                std::cout << "Failed to resolve document: " << url << std::endl;
            if (result.error().code != ERR_DOCUMENT_RESOLUTION_FAILURE) {
                return dp::Result<json, dp::Error>::err(make_error(
                    ERR_DOCUMENT_RESOLUTION_FAILURE,
                    "Cannot resolve document for: " + url + ". Error: " + errorMessage(result.error())));
            }
            return result;
        }

        if (fetched_now && log_fetches_)
            std::cout << "Cached document: " << url << std::endl;
        return result;
    }

    dp::Result<json, dp::Error> DocumentLoader::resolveDidDocument(const std::string &did_url) const {
        auto parsed = parseDid(did_url);
        if (parsed.is_err())
            return dp::Result<json, dp::Error>::err(parsed.error());

        auto decoded = decodePublicKey(parsed.value().publicKeyMultibase);
        if (decoded.is_err()) {
            return dp::Result<json, dp::Error>::err(
                make_error(ERR_DOCUMENT_RESOLUTION_FAILURE,
                           "Cannot resolve DID document for: " + did_url + ". Error: " + errorMessage(decoded.error())));
        }

        const std::string &authority = parsed.value().authority;
        json document;
        document["@context"] = json::array({DID_V1_CONTEXT, MULTIKEY_V1_CONTEXT});
        document["id"] = authority;
        document["type"] = "Multikey";
        document["controller"] = authority;
        document["publicKeyMultibase"] = parsed.value().publicKeyMultibase;
        document["assertionMethod"] = json::array({authority});
        document["authentication"] = json::array({authority});
        return dp::Result<json, dp::Error>::ok(document);
    }

    dp::Result<void, dp::Error> DocumentLoader::resolveContexts(const json &document) const {
        if (!document.is_object() || !document.contains("@context")) {
            return dp::Result<void, dp::Error>::err(invalid_document("Document has no @context"));
        }

        for (const auto &url : contextUrls(document)) {
            auto loaded = load(url);
            if (loaded.is_err())
                return dp::Result<void, dp::Error>::err(loaded.error());
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace didkey
