#include <didkey/common/config.hpp>
#include <didkey/common/error.hpp>
#include <didkey/context/context_store.hpp>
#include <didkey/context/document_loader.hpp>
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace didkey;

namespace {
    const std::string CUSTOM_CONTEXT = "https://instun.com/custom-context";
    const std::string ED25519_DID = "did:key:z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK";

    json customContext() {
        return json::parse(R"({
            "@context": {
                "@version": 1.1,
                "@protected": true,
                "id": "@id",
                "type": "@type",
                "dog_name": {"@id": "https://instun.com/vocab#dog_name", "@type": "@json"},
                "cat_name": "https://instun.com/vocab#cat_name"
            }
        })");
    }
} // namespace

TEST_SUITE("Context Store Tests") {

    TEST_CASE("Store is seeded with the default contexts") {
        ContextStore store;
        CHECK(store.size() == defaultContexts().size());
        CHECK(store.contains(CREDENTIALS_V1_CONTEXT));
        CHECK(store.contains(CREDENTIALS_V2_CONTEXT));
        CHECK(store.contains(DID_V1_CONTEXT));
        CHECK(store.contains(DATA_INTEGRITY_V2_CONTEXT));
        CHECK(store.contains(MULTIKEY_V1_CONTEXT));

        auto v1 = store.get(CREDENTIALS_V1_CONTEXT);
        REQUIRE(v1.has_value());
        CHECK(v1->contains("@context"));
    }

    TEST_CASE("Store without defaults") {
        std::map<std::string, json> seed;
        seed[CUSTOM_CONTEXT] = customContext();
        ContextStore store(seed, false);
        CHECK(store.size() == 1);
        CHECK_FALSE(store.contains(CREDENTIALS_V1_CONTEXT));
    }

    TEST_CASE("Register a custom context") {
        ContextStore store;
        CHECK_FALSE(store.get(CUSTOM_CONTEXT).has_value());

        store.put(CUSTOM_CONTEXT, customContext());
        auto document = store.get(CUSTOM_CONTEXT);
        REQUIRE(document.has_value());
        CHECK((*document)["@context"]["cat_name"] == "https://instun.com/vocab#cat_name");
    }

    TEST_CASE("Fetched documents are cached") {
        ContextStore store;
        int calls = 0;
        Fetcher fetcher = [&](const std::string &) {
            ++calls;
            return dp::Result<json, dp::Error>::ok(customContext());
        };

        REQUIRE(store.getOrFetch(CUSTOM_CONTEXT, fetcher).is_ok());
        REQUIRE(store.getOrFetch(CUSTOM_CONTEXT, fetcher).is_ok());
        CHECK(calls == 1);
        CHECK(store.fetchCount() == 1);
        CHECK(store.contains(CUSTOM_CONTEXT));
    }

    TEST_CASE("Failed fetches are not cached") {
        ContextStore store;
        int calls = 0;
        Fetcher failing = [&](const std::string &) {
            ++calls;
            return dp::Result<json, dp::Error>::err(document_resolution_failure("offline"));
        };

        CHECK(store.getOrFetch(CUSTOM_CONTEXT, failing).is_err());
        CHECK(store.getOrFetch(CUSTOM_CONTEXT, failing).is_err());
        CHECK(calls == 2);
        CHECK_FALSE(store.contains(CUSTOM_CONTEXT));
    }

    TEST_CASE("Throwing fetcher becomes a resolution failure") {
        ContextStore store;
        Fetcher throwing = [](const std::string &) -> dp::Result<json, dp::Error> {
            throw std::runtime_error("connection reset");
        };

        auto result = store.getOrFetch(CUSTOM_CONTEXT, throwing);
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_DOCUMENT_RESOLUTION_FAILURE));
    }

    TEST_CASE("Missing fetcher fails for unknown URLs") {
        ContextStore store;
        auto result = store.getOrFetch(CUSTOM_CONTEXT, nullptr);
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_DOCUMENT_RESOLUTION_FAILURE));

        // Seeded URLs never need one
        CHECK(store.getOrFetch(CREDENTIALS_V2_CONTEXT, nullptr).is_ok());
    }

    TEST_CASE("Concurrent requests share one fetch") {
        ContextStore store;
        std::atomic<int> calls{0};
        Fetcher slow = [&](const std::string &) {
            ++calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return dp::Result<json, dp::Error>::ok(customContext());
        };

        std::atomic<int> successes{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                if (store.getOrFetch(CUSTOM_CONTEXT, slow).is_ok())
                    ++successes;
            });
        }
        for (auto &t : threads)
            t.join();

        CHECK(successes.load() == 8);
        CHECK(calls.load() == 1);
        CHECK(store.fetchCount() == 1);
    }
}

TEST_SUITE("Document Loader Tests") {

    TEST_CASE("Load seeded context without a fetcher") {
        DocumentLoader loader(std::make_shared<ContextStore>(), nullptr, false);
        CHECK(loader.load(CREDENTIALS_V1_CONTEXT).is_ok());

        auto missing = loader.load(CUSTOM_CONTEXT);
        REQUIRE(missing.is_err());
        CHECK(isError(missing.error(), ERR_DOCUMENT_RESOLUTION_FAILURE));
    }

    TEST_CASE("Loader fetches through the store") {
        auto store = std::make_shared<ContextStore>();
        DocumentLoader loader(store, [](const std::string &) { return dp::Result<json, dp::Error>::ok(customContext()); },
                              false);

        CHECK(loader.load(CUSTOM_CONTEXT).is_ok());
        CHECK(store->contains(CUSTOM_CONTEXT));
    }

    TEST_CASE("DID document synthesis") {
        DocumentLoader loader(std::make_shared<ContextStore>(), nullptr, false);
        auto document = loader.load(ED25519_DID + "#z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK");
        REQUIRE(document.is_ok());

        const json &doc = document.value();
        CHECK(doc["id"] == ED25519_DID);
        CHECK(doc["type"] == "Multikey");
        CHECK(doc["controller"] == ED25519_DID);
        CHECK(doc["publicKeyMultibase"] == "z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK");
        CHECK(doc["assertionMethod"] == json::array({ED25519_DID}));
        CHECK(doc["authentication"] == json::array({ED25519_DID}));
    }

    TEST_CASE("Bad did:key fails to resolve") {
        DocumentLoader loader(std::make_shared<ContextStore>(), nullptr, false);
        CHECK(loader.load("did:key:").is_err());
        CHECK(loader.load("did:key:zQ3shokFTS3brHcDQrn82RUDfCZESWL1ZdCEJwekUDPQiYBme").is_err());
    }

    TEST_CASE("Resolve every context of a document") {
        auto store = std::make_shared<ContextStore>();
        DocumentLoader loader(store, nullptr, false);

        json credential = json::parse(R"({"@context": ["https://www.w3.org/2018/credentials/v1", "https://instun.com/custom-context"]})");
        CHECK(loader.resolveContexts(credential).is_err());

        store->put(CUSTOM_CONTEXT, customContext());
        CHECK(loader.resolveContexts(credential).is_ok());

        auto no_context = loader.resolveContexts(json::object());
        REQUIRE(no_context.is_err());
        CHECK(isError(no_context.error(), ERR_INVALID_DOCUMENT));
    }
}
