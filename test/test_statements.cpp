#include <didkey/common/error.hpp>
#include <didkey/suite/statements.hpp>
#include <doctest/doctest.h>

#include <algorithm>

using namespace didkey;

namespace {
    json sampleCredential() {
        return json::parse(R"({
            "@context": ["https://www.w3.org/2018/credentials/v1", "https://instun.com/custom-context"],
            "type": ["VerifiableCredential"],
            "issuer": "did:key:zDnExample",
            "issuanceDate": "2024-01-01T00:00:00Z",
            "credentialSubject": {
                "dog_name": {"name1": "Fido", "breed": "Labrador", "age": 3},
                "cat_name": "tom"
            },
            "proof": {"type": "DataIntegrityProof"}
        })");
    }

    std::vector<std::string> pointersOf(const std::vector<Statement> &statements) {
        std::vector<std::string> pointers;
        for (const auto &statement : statements)
            pointers.push_back(statement.pointer);
        return pointers;
    }

    bool contains(const std::vector<std::string> &pointers, const std::string &pointer) {
        return std::find(pointers.begin(), pointers.end(), pointer) != pointers.end();
    }
} // namespace

TEST_SUITE("Statement Tests") {

    TEST_CASE("Leaves in pointer order without the proof") {
        auto pointers = pointersOf(toStatements(sampleCredential()));
        CHECK(std::is_sorted(pointers.begin(), pointers.end()));
        CHECK(pointers.size() == 8);
        CHECK(contains(pointers, "/@context"));
        CHECK(contains(pointers, "/credentialSubject/dog_name/breed"));
        CHECK(contains(pointers, "/credentialSubject/cat_name"));
        CHECK_FALSE(contains(pointers, "/proof"));
        CHECK_FALSE(contains(pointers, "/proof/type"));
    }

    TEST_CASE("Arrays are atomic") {
        auto statements = toStatements(sampleCredential());
        auto it = std::find_if(statements.begin(), statements.end(),
                               [](const Statement &s) { return s.pointer == "/@context"; });
        REQUIRE(it != statements.end());
        CHECK(it->value.is_array());
        CHECK(it->value.size() == 2);
    }

    TEST_CASE("Nested proof members are ordinary statements") {
        json doc = json::parse(R"({"@context": "x", "evidence": {"proof": "kept"}})");
        auto pointers = pointersOf(toStatements(doc));
        CHECK(contains(pointers, "/evidence/proof"));
    }

    TEST_CASE("Statement text is pointer and canonical value") {
        json doc = json::parse(R"({"a": {"b": {"y": 1, "x": [2]}}})");
        auto statements = toStatements(doc);
        REQUIRE(statements.size() == 2);
        CHECK(statements[0].text() == "/a/b/x=[2]");
        CHECK(statements[1].text() == "/a/b/y=1");
    }

    TEST_CASE("Keys with slashes are escaped") {
        json doc = json::parse(R"({"a/b": "v"})");
        auto statements = toStatements(doc);
        REQUIRE(statements.size() == 1);
        CHECK(statements[0].pointer == "/a~1b");
        REQUIRE(statements[0].path.size() == 1);
        CHECK(statements[0].path[0] == "a/b");
    }

    TEST_CASE("Pointer coverage") {
        Statement leaf{"/credentialSubject/dog_name/age", {"credentialSubject", "dog_name", "age"}, 3};
        CHECK(covers({"credentialSubject"}, leaf));
        CHECK(covers({"credentialSubject", "dog_name"}, leaf));
        CHECK(covers({"credentialSubject", "dog_name", "age"}, leaf));
        CHECK_FALSE(covers({"credentialSubject", "cat_name"}, leaf));

        // A pointer into an atomic array covers the array statement
        Statement context{"/@context", {"@context"}, json::array({"a", "b"})};
        CHECK(covers({"@context", "0"}, context));
    }
}

TEST_SUITE("Pointer Validation Tests") {

    TEST_CASE("Existing pointers are valid") {
        auto valid = validatePointers(sampleCredential(), {"/issuer", "/credentialSubject/dog_name", "/@context/1", ""});
        CHECK(valid.is_ok());
    }

    TEST_CASE("Missing value is rejected") {
        auto result = validatePointers(sampleCredential(), {"/credentialSubject/horse_name"});
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_INVALID_POINTER));
    }

    TEST_CASE("Out of range index is rejected") {
        CHECK(validatePointers(sampleCredential(), {"/@context/2"}).is_err());
        CHECK(validatePointers(sampleCredential(), {"/@context/01"}).is_err());
    }

    TEST_CASE("Malformed pointer is rejected") {
        auto result = validatePointers(sampleCredential(), {"issuer"});
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_INVALID_POINTER));
    }
}

TEST_SUITE("Statement Partition Tests") {

    TEST_CASE("Context is always mandatory") {
        auto partition = partitionStatements(toStatements(sampleCredential()), {});
        REQUIRE(partition.is_ok());
        auto mandatory = pointersOf(partition.value().mandatory);
        REQUIRE(mandatory.size() == 1);
        CHECK(mandatory[0] == "/@context");
        CHECK(partition.value().non_mandatory.size() == 7);
    }

    TEST_CASE("Mandatory pointers select their statements") {
        auto partition = partitionStatements(toStatements(sampleCredential()), {"/issuanceDate", "/issuer"});
        REQUIRE(partition.is_ok());
        auto mandatory = pointersOf(partition.value().mandatory);
        CHECK(mandatory == std::vector<std::string>{"/@context", "/issuanceDate", "/issuer"});

        auto rest = pointersOf(partition.value().non_mandatory);
        CHECK(contains(rest, "/credentialSubject/cat_name"));
        CHECK(contains(rest, "/type"));
    }

    TEST_CASE("Object pointer makes every leaf below it mandatory") {
        auto partition = partitionStatements(toStatements(sampleCredential()), {"/credentialSubject/dog_name"});
        REQUIRE(partition.is_ok());
        CHECK(partition.value().mandatory.size() == 4);
    }

    TEST_CASE("Statement digest depends on order and content") {
        auto statements = toStatements(sampleCredential());
        auto a = hashStatements(DigestAlgorithm::SHA256, statements);
        REQUIRE(a.is_ok());
        CHECK(a.value().size() == 32);

        statements.pop_back();
        auto b = hashStatements(DigestAlgorithm::SHA256, statements);
        REQUIRE(b.is_ok());
        CHECK(a.value() != b.value());
    }
}

TEST_SUITE("Document Selection Tests") {

    TEST_CASE("Reduced document keeps selected fields and context") {
        auto reduced = selectDocument(sampleCredential(), {"/issuer", "/issuanceDate", "/credentialSubject/dog_name"});
        REQUIRE(reduced.is_ok());
        const json &doc = reduced.value();
        CHECK(doc["@context"] == sampleCredential()["@context"]);
        CHECK(doc["issuer"] == "did:key:zDnExample");
        CHECK(doc["issuanceDate"] == "2024-01-01T00:00:00Z");
        CHECK(doc["credentialSubject"]["dog_name"]["name1"] == "Fido");
        CHECK(doc["credentialSubject"]["dog_name"]["age"] == 3);
        CHECK_FALSE(doc["credentialSubject"].contains("cat_name"));
        CHECK_FALSE(doc.contains("proof"));
    }

    TEST_CASE("Ancestor id and type are kept") {
        json credential = sampleCredential();
        credential["credentialSubject"]["id"] = "did:example:subject";

        auto reduced = selectDocument(credential, {"/credentialSubject/cat_name"});
        REQUIRE(reduced.is_ok());
        const json &doc = reduced.value();
        CHECK(doc["type"] == json::array({"VerifiableCredential"}));
        CHECK(doc["credentialSubject"]["id"] == "did:example:subject");
        CHECK(doc["credentialSubject"]["cat_name"] == "tom");
        CHECK_FALSE(doc["credentialSubject"].contains("dog_name"));
        CHECK_FALSE(doc.contains("issuer"));
    }

    TEST_CASE("Selection of an invalid pointer fails") {
        auto reduced = selectDocument(sampleCredential(), {"no-slash"});
        REQUIRE(reduced.is_err());
        CHECK(isError(reduced.error(), ERR_INVALID_POINTER));
    }
}
