#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/digest.hpp>
#include <didkey/common/json.hpp>
#include <string>
#include <vector>

namespace didkey {

    /// One leaf of a document: a non-object value (arrays and empty objects are atomic)
    /// addressed by its JSON pointer.
    struct Statement {
        std::string pointer;
        std::vector<std::string> path; // Unescaped pointer tokens
        json value;

        /// Signed form: <pointer>=<canonical value>
        std::string text() const;
    };

    /// Mandatory / non-mandatory split of a document's statements.
    /// Both lists keep pointer order.
    struct StatementPartition {
        std::vector<Statement> mandatory;
        std::vector<Statement> non_mandatory;
    };

    /// Pointer that is always mandatory
    constexpr const char *CONTEXT_POINTER = "/@context";

    /// All leaves of the document in pointer order. The top-level "proof" member is skipped.
    std::vector<Statement> toStatements(const json &document);

    /// Whether a pointer (as tokens) covers a statement: the statement lies under the
    /// pointer, or the pointer lies inside the statement's atomic value.
    bool covers(const std::vector<std::string> &pointer_path, const Statement &statement);

    /// Fails with ERR_INVALID_POINTER unless every pointer addresses an existing value
    dp::Result<void, dp::Error> validatePointers(const json &document, const std::vector<std::string> &pointers);

    /// Split statements by the mandatory pointers ("/@context" is always mandatory)
    dp::Result<StatementPartition, dp::Error> partitionStatements(const std::vector<Statement> &statements,
                                                                  const std::vector<std::string> &mandatory_pointers);

    /// Reduced document holding the statements covered by the pointers, "@context", and
    /// the "id"/"type" of every object along a selected path
    dp::Result<json, dp::Error> selectDocument(const json &document, const std::vector<std::string> &pointers);

    /// Digest of the statement texts joined by '\n'
    dp::Result<Bytes, dp::Error> hashStatements(DigestAlgorithm algorithm, const std::vector<Statement> &statements);

} // namespace didkey
