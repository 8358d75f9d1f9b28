#include <didkey/common/error.hpp>
#include <didkey/suite/statements.hpp>

#include <algorithm>
#include <set>

namespace didkey {

    namespace {

        void collect(const json &value, std::vector<std::string> &path, std::vector<Statement> &out) {
            if (value.is_object() && !value.empty()) {
                for (auto it = value.begin(); it != value.end(); ++it) {
                    if (path.empty() && it.key() == "proof")
                        continue;
                    path.push_back(it.key());
                    collect(it.value(), path, out);
                    path.pop_back();
                }
                return;
            }
            out.push_back(Statement{joinPointer(path), path, value});
        }

        bool isPrefix(const std::vector<std::string> &prefix, const std::vector<std::string> &path) {
            if (prefix.size() > path.size())
                return false;
            return std::equal(prefix.begin(), prefix.end(), path.begin());
        }

        bool isArrayIndex(const std::string &token) {
            if (token.empty() || (token.size() > 1 && token[0] == '0'))
                return false;
            return std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
        }

        dp::Result<std::vector<std::vector<std::string>>, dp::Error>
        splitAll(const std::vector<std::string> &pointers) {
            std::vector<std::vector<std::string>> paths;
            for (const auto &pointer : pointers) {
                auto tokens = splitPointer(pointer);
                if (tokens.is_err())
                    return dp::Result<std::vector<std::vector<std::string>>, dp::Error>::err(tokens.error());
                paths.push_back(tokens.value());
            }
            return dp::Result<std::vector<std::vector<std::string>>, dp::Error>::ok(paths);
        }

        bool coveredByAny(const std::vector<std::vector<std::string>> &paths, const Statement &statement) {
            for (const auto &path : paths) {
                if (covers(path, statement))
                    return true;
            }
            return false;
        }

        const json *valueAt(const json &document, const std::vector<std::string> &path) {
            const json *cur = &document;
            for (const auto &token : path) {
                if (cur->is_object()) {
                    auto it = cur->find(token);
                    if (it == cur->end())
                        return nullptr;
                    cur = &(*it);
                } else if (cur->is_array()) {
                    if (!isArrayIndex(token))
                        return nullptr;
                    size_t index = std::stoul(token);
                    if (index >= cur->size())
                        return nullptr;
                    cur = &(*cur)[index];
                } else {
                    return nullptr;
                }
            }
            return cur;
        }

    } // namespace

    std::string Statement::text() const { return pointer + "=" + canonicalize(value); }

    std::vector<Statement> toStatements(const json &document) {
        std::vector<Statement> statements;
        std::vector<std::string> path;
        collect(document, path, statements);
        std::sort(statements.begin(), statements.end(),
                  [](const Statement &a, const Statement &b) { return a.pointer < b.pointer; });
        return statements;
    }

    bool covers(const std::vector<std::string> &pointer_path, const Statement &statement) {
        return isPrefix(pointer_path, statement.path) || isPrefix(statement.path, pointer_path);
    }

    dp::Result<void, dp::Error> validatePointers(const json &document, const std::vector<std::string> &pointers) {
        for (const auto &pointer : pointers) {
            auto tokens = splitPointer(pointer);
            if (tokens.is_err())
                return dp::Result<void, dp::Error>::err(tokens.error());
            if (valueAt(document, tokens.value()) == nullptr) {
                return dp::Result<void, dp::Error>::err(
                    make_error(ERR_INVALID_POINTER, "JSON pointer does not match any value: " + pointer));
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<StatementPartition, dp::Error> partitionStatements(const std::vector<Statement> &statements,
                                                                  const std::vector<std::string> &mandatory_pointers) {
        auto paths = splitAll(mandatory_pointers);
        if (paths.is_err())
            return dp::Result<StatementPartition, dp::Error>::err(paths.error());

        auto mandatory_paths = paths.value();
        mandatory_paths.push_back(std::vector<std::string>{"@context"});

        StatementPartition partition;
        for (const auto &statement : statements) {
            if (coveredByAny(mandatory_paths, statement))
                partition.mandatory.push_back(statement);
            else
                partition.non_mandatory.push_back(statement);
        }
        return dp::Result<StatementPartition, dp::Error>::ok(partition);
    }

    dp::Result<json, dp::Error> selectDocument(const json &document, const std::vector<std::string> &pointers) {
        if (!document.is_object())
            return dp::Result<json, dp::Error>::err(invalid_document("Only objects can be reduced"));

        auto parsed = splitAll(pointers);
        if (parsed.is_err())
            return dp::Result<json, dp::Error>::err(parsed.error());

        auto paths = parsed.value();
        paths.push_back(std::vector<std::string>{"@context"});

        auto statements = toStatements(document);

        // Objects along a selected path keep their id and type
        std::set<std::vector<std::string>> extra;
        for (const auto &statement : statements) {
            if (!coveredByAny(paths, statement))
                continue;
            for (size_t depth = 0; depth < statement.path.size(); ++depth) {
                std::vector<std::string> ancestor(statement.path.begin(), statement.path.begin() + depth);
                const json *node = valueAt(document, ancestor);
                if (node == nullptr || !node->is_object())
                    continue;
                for (const char *key : {"id", "type"}) {
                    if (node->contains(key)) {
                        auto member = ancestor;
                        member.push_back(key);
                        extra.insert(member);
                    }
                }
            }
        }
        paths.insert(paths.end(), extra.begin(), extra.end());

        json reduced = json::object();
        for (const auto &statement : statements) {
            if (!coveredByAny(paths, statement))
                continue;
            if (statement.path.empty())
                return dp::Result<json, dp::Error>::ok(document);

            // Walk with operator[] on objects only; every interior node of a statement is an object
            json *cur = &reduced;
            for (size_t i = 0; i + 1 < statement.path.size(); ++i) {
                const auto &token = statement.path[i];
                if (!cur->contains(token))
                    (*cur)[token] = json::object();
                cur = &(*cur)[token];
            }
            (*cur)[statement.path.back()] = statement.value;
        }
        return dp::Result<json, dp::Error>::ok(reduced);
    }

    dp::Result<Bytes, dp::Error> hashStatements(DigestAlgorithm algorithm, const std::vector<Statement> &statements) {
        std::string joined;
        for (size_t i = 0; i < statements.size(); ++i) {
            if (i > 0)
                joined += '\n';
            joined += statements[i].text();
        }
        return digest(algorithm, joined);
    }

} // namespace didkey
