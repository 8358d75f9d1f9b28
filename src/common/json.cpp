#include <didkey/common/error.hpp>
#include <didkey/common/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace didkey {

    std::string canonicalize(const json &document) {
        // nlohmann::json stores objects in a std::map, so dump() emits sorted keys
        return document.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string escapePointerToken(const std::string &token) {
        std::string escaped;
        escaped.reserve(token.size());
        for (char c : token) {
            if (c == '~')
                escaped += "~0";
            else if (c == '/')
                escaped += "~1";
            else
                escaped += c;
        }
        return escaped;
    }

    std::string unescapePointerToken(const std::string &token) {
        std::string unescaped;
        unescaped.reserve(token.size());
        for (size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '~' && i + 1 < token.size()) {
                if (token[i + 1] == '0') {
                    unescaped += '~';
                    ++i;
                    continue;
                }
                if (token[i + 1] == '1') {
                    unescaped += '/';
                    ++i;
                    continue;
                }
            }
            unescaped += token[i];
        }
        return unescaped;
    }

    dp::Result<std::vector<std::string>, dp::Error> splitPointer(const std::string &pointer) {
        std::vector<std::string> tokens;
        if (pointer.empty())
            return dp::Result<std::vector<std::string>, dp::Error>::ok(tokens);

        if (pointer[0] != '/') {
            return dp::Result<std::vector<std::string>, dp::Error>::err(
                make_error(ERR_INVALID_POINTER, "JSON pointer must start with '/': " + pointer));
        }

        size_t start = 1;
        while (true) {
            size_t next = pointer.find('/', start);
            std::string raw = pointer.substr(start, next == std::string::npos ? std::string::npos : next - start);
            for (size_t i = 0; i < raw.size(); ++i) {
                if (raw[i] == '~' && (i + 1 >= raw.size() || (raw[i + 1] != '0' && raw[i + 1] != '1'))) {
                    return dp::Result<std::vector<std::string>, dp::Error>::err(
                        make_error(ERR_INVALID_POINTER, "Invalid escape in JSON pointer: " + pointer));
                }
            }
            tokens.push_back(unescapePointerToken(raw));
            if (next == std::string::npos)
                break;
            start = next + 1;
        }
        return dp::Result<std::vector<std::string>, dp::Error>::ok(tokens);
    }

    std::string joinPointer(const std::vector<std::string> &tokens) {
        std::string pointer;
        for (const auto &token : tokens)
            pointer += "/" + escapePointerToken(token);
        return pointer;
    }

    std::string currentTimestamp() {
        std::time_t now = std::time(nullptr);
        std::tm utc{};
        gmtime_r(&now, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::vector<std::string> contextUrls(const json &document) {
        std::vector<std::string> urls;
        if (!document.is_object() || !document.contains("@context"))
            return urls;

        const auto &context = document["@context"];
        if (context.is_string()) {
            urls.push_back(context.get<std::string>());
        } else if (context.is_array()) {
            for (const auto &entry : context) {
                if (entry.is_string())
                    urls.push_back(entry.get<std::string>());
            }
        }
        return urls;
    }

    bool hasContext(const json &document, const std::string &url) {
        for (const auto &entry : contextUrls(document)) {
            if (entry == url)
                return true;
        }
        return false;
    }

    std::string identifierOf(const json &value) {
        if (value.is_string())
            return value.get<std::string>();
        if (value.is_object() && value.contains("id") && value["id"].is_string())
            return value["id"].get<std::string>();
        return "";
    }

} // namespace didkey
