#include "util/path_utils.hpp"

#include "util/text_utils.hpp"

#include <cctype>
#include <cstdlib>

namespace isoboot {

namespace {

bool IsNameStart(char c) {
    return c == '_' || std::isalpha(static_cast<unsigned char>(c));
}

bool IsNameChar(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

std::string Lookup(const EnvLookup& env, const std::string& name) {
    if (!env) return {};
    auto v = env(name);
    return v ? *v : std::string();
}

} // namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

bool IsHttpUrl(std::string_view s) {
    const std::string lower = ToLower(s.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

std::string ExpandUserPath(std::string_view input, const EnvLookup& env) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    if (!input.empty() && input[0] == '~' && (input.size() == 1 || input[1] == '/')) {
        const std::string home = Lookup(env, "HOME");
        if (!home.empty()) {
            out += home;
            i = 1;
        }
    }

    while (i < input.size()) {
        const char c = input[i];
        if (c != '$' || i + 1 >= input.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        if (input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string_view::npos) {
                out.push_back(c);
                ++i;
                continue;
            }
            const std::string_view name = input.substr(i + 2, close - (i + 2));
            bool valid = !name.empty() && IsNameStart(name[0]);
            for (char n : name) valid = valid && IsNameChar(n);
            if (!valid) {
                out.append(input.substr(i, close - i + 1));
            } else {
                out += Lookup(env, std::string(name));
            }
            i = close + 1;
            continue;
        }

        if (!IsNameStart(input[i + 1])) {
            out.push_back(c);
            ++i;
            continue;
        }

        size_t end = i + 1;
        while (end < input.size() && IsNameChar(input[end])) ++end;
        out += Lookup(env, std::string(input.substr(i + 1, end - (i + 1))));
        i = end;
    }

    return out;
}

std::optional<std::string> UrlFileName(std::string_view url) {
    std::string_view s = url;
    if (auto hash = s.find('#'); hash != std::string_view::npos) s = s.substr(0, hash);
    if (auto query = s.find('?'); query != std::string_view::npos) s = s.substr(0, query);

    const size_t scheme = s.find("://");
    const size_t host_start = (scheme == std::string_view::npos) ? 0 : scheme + 3;
    const size_t path_start = s.find('/', host_start);
    if (path_start == std::string_view::npos) return std::nullopt;

    const std::string_view name = s.substr(s.rfind('/') + 1);
    if (name.empty() || name == "." || name == "..") return std::nullopt;
    return std::string(name);
}

} // namespace isoboot
