#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace isoboot {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
EnvLookup ProcessEnvironment();

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// True for "http://..." and "https://..." with a case-insensitive scheme.
bool IsHttpUrl(std::string_view s);

// Expands a leading "~" / "~/" to $HOME and substitutes $NAME / ${NAME}.
// Nothing else is interpreted: no globbing, no command substitution,
// no "~user", and substituted values are never expanded again.
std::string ExpandUserPath(std::string_view input, const EnvLookup& env);

// Final path segment of a URL with query and fragment removed.
// nullopt when the URL has no usable file name ("https://host/", "https://host").
std::optional<std::string> UrlFileName(std::string_view url);

} // namespace isoboot
