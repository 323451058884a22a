#include "util/config.hpp"

#include "util/config_json_utils.hpp"
#include "util/text_utils.hpp"

namespace isoboot {

std::optional<WriteBackend> ParseWriteBackend(std::string_view s) {
    const std::string lower = ToLower(s);
    if (lower == "auto") return WriteBackend::Auto;
    if (lower == "dd") return WriteBackend::Dd;
    if (lower == "direct") return WriteBackend::Direct;
    return std::nullopt;
}

const char* ToString(WriteBackend backend) {
    switch (backend) {
        case WriteBackend::Auto:   return "auto";
        case WriteBackend::Dd:     return "dd";
        case WriteBackend::Direct: return "direct";
    }
    return "unknown";
}

WriteBackend ResolveWriteBackend(WriteBackend configured, bool is_root) {
    if (configured == WriteBackend::Dd) return WriteBackend::Dd;
    return is_root ? WriteBackend::Direct : WriteBackend::Dd;
}

Result Config::LoadFromFile(const std::string& path, Config& out) {
    out = Config{};

    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Io(-1, "Config: " + err);
    }

    Config loaded;
    if (!config::detail::FillConfigFromJson(json, loaded, err)) {
        return Result::Fail(ErrorKind::ValidationRejected, -1, "Config: " + err + " in " + path);
    }

    out = std::move(loaded);
    return Result::Ok();
}

std::string ConfigPathFromEnvironment(const EnvLookup& env) {
    if (env) {
        if (auto v = env(kConfigPathEnv); v && !v->empty()) {
            return *v;
        }
    }
    return kDefaultConfigPath;
}

} // namespace isoboot
