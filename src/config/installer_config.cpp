#include <provision/config/installer_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <system_error>

namespace provision::config {

namespace {

constexpr const char* kSection = "install";

std::optional<std::chrono::seconds> parseSeconds(std::string value, const char* what) {
    trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    long long seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc{} || ptr != value.data() + value.size() || seconds <= 0) {
        spdlog::warn("[InstallerConfig] Ignoring invalid {} '{}'", what, value);
        return std::nullopt;
    }
    return std::chrono::seconds{seconds};
}

} // namespace

InstallerConfig loadInstallerConfig(const std::filesystem::path& configPath, EnvLookup env) {
    if (!env) {
        env = process_env_lookup();
    }

    InstallerConfig cfg;

    std::filesystem::path path = configPath;
    if (path.empty()) {
        if (auto fromEnv = env("PROVISION_CONFIG"); fromEnv && !fromEnv->empty()) {
            path = expand_tilde(*fromEnv);
        } else {
            path = get_config_path();
        }
    }

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("[InstallerConfig] Reading {}", path.string());

        if (auto v = parse_config_value(path, kSection, "auto_install"); !v.empty()) {
            cfg.autoInstall = env_truthy(v);
        }
        if (auto t = parseSeconds(parse_config_value(path, kSection, "command_timeout_seconds"),
                                  "command_timeout_seconds")) {
            cfg.commandTimeout = *t;
        }
        if (auto t = parseSeconds(parse_config_value(path, kSection, "verify_timeout_seconds"),
                                  "verify_timeout_seconds")) {
            cfg.verifyTimeout = *t;
        }
        if (auto v = parse_config_value(path, kSection, "package_manager"); !v.empty()) {
            cfg.preferredManager = v;
        }
    }

    if (auto v = env("PROVISION_PACKAGE_MANAGER"); v && !v->empty()) {
        cfg.preferredManager = *v;
    }
    if (auto v = env("PROVISION_COMMAND_TIMEOUT_SECONDS"); v) {
        if (auto t = parseSeconds(*v, "PROVISION_COMMAND_TIMEOUT_SECONDS")) {
            cfg.commandTimeout = *t;
        }
    }

    return cfg;
}

} // namespace provision::config
