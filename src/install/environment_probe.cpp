#include <provision/install/environment_probe.h>

#include <utility>

namespace provision::install {

EnvironmentProbe::EnvironmentProbe() : lookup_(config::process_env_lookup()) {}

EnvironmentProbe::EnvironmentProbe(config::EnvLookup lookup)
    : lookup_(lookup ? std::move(lookup) : config::process_env_lookup()) {}

bool EnvironmentProbe::isAutoInstallDisabled() const {
    auto value = lookup_(kDisableAutoInstallEnv);
    return value && config::env_truthy(*value);
}

bool EnvironmentProbe::isCiEnvironment() const {
    for (auto name : kCiIndicatorEnv) {
        if (auto value = lookup_(name); value && !value->empty()) {
            return true;
        }
    }
    return false;
}

} // namespace provision::install
