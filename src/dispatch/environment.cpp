#include "dispatch/environment.hpp"

#include <trialrun/logging.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace trialrun {

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string{value};
}

bool is_truthy(std::string_view value) {
    return !value.empty() && value != "0" && value != "false";
}

} // namespace

Environment Environment::from_process() {
    Environment env;

    env.ci = is_truthy(get_env(CI_VAR).value_or(""));
    env.plot_backend = get_env(PLOT_BACKEND_VAR);

    if (env.plot_backend && env.plot_backend->empty()) {
        env.plot_backend.reset();
    }

    // hardware_concurrency may report 0 if the count is not computable
    if (auto threads = std::thread::hardware_concurrency(); threads != 0) {
        env.hardware_threads = threads;
    }

    LOG_DEBUG("Environment: ci={}, plot_backend={}, hardware_threads={}", env.ci, env.plot_backend,
              env.hardware_threads);

    return env;
}

} // namespace trialrun
