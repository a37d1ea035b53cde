#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "dispatch/environment.hpp"
#include "registry/unit_registry.hpp"
#include "user/program_options.hpp"

namespace trialrun {

/// Resolves the command line against the registered units and runs them
class HarnessApp final : public App
{
public:
    HarnessApp(ProgramOptions opts, UnitRegistry registry, Environment env);

private:
    int run_impl() override;

    UnitRegistry registry_;
    Environment env_;
};

} // namespace trialrun
