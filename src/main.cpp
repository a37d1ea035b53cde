#include "app/harness_app.hpp"
#include "dispatch/environment.hpp"
#include "registry/unit_registry.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <trialrun/logging.hpp>
#include <trialrun/registrars/global_registrar.hpp>

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace trialrun;

    init_loggers();

    LOG_TRACE("Registered units: {}", GlobalRegistrar::get().get_num_registered());

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    HarnessApp app{parse_args_or_exit(args), UnitRegistry::from_global(), Environment::from_process()};

    return app.run();
}
