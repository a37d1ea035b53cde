#include "app/harness_app.hpp"

#include "dispatch/environment.hpp"
#include "dispatch/mode_dispatcher.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "output/verbosity.hpp"
#include "registry/unit_registry.hpp"
#include "run_orchestrator.hpp"
#include "user/program_options.hpp"

#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>

#include <memory>
#include <utility>

namespace trialrun {

HarnessApp::HarnessApp(ProgramOptions opts, UnitRegistry registry, Environment env)
    : App{std::move(opts)}
    , registry_{std::move(registry)}
    , env_{std::move(env)} {}

int HarnessApp::run_impl() {
    LOG_DEBUG("{} units registered", registry_.size());

    StdoutSink output_sink;

    auto config = resolve(OPTS, env_, registry_);

    if (!config) {
        PlainTextSerializer serializer{output_sink, OPTS.colorize_option, OPTS.verbosity};
        serializer.on_error(fmt::format("{}", config.error()));
        serializer.finalize();
        return static_cast<int>(ExitCode::InfrastructureFailure);
    }

    auto output_serializer = std::make_shared<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity,
                                                                   config->unit_config.verbose);

    if (OPTS.list_only) {
        output_serializer->on_unit_list(config->units, config->violations);
        output_serializer->finalize();
        return static_cast<int>(ExitCode::Success);
    }

    RunOrchestrator orchestrator{std::move(config.value()), output_serializer};

    auto report = orchestrator.run();

    if (!report) {
        LOG_ERROR("Run could not start: {}", report.error());
        return static_cast<int>(ExitCode::InfrastructureFailure);
    }

    return static_cast<int>(report->exit_code());
}

} // namespace trialrun
