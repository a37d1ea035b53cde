#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <trialrun/common/class_traits.hpp>
#include <trialrun/run_session.hpp>

#include <optional>
#include <utility>

namespace trialrun {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Process exit code; an escaped exception is an infrastructure failure
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(static_cast<int>(ExitCode::InfrastructureFailure));
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace trialrun
