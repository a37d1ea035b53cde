#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "registry/unit_registry.hpp"

#include <trialrun/common/class_traits.hpp>
#include <trialrun/run_session.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace trialrun {

/// Receives run events in order and renders them to a Sink
///
/// ``on_outcome`` is called in completion order; ``on_report`` once with the registry-ordered result.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_begin(const RunMetadata& metadata, RunMode mode, std::size_t num_units,
                              std::size_t worker_count) = 0;
    virtual void on_outcome(const Outcome& outcome) = 0;
    virtual void on_report(const RunReport& report) = 0;

    /// ``--list``: the units a run would execute, and any structural violations
    virtual void on_unit_list(std::span<const DiscoveredUnit> units,
                              std::span<const StructuralViolation> violations) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

    VerbosityLevel get_verbosity() const { return verbosity_; }

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace trialrun
