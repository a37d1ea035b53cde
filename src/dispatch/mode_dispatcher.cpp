#include "dispatch/mode_dispatcher.hpp"

#include "dispatch/environment.hpp"
#include "registry/unit_registry.hpp"
#include "user/program_options.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/filter.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trialrun {

bool is_glob(std::string_view selector) {
    return selector.find_first_of("*?[") != std::string_view::npos;
}

RunMode infer_mode(const ProgramOptions& opts, const Environment& env) {
    if (opts.mode) {
        return *opts.mode;
    }

    if (env.ci) {
        return RunMode::Automated;
    }

    if (opts.selectors.size() == 1 && !is_glob(opts.selectors.front()) && opts.tags.empty()) {
        return RunMode::Standalone;
    }

    return RunMode::Discovery;
}

namespace {

/// Every exact name among ``selectors`` must name a discoverable unit
Expected<void, DispatchError> check_exact_names(const std::vector<std::string>& selectors, const Discovery& all) {
    for (const auto& selector : selectors) {
        if (is_glob(selector)) {
            continue;
        }

        auto found = ranges::any_of(all.units, [&selector](const DiscoveredUnit& unit) {
            return unit.unit->get_name() == selector;
        });

        if (found) {
            continue;
        }

        auto violation = ranges::find_if(all.violations, [&selector](const StructuralViolation& violation) {
            return violation.unit_name == selector;
        });

        if (violation != all.violations.end()) {
            return DispatchError{.kind = DispatchError::NoSuchUnit,
                                 .message = fmt::format("unit {:?} cannot run: {}", selector, violation->message)};
        }

        return DispatchError{.kind = DispatchError::NoSuchUnit, .message = fmt::format("no unit named {:?}", selector)};
    }

    return {};
}

void warn_empty_globs(const std::vector<std::string>& selectors, const Discovery& selected) {
    for (const auto& selector : selectors | ranges::views::filter(is_glob)) {
        UnitFilter single{.name_patterns = {selector}, .tags = {}};

        auto matched = ranges::any_of(selected.units, [&single](const DiscoveredUnit& unit) {
            return single.matches(*unit.unit, unit.topic);
        });

        if (!matched) {
            LOG_WARN("Pattern {:?} does not match any unit", selector);
        }
    }
}

void warn_unused_overrides(const UnitConfig& config, const std::vector<DiscoveredUnit>& units) {
    for (const auto& [name, value] : config.overrides) {
        auto declared = ranges::any_of(units, [&name](const DiscoveredUnit& unit) {
            return ranges::any_of(unit.unit->get_params(),
                                  [&name](const ParamSpec& param) { return param.name == name; });
        });

        if (!declared) {
            LOG_WARN("Override {}={:?} is not declared by any selected unit", name, value);
        }
    }
}

} // namespace

Expected<RunConfig, DispatchError> resolve(const ProgramOptions& opts, const Environment& env,
                                           const UnitRegistry& registry) {
    const RunMode mode = infer_mode(opts, env);

    LOG_DEBUG("Resolving a {} run (explicit: {})", mode, opts.mode.has_value());

    if (mode == RunMode::Standalone) {
        if (opts.selectors.empty()) {
            return DispatchError{.kind = DispatchError::InvalidOption,
                                 .message = "standalone mode requires at least one unit name"};
        }
        if (ranges::any_of(opts.selectors, is_glob)) {
            return DispatchError{.kind = DispatchError::InvalidOption,
                                 .message = fmt::format("standalone mode takes exact unit names, not patterns ({})",
                                                        opts.selectors)};
        }
    }

    const Discovery all = registry.discover();

    if (opts.strict && !all.violations.empty()) {
        return DispatchError{.kind = DispatchError::StructuralViolation,
                             .message = fmt::format("{} structural violation(s), first: {}", all.violations.size(),
                                                    all.violations.front().message)};
    }

    if (auto res = check_exact_names(opts.selectors, all); !res) {
        return res.error();
    }

    Discovery selected = registry.discover(UnitFilter{.name_patterns = opts.selectors, .tags = opts.tags});

    warn_empty_globs(opts.selectors, selected);

    RunConfig config;
    config.mode = mode;
    config.units = std::move(selected.units);
    config.violations = std::move(selected.violations);

    if (mode == RunMode::Standalone) {
        if (opts.workers.value_or(1) > 1) {
            LOG_WARN("Standalone runs use a single worker; ignoring a worker count of {}", *opts.workers);
        }
        config.worker_count = 1;
    } else {
        config.worker_count = std::max<std::size_t>(1, opts.workers.value_or(env.hardware_threads));
    }

    // Standalone is the interactive debugging mode: plots and verbose output unless turned off
    const bool interactive = mode == RunMode::Standalone;

    config.unit_config.verbose = opts.verbose.value_or(interactive);
    config.unit_config.do_plot = opts.plot.value_or(interactive);
    if (config.unit_config.do_plot) {
        config.unit_config.plot_backend = env.plot_backend;
    }
    config.unit_config.overrides = opts.overrides;

    warn_unused_overrides(config.unit_config, config.units);

    config.default_timeout = opts.timeout;
    if (mode == RunMode::Automated) {
        config.budget = opts.budget;
    }
    config.grace = opts.grace;

    config.strict_structure = opts.strict;
    config.strict_coverage = opts.strict_coverage;
    config.gate = CoverageGate{.minimum = opts.coverage_min, .target = opts.coverage_target};

    config.artifact_root = opts.artifact_root;
    config.coverage_report = opts.coverage_report;

    LOG_DEBUG("Resolved: {} units, {} workers, verbose={}, plot={}, budget={}", config.units.size(),
              config.worker_count, config.unit_config.verbose, config.unit_config.do_plot, config.budget);

    return config;
}

} // namespace trialrun
