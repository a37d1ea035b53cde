#include <trialrun/api/unit_context.hpp>

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/common/macros.hpp>
#include <trialrun/exceptions.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace trialrun {

UnitContext::UnitContext(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts)
    : unit_{&unit}
    , config_{&config}
    , artifacts_{&artifacts} {}

UnitContext::~UnitContext() = default;

std::string_view UnitContext::get_name() const {
    return unit_->get_name();
}

std::optional<std::string> UnitContext::raw_param(std::string_view name) const {
    const auto& declared = unit_->get_params();
    auto decl = ranges::find_if(declared, [name](const ParamSpec& spec) { return spec.name == name; });
    const bool is_declared = decl != declared.end();

    if (is_declared) {
        if (auto iter = config_->overrides.find(name); iter != config_->overrides.end()) {
            return iter->second;
        }
    }

    // run-level toggles win over declared defaults
    if (name == "do_plot") {
        return config_->do_plot ? "true" : "false";
    }
    if (name == "verbose") {
        return config_->verbose ? "true" : "false";
    }

    if (!is_declared) {
        return std::nullopt;
    }

    return decl->default_value;
}

bool UnitContext::record(CheckResult result) {
    if (!result.passed) {
        LOG_DEBUG("Check failed in {:?}: {} (expected {}, actual {}) at {}", get_name(), result.summary,
                  result.expected, result.actual, result.location);
    }

    checks_.push_back(std::move(result));

    return checks_.back().passed;
}

bool UnitContext::expect(bool condition, std::string_view summary, CheckResult::DebugInfo debug_info) {
    return record({.passed = condition,
                   .summary = std::string{summary.empty() ? debug_info.msg : summary},
                   .expected = "true",
                   .actual = condition ? "true" : "false",
                   .location = detail::format_location(debug_info.loc)});
}

void UnitContext::note(std::string message) {
    notes_.push_back(std::move(message));
}

void UnitContext::skip(std::string reason) {
    throw SkipUnit{std::move(reason)};
}

ArtifactHandle& UnitContext::artifact(std::string_view file_name) {
    auto handle = TRY_OR_THROW(artifacts_->scoped_artifact(get_name(), file_name),
                               fmt::format("could not open artifact {:?}", file_name));

    open_artifacts_.push_back(std::make_unique<ArtifactHandle>(std::move(handle)));

    return *open_artifacts_.back();
}

void UnitContext::set_error(std::string summary, std::string expected, std::string actual) {
    error_ = RecordedError{.summary = std::move(summary), .expected = std::move(expected), .actual = std::move(actual)};
}

void UnitContext::set_skipped(std::string reason) {
    skip_reason_ = std::move(reason);
}

UnitExecution UnitContext::finalize(std::chrono::milliseconds duration) {
    for (auto& handle : open_artifacts_) {
        if (auto res = handle->close(); !res) {
            note(fmt::format("artifact {} could not be finished: {}", handle->path().filename(), res.error()));
        }
    }
    open_artifacts_.clear();

    Outcome outcome{.unit_name = std::string{get_name()},
                    .status = UnitStatus::Passed,
                    .duration = duration,
                    .failure = std::nullopt,
                    .skip_reason = std::nullopt,
                    .inspection = inspection_,
                    .num_checks = gsl::narrow_cast<int>(checks_.size()),
                    .num_failed_checks = gsl::narrow_cast<int>(
                        ranges::count_if(checks_, [](const CheckResult& check) { return !check.passed; })),
                    .coverage_sample = std::nullopt};

    if (error_) {
        outcome.status = UnitStatus::Errored;
        outcome.failure = FailureDetail{.summary = error_->summary,
                                        .expected = error_->expected,
                                        .actual = error_->actual,
                                        .context = notes_,
                                        .location = std::string{unit_->get_source_file()}};
    } else if (skip_reason_) {
        outcome.status = UnitStatus::Skipped;
        outcome.skip_reason = skip_reason_;
    } else if (outcome.num_failed_checks > 0) {
        auto first_failure =
            ranges::find_if(checks_, [](const CheckResult& check) { return !check.passed; });

        outcome.status = UnitStatus::Failed;
        outcome.failure = FailureDetail{.summary = first_failure->summary,
                                        .expected = first_failure->expected,
                                        .actual = first_failure->actual,
                                        .context = notes_,
                                        .location = first_failure->location};

        if (outcome.num_failed_checks > 1) {
            outcome.failure->context.push_back(
                fmt::format("{} of {} checks failed", outcome.num_failed_checks, outcome.num_checks));
        }
    }

    return {.outcome = std::move(outcome), .coverage = std::move(coverage_)};
}

} // namespace trialrun
