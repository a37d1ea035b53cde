#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "registry/unit_registry.hpp"
#include "user/program_options.hpp"

#include <trialrun/coverage/coverage.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace trialrun {

using enum VerbosityLevel;

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity, bool verbose_run)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , verbose_run_{verbose_run}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_begin(const RunMetadata& metadata, RunMode mode, std::size_t num_units,
                                       std::size_t worker_count) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " Execution Info ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view date_label = "Date and Time: ";
    constexpr std::string_view run_label = "Run: ";

    std::string version_text = fmt::format("{}-g{}", metadata.version_string, metadata.git_hash);
    std::string local_timepoint_text = to_localtime_string(metadata.start_time, "%a %b %d %T %Y").value_or("<ERROR>");
    std::string run_text = fmt::format("{} mode, {} {} on {} {}", mode, num_units,
                                       pluralize("unit", static_cast<int>(num_units)), worker_count,
                                       pluralize("worker", static_cast<int>(worker_count)));

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += fmt::format("{}{:>{}}\n", version_label, version_text, terminal_width_ - version_label.size());
    out += fmt::format("{}{:>{}}\n", date_label, local_timepoint_text, terminal_width_ - date_label.size());
    out += fmt::format("{}{:>{}}\n", run_label, run_text, terminal_width_ - run_label.size());
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink_.write(out);
}

fmt::text_style PlainTextSerializer::status_style(UnitStatus status) const {
    switch (status) {
    case UnitStatus::Passed:
        return SUCCESS_STYLE;
    case UnitStatus::Skipped:
        return SKIPPED_STYLE;
    case UnitStatus::Failed:
    case UnitStatus::Errored:
    case UnitStatus::TimedOut:
        return ERROR_STYLE;
    }

    return {};
}

void PlainTextSerializer::on_outcome(const Outcome& outcome) {
    if (!should_output_outcome(verbosity_, outcome.status)) {
        return;
    }

    constexpr std::size_t status_width = 10;

    std::string status_text = fmt::format("{:<{}}", fmt::format("{}", outcome.status), status_width);
    std::string out = fmt::format("{} {} ({})\n", style_str(status_text, status_style(outcome.status)),
                                  style(outcome.unit_name, VALUE_STYLE), outcome.duration);

    if (outcome.skip_reason) {
        out += fmt::format("    {}\n", style_str(*outcome.skip_reason, SKIPPED_STYLE, "skipped: {}"));
    }

    if (outcome.failure && verbosity_ >= All) {
        out += fmt::format("    {}\n", outcome.failure->summary);
    }

    if (outcome.inspection && should_output_inspection(verbosity_, verbose_run_)) {
        out += fmt::format("    inspect: {}\n", style(*outcome.inspection, VALUE_STYLE));
    }

    sink_.write(out);
}

void PlainTextSerializer::output_failures(const RunReport& report) {
    if (report.failure_messages.empty() || !should_output_failure_details(verbosity_)) {
        return;
    }

    std::string out = fmt::format("\n{0}\n{1}\n{0}\n", LINE_DIVIDER(terminal_width_),
                                  style_str(pluralize("Failure", static_cast<int>(report.failure_messages.size())),
                                            ERROR_STYLE));

    for (const auto& message : report.failure_messages) {
        out += message;
        out += "\n";
    }

    sink_.write(out);
}

void PlainTextSerializer::output_violations(std::span<const StructuralViolation> violations) {
    if (violations.empty()) {
        return;
    }

    std::string out = style_str(violations.size(), WARNING_STYLE, "{} structural violation(s):\n");

    for (const auto& violation : violations) {
        out += fmt::format("  [{}] {} ({})\n", violation.kind, violation.message, violation.source_file);
    }

    sink_.write(out);
}

void PlainTextSerializer::output_coverage(const RunReport& report) {
    const auto& coverage = report.coverage;

    if (coverage.totals.lines_total == 0) {
        sink_.write("Coverage: no regions recorded\n");
        return;
    }

    auto percent = [](double ratio) { return fmt::format("{:.1f}%", ratio * 100); };

    std::string gate_text;
    if (!report.gate.passed) {
        gate_text = style_str(percent(report.coverage_gate.minimum), ERROR_STYLE, "below minimum of {}");
    } else if (!report.gate.target_met) {
        gate_text = style_str(percent(report.coverage_gate.target), WARNING_STYLE, "below target of {}");
    } else {
        gate_text = style_str(percent(report.coverage_gate.target), SUCCESS_STYLE, "meets target of {}");
    }

    sink_.write(fmt::format("Coverage: lines {} | branches {} ({})\n",
                            style(percent(coverage.line_ratio()), VALUE_STYLE),
                            style(percent(coverage.branch_ratio()), VALUE_STYLE), gate_text));

    if (!should_output_module_coverage(verbosity_)) {
        return;
    }

    for (const auto& module : coverage.modules) {
        sink_.write(fmt::format("  {}\n", module));
    }
}

void PlainTextSerializer::output_summary(const RunReport& report) {
    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";

    const auto& counts = report.counts;
    const int num_failing = counts.failed + counts.errored + counts.timed_out;

    auto labeled_num = [](int num, std::string_view label_singular) {
        return fmt::format("{} {}", num, pluralize(label_singular, num));
    };

    // Mostly copying Catch2's result summary format
    if (num_failing == 0) {
        out += fmt::format("{} ({} in {})\n", style_str("All units passed", SUCCESS_STYLE),
                           labeled_num(counts.passed, "unit"), report.total_duration);

        if (counts.skipped > 0) {
            out += fmt::format("{}\n", style_str(labeled_num(counts.skipped, "unit"), SKIPPED_STYLE, "{} skipped"));
        }
    } else {
        // We would need >99999 units for this to look off
        static constexpr std::size_t field_width = 14;

        out += fmt::format("{:<{}}: {:>{}} | {:>{}} | {:>{}} | {:>{}} | {:>{}} | {:>{}}\n", "Units", field_width,
                           fmt::format("{} total", counts.total()), field_width,
                           style(fmt::format("{} passed", counts.passed), SUCCESS_STYLE), field_width,
                           style(fmt::format("{} failed", counts.failed), ERROR_STYLE), field_width,
                           style(fmt::format("{} errored", counts.errored), ERROR_STYLE), field_width,
                           style(fmt::format("{} timed out", counts.timed_out), ERROR_STYLE), field_width,
                           style(fmt::format("{} skipped", counts.skipped), SKIPPED_STYLE), field_width);
        out += fmt::format("Finished in {}\n", report.total_duration);
    }

    if (report.budget_exceeded) {
        out += style_str("Run budget exceeded", ERROR_STYLE, "{}\n");
    }

    if (report.coverage_failed()) {
        out += style_str("Coverage gate failed", ERROR_STYLE, "{}\n");
    }

    if (verbosity_ >= Extra) {
        out += fmt::format("Exit code: {} ({})\n", static_cast<int>(report.exit_code()), report.exit_code());
    }

    sink_.write(out);
}

void PlainTextSerializer::on_report(const RunReport& report) {
    output_failures(report);

    if (!should_output_suite_summary(verbosity_)) {
        return;
    }

    sink_.write("\n");
    output_violations(report.violations);
    output_coverage(report);
    output_summary(report);
}

void PlainTextSerializer::on_unit_list(std::span<const DiscoveredUnit> units,
                                       std::span<const StructuralViolation> violations) {
    std::string out;

    std::string_view current_topic;
    for (const auto& [unit, topic] : units) {
        if (topic != current_topic) {
            out += fmt::format("{}:\n", style(topic, POP_OUT_STYLE));
            current_topic = topic;
        }

        out += fmt::format("  {}", style(unit->get_name(), VALUE_STYLE));

        if (!unit->get_tags().empty()) {
            out += fmt::format(" [{}]", fmt::join(unit->get_tags(), ", "));
        }
        if (const auto& reason = unit->get_skip_reason()) {
            out += style_str(*reason, SKIPPED_STYLE, " (skipped: {})");
        }

        out += "\n";
    }

    out += fmt::format("{} {}\n", units.size(), pluralize("unit", static_cast<int>(units.size())));

    sink_.write(out);

    output_violations(violations);
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    std::string out = style_str(what, WARNING_STYLE, "{}\n");
    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    std::string out = style_str(what, ERROR_STYLE, "{}\n");
    sink_.write(out);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return size.ws_col; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error(), DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    // A pseudo terminal can report zero columns
    return width.value() == 0 ? DEFAULT_WIDTH : width.value();
}

} // namespace trialrun
