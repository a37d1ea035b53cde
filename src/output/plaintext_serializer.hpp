#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "registry/unit_registry.hpp"
#include "user/program_options.hpp"

#include <trialrun/run_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace trialrun {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity,
                        bool verbose_run = false);

    void on_run_begin(const RunMetadata& metadata, RunMode mode, std::size_t num_units,
                      std::size_t worker_count) override;
    void on_outcome(const Outcome& outcome) override;
    void on_report(const RunReport& report) override;
    void on_unit_list(std::span<const DiscoveredUnit> units,
                      std::span<const StructuralViolation> violations) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    void output_failures(const RunReport& report);
    void output_violations(std::span<const StructuralViolation> violations);
    void output_coverage(const RunReport& report);
    void output_summary(const RunReport& report);

    fmt::text_style status_style(UnitStatus status) const;

    template <fmt::formattable T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <fmt::formattable T>
    std::string style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt = "{}") const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("unit", 0) => "units"
    ///  pluralize("unit", 1) => "unit"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, fatal errors, etc.
    //   success  - PASSED messages
    //   skipped  - SKIPPED messages and reasons
    //   value    - names and values referenced by outcomes
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto SKIPPED_STYLE = fmt::fg(fmt::color::gray);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Basic line dividers to seperate output, parameterized on length
    // Line Divider 2x Emphasized : "#######"...
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');
    static const inline auto LINE_DIVIDER_2EM = MAKE_LINE_DIVIDER('#');

    bool do_colorize_;
    bool verbose_run_;
    std::size_t terminal_width_;
};

template <fmt::formattable T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <fmt::formattable T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt) const {
    if (!do_colorize_) {
        return fmt::format(fmt, arg);
    }

    return fmt::format(style, fmt::runtime(fmt.get()), arg);
}

} // namespace trialrun
