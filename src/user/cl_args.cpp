#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <trialrun/common/expected.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>
#include <trialrun/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace trialrun {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ TRIALRUN_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

template <typename T>
T parse_number(std::string_view text, std::string_view what) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);

    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(fmt::format("{} must be a number (got {:?})", what, text));
    }

    return value;
}

/// Thirty days
constexpr double MAX_SECONDS = 30.0 * 24 * 60 * 60;

std::chrono::milliseconds parse_seconds(std::string_view text, std::string_view what) {
    auto seconds = parse_number<double>(text, what);

    if (!std::isfinite(seconds) || seconds < 0) {
        throw std::invalid_argument(fmt::format("{} must be a non-negative number of seconds (got {:?})", what, text));
    }
    if (seconds > MAX_SECONDS) {
        throw std::invalid_argument(fmt::format("{} must be at most {} seconds (got {:?})", what, MAX_SECONDS, text));
    }

    return std::chrono::round<std::chrono::milliseconds>(std::chrono::duration<double>{seconds});
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("trialrun v{}", TRIALRUN_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("selectors")
        .nargs(argparse::nargs_pattern::any)
        .metavar("UNIT")
        .action([this] (const std::string& selector) {
                opts_buffer_.selectors.push_back(selector);
            })
        .help("Unit names or name patterns (fnmatch syntax) to run. Runs every unit if none are given.");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(TRIALRUN_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("--mode")
        .choices("standalone", "discovery", "automated")
        .metavar("MODE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                if (opt == "standalone") {
                    opts_buffer_.mode = RunMode::Standalone;
                } else if (opt == "discovery") {
                    opts_buffer_.mode = RunMode::Discovery;
                } else if (opt == "automated") {
                    opts_buffer_.mode = RunMode::Automated;
                }
            })
        .help("Invocation mode. Inferred when omitted: automated under CI, standalone for a single unit name, "
              "discovery otherwise.");

    arg_parser_.add_argument("-t", "--tag")
        .metavar("TAG")
        .append()
        .action([this] (const std::string& tag) {
                opts_buffer_.tags.push_back(tag);
            })
        .help("Only run units with this tag or topic (repeatable)");

    arg_parser_.add_argument("-j", "--workers")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.workers = parse_number<std::size_t>(opt, "Worker count");
            })
        .help("Number of parallel workers. Defaults to the number of cores; always 1 in standalone mode.");

    arg_parser_.add_argument("--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.verbose = true; })
        .help("Enable verbose unit output and keep artifacts after the run");

    arg_parser_.add_argument("--no-verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.verbose = false; })
        .help("Disable verbose unit output");

    arg_parser_.add_argument("--plot")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.plot = true; })
        .help("Enable plotting in units");

    arg_parser_.add_argument("--no-plot")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.plot = false; })
        .help("Disable plotting in units");

    arg_parser_.add_argument("--timeout")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.timeout = parse_seconds(opt, "Timeout"); })
        .help("Timeout for units that do not declare one (default: none; automated runs are bounded by the budget)");

    arg_parser_.add_argument("--budget")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.budget = parse_seconds(opt, "Budget"); })
        .help(fmt::format("Wall-clock budget for an automated run (default: {})", ProgramOptions::DEFAULT_BUDGET));

    arg_parser_.add_argument("--grace")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.grace = parse_seconds(opt, "Grace period"); })
        .help(fmt::format("Time running units get to finish after the budget is exceeded (default: {})",
                          ProgramOptions::DEFAULT_GRACE));

    arg_parser_.add_argument("--strict")
        .flag()
        .store_into(opts_buffer_.strict)
        .help("Fail before running anything if the registry has structural violations");

    arg_parser_.add_argument("--strict-coverage")
        .flag()
        .store_into(opts_buffer_.strict_coverage)
        .help("Fail the run if branch coverage is below the minimum");

    arg_parser_.add_argument("--coverage-min")
        .metavar("RATIO")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.coverage_min = parse_number<double>(opt, "Minimum coverage");
            })
        .help(fmt::format("Minimum branch coverage ratio (default: {})", ProgramOptions::DEFAULT_COVERAGE_MIN));

    arg_parser_.add_argument("--coverage-target")
        .metavar("RATIO")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.coverage_target = parse_number<double>(opt, "Target coverage");
            })
        .help(fmt::format("Target branch coverage ratio (default: {})", ProgramOptions::DEFAULT_COVERAGE_TARGET));

    arg_parser_.add_argument("--artifacts")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.artifact_root = opt; })
        .help(fmt::format("Artifact directory (default: {})", ProgramOptions::DEFAULT_ARTIFACT_ROOT));

    arg_parser_.add_argument("--coverage-report")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.coverage_report = opt; })
        .help(fmt::format("Where to write the JSON coverage report; a text summary is written beside it "
                          "(default: {})", ProgramOptions::DEFAULT_COVERAGE_REPORT));

    arg_parser_.add_argument("-D", "--set")
        .metavar("NAME=VALUE")
        .append()
        .action([this] (const std::string& opt) {
                auto eq = opt.find('=');

                if (eq == std::string::npos || eq == 0) {
                    throw std::invalid_argument(fmt::format("Parameter override {:?} is not of the form NAME=VALUE", opt));
                }

                opts_buffer_.overrides[opt.substr(0, eq)] = opt.substr(eq + 1);
            })
        .help("Override a unit parameter (repeatable)");

    arg_parser_.add_argument("--list")
        .flag()
        .store_into(opts_buffer_.list_only)
        .help("List the selected units without running them");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    if (opts_buffer_.verbosity == Silent) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(static_cast<int>(opts_buffer_.verbosity) - 1);
                })
            .append()
            .help("Decrease output verbosity (repeatable)");

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. Useful for scripting.");

        arg_parser_.add_argument("--output")
            .choices("silent", "quiet", "summary", "all", "extra")
            .metavar("LEVEL")
            .nargs(1)
            .action([this] (const std::string& opt) {
                    if (opt == "silent") {
                        opts_buffer_.verbosity = Silent;
                    } else if (opt == "quiet") {
                        opts_buffer_.verbosity = Quiet;
                    } else if (opt == "summary") {
                        opts_buffer_.verbosity = Summary;
                    } else if (opt == "all") {
                        opts_buffer_.verbosity = All;
                    } else if (opt == "extra") {
                        opts_buffer_.verbosity = Extra;
                    }
                })
            .help("Output verbosity: 'all' also lists passing units, 'extra' adds inspection values and "
                  "per-module coverage");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace trialrun
