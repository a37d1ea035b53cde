#pragma once

#include "user/program_options.hpp"

#include <trialrun/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};
};

/// Parse ``args``, or print the error with the help message and exit with ``exit_code``
ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 2) noexcept;

} // namespace trialrun
