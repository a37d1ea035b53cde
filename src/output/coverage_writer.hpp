#pragma once

#include <trialrun/common/error_types.hpp>
#include <trialrun/coverage/coverage.hpp>

#include <filesystem>
#include <string>

namespace trialrun {

/// Plain-text rendering of a coverage report and its gate result, one module per line
std::string render_coverage_text(const CoverageReport& report, const CoverageGate& gate, const GateResult& result);

/// Path of the text summary written beside ``json_path``: same stem, ".txt" extension
std::filesystem::path coverage_text_path(const std::filesystem::path& json_path);

/// Write the machine-readable report to ``json_path`` and the rendered summary beside it.
/// Parent directories are created as needed.
Result<void> write_coverage_report(const std::filesystem::path& json_path, const CoverageReport& report,
                                   const CoverageGate& gate, const GateResult& result);

} // namespace trialrun
