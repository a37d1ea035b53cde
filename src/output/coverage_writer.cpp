#include "output/coverage_writer.hpp"

#include "coverage/coverage_json.hpp"

#include <trialrun/common/error_types.hpp>
#include <trialrun/coverage/coverage.hpp>
#include <trialrun/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace trialrun {

namespace fs = std::filesystem;

namespace {

constexpr int JSON_INDENT = 2;

Result<void> write_file(const fs::path& path, std::string_view contents) {
    std::ofstream file{path, std::ios::trunc};

    if (!file) {
        LOG_ERROR("Could not open {} for writing", path);
        return ErrorKind::IoError;
    }

    file << contents;
    file.close();

    if (!file) {
        LOG_ERROR("Could not write {}", path);
        return ErrorKind::IoError;
    }

    return {};
}

} // namespace

std::string render_coverage_text(const CoverageReport& report, const CoverageGate& gate, const GateResult& result) {
    std::string out = fmt::format("{}\n", report.totals);

    for (const auto& module : report.modules) {
        out += fmt::format("  {}\n", module);
    }

    out += fmt::format("gate: branch coverage {:.1f}% against minimum {:.1f}% -> {}\n", result.branch_ratio * 100,
                       gate.minimum * 100, result.passed ? "passed" : "FAILED");
    out += fmt::format("target: {:.1f}% -> {}\n", gate.target * 100, result.target_met ? "met" : "not met");

    return out;
}

fs::path coverage_text_path(const fs::path& json_path) {
    fs::path text_path = json_path;
    text_path.replace_extension(".txt");
    return text_path;
}

Result<void> write_coverage_report(const fs::path& json_path, const CoverageReport& report, const CoverageGate& gate,
                                   const GateResult& result) {
    if (json_path.has_parent_path()) {
        std::error_code err;
        fs::create_directories(json_path.parent_path(), err);

        if (err) {
            LOG_ERROR("Could not create directory for coverage report {}: {}", json_path, err);
            return ErrorKind::IoError;
        }
    }

    nlohmann::json doc = report;
    doc["gate"] = {
        {"minimum", gate.minimum},
        {"target", gate.target},
        {"passed", result.passed},
        {"target_met", result.target_met},
    };

    TRY(write_file(json_path, doc.dump(JSON_INDENT) + "\n"));
    TRY(write_file(coverage_text_path(json_path), render_coverage_text(report, gate, result)));

    LOG_DEBUG("Wrote coverage report to {}", json_path);

    return {};
}

} // namespace trialrun
