#include "scheduler/wire.hpp"

#include "coverage/coverage_json.hpp"

#include <trialrun/api/unit_context.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun::wire {

using nlohmann::json;

namespace {

constexpr std::array ALL_STATUSES = {UnitStatus::Passed, UnitStatus::Failed, UnitStatus::Skipped, UnitStatus::Errored,
                                     UnitStatus::TimedOut};

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> optional_from_json(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

json failure_to_json(const std::optional<FailureDetail>& failure) {
    if (!failure) {
        return nullptr;
    }

    return {
        {"summary", failure->summary}, {"expected", failure->expected}, {"actual", failure->actual},
        {"context", failure->context}, {"location", failure->location},
    };
}

} // namespace

std::optional<UnitStatus> status_from_string(std::string_view name) {
    for (auto status : ALL_STATUSES) {
        if (fmt::format("{}", status) == name) {
            return status;
        }
    }

    return std::nullopt;
}

std::string encode(const UnitExecution& execution) {
    const auto& outcome = execution.outcome;

    const json message = {
        {"version", PROTOCOL_VERSION},
        {"outcome",
         {
             {"unit", outcome.unit_name},
             {"status", fmt::format("{}", outcome.status)},
             {"duration_ms", outcome.duration.count()},
             {"failure", failure_to_json(outcome.failure)},
             {"skip_reason", optional_to_json(outcome.skip_reason)},
             {"inspection", optional_to_json(outcome.inspection)},
             {"num_checks", outcome.num_checks},
             {"num_failed_checks", outcome.num_failed_checks},
         }},
        {"coverage", execution.coverage},
    };

    return message.dump();
}

Result<UnitExecution> decode(std::string_view data) {
    // no exceptions; a discarded value means the document was malformed or truncated
    const json message = json::parse(data, nullptr, /*allow_exceptions=*/false);

    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("Malformed message from unit process ({} bytes)", data.size());
        return ErrorKind::ProtocolError;
    }

    try {
        if (message.at("version").get<int>() != PROTOCOL_VERSION) {
            LOG_WARN("Unit process speaks protocol version {}, expected {}", message.at("version").dump(),
                     PROTOCOL_VERSION);
            return ErrorKind::ProtocolError;
        }

        const auto& jout = message.at("outcome");

        auto status = status_from_string(jout.at("status").get<std::string>());
        if (!status) {
            LOG_WARN("Unknown unit status {}", jout.at("status").dump());
            return ErrorKind::ProtocolError;
        }

        UnitExecution execution;
        auto& outcome = execution.outcome;

        outcome.unit_name = jout.at("unit").get<std::string>();
        outcome.status = *status;
        outcome.duration = std::chrono::milliseconds{jout.at("duration_ms").get<std::int64_t>()};
        outcome.skip_reason = optional_from_json<std::string>(jout, "skip_reason");
        outcome.inspection = optional_from_json<std::string>(jout, "inspection");
        outcome.num_checks = jout.at("num_checks").get<int>();
        outcome.num_failed_checks = jout.at("num_failed_checks").get<int>();

        if (const auto& jfail = jout.at("failure"); !jfail.is_null()) {
            outcome.failure = FailureDetail{.summary = jfail.at("summary").get<std::string>(),
                                            .expected = jfail.at("expected").get<std::string>(),
                                            .actual = jfail.at("actual").get<std::string>(),
                                            .context = jfail.at("context").get<std::vector<std::string>>(),
                                            .location = jfail.at("location").get<std::string>()};
        }

        execution.coverage = message.at("coverage").get<CoverageSample>();

        return execution;
    } catch (const json::exception& ex) {
        LOG_WARN("Incomplete message from unit process: {}", ex.what());
        return ErrorKind::ProtocolError;
    }
}

} // namespace trialrun::wire
