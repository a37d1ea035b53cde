#pragma once

#include <trialrun/api/unit_context.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/run_session.hpp>

#include <optional>
#include <string>
#include <string_view>

/// Message a unit process sends to its supervisor when it finishes: one JSON document
namespace trialrun::wire {

constexpr int PROTOCOL_VERSION = 1;

std::string encode(const UnitExecution& execution);

/// ProtocolError if ``data`` is not a complete, well-formed message
Result<UnitExecution> decode(std::string_view data);

std::optional<UnitStatus> status_from_string(std::string_view name);

} // namespace trialrun::wire
