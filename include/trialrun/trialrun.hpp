#pragma once

#include <trialrun/api/metadata.hpp>      // IWYU pragma: export
#include <trialrun/api/unit_base.hpp>     // IWYU pragma: export
#include <trialrun/api/unit_config.hpp>   // IWYU pragma: export
#include <trialrun/api/unit_context.hpp>  // IWYU pragma: export
#include <trialrun/coverage/coverage.hpp> // IWYU pragma: export
#include <trialrun/logging.hpp>           // IWYU pragma: export

#include <fmt/format.h> // IWYU pragma: export

// Commonly wanted stdlib headers, to keep unit sources less visually cluttered
#include <algorithm>   // IWYU pragma: export
#include <array>       // IWYU pragma: export
#include <chrono>      // IWYU pragma: export
#include <cmath>       // IWYU pragma: export
#include <cstddef>     // IWYU pragma: export
#include <cstdint>     // IWYU pragma: export
#include <numeric>     // IWYU pragma: export
#include <string>      // IWYU pragma: export
#include <string_view> // IWYU pragma: export
#include <vector>      // IWYU pragma: export

// should always include last if possible, as the short macro names may conflict with other libraries.
#include <trialrun/api/unit_macros.hpp> // IWYU pragma: export
