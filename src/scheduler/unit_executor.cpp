#include "scheduler/unit_executor.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/exceptions.hpp>
#include <trialrun/logging.hpp>

#include <boost/type_index.hpp>
#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <string>
#include <string_view>

namespace trialrun {

namespace {

constexpr std::string_view COMPLETES_NORMALLY = "unit body completes without throwing";

std::string describe_exception(const std::exception& ex) {
    return fmt::format("{}: {}", boost::typeindex::type_id_runtime(ex).pretty_name(), ex.what());
}

} // namespace

UnitExecution execute_unit(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts) {
    using std::chrono::steady_clock;

    UnitContext context{unit, config, artifacts};
    const auto start = steady_clock::now();

    // The unit body is user code; everything it can throw becomes part of the outcome
    try {
        unit.run(context);
    } catch (const SkipUnit& skip) {
        LOG_DEBUG("Unit {:?} skipped: {}", unit.get_name(), skip.reason());
        context.set_skipped(skip.reason());
    } catch (const ContextInternalError& ex) {
        LOG_DEBUG("Internal context error in {:?}: {}", unit.get_name(), ex);
        context.set_error(fmt::format("{} ({})", ex.what(), ex.get_error()), std::string{COMPLETES_NORMALLY},
                          describe_exception(ex));
    } catch (const std::exception& ex) {
        LOG_DEBUG("Unit {:?} threw: {}", unit.get_name(), ex.what());
        context.set_error(fmt::format("unhandled exception: {}", ex.what()), std::string{COMPLETES_NORMALLY},
                          describe_exception(ex));
    } catch (...) {
        LOG_DEBUG("Unit {:?} threw a non-std::exception", unit.get_name());
        context.set_error("unhandled exception of unknown type (not derived from std::exception)",
                          std::string{COMPLETES_NORMALLY}, "exception of a type not derived from std::exception");
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start);

    return context.finalize(duration);
}

} // namespace trialrun
