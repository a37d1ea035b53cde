#pragma once

#include <trialrun/api/metadata.hpp>
#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/common/macros.hpp>
#include <trialrun/registrars/auto_registrars.hpp> // IWYU pragma: export

#include <string_view>

// Some macros to substantially simplify unit development

#define UNIT_IMPL(ident, name, /*metadata attributes*/...)                                                             \
    namespace {                                                                                                        \
    class ident final : public ::trialrun::UnitBase                                                                    \
    {                                                                                                                  \
    public:                                                                                                            \
        using UnitBase::UnitBase;                                                                                      \
        void run(::trialrun::UnitContext& ctx) const override;                                                         \
    };                                                                                                                 \
    using namespace ::trialrun::metadata; /*NOLINT(google-build-using-namespace)*/                                     \
    constexpr auto CONCAT(ident, __metadata) =                                                                         \
        ::trialrun::metadata::create(::trialrun::metadata::global_file_metadata() __VA_OPT__(, ) __VA_ARGS__);         \
    const ::trialrun::UnitAutoRegistrar<ident> CONCAT(ident, __registrar){name, __FILE__, CONCAT(ident, __metadata)};  \
    }                                                                                                                  \
    void ident::run([[maybe_unused]] ::trialrun::UnitContext& ctx) const

/// Define and register a unit
///
///   UNIT("test_converges", Tags{"slow"}, Timeout{std::chrono::seconds{5}}) {
///       EXPECT_NEAR(integrate(), 2.0, 1e-6);
///   }
#define UNIT(name, ...) UNIT_IMPL(CONCAT(UNIT__, __COUNTER__), name __VA_OPT__(, ) __VA_ARGS__)

/// Defaults for every unit declared later in the same file, e.g. FILE_METADATA(Topic{"integrator"})
#define FILE_METADATA(...)                                                                                             \
    namespace trialrun::metadata {                                                                                     \
    static consteval auto global_file_metadata() {                                                                     \
        return ::trialrun::metadata::create(__VA_ARGS__);                                                              \
    }                                                                                                                  \
    } // namespace trialrun::metadata

// Each macro takes an optional trailing summary message

#define EXPECT(condition, ...)                                                                                         \
    ctx.expect(static_cast<bool>(condition), std::string_view{__VA_ARGS__},                                            \
               ::trialrun::CheckResult::DebugInfo{#condition})

#define EXPECT_EQ(actual, expected, ...)                                                                               \
    ctx.expect_eq((actual), (expected), std::string_view{__VA_ARGS__},                                                 \
                  ::trialrun::CheckResult::DebugInfo{#actual " == " #expected})

#define EXPECT_NEAR(actual, expected, tolerance, ...)                                                                  \
    ctx.expect_near((actual), (expected), (tolerance), std::string_view{__VA_ARGS__},                                  \
                    ::trialrun::CheckResult::DebugInfo{#actual " ~= " #expected})
