#pragma once

#include <trialrun/api/unit_base.hpp>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace trialrun {

/// A global singleton registrar holding every unit declared in the executable.
///
/// Units are added by static ``UnitAutoRegistrar``s (see the ``UNIT`` macro) in declaration order.
/// Nothing is validated here; the unit registry reports structural problems at discovery time.
class GlobalRegistrar
{
public:
    /// Safe global singleton pattern (first intro. by Scott Meyers for C++, I think)
    static GlobalRegistrar& get() noexcept;

    /// Registers the unit to be made discoverable
    void add_unit(std::unique_ptr<UnitBase> unit);

    auto get_units() const noexcept {
        return registered_units_ |
               ranges::views::transform([](const std::unique_ptr<UnitBase>& unit) -> const UnitBase& { return *unit; });
    }

    /// First registered unit named ``name``
    std::optional<std::reference_wrapper<const UnitBase>> get_unit(std::string_view name) const {
        auto name_matcher = [name](const std::unique_ptr<UnitBase>& unit) { return unit->get_name() == name; };

        if (auto iter = ranges::find_if(registered_units_, name_matcher); iter != registered_units_.end()) {
            return **iter;
        }

        return std::nullopt;
    }

    std::size_t get_num_registered() const;

private:
    GlobalRegistrar() = default;

    std::vector<std::unique_ptr<UnitBase>> registered_units_;
};

} // namespace trialrun
