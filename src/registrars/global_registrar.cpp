#include <trialrun/registrars/global_registrar.hpp>

#include <trialrun/api/unit_base.hpp>

#include <cstddef>
#include <memory>
#include <utility>

namespace trialrun {

GlobalRegistrar& GlobalRegistrar::get() noexcept {
    // thread-safe singleton initialization pattern
    static GlobalRegistrar local_instance{};

    return local_instance;
}

void GlobalRegistrar::add_unit(std::unique_ptr<UnitBase> unit) {
    registered_units_.push_back(std::move(unit));
}

std::size_t GlobalRegistrar::get_num_registered() const {
    return registered_units_.size();
}

} // namespace trialrun
