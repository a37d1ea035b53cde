#pragma once

#include <trialrun/api/metadata.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

class UnitContext;

/// A declared parameter and its default value, as text
struct ParamSpec
{
    std::string name;
    std::string default_value;
};

/// Base class primarily for a user-written unit
///
/// Holds the registration-time description of the unit. Immutable after construction.
class UnitBase
{
public:
    template <typename... MetadataAttrs>
    explicit UnitBase(std::string_view name, std::string_view source_file,
                      metadata::Metadata<MetadataAttrs...> metadata = metadata::Metadata<MetadataAttrs...>{})
        : name_{name}
        , source_file_{source_file} {
        if (auto topic = metadata.template get<metadata::Topic>()) {
            topic_ = std::string{topic->name};
        }
        if (auto tags = metadata.template get<metadata::Tags>()) {
            tags_.assign(tags->get().begin(), tags->get().end());
        }
        if (auto timeout = metadata.template get<metadata::Timeout>()) {
            timeout_ = timeout->duration;
        }
        if (auto skip = metadata.template get<metadata::Skip>()) {
            skip_reason_ = std::string{skip->reason};
        }
        if (auto params = metadata.template get<metadata::Params>()) {
            for (const auto& param : params->get()) {
                params_.push_back({.name = std::string{param.name}, .default_value = std::string{param.default_value}});
            }
        }
    }

    UnitBase(const UnitBase&) = default;
    UnitBase(UnitBase&&) = default;
    UnitBase& operator=(const UnitBase&) = default;
    UnitBase& operator=(UnitBase&&) = default;

    virtual ~UnitBase() = default;

    virtual void run(UnitContext& ctx) const = 0;

    std::string_view get_name() const { return name_; }

    std::string_view get_source_file() const { return source_file_; }

    /// Topic given through ``metadata::Topic``, if any
    const std::optional<std::string>& get_declared_topic() const { return topic_; }

    const std::vector<std::string>& get_tags() const { return tags_; }

    const std::vector<ParamSpec>& get_params() const { return params_; }

    std::optional<std::chrono::milliseconds> get_timeout() const { return timeout_; }

    const std::optional<std::string>& get_skip_reason() const { return skip_reason_; }

private:
    std::string name_;
    std::string source_file_;

    std::optional<std::string> topic_;
    std::vector<std::string> tags_;
    std::vector<ParamSpec> params_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::optional<std::string> skip_reason_;
};

} // namespace trialrun
