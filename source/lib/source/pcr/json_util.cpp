#include <pcr/json_util.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

namespace
{
auto SplitPath(std::string_view path)
{
    static constexpr auto c_ToStrings{ std::views::transform(
        [](auto str)
        { return std::string(str.begin(), str.end()); }) };
    return path | std::views::split('.') | c_ToStrings;
}
} // namespace

const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path)
{
    std::reference_wrapper target_json{ root };
    for (const std::string& path_part : SplitPath(path))
    {
        if (!target_json.get().is_object() || !target_json.get().contains(path_part))
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        target_json = std::cref(target_json.get()[path_part]);
    }
    return target_json;
}

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value)
{
    std::reference_wrapper target_json{ root };
    for (const std::string& path_part : SplitPath(path))
    {
        if (target_json.get().is_null())
        {
            target_json.get() = nlohmann::json::object();
        }
        else if (!target_json.get().is_object())
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        target_json = std::ref(target_json.get()[path_part]);
    }

    target_json.get() = std::move(value);
    return target_json.get();
}

void ApplyJsonOverrides(nlohmann::json& root, const JsonOverrides& overrides)
{
    for (const auto& [path, value] : overrides)
    {
        try
        {
            // Try parsing the override as a literal ...
            SetJsonValue(root, path, nlohmann::json::parse(value));
        }
        catch (const nlohmann::json::parse_error&)
        {
            // ... and keep it as a string if that's not possible.
            SetJsonValue(root, path, value);
        }
    }
}
