#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

// Paths are dot separated, e.g. "layout.body.line_spacing"
const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path);

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);

using JsonOverrides = std::unordered_map<std::string, std::string>;

// Each value is parsed as a json literal, or kept as a string if that is not possible
void ApplyJsonOverrides(nlohmann::json& root, const JsonOverrides& overrides);
