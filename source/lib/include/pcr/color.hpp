#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <dla/vector.h>

#include <opencv2/core/types.hpp>

using ColorRGB8 = dla::tvec3<uint8_t>;
using ColorRGB32f = dla::tvec3<float>;

std::string ColorToHex(const ColorRGB8& color);

// Parses "#rrggbb" or "rrggbb"
std::optional<ColorRGB8> ColorFromHex(std::string_view hex);

// OpenCV stores pixels as BGR(A)
cv::Scalar ColorToScalar(const ColorRGB8& color, uint8_t alpha = 255);
