// filename: color.hpp
// part of 2D Faction Territory Mapper
// MIT License

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "territory/types.hpp"

namespace territory {

// Packed 0xRRGGBB.
using Rgb = std::uint32_t;

using ColorOverrides = std::unordered_map<FactionId, Rgb>;

/**
 * @brief Trim, unwrap an embedded @UUID[...] reference and map empty keys to "neutral".
 */
[[nodiscard]] FactionId normalizeFactionKey(const std::string& raw);

/**
 * @brief Stable hue in [0, 360) from a 32-bit wrapping h = h * 31 + byte string hash.
 */
[[nodiscard]] int hashStringToHue(const std::string& text);

/**
 * @brief HSL to packed RGB.
 * @param hue degrees in [0, 360)
 * @param saturation percent
 * @param lightness percent
 */
[[nodiscard]] Rgb hslToRgb(double hue, double saturation, double lightness);

/**
 * @brief Parse "#RRGGBB", "#RGB" (leading '#' optional).
 */
[[nodiscard]] std::optional<Rgb> parseCssHexColor(const std::string& text);

/**
 * @brief Display color of a faction: the override when present, else a hashed hue at
 *        65% saturation and 50% lightness.
 */
[[nodiscard]] Rgb resolveFactionColor(const FactionId& faction, const ColorOverrides& overrides);

[[nodiscard]] std::string formatHexColor(Rgb color);

}  // namespace territory
