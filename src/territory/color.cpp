// filename: color.cpp
// part of 2D Faction Territory Mapper
// MIT License

#include "territory/color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace territory {
namespace {

constexpr double kHashedSaturation = 65.0;
constexpr double kHashedLightness = 50.0;

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

}  // namespace

FactionId normalizeFactionKey(const std::string& raw) {
    std::string key = trim(raw);
    const std::string marker = "@UUID[";
    const std::size_t open = key.find(marker);
    if (open != std::string::npos) {
        const std::size_t innerBegin = open + marker.size();
        const std::size_t close = key.find(']', innerBegin);
        if (close != std::string::npos && close > innerBegin) {
            key = trim(key.substr(innerBegin, close - innerBegin));
        }
    }
    if (key.empty()) {
        return kNeutralFaction;
    }
    return key;
}

int hashStringToHue(const std::string& text) {
    std::uint32_t hash = 0;
    for (const char c : text) {
        hash = hash * 31U + static_cast<unsigned char>(c);
    }
    const auto signedHash = static_cast<std::int64_t>(static_cast<std::int32_t>(hash));
    return static_cast<int>(std::llabs(signedHash) % 360);
}

Rgb hslToRgb(double hue, double saturation, double lightness) {
    const double s = saturation / 100.0;
    const double l = lightness / 100.0;
    const double c = (1.0 - std::abs(2.0 * l - 1.0)) * s;
    const double x = c * (1.0 - std::abs(std::fmod(hue / 60.0, 2.0) - 1.0));
    const double m = l - c / 2.0;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    if (hue < 60.0) {
        r = c;
        g = x;
    } else if (hue < 120.0) {
        r = x;
        g = c;
    } else if (hue < 180.0) {
        g = c;
        b = x;
    } else if (hue < 240.0) {
        g = x;
        b = c;
    } else if (hue < 300.0) {
        r = x;
        b = c;
    } else {
        r = c;
        b = x;
    }

    const auto to255 = [m](double v) {
        const double scaled = std::round((v + m) * 255.0);
        return static_cast<Rgb>(std::clamp(scaled, 0.0, 255.0));
    };
    return (to255(r) << 16U) | (to255(g) << 8U) | to255(b);
}

std::optional<Rgb> parseCssHexColor(const std::string& text) {
    std::string hex = trim(text);
    if (!hex.empty() && hex.front() == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() != 6 && hex.size() != 3) {
        return std::nullopt;
    }

    Rgb value = 0;
    for (const char c : hex) {
        const int digit = hexDigit(c);
        if (digit < 0) {
            return std::nullopt;
        }
        value = (value << 4U) | static_cast<Rgb>(digit);
        if (hex.size() == 3) {
            value = (value << 4U) | static_cast<Rgb>(digit);
        }
    }
    return value;
}

Rgb resolveFactionColor(const FactionId& faction, const ColorOverrides& overrides) {
    const FactionId key = normalizeFactionKey(faction);
    const auto it = overrides.find(key);
    if (it != overrides.end()) {
        return it->second;
    }
    return hslToRgb(static_cast<double>(hashStringToHue(key)), kHashedSaturation, kHashedLightness);
}

std::string formatHexColor(Rgb color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%06x", static_cast<unsigned>(color & 0xFFFFFFU));
    return std::string(buffer);
}

}  // namespace territory
