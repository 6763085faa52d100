#include "scrivener/label_colors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace folio::scrivener {

namespace {

struct NamedColor {
    std::string_view name;
    int r;
    int g;
    int b;
};

constexpr std::array<NamedColor, 9> kNamedColors = {{
    {"Red", 0xFF, 0x00, 0x00},
    {"Orange", 0xFF, 0x80, 0x00},
    {"Yellow", 0xFF, 0xD7, 0x00},
    {"Green", 0x00, 0xAA, 0x00},
    {"Blue", 0x00, 0x00, 0xFF},
    {"Purple", 0x80, 0x00, 0x80},
    {"Pink", 0xFF, 0x69, 0xB4},
    {"Brown", 0x8B, 0x45, 0x13},
    {"Gray", 0x80, 0x80, 0x80},
}};

// Squared RGB distance beyond which a hex value is not called by any name.
constexpr int kMaxDistance = 120 * 120;

struct Keyword {
    std::string_view word;
    std::string_view color;
};

constexpr std::array<Keyword, 14> kNameKeywords = {{
    {"red", "Red"},
    {"urgent", "Red"},
    {"critical", "Red"},
    {"orange", "Orange"},
    {"important", "Orange"},
    {"yellow", "Yellow"},
    {"review", "Yellow"},
    {"green", "Green"},
    {"done", "Green"},
    {"complete", "Green"},
    {"blue", "Blue"},
    {"info", "Blue"},
    {"purple", "Purple"},
    {"pink", "Pink"},
}};

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<std::string> nearest_color_name(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') hex.remove_prefix(1);
    if (hex.size() != 6) return std::nullopt;

    int rgb[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[i * 2]);
        const int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        rgb[i] = hi * 16 + lo;
    }

    const NamedColor* best = nullptr;
    int best_distance = kMaxDistance + 1;
    for (const auto& c : kNamedColors) {
        const int dr = rgb[0] - c.r;
        const int dg = rgb[1] - c.g;
        const int db = rgb[2] - c.b;
        const int d = dr * dr + dg * dg + db * db;
        if (d < best_distance) {
            best_distance = d;
            best = &c;
        }
    }
    if (!best || best_distance > kMaxDistance) return std::nullopt;
    return std::string(best->name);
}

std::string label_color_name(const Label& label) {
    const auto name = lower(label.name);
    for (const auto& k : kNameKeywords) {
        if (name.find(k.word) != std::string::npos) {
            return std::string(k.color);
        }
    }
    if (auto named = nearest_color_name(label.color_hex)) {
        return *named;
    }
    return "Brown";
}

} // namespace folio::scrivener
