#pragma once

#include <string>

// Forward declaration for YAML
namespace YAML {
    class Node;
}

struct Color {
    int r, g, b;
    bool set;

    // Default: unset (text printed without escape codes)
    Color() : r(0), g(0), b(0), set(false) {}

    // From RGB values (0-255)
    static Color from_rgb(int red, int green, int blue) {
        Color c;
        c.r = red;
        c.g = green;
        c.b = blue;
        c.set = true;
        return c;
    }

    // From hex string (#RRGGBB); anything unparsable yields an unset color
    static Color from_hex(const std::string& hex);

    // 24-bit ANSI foreground escape, empty when unset
    std::string ansi_foreground() const;

    bool is_set() const { return set; }
};

struct Theme {
    static constexpr const char* RESET = "\033[0;0m";

    Color mark_color;           // Mark names in listings and suggestions
    Color heading_color;        // Menu section headings
    bool enabled = true;        // false when color is off or stderr is not a terminal

    Theme() {
        mark_color = Color::from_rgb(0, 175, 135);
    }

    // Parse mark-color, heading-color and color from a config node
    static Theme from_yaml(const YAML::Node& node);

    std::string paint(const Color& color, const std::string& text) const;
    std::string mark(const std::string& name) const { return paint(mark_color, name); }
    std::string heading(const std::string& text) const { return paint(heading_color, text); }
};
