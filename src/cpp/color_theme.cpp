#include "color_theme.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <sstream>

Color Color::from_hex(const std::string& hex) {
    std::string h = hex;
    // Remove # if present
    if (!h.empty() && h[0] == '#') {
        h = h.substr(1);
    }

    if (h.length() != 6) {
        return Color();
    }
    for (char ch : h) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            return Color();
        }
    }

    unsigned long value = std::stoul(h, nullptr, 16);
    return from_rgb(static_cast<int>((value >> 16) & 0xff),
                    static_cast<int>((value >> 8) & 0xff),
                    static_cast<int>(value & 0xff));
}

std::string Color::ansi_foreground() const {
    if (!set) {
        return "";
    }
    std::ostringstream ss;
    ss << "\033[38;2;" << r << ";" << g << ";" << b << "m";
    return ss.str();
}

Theme Theme::from_yaml(const YAML::Node& node) {
    Theme theme; // Starts with default colors

    if (node["mark-color"]) {
        theme.mark_color = Color::from_hex(node["mark-color"].as<std::string>());
    }
    if (node["heading-color"]) {
        theme.heading_color = Color::from_hex(node["heading-color"].as<std::string>());
    }
    if (node["color"]) {
        theme.enabled = node["color"].as<bool>();
    }

    return theme;
}

std::string Theme::paint(const Color& color, const std::string& text) const {
    if (!enabled || !color.is_set()) {
        return text;
    }
    return color.ansi_foreground() + text + RESET;
}
