#include "symcli/render_mode.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

namespace symcli {

namespace {

std::string_view AnsiCode(const Color color) {
    switch (color) {
        case Color::Red:
            return "\033[31m";
        case Color::Green:
            return "\033[32m";
        case Color::Yellow:
            return "\033[33m";
        case Color::Blue:
            return "\033[34m";
        case Color::Bold:
            return "\033[1m";
        case Color::Dim:
            return "\033[2m";
    }
    return "";
}

constexpr std::string_view kReset = "\033[0m";

}  // namespace

RenderMode RenderMode::Detect(const bool no_color_flag, const bool stream_is_terminal) {
    RenderMode mode;
    if (no_color_flag) {
        return mode;
    }
    const char* no_color_env = std::getenv("NO_COLOR");
    if (no_color_env != nullptr && no_color_env[0] != '\0') {
        return mode;
    }
    mode.color = stream_is_terminal;
    return mode;
}

std::string RenderMode::Paint(const std::string_view text, const Color color) const {
    if (!this->color) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size() + 10);
    out += AnsiCode(color);
    out += text;
    out += kReset;
    return out;
}

}  // namespace symcli
