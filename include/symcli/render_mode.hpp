#pragma once

#include <string>
#include <string_view>

namespace symcli {

enum class Color { Red, Green, Yellow, Blue, Bold, Dim };

// Explicit presentation parameter for every text builder. Color is never a
// process-wide switch.
struct RenderMode {
    bool color = false;

    // Color only when the stream is a terminal, NO_COLOR is unset and
    // --no-color was not given.
    static RenderMode Detect(bool no_color_flag, bool stream_is_terminal);

    std::string Paint(std::string_view text, Color color) const;
};

}  // namespace symcli
