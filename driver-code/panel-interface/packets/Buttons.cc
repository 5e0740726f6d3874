#include <array>

#include <packets/Buttons.hh>

namespace PanelDriver { namespace Packets {

namespace {
constexpr std::array<Button, 12> ALL_BUTTONS{
    Button::S1, Button::S2, Button::S3, Button::S4, Button::S5, Button::S6,
    Button::LeftAnticlockwise, Button::LeftClockwise,
    Button::Up, Button::Down,
    Button::RightAnticlockwise, Button::RightClockwise,
};
}

ButtonState ButtonState::decode(std::span<const uint8_t, REPORT_SZ> report) {
    uint16_t raw = static_cast<uint16_t>((report[0] << 8) | report[1]);
    return ButtonState(raw);
}

const char* button_name(Button b) {
    switch (b) {
        case Button::S1: return "S1";
        case Button::S2: return "S2";
        case Button::S3: return "S3";
        case Button::S4: return "S4";
        case Button::S5: return "S5";
        case Button::S6: return "S6";
        case Button::LeftAnticlockwise: return "LeftAnticlockwise";
        case Button::LeftClockwise: return "LeftClockwise";
        case Button::Up: return "Up";
        case Button::Down: return "Down";
        case Button::RightAnticlockwise: return "RightAnticlockwise";
        case Button::RightClockwise: return "RightClockwise";
    }
    return "?";
}

std::string ButtonState::to_string() const {
    std::string out{"["};
    bool first = true;
    for (auto b : ALL_BUTTONS) {
        if (!pressed(b)) continue;
        if (!first) out += ", ";
        out += button_name(b);
        first = false;
    }
    out += "]";
    return out;
}

} }
