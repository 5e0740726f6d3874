#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace PanelDriver { namespace Packets {

// Bit positions in the 16-bit report, high byte first on the wire.
enum class Button : uint16_t {
    S1 = 0x0100,
    S2 = 0x0200,
    S3 = 0x0400,
    S4 = 0x0800,
    S5 = 0x1000,
    S6 = 0x2000,
    LeftAnticlockwise = 0x4000,
    LeftClockwise = 0x8000,
    Up = 0x0001,
    Down = 0x0002,
    RightAnticlockwise = 0x0004,
    RightClockwise = 0x0008,
};

class ButtonState {
public:
    static constexpr size_t REPORT_SZ = 2;
    static constexpr uint16_t KNOWN_BITS = 0xff0f;

    ButtonState() = default;
    explicit ButtonState(uint16_t bits) : bits_(bits & KNOWN_BITS) { }

    // reserved bits are dropped, not rejected
    static ButtonState decode(std::span<const uint8_t, REPORT_SZ> report);

    uint16_t bits() const { return bits_; }
    bool pressed(Button b) const { return (bits_ & static_cast<uint16_t>(b)) != 0; }
    bool none() const { return bits_ == 0; }

    // buttons whose state differs from `previous`
    ButtonState changed_from(ButtonState previous) const
    { return ButtonState(bits_ ^ previous.bits_); }

    std::string to_string() const;

    bool operator==(const ButtonState&) const = default;

private:
    uint16_t bits_ = 0;
};

const char* button_name(Button b);

} }
