#pragma once
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <LibUsbCpp.hh>

namespace PanelDriver {

// A USB transfer failed. Raised by a Transport and classified by the caller.
class TransportError : public LibUsbCpp::UsbException {
public:
    enum class Kind {
        timeout,
        no_device,
        access_denied,
        other,
    };

    TransportError(Kind kind, int libusb_code, const std::string& what);

    static TransportError from_libusb(int libusb_code, const std::string& context);

    Kind kind() const { return kind_; }

    bool is_timeout() const { return kind_ == Kind::timeout; }
    bool is_no_device() const { return kind_ == Kind::no_device; }
    bool is_access_denied() const { return kind_ == Kind::access_denied; }

private:
    Kind kind_;
};

// The byte stream from the device can no longer be trusted.
class ProtocolViolation : public std::runtime_error {
public:
    ProtocolViolation(const std::string& what) :
        std::runtime_error(what)
    { }
};

// true for an access-denied libusb failure at any setup step
bool is_access_denied(const LibUsbCpp::UsbException& e);

// The device doesn't look the way a panel should; ends one connection attempt.
class InitializationError : public std::runtime_error {
public:
    InitializationError(const std::string& what) :
        std::runtime_error(what)
    { }
};

// GUID-style type identifier the host API reports for this device family.
struct DeviceTypeId {
    uint32_t data1;
    uint16_t data2;
    uint16_t data3;
    std::array<uint8_t, 8> data4;

    std::string to_string() const;
    bool operator==(const DeviceTypeId&) const = default;
};

// there is no way to read it from the device; it is fixed for the family
inline constexpr DeviceTypeId PANEL_DEVICE_TYPE{
    0x3E083CD8, 0x6A37, 0x4A58,
    {0x80, 0xA8, 0x3D, 0x6A, 0x2C, 0x07, 0x51, 0x3E}
};

}
