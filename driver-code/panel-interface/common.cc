#include <iomanip>
#include <sstream>

#include <common.hh>

namespace PanelDriver {

TransportError::TransportError(Kind kind, int libusb_code, const std::string& what) :
    LibUsbCpp::UsbException(what, libusb_code),
    kind_(kind)
{ }

bool is_access_denied(const LibUsbCpp::UsbException& e) {
    return e.code() == LIBUSB_ERROR_ACCESS;
}

TransportError TransportError::from_libusb(int libusb_code, const std::string& context) {
    Kind kind;
    switch (libusb_code) {
        case LIBUSB_ERROR_TIMEOUT:
            kind = Kind::timeout;
            break;
        case LIBUSB_ERROR_NO_DEVICE:
            kind = Kind::no_device;
            break;
        case LIBUSB_ERROR_ACCESS:
            kind = Kind::access_denied;
            break;
        default:
            kind = Kind::other;
            break;
    }
    return TransportError{kind, libusb_code, context + ": " + libusb_strerror(libusb_code)};
}

std::string DeviceTypeId::to_string() const {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0')
       << std::setw(8) << data1 << '-'
       << std::setw(4) << data2 << '-'
       << std::setw(4) << data3 << '-'
       << std::setw(2) << +data4[0] << std::setw(2) << +data4[1] << '-';
    for (size_t i = 2; i < data4.size(); ++i) {
        ss << std::setw(2) << +data4[i];
    }
    return ss.str();
}

}
