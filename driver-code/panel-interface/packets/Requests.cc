#include <stdexcept>

#include <packets/Requests.hh>

namespace PanelDriver { namespace Packets {

Request wire_request(Operation op) {
    switch (op) {
        case Operation::SetImage: return Request::SetImage;
        case Operation::SetLed: return Request::SetLed;
        case Operation::ClearImage: return Request::ClearImage;
        case Operation::SaveFile: return Request::SaveFile;
        case Operation::DisplayFile: return Request::FileOperation;
        case Operation::DeleteFile: return Request::FileOperation;
        case Operation::FactoryModeProbe: return Request::FactoryModeProbe;
    }
    throw std::invalid_argument{"unknown operation"};
}

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::SetImage: return "set_image";
        case Operation::SetLed: return "set_led";
        case Operation::ClearImage: return "clear_image";
        case Operation::SaveFile: return "save_file";
        case Operation::DisplayFile: return "display_file";
        case Operation::DeleteFile: return "delete_file";
        case Operation::FactoryModeProbe: return "factory_mode_probe";
    }
    return "?";
}

namespace Requests {

ControlPacket set_image(uint8_t page, size_t image_size) {
    ControlPacket p{wire_request(Operation::SetImage)};
    p.set_page(page);
    p.set_data_size(image_size);
    return p;
}

ControlPacket set_led(uint8_t page, uint8_t index, bool value) {
    ControlPacket p{wire_request(Operation::SetLed)};
    p.set_param_1(page);
    p.set_param_2(index);
    p.set_param_3(value ? 1 : 0);
    return p;
}

ControlPacket clear_image(uint8_t page) {
    ControlPacket p{wire_request(Operation::ClearImage)};
    p.set_page(page);
    return p;
}

ControlPacket save_file(uint8_t page, uint8_t file_id, size_t file_size) {
    ControlPacket p{wire_request(Operation::SaveFile)};
    p.set_param_1(page);
    p.set_param_3(file_id);
    p.set_data_size(file_size);
    return p;
}

ControlPacket display_file(uint8_t page, uint8_t index, uint8_t file_id) {
    ControlPacket p{wire_request(Operation::DisplayFile)};
    p.set_param_1(page);
    p.set_param_2(index);
    p.set_param_3(file_id);
    return p;
}

ControlPacket delete_file(uint8_t page, uint8_t file_id) {
    // same opcode as display_file, param_2 left empty
    ControlPacket p{wire_request(Operation::DeleteFile)};
    p.set_param_1(page);
    p.set_param_3(file_id);
    return p;
}

ControlPacket factory_mode_probe() {
    return ControlPacket{wire_request(Operation::FactoryModeProbe)};
}

}

} }
