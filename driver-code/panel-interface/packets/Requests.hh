#pragma once

#include <cstddef>
#include <cstdint>

#include <packets/ControlPacket.hh>

namespace PanelDriver { namespace Packets {

/*
 * What the caller asked for. Several of these share one wire opcode and
 * differ only in which parameter slots are filled, so a decoded packet
 * alone can't tell them apart.
 */
enum class Operation {
    SetImage,
    SetLed,
    ClearImage,
    SaveFile,
    DisplayFile,
    DeleteFile,
    FactoryModeProbe,
};

Request wire_request(Operation op);
const char* operation_name(Operation op);

namespace Requests {

// raw frame, payload of `image_size` bytes follows
ControlPacket set_image(uint8_t page, size_t image_size);

ControlPacket set_led(uint8_t page, uint8_t index, bool value);

ControlPacket clear_image(uint8_t page);

// file contents follow as payload
ControlPacket save_file(uint8_t page, uint8_t file_id, size_t file_size);

ControlPacket display_file(uint8_t page, uint8_t index, uint8_t file_id);

ControlPacket delete_file(uint8_t page, uint8_t file_id);

ControlPacket factory_mode_probe();

}

} }
