#include <limits>
#include <sstream>
#include <stdexcept>

#include <common.hh>
#include <packets/ControlPacket.hh>

namespace PanelDriver { namespace Packets {

namespace {

void put_u32(uint8_t*& p, uint32_t v) {
    *p++ = static_cast<uint8_t>((v >> 24) & 0xff);
    *p++ = static_cast<uint8_t>((v >> 16) & 0xff);
    *p++ = static_cast<uint8_t>((v >> 8) & 0xff);
    *p++ = static_cast<uint8_t>(v & 0xff);
}

uint32_t get_u32(const uint8_t*& p) {
    uint32_t v = static_cast<uint32_t>(*p++) << 24;
    v |= static_cast<uint32_t>(*p++) << 16;
    v |= static_cast<uint32_t>(*p++) << 8;
    v |= static_cast<uint32_t>(*p++);
    return v;
}

}

std::optional<Request> request_from_code(uint32_t code) {
    switch (code) {
        case 0x02: return Request::FolderRemoved;
        case 0x03: return Request::SaveFile;
        case 0x04: return Request::SetImageFile;
        case 0x06: return Request::SetImage;
        case 0x07: return Request::FileOperation;
        case 0x09: return Request::StartServer;
        case 0x0A: return Request::FactoryModeProbe;
        case 0x13: return Request::ClearImage;
        case 0x18: return Request::SetLed;
        default: return std::nullopt;
    }
}

const char* request_name(Request r) {
    switch (r) {
        case Request::FolderRemoved: return "FolderRemoved";
        case Request::SaveFile: return "SaveFile";
        case Request::SetImageFile: return "SetImageFile";
        case Request::SetImage: return "SetImage";
        case Request::FileOperation: return "FileOperation";
        case Request::StartServer: return "StartServer";
        case Request::FactoryModeProbe: return "FactoryModeProbe";
        case Request::ClearImage: return "ClearImage";
        case Request::SetLed: return "SetLed";
    }
    return "?";
}

ControlPacket::ControlPacket(Request request) :
    request_(static_cast<uint32_t>(request))
{ }

ControlPacket ControlPacket::decode(std::span<const uint8_t> bytes) {
    if (bytes.size() != WIRE_SZ) {
        std::stringstream ss;
        ss << "control packet must be " << WIRE_SZ
           << " bytes, got " << bytes.size();
        throw ProtocolViolation{ss.str()};
    }

    const uint8_t* p = bytes.data();
    ControlPacket cp;
    cp.server_id_ = get_u32(p);
    cp.page_ = get_u32(p);
    cp.data_size_ = get_u32(p);
    cp.header_error_ = get_u32(p);
    cp.header_info_ = get_u32(p);
    cp.request_ = get_u32(p);
    cp.param_1_ = get_u32(p);
    cp.param_2_ = get_u32(p);
    cp.param_3_ = get_u32(p);
    cp.request_error_ = get_u32(p);
    cp.request_info_ = get_u32(p);
    return cp;
}

ControlPacket::wire_t ControlPacket::encode() const {
    wire_t out{};
    uint8_t* p = out.data();
    put_u32(p, server_id_);
    put_u32(p, page_);
    put_u32(p, data_size_);
    put_u32(p, header_error_);
    put_u32(p, header_info_);
    put_u32(p, request_);
    put_u32(p, param_1_);
    put_u32(p, param_2_);
    put_u32(p, param_3_);
    put_u32(p, request_error_);
    put_u32(p, request_info_);
    return out;
}

uint8_t ControlPacket::page() const {
    if (page_ > std::numeric_limits<uint8_t>::max()) {
        throw ProtocolViolation{"page out of range: " + std::to_string(page_)};
    }
    return static_cast<uint8_t>(page_);
}

void ControlPacket::set_data_size(size_t v) {
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error{"payload too large for a control packet"};
    }
    data_size_ = static_cast<uint32_t>(v);
}

std::string ControlPacket::to_string() const {
    std::stringstream ss;
    auto req = request();
    ss << "ControlPacket{request=";
    if (req) ss << request_name(*req);
    else ss << "unknown(0x" << std::hex << request_ << std::dec << ")";
    ss << " server_id=" << server_id_
       << " page=" << page_
       << " data_size=" << data_size_
       << " params=(" << param_1_ << ", " << param_2_ << ", " << param_3_ << ")"
       << " header_error=" << header_error_
       << " header_info=" << header_info_
       << " request_error=" << request_error_
       << " request_info=" << request_info_
       << "}";
    return ss.str();
}

} }
