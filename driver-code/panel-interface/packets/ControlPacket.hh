#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace PanelDriver { namespace Packets {

// Wire opcodes. Some are reused for different operations; see Operation.
enum class Request : uint32_t {
    FolderRemoved = 0x02,    // meaning uncertain
    SaveFile = 0x03,
    SetImageFile = 0x04,
    SetImage = 0x06,
    FileOperation = 0x07,    // display or delete, by which params are set
    StartServer = 0x09,
    FactoryModeProbe = 0x0A, // semantics uncertain
    ClearImage = 0x13,
    SetLed = 0x18,
};

std::optional<Request> request_from_code(uint32_t code);
const char* request_name(Request r);

// Error and info words of a response.
struct StatusWords {
    uint32_t header_error;
    uint32_t header_info;
    uint32_t request_error;
    uint32_t request_info;
};

/*
 * Fixed 44 byte envelope of the vendor protocol: eleven big-endian
 * 32-bit words, no padding. `data_size` announces a payload that
 * follows on the same endpoint.
 */
class ControlPacket {
public:
    static constexpr size_t NUM_FIELDS = 11;
    static constexpr size_t WIRE_SZ = NUM_FIELDS * sizeof(uint32_t);
    using wire_t = std::array<uint8_t, WIRE_SZ>;

    explicit ControlPacket(Request request);

    static ControlPacket decode(std::span<const uint8_t> bytes);
    wire_t encode() const;

    uint32_t server_id() const { return server_id_; }
    void set_server_id(uint32_t v) { server_id_ = v; }

    // throws ProtocolViolation if the stored value doesn't fit a page
    uint8_t page() const;
    uint32_t raw_page() const { return page_; }
    void set_page(uint8_t v) { page_ = v; }

    size_t data_size() const { return data_size_; }
    void set_data_size(size_t v);

    uint32_t header_error() const { return header_error_; }
    void set_header_error(uint32_t v) { header_error_ = v; }
    uint32_t header_info() const { return header_info_; }
    void set_header_info(uint32_t v) { header_info_ = v; }

    // std::nullopt when the opcode isn't one we know
    std::optional<Request> request() const { return request_from_code(request_); }
    uint32_t request_code() const { return request_; }
    void set_request(Request r) { request_ = static_cast<uint32_t>(r); }

    uint32_t param_1() const { return param_1_; }
    void set_param_1(uint32_t v) { param_1_ = v; }
    uint32_t param_2() const { return param_2_; }
    void set_param_2(uint32_t v) { param_2_ = v; }
    uint32_t param_3() const { return param_3_; }
    void set_param_3(uint32_t v) { param_3_ = v; }

    uint32_t request_error() const { return request_error_; }
    void set_request_error(uint32_t v) { request_error_ = v; }
    uint32_t request_info() const { return request_info_; }
    void set_request_info(uint32_t v) { request_info_ = v; }

    bool has_error() const
    { return header_error_ > 0 || request_error_ > 0; }

    StatusWords status() const
    { return {header_error_, header_info_, request_error_, request_info_}; }

    std::string to_string() const;

private:
    ControlPacket() = default;

    uint32_t server_id_ = 0;
    uint32_t page_ = 0;
    uint32_t data_size_ = 0;
    uint32_t header_error_ = 0;
    uint32_t header_info_ = 0;
    uint32_t request_ = 0;
    uint32_t param_1_ = 0;
    uint32_t param_2_ = 0;
    uint32_t param_3_ = 0;
    uint32_t request_error_ = 0;
    uint32_t request_info_ = 0;
};

} }
