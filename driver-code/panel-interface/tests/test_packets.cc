#include <gtest/gtest.h>
#include <array>
#include <vector>

#include <common.hh>
#include <packets/Buttons.hh>
#include <packets/ControlPacket.hh>
#include <packets/Requests.hh>

using namespace PanelDriver;
using namespace PanelDriver::Packets;

TEST(ControlPacket, EncodesBigEndianFieldsInOrder) {
    ControlPacket p{Request::SetLed};
    p.set_server_id(0x01020304);
    p.set_page(7);
    p.set_data_size(0x0a0b);
    p.set_param_1(0xdeadbeef);
    p.set_request_info(0xff);

    auto w = p.encode();
    ASSERT_EQ(w.size(), 44u);

    const std::array<uint8_t, 4> server_id{0x01, 0x02, 0x03, 0x04};
    EXPECT_TRUE(std::equal(server_id.begin(), server_id.end(), w.begin()));
    EXPECT_EQ(w[7], 7);
    EXPECT_EQ(w[10], 0x0a);
    EXPECT_EQ(w[11], 0x0b);
    // request is the sixth word
    EXPECT_EQ(w[20], 0);
    EXPECT_EQ(w[23], 0x18);
    EXPECT_EQ(w[24], 0xde);
    EXPECT_EQ(w[27], 0xef);
    EXPECT_EQ(w[43], 0xff);
}

TEST(ControlPacket, RoundTripKeepsEveryField) {
    ControlPacket p{Request::SaveFile};
    p.set_server_id(0xffffffff);
    p.set_page(255);
    p.set_data_size(123456);
    p.set_header_error(1);
    p.set_header_info(2);
    p.set_param_1(3);
    p.set_param_2(0x80000000);
    p.set_param_3(5);
    p.set_request_error(6);
    p.set_request_info(7);

    auto back = ControlPacket::decode(p.encode());
    EXPECT_EQ(back.server_id(), 0xffffffffu);
    EXPECT_EQ(back.page(), 255);
    EXPECT_EQ(back.data_size(), 123456u);
    EXPECT_EQ(back.header_error(), 1u);
    EXPECT_EQ(back.header_info(), 2u);
    EXPECT_EQ(back.request(), Request::SaveFile);
    EXPECT_EQ(back.param_1(), 3u);
    EXPECT_EQ(back.param_2(), 0x80000000u);
    EXPECT_EQ(back.param_3(), 5u);
    EXPECT_EQ(back.request_error(), 6u);
    EXPECT_EQ(back.request_info(), 7u);
    EXPECT_EQ(back.encode(), p.encode());
}

TEST(ControlPacket, RoundTripAcrossOpcodesPagesAndParams) {
    const Request opcodes[] = {
        Request::FolderRemoved, Request::SaveFile, Request::SetImageFile,
        Request::SetImage, Request::FileOperation, Request::StartServer,
        Request::FactoryModeProbe, Request::ClearImage, Request::SetLed,
    };
    const uint32_t edges[] = {0, 1, 0x7fffffff, 0x80000000, 0xffffffff};

    for (auto op : opcodes) {
        for (unsigned page = 0; page <= 255; ++page) {
            for (auto v : edges) {
                ControlPacket p{op};
                p.set_page(static_cast<uint8_t>(page));
                p.set_server_id(v);
                p.set_data_size(v);
                p.set_param_1(v);
                p.set_param_2(~v);
                p.set_param_3(v);
                p.set_header_error(v);
                p.set_header_info(~v);
                p.set_request_error(~v);
                p.set_request_info(v);

                auto back = ControlPacket::decode(p.encode());
                ASSERT_EQ(back.request(), op) << request_name(op) << " page " << page << " v " << v;
                ASSERT_EQ(back.page(), static_cast<uint8_t>(page));
                ASSERT_EQ(back.server_id(), v);
                ASSERT_EQ(back.data_size(), static_cast<size_t>(v));
                ASSERT_EQ(back.param_1(), v);
                ASSERT_EQ(back.param_2(), ~v);
                ASSERT_EQ(back.param_3(), v);
                ASSERT_EQ(back.header_error(), v);
                ASSERT_EQ(back.header_info(), ~v);
                ASSERT_EQ(back.request_error(), ~v);
                ASSERT_EQ(back.request_info(), v);
                ASSERT_EQ(back.encode(), p.encode());
            }
        }
    }
}

TEST(ControlPacket, NewPacketIsZeroedApartFromRequest) {
    auto w = ControlPacket{Request::ClearImage}.encode();
    for (size_t i = 0; i < w.size(); ++i) {
        if (i == 23) {
            EXPECT_EQ(w[i], 0x13);
        }
        else {
            EXPECT_EQ(w[i], 0) << "byte " << i;
        }
    }
}

TEST(ControlPacket, DecodeRejectsWrongLength) {
    std::vector<uint8_t> short_buf(43, 0);
    EXPECT_THROW(ControlPacket::decode(short_buf), ProtocolViolation);
    std::vector<uint8_t> long_buf(45, 0);
    EXPECT_THROW(ControlPacket::decode(long_buf), ProtocolViolation);
}

TEST(ControlPacket, UnknownOpcodeStillInspectable) {
    std::vector<uint8_t> raw(44, 0);
    raw[23] = 0x55;   // request
    raw[15] = 0x01;   // header_error
    auto p = ControlPacket::decode(raw);
    EXPECT_FALSE(p.request().has_value());
    EXPECT_EQ(p.request_code(), 0x55u);
    EXPECT_TRUE(p.has_error());
    EXPECT_NE(p.to_string().find("unknown(0x55)"), std::string::npos);
}

TEST(ControlPacket, HasErrorIffEitherErrorWordSet) {
    struct Case { uint32_t header; uint32_t request; bool expected; };
    const Case cases[] = {
        {0, 0, false},
        {1, 0, true},
        {0, 9, true},
        {0xffffffff, 0xffffffff, true},
    };
    for (const auto& c : cases) {
        ControlPacket p{Request::SetImage};
        p.set_header_error(c.header);
        p.set_request_error(c.request);
        // info words never count as errors
        p.set_header_info(42);
        p.set_request_info(42);
        EXPECT_EQ(p.has_error(), c.expected) << c.header << "/" << c.request;
    }
}

TEST(ControlPacket, PageAboveByteRangeIsViolation) {
    std::vector<uint8_t> raw(44, 0);
    raw[6] = 0x01;   // page = 256
    auto p = ControlPacket::decode(raw);
    EXPECT_EQ(p.raw_page(), 256u);
    EXPECT_THROW(p.page(), ProtocolViolation);
}

TEST(Requests, CatalogOpcodes) {
    EXPECT_EQ(static_cast<uint32_t>(Request::FolderRemoved), 0x02u);
    EXPECT_EQ(static_cast<uint32_t>(Request::SaveFile), 0x03u);
    EXPECT_EQ(static_cast<uint32_t>(Request::SetImageFile), 0x04u);
    EXPECT_EQ(static_cast<uint32_t>(Request::SetImage), 0x06u);
    EXPECT_EQ(static_cast<uint32_t>(Request::FileOperation), 0x07u);
    EXPECT_EQ(static_cast<uint32_t>(Request::StartServer), 0x09u);
    EXPECT_EQ(static_cast<uint32_t>(Request::FactoryModeProbe), 0x0Au);
    EXPECT_EQ(static_cast<uint32_t>(Request::ClearImage), 0x13u);
    EXPECT_EQ(static_cast<uint32_t>(Request::SetLed), 0x18u);
    EXPECT_FALSE(request_from_code(0x01).has_value());
}

TEST(Requests, SetLedUsesThreeParams) {
    auto p = Requests::set_led(2, 5, true);
    EXPECT_EQ(p.request(), Request::SetLed);
    EXPECT_EQ(p.param_1(), 2u);
    EXPECT_EQ(p.param_2(), 5u);
    EXPECT_EQ(p.param_3(), 1u);
    EXPECT_EQ(p.raw_page(), 0u);
    EXPECT_EQ(p.data_size(), 0u);

    EXPECT_EQ(Requests::set_led(2, 5, false).param_3(), 0u);
}

TEST(Requests, ImageRequestsUsePageField) {
    auto set = Requests::set_image(3, 0x38400);
    EXPECT_EQ(set.request(), Request::SetImage);
    EXPECT_EQ(set.page(), 3);
    EXPECT_EQ(set.data_size(), 0x38400u);

    auto clear = Requests::clear_image(4);
    EXPECT_EQ(clear.request(), Request::ClearImage);
    EXPECT_EQ(clear.page(), 4);
    EXPECT_EQ(clear.data_size(), 0u);
}

TEST(Requests, SaveFileCarriesPageAndFileId) {
    auto p = Requests::save_file(1, 3, 11);
    EXPECT_EQ(p.request(), Request::SaveFile);
    EXPECT_EQ(p.param_1(), 1u);
    EXPECT_EQ(p.param_2(), 0u);
    EXPECT_EQ(p.param_3(), 3u);
    EXPECT_EQ(p.data_size(), 11u);
}

TEST(Requests, DisplayAndDeleteShareOneOpcode) {
    EXPECT_EQ(wire_request(Operation::DisplayFile), wire_request(Operation::DeleteFile));

    auto display = Requests::display_file(1, 2, 3);
    auto del = Requests::delete_file(1, 3);
    EXPECT_EQ(display.request_code(), 0x07u);
    EXPECT_EQ(del.request_code(), 0x07u);

    // only the populated slots tell them apart
    EXPECT_EQ(display.param_1(), 1u);
    EXPECT_EQ(display.param_2(), 2u);
    EXPECT_EQ(display.param_3(), 3u);
    EXPECT_EQ(del.param_1(), 1u);
    EXPECT_EQ(del.param_2(), 0u);
    EXPECT_EQ(del.param_3(), 3u);
}

TEST(Requests, FactoryProbeHasNoParams) {
    auto p = Requests::factory_mode_probe();
    EXPECT_EQ(p.request(), Request::FactoryModeProbe);
    EXPECT_EQ(p.param_1() | p.param_2() | p.param_3() | p.raw_page(), 0u);
    EXPECT_EQ(p.data_size(), 0u);
}

TEST(Buttons, DecodeKnownReports) {
    std::array<uint8_t, 2> s1{0x01, 0x00};
    auto b = ButtonState::decode(s1);
    EXPECT_TRUE(b.pressed(Button::S1));
    EXPECT_EQ(b.bits(), static_cast<uint16_t>(Button::S1));

    std::array<uint8_t, 2> left_cw{0x80, 0x00};
    b = ButtonState::decode(left_cw);
    EXPECT_EQ(b.bits(), static_cast<uint16_t>(Button::LeftClockwise));

    std::array<uint8_t, 2> right_side{0x00, 0x0F};
    b = ButtonState::decode(right_side);
    EXPECT_TRUE(b.pressed(Button::Up));
    EXPECT_TRUE(b.pressed(Button::Down));
    EXPECT_TRUE(b.pressed(Button::RightAnticlockwise));
    EXPECT_TRUE(b.pressed(Button::RightClockwise));
    EXPECT_FALSE(b.pressed(Button::S1));
    EXPECT_EQ(b.to_string(), "[Up, Down, RightAnticlockwise, RightClockwise]");

    std::array<uint8_t, 2> nothing{0x00, 0x00};
    EXPECT_TRUE(ButtonState::decode(nothing).none());
}

TEST(Buttons, ReservedBitsIgnored) {
    std::array<uint8_t, 2> reserved{0x00, 0xF0};
    EXPECT_TRUE(ButtonState::decode(reserved).none());

    std::array<uint8_t, 2> mixed{0x02, 0xF1};
    auto b = ButtonState::decode(mixed);
    EXPECT_EQ(b.bits(), static_cast<uint16_t>(Button::S2) | static_cast<uint16_t>(Button::Up));
}

TEST(Buttons, ChangedFrom) {
    ButtonState before{static_cast<uint16_t>(Button::S1)};
    ButtonState after{static_cast<uint16_t>(Button::S2)};
    auto diff = after.changed_from(before);
    EXPECT_TRUE(diff.pressed(Button::S1));
    EXPECT_TRUE(diff.pressed(Button::S2));
    EXPECT_TRUE(after.changed_from(after).none());
}

TEST(DeviceType, FormatsAsGuid) {
    EXPECT_EQ(PANEL_DEVICE_TYPE.to_string(), "3E083CD8-6A37-4A58-80A8-3D6A2C07513E");
}

int main(int argc, char *argv[]) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
