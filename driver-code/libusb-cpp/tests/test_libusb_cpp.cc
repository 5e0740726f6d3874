#include <gtest/gtest.h>
#include <vector>

#include <LibUsbCpp.hh>

using LibUsbCpp::UsbException;
using LibUsbCpp::ascii_from_string_descriptor;

TEST(StringDescriptor, DecodesAsciiSerial) {
    // bLength, bDescriptorType, then "A1b2" in UTF-16LE
    std::vector<unsigned char> desc{10, LIBUSB_DT_STRING, 'A', 0, '1', 0, 'b', 0, '2', 0};
    EXPECT_EQ(ascii_from_string_descriptor(desc), "A1b2");
}

TEST(StringDescriptor, NonAsciiBecomesPlaceholder) {
    std::vector<unsigned char> desc{6, LIBUSB_DT_STRING, 'X', 0, 0xe9, 0x00};
    EXPECT_EQ(ascii_from_string_descriptor(desc), "X?");

    std::vector<unsigned char> wide{4, LIBUSB_DT_STRING, 0x34, 0x12};
    EXPECT_EQ(ascii_from_string_descriptor(wide), "?");
}

TEST(StringDescriptor, EmptyString) {
    std::vector<unsigned char> desc{2, LIBUSB_DT_STRING};
    EXPECT_EQ(ascii_from_string_descriptor(desc), "");
}

TEST(StringDescriptor, StopsAtDeclaredLength) {
    // the transfer returned more than bLength claims
    std::vector<unsigned char> desc{4, LIBUSB_DT_STRING, 'O', 0, 'K', 0};
    EXPECT_EQ(ascii_from_string_descriptor(desc), "O");
}

TEST(StringDescriptor, RejectsMalformed) {
    std::vector<unsigned char> too_short{2};
    EXPECT_THROW(ascii_from_string_descriptor(too_short), UsbException);

    std::vector<unsigned char> wrong_type{4, LIBUSB_DT_DEVICE, 'A', 0};
    EXPECT_THROW(ascii_from_string_descriptor(wrong_type), UsbException);

    // claims more bytes than were transferred
    std::vector<unsigned char> truncated{10, LIBUSB_DT_STRING, 'A', 0};
    EXPECT_THROW(ascii_from_string_descriptor(truncated), UsbException);

    std::vector<unsigned char> bad_length{1, LIBUSB_DT_STRING};
    EXPECT_THROW(ascii_from_string_descriptor(bad_length), UsbException);
}

int main(int argc, char *argv[]) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
