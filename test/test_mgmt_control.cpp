#include <gtest/gtest.h>
#include <vector>
#include "mgmt_control.h"

using namespace mgmt_control;

TEST(MgmtControl, ParseIndex) {
    uint16_t index = 99;
    EXPECT_TRUE(parse_index("hci0", index));
    EXPECT_EQ(index, 0);
    EXPECT_TRUE(parse_index("hci12", index));
    EXPECT_EQ(index, 12);
    EXPECT_FALSE(parse_index("hci", index));
    EXPECT_FALSE(parse_index("usb0", index));
    EXPECT_FALSE(parse_index("hci1a", index));
}

TEST(MgmtControl, BuildCommand) {
    EXPECT_EQ(build_command(OP_SET_BREDR, 1, {0x00}),
              (std::vector<uint8_t>{0x2A, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00}));
    EXPECT_EQ(build_command(OP_READ_INFO, 0, {}).size(), HEADER_SIZE);
}

TEST(MgmtControl, ParseCommandComplete) {
    // CMD_COMPLETE, index 0, len 7: opcode SET_LE, status 0, 4 bytes settings
    std::vector<uint8_t> pkt = {0x01, 0x00, 0x00, 0x00, 0x07, 0x00,
                                0x0D, 0x00, 0x00, 0x01, 0x02, 0x00, 0x00};
    Reply r;
    ASSERT_TRUE(parse_reply(pkt.data(), pkt.size(), OP_SET_LE, 0, r));
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.data, (std::vector<uint8_t>{0x01, 0x02, 0x00, 0x00}));

    EXPECT_FALSE(parse_reply(pkt.data(), pkt.size(), OP_SET_BREDR, 0, r));
    EXPECT_FALSE(parse_reply(pkt.data(), pkt.size(), OP_SET_LE, 1, r));
    EXPECT_FALSE(parse_reply(pkt.data(), 8, OP_SET_LE, 0, r));
}

TEST(MgmtControl, ParseCommandStatusError) {
    std::vector<uint8_t> pkt = {0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 0x2A, 0x00, 0x0C};
    Reply r;
    ASSERT_TRUE(parse_reply(pkt.data(), pkt.size(), OP_SET_BREDR, 0, r));
    EXPECT_EQ(r.status, 0x0C);
    EXPECT_TRUE(r.data.empty());
}

TEST(MgmtControl, CurrentSettingsFromReadInfo) {
    Reply info{OP_READ_INFO, 0, std::vector<uint8_t>(280, 0)};
    info.data[13] = 0x81;  // powered + BR/EDR
    info.data[14] = 0x02;  // LE
    uint32_t settings = 0;
    ASSERT_TRUE(current_settings(info, settings));
    EXPECT_TRUE(settings & SETTING_POWERED);
    EXPECT_TRUE(settings & SETTING_BREDR);
    EXPECT_TRUE(settings & SETTING_LE);

    Reply short_info{OP_READ_INFO, 0, std::vector<uint8_t>(10, 0)};
    EXPECT_FALSE(current_settings(short_info, settings));
}
