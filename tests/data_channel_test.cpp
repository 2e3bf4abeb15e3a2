/**
 * @file data_channel_test.cpp
 * @brief Unit tests for PASV/PORT address encoding
 */

#include "clamftp/DataChannel.h"
#include <gtest/gtest.h>

using namespace ClamFtp;

TEST(DataChannelTest, EncodesPortAsHighAndLowByte) {
    EXPECT_EQ(DataChannel::encodeHostPort("192.168.1.100", 5141), "192,168,1,100,20,21");
    EXPECT_EQ(DataChannel::encodeHostPort("127.0.0.1", 21), "127,0,0,1,0,21");
    EXPECT_EQ(DataChannel::encodeHostPort("10.0.0.1", 65535), "10,0,0,1,255,255");
}

TEST(DataChannelTest, BuildsActiveCommandPayload) {
    EXPECT_EQ(DataChannel::buildActiveCommandPayload("192.168.1.100", 5141), "PORT 192,168,1,100,20,21");
}

TEST(DataChannelTest, InvalidAddressEncodesToEmpty) {
    EXPECT_EQ(DataChannel::encodeHostPort("not-an-ip", 21), "");
    EXPECT_EQ(DataChannel::buildActiveCommandPayload("300.1.1.1", 21), "");
}

TEST(DataChannelTest, ParsesPassiveReply) {
    HostPort endpoint;
    ASSERT_TRUE(DataChannel::parsePassiveReply("Entering Passive Mode (192,168,1,100,20,21).", endpoint));

    EXPECT_EQ(endpoint.ip, "192.168.1.100");
    EXPECT_EQ(endpoint.port, 5141);
}

TEST(DataChannelTest, ParsesPassiveReplyWithSpaces) {
    HostPort endpoint;
    ASSERT_TRUE(DataChannel::parsePassiveReply("Entering Passive Mode (10, 0, 0, 5, 4, 1)", endpoint));

    EXPECT_EQ(endpoint.ip, "10.0.0.5");
    EXPECT_EQ(endpoint.port, 1025);
}

TEST(DataChannelTest, RejectsMalformedPassiveReplies) {
    HostPort endpoint;
    EXPECT_FALSE(DataChannel::parsePassiveReply("Entering Passive Mode", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("Entering Passive Mode (192,168,1,100,20", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(192,168,1,100,20)", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(192,168,1,100,20,21,7)", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(192,168,1,256,20,21)", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(192,168,1,-1,20,21)", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(192,168,,100,20,21)", endpoint));
    EXPECT_FALSE(DataChannel::parsePassiveReply("(a,b,c,d,e,f)", endpoint));
}

TEST(DataChannelTest, DecodeReversesEncode) {
    const HostPort samples[] = {
        {"0.0.0.0", 0},
        {"127.0.0.1", 1},
        {"192.168.1.100", 5141},
        {"255.255.255.255", 65535},
        {"10.20.30.40", 256},
    };

    for (const auto& sample : samples) {
        HostPort decoded;
        ASSERT_TRUE(DataChannel::decodeHostPort(DataChannel::encodeHostPort(sample.ip, sample.port), decoded));
        EXPECT_EQ(decoded, sample);
    }
}
