/**
 * @file ftp_reply_test.cpp
 * @brief Unit tests for FTP reply parsing and classification
 */

#include "clamftp/FtpReply.h"
#include <gtest/gtest.h>

using namespace ClamFtp;

TEST(FtpReplyTest, ParsesCodeAndMessage) {
    FtpReply reply = FtpReply::parse("220 Service ready\r\n");

    EXPECT_EQ(reply.code(), 220);
    EXPECT_EQ(reply.message(), "Service ready");
    EXPECT_EQ(reply.raw(), "220 Service ready\r\n");
    EXPECT_TRUE(reply.hasCode());
    EXPECT_TRUE(reply.isPositive());
    EXPECT_EQ(reply.toString(), "220 Service ready");
}

TEST(FtpReplyTest, OnlyFirstLineOfMultiLineReplyIsClassified) {
    FtpReply reply = FtpReply::parse("230-Welcome\r\n   to the server\r\n230 Login successful\r\n");

    EXPECT_EQ(reply.code(), 230);
    EXPECT_EQ(reply.message(), "Welcome");
}

TEST(FtpReplyTest, ClassesPartitionTheCodeRange) {
    for (int code = 100; code <= 599; ++code) {
        FtpReply reply = FtpReply::parse(std::to_string(code) + " text");
        const int classes = static_cast<int>(reply.isPreliminary()) +
                            static_cast<int>(reply.isPositive()) +
                            static_cast<int>(reply.isIntermediate()) +
                            static_cast<int>(reply.isError());
        EXPECT_EQ(classes, 1) << "code " << code;
        EXPECT_FALSE(reply.isMalformed());
    }
}

TEST(FtpReplyTest, ClassificationMatchesFirstDigit) {
    EXPECT_TRUE(FtpReply::parse("150 Opening data connection").isPreliminary());
    EXPECT_TRUE(FtpReply::parse("226 Transfer complete").isPositive());
    EXPECT_TRUE(FtpReply::parse("331 Password required").isIntermediate());
    EXPECT_TRUE(FtpReply::parse("421 Service not available").isError());
    EXPECT_TRUE(FtpReply::parse("550 No such file").isError());
}

TEST(FtpReplyTest, NonNumericReplyIsMalformed) {
    FtpReply reply = FtpReply::parse("hello there");

    EXPECT_EQ(reply.code(), 0);
    EXPECT_TRUE(reply.isMalformed());
    EXPECT_FALSE(reply.isPositive());
    EXPECT_FALSE(reply.isError());
    EXPECT_EQ(reply.toString(), "<malformed reply> hello there");
}

TEST(FtpReplyTest, ShortAndEmptyRepliesAreMalformed) {
    EXPECT_TRUE(FtpReply::parse("").isMalformed());
    EXPECT_TRUE(FtpReply::parse("22").isMalformed());
    EXPECT_TRUE(FtpReply::parse("2x0 nope").isMalformed());
}

TEST(FtpReplyTest, ThreeDigitsOutsideReplyRangeAreMalformed) {
    EXPECT_TRUE(FtpReply::parse("000 zero").isMalformed());
    EXPECT_TRUE(FtpReply::parse("099 low").isMalformed());
    EXPECT_TRUE(FtpReply::parse("600 high").isMalformed());
}

TEST(FtpReplyTest, BareCodeHasEmptyMessage) {
    FtpReply reply = FtpReply::parse("200");

    EXPECT_EQ(reply.code(), 200);
    EXPECT_TRUE(reply.message().empty());
}
