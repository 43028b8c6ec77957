#include "ping_parser.hpp"
#include <gtest/gtest.h>

TEST(PingParserTest, ParsesFpingSummary) {
    auto report = PingParser::parse("8.8.8.8 : xmt/rcv/%loss = 5/5/0%, min/avg/max = 11.2/12.5/14.1\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 0);
    ASSERT_TRUE(report.avg_latency_ms.has_value());
    EXPECT_DOUBLE_EQ(*report.avg_latency_ms, 12.5);
}

TEST(PingParserTest, ParsesFpingPartialLoss) {
    auto report = PingParser::parse("8.8.8.8 : xmt/rcv/%loss = 5/3/40%, min/avg/max = 10.0/20.0/30.0\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 40);
    EXPECT_DOUBLE_EQ(*report.avg_latency_ms, 20.0);
}

TEST(PingParserTest, FpingTotalLossHasNoLatency) {
    auto report = PingParser::parse("8.8.8.8 : xmt/rcv/%loss = 5/0/100%\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 100);
    EXPECT_FALSE(report.avg_latency_ms.has_value());
}

TEST(PingParserTest, ParsesIputilsSummary) {
    const std::string output =
        "PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.\n"
        "\n"
        "--- 8.8.8.8 ping statistics ---\n"
        "5 packets transmitted, 5 received, 0% packet loss, time 4006ms\n"
        "rtt min/avg/max/mdev = 11.201/12.532/14.104/0.912 ms\n";

    auto report = PingParser::parse(output);

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 0);
    ASSERT_TRUE(report.avg_latency_ms.has_value());
    EXPECT_DOUBLE_EQ(*report.avg_latency_ms, 12.532);
}

TEST(PingParserTest, FractionalLossRoundsUp) {
    auto report = PingParser::parse("3 packets transmitted, 2 received, 33.3333% packet loss, time 2003ms\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 34);
}

TEST(PingParserTest, BareTripleFallsBackToMiddleValue) {
    auto report = PingParser::parse("round-trip 1.500/2.750/4.000\n");

    ASSERT_TRUE(report.avg_latency_ms.has_value());
    EXPECT_DOUBLE_EQ(*report.avg_latency_ms, 2.75);
    EXPECT_FALSE(report.loss_percent.has_value());
}

TEST(PingParserTest, GarbageIsUnknownNotZero) {
    auto report = PingParser::parse("fping: can't create socket (must run as root?)\n");

    EXPECT_FALSE(report.loss_percent.has_value());
    EXPECT_FALSE(report.avg_latency_ms.has_value());
}

TEST(PingParserTest, EmptyOutputIsUnknown) {
    auto report = PingParser::parse("");

    EXPECT_FALSE(report.loss_percent.has_value());
    EXPECT_FALSE(report.avg_latency_ms.has_value());
}

TEST(PingParserTest, LossAboveHundredIsRejected) {
    auto report = PingParser::parse("host : xmt/rcv/%loss = 5/5/250%\n");

    EXPECT_FALSE(report.loss_percent.has_value());
}

TEST(PingParserTest, FpingReturnRateWithDuplicatesIsNoLoss) {
    auto report = PingParser::parse("8.8.8.8 : xmt/rcv/%return = 5/6/120%, min/avg/max = 10.1/12.0/14.2\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 0);
    ASSERT_TRUE(report.avg_latency_ms.has_value());
    EXPECT_DOUBLE_EQ(*report.avg_latency_ms, 12.0);
}

TEST(PingParserTest, FpingReturnRateBelowHundredIsLoss) {
    auto report = PingParser::parse("8.8.8.8 : xmt/rcv/%return = 5/4/80%, min/avg/max = 10.1/12.0/14.2\n");

    ASSERT_TRUE(report.loss_percent.has_value());
    EXPECT_EQ(*report.loss_percent, 20);
}
