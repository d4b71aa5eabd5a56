#include <gtest/gtest.h>

#include "echo_message.hpp"
#include "trace_errors.hpp"

using namespace zt;

TEST(EchoMessage, LatencySample) {
    auto msg = parse_echo_message(R"({"type":"ws-latency","seq":4,"sent":1712345678901})");
    ASSERT_TRUE(std::holds_alternative<LatencyMessage>(msg));
    EXPECT_EQ(std::get<LatencyMessage>(msg).body["seq"].asInt(), 4);
}

TEST(EchoMessage, FinalSummaryWithType) {
    auto msg = parse_echo_message(
        R"({"type":"ws-final","UUID":"6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6f7","MinRTT":12.5})");
    ASSERT_TRUE(std::holds_alternative<FinalMessage>(msg));
    const auto& fin = std::get<FinalMessage>(msg);
    EXPECT_EQ(fin.uuid, "6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6f7");
    EXPECT_DOUBLE_EQ(fin.body["MinRTT"].asDouble(), 12.5);
}

TEST(EchoMessage, UntypedSummaryIsFinal) {
    auto msg = parse_echo_message(R"({"UUID":"6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6f7"})");
    EXPECT_TRUE(std::holds_alternative<FinalMessage>(msg));
}

TEST(EchoMessage, RejectsUnknownShapes) {
    EXPECT_THROW(parse_echo_message("not json"), MessageFormatError);
    EXPECT_THROW(parse_echo_message("[1,2,3]"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"type":"ws-latency"} trailing)"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"type":"ws-bogus"})"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"type":7})"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"type":"ws-final"})"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"UUID":"nope"})"), MessageFormatError);
    EXPECT_THROW(parse_echo_message(R"({"UUID":42})"), MessageFormatError);
}
