#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

#include <set>

using namespace escpos;
using namespace escpos::domain::status;

class RealTimeStatusTest : public ::testing::Test {
protected:
    Protocol protocol;

    static std::set<RealTimeStatusFlag> keys(const std::map<RealTimeStatusFlag, bool> &flags) {
        std::set<RealTimeStatusFlag> out;
        for (const auto &entry: flags) out.insert(entry.first);
        return out;
    }
};

TEST_F(RealTimeStatusTest, RequestCommands) {
    EXPECT_EQ(protocol.status()->realTimeStatus(RealTimeStatusRequest::Printer), test::bytes({0x10, 0x04, 1, 0}));
    EXPECT_EQ(protocol.status()->realTimeStatus(RealTimeStatusRequest::InkB), test::bytes({0x10, 0x04, 7, 2}));
    EXPECT_EQ(protocol.status()->realTimeStatus(RealTimeStatusRequest::DMD), test::bytes({0x10, 0x04, 18, 2}));
}

TEST_F(RealTimeStatusTest, TemplateCheck) {
    EXPECT_TRUE(RealTimeStatusResponse::matchesTemplate(0x12));
    EXPECT_FALSE(RealTimeStatusResponse::matchesTemplate(0x13));
    EXPECT_FALSE(RealTimeStatusResponse::matchesTemplate(0x10));
    EXPECT_FALSE(RealTimeStatusResponse::matchesTemplate(0x02));
    EXPECT_FALSE(RealTimeStatusResponse::matchesTemplate(0x92));
    EXPECT_THROW(RealTimeStatusResponse(RealTimeStatusRequest::Printer, 0x00).decode(), types::ProtocolException);
}

TEST_F(RealTimeStatusTest, DecodedKeysMatchCategory) {
    const RealTimeStatusRequest all[] = {
            RealTimeStatusRequest::Printer, RealTimeStatusRequest::OfflineCause,
            RealTimeStatusRequest::ErrorCause, RealTimeStatusRequest::RollPaperSensor,
            RealTimeStatusRequest::InkA, RealTimeStatusRequest::InkB, RealTimeStatusRequest::Peeler,
            RealTimeStatusRequest::Interface, RealTimeStatusRequest::DMD};
    for (const auto request: all) {
        const auto flags = RealTimeStatusResponse(request, 0x12).decode();
        const auto expected = flagsOf(request);
        EXPECT_EQ(keys(flags), std::set<RealTimeStatusFlag>(expected.begin(), expected.end()))
                            << toString(request);
    }
}

TEST_F(RealTimeStatusTest, EveryByteAndCategory) {
    const RealTimeStatusRequest all[] = {
            RealTimeStatusRequest::Printer, RealTimeStatusRequest::OfflineCause,
            RealTimeStatusRequest::ErrorCause, RealTimeStatusRequest::RollPaperSensor,
            RealTimeStatusRequest::InkA, RealTimeStatusRequest::InkB, RealTimeStatusRequest::Peeler,
            RealTimeStatusRequest::Interface, RealTimeStatusRequest::DMD};
    for (int value = 0; value < 256; ++value) {
        const auto raw = static_cast<uint8_t>(value);
        // bit0 = 0, bit1 = 1, bit4 = 1, bit7 = 0
        const bool fixedBitsOk = (raw & 0x93) == 0x12;
        ASSERT_EQ(RealTimeStatusResponse::matchesTemplate(raw), fixedBitsOk) << value;
        for (const auto request: all) {
            if (!fixedBitsOk) {
                EXPECT_THROW(RealTimeStatusResponse(request, raw).decode(), types::ProtocolException)
                                    << value << " " << toString(request);
                continue;
            }
            const auto expected = flagsOf(request);
            EXPECT_EQ(keys(RealTimeStatusResponse(request, raw).decode()),
                      std::set<RealTimeStatusFlag>(expected.begin(), expected.end()))
                                << value << " " << toString(request);
        }
    }
}

TEST_F(RealTimeStatusTest, PrinterStatusBits) {
    const auto idle = RealTimeStatusResponse(RealTimeStatusRequest::Printer, 0x12).decode();
    EXPECT_TRUE(idle.at(RealTimeStatusFlag::Online));
    EXPECT_TRUE(idle.at(RealTimeStatusFlag::DrawerKickOutConnectorPin3Low));
    EXPECT_FALSE(idle.at(RealTimeStatusFlag::WaitingForOnlineRecovery));

    // bit3 alto: offline, bit6: tasto feed premuto
    const auto offline = RealTimeStatusResponse(RealTimeStatusRequest::Printer, 0x5A).decode();
    EXPECT_FALSE(offline.at(RealTimeStatusFlag::Online));
    EXPECT_TRUE(offline.at(RealTimeStatusFlag::PaperFeedButtonPressed));
}

TEST_F(RealTimeStatusTest, RollPaperSensorPairs) {
    const auto adequate = RealTimeStatusResponse(RealTimeStatusRequest::RollPaperSensor, 0x12).decode();
    EXPECT_TRUE(adequate.at(RealTimeStatusFlag::RollPaperNearEndSensorPaperAdequate));
    EXPECT_TRUE(adequate.at(RealTimeStatusFlag::RollPaperEndSensorPaperPresent));

    const auto nearEnd = RealTimeStatusResponse(RealTimeStatusRequest::RollPaperSensor, 0x1E).decode();
    EXPECT_FALSE(nearEnd.at(RealTimeStatusFlag::RollPaperNearEndSensorPaperAdequate));

    const auto end = RealTimeStatusResponse(RealTimeStatusRequest::RollPaperSensor, 0x72).decode();
    EXPECT_FALSE(end.at(RealTimeStatusFlag::RollPaperEndSensorPaperPresent));
}
