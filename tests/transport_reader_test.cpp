#include <gtest/gtest.h>

#include "core/protocol/TransportReader.h"
#include "infrastructure/transport/InMemoryModbusTransport.h"

namespace {

using protocol::RegisterKind;
using protocol::TransportReader;
using transport::InMemoryModbusTransport;

TEST(TransportReaderTest, ReturnsRequestedBlock) {
    InMemoryModbusTransport link;
    link.setRegisters(3, 100, {1, 2, 3});
    TransportReader reader(link, RegisterKind::Input);

    const auto result = reader.readBlock(100, 3, 3);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.values, (std::vector<std::uint16_t>{1, 2, 3}));

    ASSERT_EQ(link.calls().size(), 1U);
    EXPECT_EQ(link.calls()[0].kind, RegisterKind::Input);
    EXPECT_EQ(link.calls()[0].unitId, 3);
}

TEST(TransportReaderTest, RejectsCountOutsideProtocolLimit) {
    InMemoryModbusTransport link;
    TransportReader reader(link, RegisterKind::Holding);

    EXPECT_FALSE(reader.readBlock(0, 0, 1).success);
    EXPECT_FALSE(reader.readBlock(0, 126, 1).success);
    EXPECT_FALSE(reader.readBlock(65530, 10, 1).success);
    EXPECT_TRUE(link.calls().empty());
}

TEST(TransportReaderTest, ExceptionResponseIsFailure) {
    InMemoryModbusTransport link;
    link.queueException(2);
    TransportReader reader(link, RegisterKind::Holding);

    const auto result = reader.readBlock(0, 4, 1);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.isException);
    EXPECT_EQ(result.error, "Modbus exception code 2");
}

TEST(TransportReaderTest, ShortResponseIsFailure) {
    InMemoryModbusTransport link;
    link.queueShortResponse(2);
    TransportReader reader(link, RegisterKind::Holding);

    const auto result = reader.readBlock(0, 4, 1);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.values.empty());
    EXPECT_EQ(result.error, "Short response: expected 4 registers, got 2");
}

TEST(TransportReaderTest, TransportFailureKeepsMessage) {
    InMemoryModbusTransport link;
    link.queueFailure("Timed out");
    TransportReader reader(link, RegisterKind::Holding);

    const auto result = reader.readBlock(0, 4, 1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Timed out");
}

} // namespace
