#include <gtest/gtest.h>

#include "layers/protocol/protocol_layer.h"

namespace {

using protocol::FrameMode;
using protocol::FunctionCode;
using protocol::ModbusRequest;
using protocol::ModbusResponse;
using protocol::ProtocolHandler;

std::vector<std::uint8_t> withCrc(std::vector<std::uint8_t> frame) {
    const auto crc = ProtocolHandler::crc16(frame);
    frame.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(crc >> 8));
    return frame;
}

TEST(ProtocolLayerTest, RtuReadRequestMatchesReferenceFrame) {
    ProtocolHandler handler;
    ModbusRequest request;
    request.slaveId = 1;
    request.function = FunctionCode::ReadHoldingRegisters;
    request.startAddress = 0;
    request.count = 1;

    const std::vector<std::uint8_t> expected{0x01, 0x03, 0x00, 0x00, 0x00, 0x01, 0x84, 0x0A};
    EXPECT_EQ(handler.createFrame(request, FrameMode::Rtu), expected);
}

TEST(ProtocolLayerTest, TcpRequestCarriesMbapHeader) {
    ProtocolHandler handler;
    ModbusRequest request;
    request.slaveId = 5;
    request.function = FunctionCode::ReadInputRegisters;
    request.startAddress = 0x0102;
    request.count = 40;
    request.transactionId = 0x0A0B;

    const std::vector<std::uint8_t> expected{0x0A, 0x0B, 0x00, 0x00, 0x00, 0x06, 0x05, 0x04, 0x01, 0x02, 0x00, 0x28};
    EXPECT_EQ(handler.createFrame(request, FrameMode::Tcp), expected);
}

TEST(ProtocolLayerTest, ParsesRtuReadResponse) {
    ProtocolHandler handler;
    const auto frame = withCrc({0x11, 0x03, 0x04, 0x00, 0x07, 0xA1, 0x20});

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Rtu, response), frame.size());
    EXPECT_EQ(response.slaveId, 0x11);
    EXPECT_EQ(response.function, 0x03);
    EXPECT_FALSE(response.isException);
    EXPECT_EQ(response.values, (std::vector<std::uint16_t>{0x0007, 0xA120}));
}

TEST(ProtocolLayerTest, IncompleteRtuFrameNeedsMoreBytes) {
    ProtocolHandler handler;
    auto frame = withCrc({0x01, 0x03, 0x04, 0x00, 0x01, 0x00, 0x02});
    frame.pop_back();

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Rtu, response), 0U);
}

TEST(ProtocolLayerTest, RtuCrcMismatchIsCorrupt) {
    ProtocolHandler handler;
    auto frame = withCrc({0x01, 0x03, 0x02, 0x00, 0x01});
    frame.back() ^= 0xFF;

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Rtu, response), ProtocolHandler::kFrameCorrupt);
}

TEST(ProtocolLayerTest, RtuOddByteCountIsCorrupt) {
    ProtocolHandler handler;
    const auto frame = withCrc({0x01, 0x03, 0x03, 0x00, 0x01, 0x02});

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Rtu, response), ProtocolHandler::kFrameCorrupt);
}

TEST(ProtocolLayerTest, ParsesRtuExceptionResponse) {
    ProtocolHandler handler;
    const auto frame = withCrc({0x02, 0x83, 0x02});

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Rtu, response), frame.size());
    EXPECT_TRUE(response.isException);
    EXPECT_EQ(response.function, 0x03);
    EXPECT_EQ(response.exceptionCode, 0x02);
}

TEST(ProtocolLayerTest, ParsesTcpResponse) {
    ProtocolHandler handler;
    const std::vector<std::uint8_t> frame{0x00, 0x2A, 0x00, 0x00, 0x00, 0x07, 0x01, 0x04, 0x04, 0x12, 0x34, 0xAB, 0xCD};

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Tcp, response), frame.size());
    EXPECT_EQ(response.transactionId, 0x2A);
    EXPECT_EQ(response.slaveId, 0x01);
    EXPECT_EQ(response.function, 0x04);
    EXPECT_EQ(response.values, (std::vector<std::uint16_t>{0x1234, 0xABCD}));
}

TEST(ProtocolLayerTest, TcpWithForeignProtocolIdIsCorrupt) {
    ProtocolHandler handler;
    const std::vector<std::uint8_t> frame{0x00, 0x01, 0x00, 0x01, 0x00, 0x05, 0x01, 0x03, 0x02, 0x00, 0x01};

    ModbusResponse response;
    EXPECT_EQ(handler.extractResponse(frame, FrameMode::Tcp, response), ProtocolHandler::kFrameCorrupt);
}

TEST(ProtocolLayerTest, FunctionForRegisterKind) {
    EXPECT_EQ(ProtocolHandler::functionFor(protocol::RegisterKind::Holding), FunctionCode::ReadHoldingRegisters);
    EXPECT_EQ(ProtocolHandler::functionFor(protocol::RegisterKind::Input), FunctionCode::ReadInputRegisters);
}

} // namespace
