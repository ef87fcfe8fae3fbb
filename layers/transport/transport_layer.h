#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include "core/transport/IModbusTransport.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

using boost::asio::ip::tcp;

enum class ConnectionType {
    Tcp,
    Rtu
};

struct TcpSettings {
    std::string host = "127.0.0.1";
    std::uint16_t port = 502;
    std::chrono::milliseconds timeout{1000};
};

struct SerialSettings {
    std::string port;
    std::uint32_t baudRate = 9600;
    std::uint8_t dataBits = 8;
    std::uint8_t stopBits = 1;
    char parity = 'N';              // N | E | O
    std::chrono::milliseconds timeout{200};
};

/**
 * Blocking Modbus master link over a TCP socket or a serial port.
 *
 * The io_context is driven by the calling thread for the duration of one
 * request, bounded by the configured timeout. A broken TCP connection is
 * reopened on the next request.
 */
class ModbusLink final : public IModbusTransport {
public:
    explicit ModbusLink(TcpSettings settings);
    explicit ModbusLink(SerialSettings settings);
    ~ModbusLink() override;

    ModbusLink(const ModbusLink&) = delete;
    ModbusLink& operator=(const ModbusLink&) = delete;

    bool open(std::string& error) override;
    void close() override;
    bool isOpen() const override;

    protocol::ReadResult readRegisters(const protocol::ReadRequest& request) override;

    std::string describe() const override;

    ConnectionType connectionType() const noexcept;

private:
    bool openTcp(const TcpSettings& settings, std::string& error);
    bool openSerial(const SerialSettings& settings, std::string& error);
    bool exchange(const std::vector<std::uint8_t>& frame, protocol::ModbusResponse& response, std::string& error);
    void discardPendingInput();
    protocol::FrameMode frameMode() const noexcept;

    boost::asio::io_context ioContext_;
    std::variant<TcpSettings, SerialSettings> settings_;
    std::variant<tcp::socket, boost::asio::serial_port> stream_;
    std::chrono::milliseconds timeout_;
    protocol::ProtocolHandler protocolHandler_;
    std::array<std::uint8_t, 512> readBuffer_{};
    std::uint16_t nextTransactionId_ = 1;
};

std::unique_ptr<IModbusTransport> makeTcpTransport(const TcpSettings& settings);
std::unique_ptr<IModbusTransport> makeSerialTransport(const SerialSettings& settings);

} // namespace transport
