#include "transport_layer.h"

#include <functional>
#include <sstream>
#include <utility>

#ifndef _WIN32
#include <termios.h>
#endif

namespace transport {

namespace {

template <typename Stream>
void closeStream(Stream& stream) {
    boost::system::error_code ec;
    stream.cancel(ec);
    stream.close(ec);
}

template <typename Stream>
void cancelStream(Stream& stream) {
    boost::system::error_code ec;
    stream.cancel(ec);
}

boost::asio::serial_port_base::parity::type toParity(char parity) {
    switch (parity) {
        case 'E':
            return boost::asio::serial_port_base::parity::even;
        case 'O':
            return boost::asio::serial_port_base::parity::odd;
        default:
            return boost::asio::serial_port_base::parity::none;
    }
}

} // namespace

ModbusLink::ModbusLink(TcpSettings settings)
    : settings_(std::move(settings)),
      stream_(std::in_place_type<tcp::socket>, ioContext_),
      timeout_(std::get<TcpSettings>(settings_).timeout) {}

ModbusLink::ModbusLink(SerialSettings settings)
    : settings_(std::move(settings)),
      stream_(std::in_place_type<boost::asio::serial_port>, ioContext_),
      timeout_(std::get<SerialSettings>(settings_).timeout) {}

ModbusLink::~ModbusLink() {
    close();
}

ConnectionType ModbusLink::connectionType() const noexcept {
    return std::holds_alternative<tcp::socket>(stream_) ? ConnectionType::Tcp : ConnectionType::Rtu;
}

protocol::FrameMode ModbusLink::frameMode() const noexcept {
    return connectionType() == ConnectionType::Tcp ? protocol::FrameMode::Tcp : protocol::FrameMode::Rtu;
}

bool ModbusLink::open(std::string& error) {
    if (isOpen()) {
        return true;
    }
    if (const auto* tcpSettings = std::get_if<TcpSettings>(&settings_)) {
        return openTcp(*tcpSettings, error);
    }
    return openSerial(std::get<SerialSettings>(settings_), error);
}

bool ModbusLink::openTcp(const TcpSettings& settings, std::string& error) {
    auto& socket = std::get<tcp::socket>(stream_);
    try {
        tcp::resolver resolver(ioContext_);
        const auto endpoints = resolver.resolve(settings.host, std::to_string(settings.port));

        boost::system::error_code connectError = boost::asio::error::would_block;
        ioContext_.restart();
        boost::asio::async_connect(socket, endpoints,
            [&connectError](const boost::system::error_code& ec, const tcp::endpoint&) {
                connectError = ec;
            });
        ioContext_.run_for(timeout_);

        if (connectError == boost::asio::error::would_block) {
            closeStream(socket);
            ioContext_.restart();
            ioContext_.run();
            error = "TCP connect to " + settings.host + ":" + std::to_string(settings.port) + " timed out";
            return false;
        }
        if (connectError) {
            closeStream(socket);
            error = "TCP connect error: " + connectError.message();
            return false;
        }

        socket.set_option(tcp::no_delay(true));
        return true;
    } catch (const std::exception& e) {
        closeStream(socket);
        error = std::string("TCP connect error: ") + e.what();
        return false;
    }
}

bool ModbusLink::openSerial(const SerialSettings& settings, std::string& error) {
    auto& port = std::get<boost::asio::serial_port>(stream_);
    try {
        port.open(settings.port);
        port.set_option(boost::asio::serial_port_base::baud_rate(settings.baudRate));
        port.set_option(boost::asio::serial_port_base::character_size(settings.dataBits));
        port.set_option(boost::asio::serial_port_base::parity(toParity(settings.parity)));
        port.set_option(boost::asio::serial_port_base::stop_bits(
            settings.stopBits == 2 ? boost::asio::serial_port_base::stop_bits::two
                                   : boost::asio::serial_port_base::stop_bits::one));
        port.set_option(boost::asio::serial_port_base::flow_control(boost::asio::serial_port_base::flow_control::none));
        return true;
    } catch (const std::exception& e) {
        closeStream(port);
        error = std::string("Serial open error: ") + e.what();
        return false;
    }
}

void ModbusLink::close() {
    std::visit([](auto& stream) { closeStream(stream); }, stream_);
}

bool ModbusLink::isOpen() const {
    return std::visit([](const auto& stream) { return stream.is_open(); }, stream_);
}

std::string ModbusLink::describe() const {
    std::ostringstream out;
    if (const auto* tcpSettings = std::get_if<TcpSettings>(&settings_)) {
        out << "tcp://" << tcpSettings->host << ':' << tcpSettings->port;
    } else {
        const auto& serial = std::get<SerialSettings>(settings_);
        out << "serial:" << serial.port << '@' << serial.baudRate << ' '
            << static_cast<int>(serial.dataBits) << serial.parity << static_cast<int>(serial.stopBits);
    }
    return out.str();
}

protocol::ReadResult ModbusLink::readRegisters(const protocol::ReadRequest& request) {
    std::string error;
    if (!isOpen() && !open(error)) {
        return {false, error, false, 0, {}};
    }

    protocol::ModbusRequest modbusRequest;
    modbusRequest.slaveId = request.unitId;
    modbusRequest.function = protocol::ProtocolHandler::functionFor(request.kind);
    modbusRequest.startAddress = request.address;
    modbusRequest.count = request.count;
    modbusRequest.transactionId = nextTransactionId_++;

    discardPendingInput();

    const auto frame = protocolHandler_.createFrame(modbusRequest, frameMode());
    protocol::ModbusResponse response;
    if (!exchange(frame, response, error)) {
        // A late TCP reply would desynchronise the next transaction; reconnect instead.
        if (connectionType() == ConnectionType::Tcp) {
            close();
        }
        return {false, error, false, 0, {}};
    }

    if (response.slaveId != modbusRequest.slaveId) {
        return {false, "Response from unit " + std::to_string(response.slaveId) + ", expected "
            + std::to_string(modbusRequest.slaveId), false, 0, {}};
    }
    if (response.function != static_cast<std::uint8_t>(modbusRequest.function)) {
        return {false, "Unexpected function code " + std::to_string(response.function) + " in response", false, 0, {}};
    }
    if (connectionType() == ConnectionType::Tcp && response.transactionId != modbusRequest.transactionId) {
        close();
        return {false, "Transaction id mismatch", false, 0, {}};
    }

    return {true, {}, response.isException, response.exceptionCode, std::move(response.values)};
}

bool ModbusLink::exchange(const std::vector<std::uint8_t>& frame,
                          protocol::ModbusResponse& response,
                          std::string& error) {
    std::vector<std::uint8_t> received;
    bool finished = false;
    // Set before the timeout cancels the stream; a handler already queued must not re-arm the read.
    bool timedOut = false;
    boost::system::error_code failure;

    std::function<void()> doRead = [&]() {
        std::visit(
            [&](auto& stream) {
                stream.async_read_some(
                    boost::asio::buffer(readBuffer_),
                    [&](const boost::system::error_code& ec, std::size_t bytesRead) {
                        if (timedOut) {
                            return;
                        }
                        if (ec) {
                            failure = ec;
                            finished = true;
                            return;
                        }

                        received.insert(received.end(), readBuffer_.begin(), readBuffer_.begin() + bytesRead);
                        while (!received.empty()) {
                            const auto consumed = protocolHandler_.extractResponse(received, frameMode(), response);
                            if (consumed == protocol::ProtocolHandler::kFrameCorrupt) {
                                received.erase(received.begin());
                                continue;
                            }
                            if (consumed > 0) {
                                finished = true;
                                return;
                            }
                            break;
                        }
                        doRead();
                    });
            },
            stream_);
    };

    ioContext_.restart();
    std::visit(
        [&](auto& stream) {
            boost::asio::async_write(
                stream,
                boost::asio::buffer(frame),
                [&](const boost::system::error_code& ec, std::size_t) {
                    if (timedOut) {
                        return;
                    }
                    if (ec) {
                        failure = ec;
                        finished = true;
                        return;
                    }
                    doRead();
                });
        },
        stream_);

    ioContext_.run_for(timeout_);

    if (!finished) {
        timedOut = true;
        std::visit([](auto& stream) { cancelStream(stream); }, stream_);
        ioContext_.restart();
        ioContext_.run();
        error = "Timed out after " + std::to_string(timeout_.count()) + " ms waiting for response";
        return false;
    }

    if (failure) {
        // reopened lazily by the next request
        close();
        error = "Link error: " + failure.message();
        return false;
    }

    return true;
}

void ModbusLink::discardPendingInput() {
#ifndef _WIN32
    if (auto* port = std::get_if<boost::asio::serial_port>(&stream_)) {
        if (port->is_open()) {
            ::tcflush(port->native_handle(), TCIFLUSH);
        }
    }
#endif
}

std::unique_ptr<IModbusTransport> makeTcpTransport(const TcpSettings& settings) {
    return std::make_unique<ModbusLink>(settings);
}

std::unique_ptr<IModbusTransport> makeSerialTransport(const SerialSettings& settings) {
    return std::make_unique<ModbusLink>(settings);
}

} // namespace transport
