#include "../include/oob_sender.hpp"
#include "../include/channels/frame_reader.hpp"
#include <iostream>

#include <boost/asio.hpp>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

bool send_oob_frame(const std::string& host, uint16_t port, const std::vector<uint8_t>& payload) {
    asio::io_context ioc;
    boost::system::error_code ec;

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        std::cerr << "[OobSender] resolve " << host << ": " << ec.message() << "\n";
        return false;
    }

    tcp::socket sock(ioc);
    asio::connect(sock, endpoints, ec);
    if (ec) {
        std::cerr << "[OobSender] connect " << host << ":" << port << ": " << ec.message() << "\n";
        return false;
    }

    const auto frame = FrameReader::encode(payload);
    asio::write(sock, asio::buffer(frame), ec);
    if (ec) {
        std::cerr << "[OobSender] write failed: " << ec.message() << "\n";
        return false;
    }

    std::cout << "[OobSender] sent " << payload.size() << " byte payload to " << host << ":" << port << "\n";
    sock.shutdown(tcp::socket::shutdown_both, ec);
    sock.close(ec);
    return true;
}

bool send_oob_token(const std::string& host, uint16_t port, const OobToken& token, WireFormat fmt) {
    return send_oob_frame(host, port, encode_token(token, fmt));
}
