#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../include/tsqueue.hpp"
#include "../include/events.hpp"
#include "../include/peer_registry.hpp"
#include "../include/oob_sender.hpp"
#include "../include/channels/socket_oob_channel.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted = true; }

void usage() {
    std::cerr <<
        "usage:\n"
        "  oob_channel listen [--bind ADDR] [--port N] [--timeout-ms N] [--read-timeout-ms N]\n"
        "                     [--max-bytes N] [--raw] [--bond ID]...\n"
        "  oob_channel send HOST PORT KEY [--raw] [--ihu-iv S] [--mobile-iv S]\n";
}

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

void print_hex(const char* label, const std::vector<uint8_t>& v) {
    std::cout << "  " << label << " (" << v.size() << "): ";
    for (auto b : v) std::cout << std::hex << std::setw(2) << std::setfill('0') << int(b);
    std::cout << std::dec << "\n";
}

int run_listen(int argc, char* argv[]) {
    OobChannelConfig cfg;
    std::vector<std::string> bonds;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };
            if (arg == "--bind")                 cfg.bind_address = next();
            else if (arg == "--port")            cfg.port = static_cast<uint16_t>(std::stoul(next()));
            else if (arg == "--timeout-ms")      cfg.accept_timeout = std::chrono::milliseconds(std::stoul(next()));
            else if (arg == "--read-timeout-ms") cfg.read_timeout = std::chrono::milliseconds(std::stoul(next()));
            else if (arg == "--max-bytes")       cfg.max_payload_bytes = std::stoul(next());
            else if (arg == "--raw")             cfg.wire_format = WireFormat::Raw;
            else if (arg == "--bond")            bonds.push_back(next());
            else throw std::invalid_argument("unknown option " + arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        usage();
        return EXIT_FAILURE;
    }

    if (bonds.empty()) {
        std::cout << "[MAIN] no --bond given, the channel will refuse to listen\n";
    }

    // everything the channel reports lands here and is handled on the main thread
    TSQueue<Event> events;

    SocketOobChannel channel(cfg, std::make_shared<StaticPeerRegistry>(bonds));
    channel.set_advertise_callback([&events](const ServiceRecord& rec, uint16_t port) {
        events.push(Event{EventType::OobListening, EvOobListening{rec.name, port}});
    });
    channel.set_state_callback([](OobState st) {
        std::cout << "[MAIN] state -> " << to_string(st) << "\n";
    });
    channel.set_callback({
        [&events](const OobToken& t) { events.push(Event{EventType::OobReceived, EvOobReceived{t}}); },
        [&events]() { events.push(Event{EventType::OobFailed, EvOobFailed{}}); },
    });

    std::signal(SIGINT, on_sigint);

    if (!channel.start()) {
        std::cerr << "[MAIN] could not start OOB channel\n";
        return EXIT_FAILURE;
    }

    uint64_t seq = 1;
    for (;;) {
        Event e;
        if (!events.pop_for(e, std::chrono::milliseconds(200))) {
            if (g_interrupted) events.push(Event{EventType::Interrupted, EvInterrupted{}});
            continue;
        }
        e.seq = seq++;

        switch (e.type) {
            case EventType::OobListening: {
                const auto& l = std::get<EvOobListening>(e.data);
                std::cout << "[MAIN] (seq " << e.seq << ") waiting for '" << l.service << "' on port " << l.port << "\n";
                break;
            }
            case EventType::OobReceived: {
                const auto& r = std::get<EvOobReceived>(e.data);
                std::cout << "[MAIN] (seq " << e.seq << ") OOB token received\n";
                print_hex("encryption key", r.token.encryption_key);
                if (!r.token.ihu_iv.empty()) print_hex("ihu iv", r.token.ihu_iv);
                if (!r.token.mobile_iv.empty()) print_hex("mobile iv", r.token.mobile_iv);
                channel.stop();
                return EXIT_SUCCESS;
            }
            case EventType::OobFailed:
                std::cout << "[MAIN] (seq " << e.seq << ") OOB exchange failed\n";
                channel.stop();
                return EXIT_FAILURE;
            case EventType::Interrupted:
                std::cout << "[MAIN] interrupted, stopping\n";
                channel.stop();
                return EXIT_FAILURE;
        }
    }
}

int run_send(int argc, char* argv[]) {
    if (argc < 5) {
        usage();
        return EXIT_FAILURE;
    }

    const std::string host = argv[2];
    OobToken token;
    WireFormat fmt = WireFormat::Structured;
    uint16_t port = 0;

    try {
        port = static_cast<uint16_t>(std::stoul(argv[3]));
        token.encryption_key = bytes_of(argv[4]);
        for (int i = 5; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };
            if (arg == "--raw")            fmt = WireFormat::Raw;
            else if (arg == "--ihu-iv")    token.ihu_iv = bytes_of(next());
            else if (arg == "--mobile-iv") token.mobile_iv = bytes_of(next());
            else throw std::invalid_argument("unknown option " + arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        usage();
        return EXIT_FAILURE;
    }

    return send_oob_token(host, port, token, fmt) ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "";
    if (mode == "listen") return run_listen(argc, argv);
    if (mode == "send") return run_send(argc, argv);
    usage();
    return EXIT_FAILURE;
}
