#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include "oob_token.hpp"

//============ EVENT TYPES ==========
enum class EventType {
    OobListening,   // endpoint is up and advertised
    OobReceived,    // token decoded
    OobFailed,      // exchange ended without a token
    Interrupted,    // SIGINT
};

//=========== PAYLOAD TYPES ===========
struct EvOobListening {
    std::string service;
    uint16_t port = 0;
};

struct EvOobReceived {
    OobToken token;
};

struct EvOobFailed {};
struct EvInterrupted {};

//======= WRAPPER =======
using EventPayload = std::variant<
    EvOobListening,
    EvOobReceived,
    EvOobFailed,
    EvInterrupted
>;

//========= EVENT STRUCTURE =======
struct Event {
    EventType type;
    EventPayload data;
    uint64_t seq = 0;  // sequence for logging
};
