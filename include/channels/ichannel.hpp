#pragma once
#include <cstdint>
#include <functional>
#include "../oob_token.hpp"

enum class OobState : uint8_t {
    Idle,
    Accepting,
    Connected,
    ReadingFrame,
    Decoding,
    Succeeded,
    Failed,
    Cancelling
};

inline const char* to_string(OobState s) {
    switch (s) {
    case OobState::Idle:         return "Idle";
    case OobState::Accepting:    return "Accepting";
    case OobState::Connected:    return "Connected";
    case OobState::ReadingFrame: return "ReadingFrame";
    case OobState::Decoding:     return "Decoding";
    case OobState::Succeeded:    return "Succeeded";
    case OobState::Failed:       return "Failed";
    case OobState::Cancelling:   return "Cancelling";
    }
    return "?";
}

class IOobChannel {
public:
    virtual ~IOobChannel() = default;

    // Kicks off one exchange in the background. False if one is already in flight.
    virtual bool start() = 0;
    // Cancels whatever is in flight; safe to call any number of times
    virtual void stop() = 0;

    // Exactly one of these fires per activation, unless stop() got there first
    struct Callback {
        std::function<void(const OobToken&)> on_success;
        std::function<void()> on_failure;
    };
    virtual void set_callback(Callback cb) = 0;

    virtual OobState state() const = 0;

    using StateCallback = std::function<void(OobState)>;
    virtual void set_state_callback(StateCallback cb) = 0;
};
