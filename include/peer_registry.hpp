#pragma once
#include <string>
#include <vector>

// Platform view of devices that completed pairing on the primary link.
// The OOB listener only opens an endpoint if at least one is known.
class IPeerRegistry {
public:
    virtual ~IPeerRegistry() = default;
    virtual std::vector<std::string> bonded_devices() const = 0;
};

// Fixed list, filled from config or the command line
class StaticPeerRegistry : public IPeerRegistry {
public:
    explicit StaticPeerRegistry(std::vector<std::string> bonded) : bonded_(std::move(bonded)) {}

    std::vector<std::string> bonded_devices() const override { return bonded_; }

private:
    std::vector<std::string> bonded_;
};
