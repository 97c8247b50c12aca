#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "ichannel.hpp"
#include "frame_reader.hpp"
#include "../peer_registry.hpp"

struct ServiceRecord {
    std::string name;
    std::string uuid;
};

// Record the listener is advertised under. Same on every run.
// TODO: switch to a per-session uuid once the sending side can discover it.
inline const ServiceRecord kOobServiceRecord{"batmobile_oob", "00001101-0000-1000-8000-00805F9B34FB"};

struct OobChannelConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t    port = 0;                               // 0 lets the OS pick, see advertise callback
    std::chrono::milliseconds accept_timeout{30000};
    std::chrono::milliseconds read_timeout{0};          // 0 = wait on the peer forever
    WireFormat  wire_format = WireFormat::Structured;
    size_t      max_payload_bytes = 16 * 1024;
    ServiceRecord service = kOobServiceRecord;
};

// Out-of-band channel over a stream socket. Acts as the server: accepts a
// single connection, reads one [u32 LE len][payload] frame, decodes it and
// reports through the callback. Each start() gets its own worker thread and
// io_context; stop() posts a forced close onto that context and joins.
//
// start() and stop() are meant to be driven from one controlling thread;
// stop() may also be called from inside the callbacks. Set the callbacks
// before start().
class SocketOobChannel : public IOobChannel {
public:
    SocketOobChannel(OobChannelConfig cfg, std::shared_ptr<const IPeerRegistry> peers);
    ~SocketOobChannel() override;

    bool start() override;
    void stop() override;

    void set_callback(Callback cb) override;

    OobState state() const override { return state_.load(); }
    void set_state_callback(StateCallback cb) override { state_cb_ = std::move(cb); }

    // Fired on the worker once the endpoint is listening, so discovery can publish it
    using AdvertiseCallback = std::function<void(const ServiceRecord&, uint16_t port)>;
    void set_advertise_callback(AdvertiseCallback cb) { advertise_cb_ = std::move(cb); }

    // port of the live listening endpoint, 0 when none is open
    uint16_t local_port() const { return port_.load(); }

private:
    struct Activation;
    enum class Outcome : uint8_t { Pending, Succeeded, Failed, Cancelled };

    OobChannelConfig cfg_;
    std::shared_ptr<const IPeerRegistry> peers_;

    // guards cancelled_, active_ and callback_
    mutable std::mutex mx_;
    bool cancelled_ = false;
    std::shared_ptr<Activation> active_;
    Callback callback_;

    std::thread worker_;
    std::atomic<uint16_t> port_{0};

    // worker side
    void exchange(std::shared_ptr<Activation> act);
    bool open_listener(Activation& a);
    void begin_accept(Activation& a);
    void on_accept(Activation& a, const boost::system::error_code& ec);
    void on_prefix(Activation& a, ReadStatus st, uint32_t len);
    void on_payload(Activation& a, ReadStatus st, RawFrame frame);
    void finish(Activation& a);

    bool is_cancelled() const;
    bool advance(OobState st);   // false once stop() has been requested

    std::atomic<OobState> state_{OobState::Idle};
    StateCallback state_cb_;
    AdvertiseCallback advertise_cb_;

    void set_state(OobState st) {
        state_.store(st, std::memory_order_relaxed);
        notify_state(st);
    }
    void notify_state(OobState st) {
        if (state_cb_) state_cb_(st);
    }
};
