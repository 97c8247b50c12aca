#include "socket_oob_channel.hpp"
#include <iostream>

#include <boost/asio.hpp>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Everything one start() owns. Only touched from the worker thread, except
// for the posted close from stop(), which also runs on the worker.
struct SocketOobChannel::Activation {
    asio::io_context   ioc;
    tcp::acceptor      acceptor{ioc};
    tcp::socket        socket{ioc};
    asio::steady_timer accept_timer{ioc};
    asio::steady_timer read_timer{ioc};
    std::unique_ptr<FrameReader> reader;

    Outcome  outcome = Outcome::Pending;
    OobToken token;

    void settle(Outcome o) {
        outcome = o;
        accept_timer.cancel();
        read_timer.cancel();
    }

    // forced close, any pending accept/read completes with an error
    void close_all() {
        boost::system::error_code ignored;
        accept_timer.cancel();
        read_timer.cancel();
        acceptor.close(ignored);
        if (socket.is_open()) {
            socket.shutdown(tcp::socket::shutdown_both, ignored);
            socket.close(ignored);
        }
    }
};

SocketOobChannel::SocketOobChannel(OobChannelConfig cfg, std::shared_ptr<const IPeerRegistry> peers)
    : cfg_(std::move(cfg)), peers_(std::move(peers)) {}

SocketOobChannel::~SocketOobChannel() { stop(); }

void SocketOobChannel::set_callback(Callback cb) {
    std::lock_guard<std::mutex> lk(mx_);
    callback_ = std::move(cb);
}

bool SocketOobChannel::start() {
    const OobState st = state_.load();
    if (st != OobState::Idle) {
        std::cerr << "[OobChannel] start ignored, exchange in progress (" << to_string(st) << ")\n";
        return false;
    }

    // the previous worker already ran its cleanup, just reap it
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) worker_.detach();
        else worker_.join();
    }

    auto act = std::make_shared<Activation>();
    {
        std::lock_guard<std::mutex> lk(mx_);
        cancelled_ = false;
        active_ = act;
        state_.store(OobState::Accepting);
    }
    notify_state(OobState::Accepting);

    worker_ = std::thread(&SocketOobChannel::exchange, this, std::move(act));
    return true;
}

void SocketOobChannel::stop() {
    std::shared_ptr<Activation> act;
    {
        std::lock_guard<std::mutex> lk(mx_);
        cancelled_ = true;
        act = active_;
        const OobState st = state_.load();
        // reported by the worker in finish(), so the callback stays in order
        if (act && (st == OobState::Accepting || st == OobState::Connected || st == OobState::ReadingFrame)) {
            state_.store(OobState::Cancelling);
        }
    }

    if (act) {
        // Runs on the worker if it is still inside run(); otherwise dropped
        // with the io_context and finish() does the closing.
        Activation* a = act.get();
        asio::post(a->ioc, [a] { a->close_all(); });
    }

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

bool SocketOobChannel::is_cancelled() const {
    std::lock_guard<std::mutex> lk(mx_);
    return cancelled_;
}

bool SocketOobChannel::advance(OobState st) {
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (cancelled_) return false;
        state_.store(st);
    }
    notify_state(st);
    return true;
}

// Worker body: accept -> read length -> read payload -> decode -> callback.
// All outcomes funnel through finish().
void SocketOobChannel::exchange(std::shared_ptr<Activation> act) {
    Activation& a = *act;

    if (!peers_ || peers_->bonded_devices().empty()) {
        // nothing opened, nothing to clean up beyond the bookkeeping in finish()
        std::cout << "[OobChannel] no devices are bonded, will not accept a connection\n";
        a.outcome = Outcome::Failed;
    } else if (open_listener(a)) {
        try {
            if (advertise_cb_) advertise_cb_(cfg_.service, port_.load());
            begin_accept(a);
            a.ioc.run();
        } catch (const std::exception& e) {
            std::cerr << "[OobChannel] worker exception: " << e.what() << "\n";
            a.outcome = Outcome::Failed;
        }
    }

    finish(a);
}

bool SocketOobChannel::open_listener(Activation& a) {
    boost::system::error_code ec;
    const auto addr = asio::ip::make_address(cfg_.bind_address, ec);
    if (ec) {
        std::cerr << "[OobChannel] bad bind address '" << cfg_.bind_address << "': " << ec.message() << "\n";
        a.outcome = Outcome::Failed;
        return false;
    }
    const tcp::endpoint ep(addr, cfg_.port);

    // Under the lock so a stop() either lands before we open (seen here) or
    // after (its close is posted and runs once the accept is queued).
    std::lock_guard<std::mutex> lk(mx_);
    if (cancelled_) {
        std::cout << "[OobChannel] stopped before listening\n";
        a.outcome = Outcome::Cancelled;
        return false;
    }

    a.acceptor.open(ep.protocol(), ec);
    if (!ec) a.acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) a.acceptor.bind(ep, ec);
    if (!ec) a.acceptor.listen(1, ec);
    if (ec) {
        std::cerr << "[OobChannel] could not listen on " << ep << ": " << ec.message() << "\n";
        a.outcome = Outcome::Failed;
        return false;
    }

    const auto local = a.acceptor.local_endpoint(ec);
    port_ = ec ? cfg_.port : local.port();
    std::cout << "[OobChannel] listening for '" << cfg_.service.name << "' (" << cfg_.service.uuid
              << ") on port " << port_.load() << "\n";
    return true;
}

void SocketOobChannel::begin_accept(Activation& a) {
    Activation* p = &a;

    a.accept_timer.expires_after(cfg_.accept_timeout);
    a.accept_timer.async_wait([this, p](const boost::system::error_code& ec) {
        if (ec) return; // accept finished first
        std::cerr << "[OobChannel] no connection within " << cfg_.accept_timeout.count() << " ms\n";
        boost::system::error_code ignored;
        p->acceptor.close(ignored);
    });

    a.acceptor.async_accept(a.socket, [this, p](const boost::system::error_code& ec) {
        on_accept(*p, ec);
    });
}

void SocketOobChannel::on_accept(Activation& a, const boost::system::error_code& ec) {
    // one connection per activation, the listener is done either way
    boost::system::error_code ignored;
    a.accept_timer.cancel();
    a.acceptor.close(ignored);
    port_ = 0;

    if (is_cancelled()) {
        std::cout << (ec ? "[OobChannel] stopped while accepting\n" : "[OobChannel] stopped after socket connection\n");
        a.settle(Outcome::Cancelled);
        return;
    }
    if (ec) {
        std::cerr << "[OobChannel] accepting socket was aborted or timed out: " << ec.message() << "\n";
        a.settle(Outcome::Failed);
        return;
    }

    std::cout << "[OobChannel] accepted connection from " << a.socket.remote_endpoint(ignored) << "\n";
    if (!advance(OobState::Connected)) {
        a.settle(Outcome::Cancelled);
        return;
    }

    Activation* p = &a;
    if (cfg_.read_timeout.count() > 0) {
        a.read_timer.expires_after(cfg_.read_timeout);
        a.read_timer.async_wait([this, p](const boost::system::error_code& tec) {
            if (tec) return;
            std::cerr << "[OobChannel] no complete frame within " << cfg_.read_timeout.count() << " ms\n";
            boost::system::error_code ignored2;
            p->socket.shutdown(tcp::socket::shutdown_both, ignored2);
            p->socket.close(ignored2);
        });
    }

    a.reader = std::make_unique<FrameReader>(a.socket, cfg_.max_payload_bytes);
    if (!advance(OobState::ReadingFrame)) {
        a.settle(Outcome::Cancelled);
        return;
    }
    a.reader->async_read_prefix([this, p](ReadStatus st, uint32_t len) { on_prefix(*p, st, len); });
}

void SocketOobChannel::on_prefix(Activation& a, ReadStatus st, uint32_t len) {
    if (is_cancelled()) {
        std::cout << "[OobChannel] stopped while reading OOB data\n";
        a.settle(Outcome::Cancelled);
        return;
    }
    if (st != ReadStatus::Ok) {
        a.settle(Outcome::Failed);
        return;
    }

    Activation* p = &a;
    a.reader->async_read_payload(len, [this, p](ReadStatus pst, RawFrame frame) {
        on_payload(*p, pst, std::move(frame));
    });
}

void SocketOobChannel::on_payload(Activation& a, ReadStatus st, RawFrame frame) {
    a.read_timer.cancel();

    if (is_cancelled()) {
        std::cout << "[OobChannel] stopped while reading OOB data\n";
        a.settle(Outcome::Cancelled);
        return;
    }
    if (st != ReadStatus::Ok) {
        std::cerr << "[OobChannel] could not read OOB data (" << to_string(st) << ")\n";
        a.settle(Outcome::Failed);
        return;
    }

    std::cout << "[OobChannel] read " << frame.size() << " byte payload\n";
    if (!advance(OobState::Decoding)) {
        a.settle(Outcome::Cancelled);
        return;
    }

    auto token = decode_token(frame, cfg_.wire_format);
    if (!token) {
        std::cerr << "[OobChannel] payload did not decode as an OOB token\n";
        a.settle(Outcome::Failed);
        return;
    }
    a.token = std::move(*token);
    a.settle(Outcome::Succeeded);
}

// Unified cleanup, runs exactly once per activation, after the io_context is done.
void SocketOobChannel::finish(Activation& a) {
    Callback cb;
    bool deliver = false;
    bool cancelling = false;
    {
        std::lock_guard<std::mutex> lk(mx_);
        std::cout << "[OobChannel] closing listening endpoint and connection\n";
        a.close_all();
        a.reader.reset();
        port_ = 0;
        active_.reset();

        deliver = !cancelled_ && a.outcome != Outcome::Cancelled;
        if (deliver) cb = callback_;
        cancelling = state_.load() == OobState::Cancelling;
    }

    if (!deliver) {
        std::cout << "[OobChannel] exchange stopped, no result reported\n";
        if (cancelling) notify_state(OobState::Cancelling);
    } else if (a.outcome == Outcome::Succeeded) {
        set_state(OobState::Succeeded);
        if (cb.on_success) cb.on_success(a.token);
    } else {
        set_state(OobState::Failed);
        if (cb.on_failure) cb.on_failure();
    }

    set_state(OobState::Idle);
}
