#include "frame_reader.hpp"
#include <iostream>

namespace asio = boost::asio;

const char* to_string(ReadStatus s) {
    switch (s) {
    case ReadStatus::Ok:          return "ok";
    case ReadStatus::EndOfStream: return "end of stream";
    case ReadStatus::IoError:     return "io error";
    case ReadStatus::TooLarge:    return "too large";
    }
    return "?";
}

FrameReader::FrameReader(asio::ip::tcp::socket& sock, size_t max_payload)
    : sock_(sock), max_payload_(max_payload) {}

void FrameReader::async_read_prefix(PrefixHandler h) {
    read_exact(kPrefixBytes, [this, h = std::move(h)](ReadStatus st) {
        if (st != ReadStatus::Ok) {
            std::cerr << "[FrameReader] could not receive size of out-of-band data (" << to_string(st) << ")\n";
            h(st, 0);
            return;
        }
        h(ReadStatus::Ok, get32(buf_.data()));
    });
}

void FrameReader::async_read_payload(uint32_t declared_len, PayloadHandler h) {
    if (declared_len > max_payload_) {
        std::cerr << "[FrameReader] declared length " << declared_len
                  << " exceeds max " << max_payload_ << ", refusing\n";
        asio::post(sock_.get_executor(), [h = std::move(h)] { h(ReadStatus::TooLarge, RawFrame{}); });
        return;
    }
    read_exact(declared_len, [this, h = std::move(h)](ReadStatus st) {
        if (st != ReadStatus::Ok) {
            h(st, RawFrame{});
            return;
        }
        RawFrame frame = std::move(buf_);
        buf_.clear();
        h(ReadStatus::Ok, std::move(frame));
    });
}

std::vector<uint8_t> FrameReader::encode(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> f;
    f.reserve(kPrefixBytes + payload.size());
    put32(f, uint32_t(payload.size()));
    f.insert(f.end(), payload.begin(), payload.end());
    return f;
}

void FrameReader::read_exact(size_t n, Done done) {
    buf_.assign(n, 0);
    want_ = n;
    got_ = 0;
    if (n == 0) {
        asio::post(sock_.get_executor(), [done = std::move(done)] { done(ReadStatus::Ok); });
        return;
    }
    read_more(std::move(done));
}

void FrameReader::read_more(Done done) {
    sock_.async_read_some(
        asio::buffer(buf_.data() + got_, want_ - got_),
        [this, done = std::move(done)](const boost::system::error_code& ec, size_t n) mutable {
            got_ += n;
            if (got_ == want_) {
                done(ReadStatus::Ok);
                return;
            }
            if (ec == asio::error::eof) {
                std::cerr << "[FrameReader] stream ended. Read " << got_ << "; expected " << want_ << "\n";
                done(ReadStatus::EndOfStream);
                return;
            }
            if (ec) {
                std::cerr << "[FrameReader] read failed: " << ec.message()
                          << ". Read " << got_ << "; expected " << want_ << "\n";
                done(ReadStatus::IoError);
                return;
            }
            read_more(std::move(done)); // short read, go again for the rest
        });
}
