#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

using RawFrame = std::vector<uint8_t>;

enum class ReadStatus : uint8_t {
    Ok,
    EndOfStream, // peer closed before the full count arrived
    IoError,     // socket error, including a forced close from stop()
    TooLarge     // declared length over the configured maximum
};

const char* to_string(ReadStatus s);

// Reads one length-prefixed frame off a connected stream socket:
//
//   byte[0..3]    payload length N, u32 little-endian
//   byte[4..4+N)  payload
//
// Each half is read with a retry loop over async_read_some until the full
// count is in; a short read of either half fails the whole frame.
// Handlers run on the socket's executor. The socket must outlive the reader.
class FrameReader {
public:
    static constexpr size_t kPrefixBytes = 4;

    using PrefixHandler  = std::function<void(ReadStatus, uint32_t)>;
    using PayloadHandler = std::function<void(ReadStatus, RawFrame)>;

    FrameReader(boost::asio::ip::tcp::socket& sock, size_t max_payload);

    void async_read_prefix(PrefixHandler h);
    void async_read_payload(uint32_t declared_len, PayloadHandler h);

    static std::vector<uint8_t> encode(const std::vector<uint8_t>& payload);

    static inline void put32(std::vector<uint8_t>& f, uint32_t v) {
        f.push_back(uint8_t(v & 0xFF));
        f.push_back(uint8_t((v >> 8) & 0xFF));
        f.push_back(uint8_t((v >> 16) & 0xFF));
        f.push_back(uint8_t(v >> 24));
    }
    static inline uint32_t get32(const uint8_t* p) {
        return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    }

private:
    using Done = std::function<void(ReadStatus)>;

    void read_exact(size_t n, Done done);
    void read_more(Done done);

    boost::asio::ip::tcp::socket& sock_;
    size_t max_payload_;

    std::vector<uint8_t> buf_;
    size_t want_ = 0;
    size_t got_ = 0;
};
