#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "oob_token.hpp"

// Sending side of the OOB exchange: connect, write one [u32 LE len][payload]
// frame, close. Blocking; false on any resolve/connect/write failure.
bool send_oob_frame(const std::string& host, uint16_t port, const std::vector<uint8_t>& payload);

bool send_oob_token(const std::string& host, uint16_t port, const OobToken& token, WireFormat fmt);
