#pragma once
#include <string>
#include <cstdint>

namespace photolink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// Port typed by a user; anything missing or unparsable yields `fallback`.
uint16_t parse_port(const std::string& s, uint16_t fallback);

std::string trim(const std::string& s);

// Decimal integer within [lo, hi]; false for anything else, including overflow.
bool parse_bounded(const std::string& s, uint64_t lo, uint64_t hi, uint64_t& out);

} // namespace photolink
