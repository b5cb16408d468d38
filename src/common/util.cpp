#include "util.hpp"

namespace photolink {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  std::string p = s.substr(pos + 1);
  if (p.empty() || p.find_first_not_of("0123456789") != std::string::npos ||
      p.size() > 5)
    return false;
  int v = std::stoi(p);
  if (v > 65535)
    return false;
  port = (uint16_t)v;
  return true;
}

uint16_t parse_port(const std::string &s, uint16_t fallback) {
  std::string t = trim(s);
  if (t.empty() || t.size() > 5 ||
      t.find_first_not_of("0123456789") != std::string::npos)
    return fallback;
  int v = std::stoi(t);
  if (v < 1 || v > 65535)
    return fallback;
  return (uint16_t)v;
}

bool parse_bounded(const std::string &s, uint64_t lo, uint64_t hi,
                   uint64_t &out) {
  std::string t = trim(s);
  if (t.empty() || t.size() > 19 ||
      t.find_first_not_of("0123456789") != std::string::npos)
    return false;
  uint64_t v = std::stoull(t);
  if (v < lo || v > hi)
    return false;
  out = v;
  return true;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return std::string();
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // namespace photolink
