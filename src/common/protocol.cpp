#include "protocol.hpp"
#include <algorithm>

namespace photolink {

LengthField encode_length(uint32_t len) {
  return LengthField{{(uint8_t)(len >> 24), (uint8_t)(len >> 16),
                      (uint8_t)(len >> 8), (uint8_t)(len & 0xFF)}};
}

uint32_t decode_length(const LengthField &field) {
  return ((uint32_t)field[0] << 24) | ((uint32_t)field[1] << 16) |
         ((uint32_t)field[2] << 8) | (uint32_t)field[3];
}

std::vector<uint8_t> encode_frame(const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> buf(kLengthFieldSize + payload.size());
  auto hdr = encode_length((uint32_t)payload.size());
  std::copy(hdr.begin(), hdr.end(), buf.begin());
  std::copy(payload.begin(), payload.end(), buf.begin() + kLengthFieldSize);
  return buf;
}

bool is_ack(const uint8_t *data, size_t n) {
  return n == kAckSize && std::equal(kAck.begin(), kAck.end(), data);
}

} // namespace photolink
