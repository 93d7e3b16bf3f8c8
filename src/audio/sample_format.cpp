#include "duplex/audio/sample_format.hpp"

#include <cstring>

namespace duplex {
namespace audio {

void PackPcm16Le(const int16_t* samples, std::size_t count,
                 std::vector<uint8_t>& out) {
  out.resize(count * 2);
  for (std::size_t i = 0; i < count; ++i) {
    const uint16_t v = static_cast<uint16_t>(samples[i]);
    out[i * 2] = static_cast<uint8_t>(v & 0xFF);
    out[i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  }
}

std::size_t UnpackFloat32Le(const uint8_t* data, std::size_t size,
                            std::vector<float>& out) {
  const std::size_t count = size / 4;
  out.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    const uint8_t* p = data + i * 4;
    const uint32_t bits = static_cast<uint32_t>(p[0]) |
                          (static_cast<uint32_t>(p[1]) << 8) |
                          (static_cast<uint32_t>(p[2]) << 16) |
                          (static_cast<uint32_t>(p[3]) << 24);
    std::memcpy(&out[i], &bits, sizeof(float));
  }
  return count;
}

void PackFloat32Le(const float* samples, std::size_t count,
                   std::vector<uint8_t>& out) {
  out.resize(count * 4);
  for (std::size_t i = 0; i < count; ++i) {
    uint32_t bits = 0;
    std::memcpy(&bits, &samples[i], sizeof(float));
    out[i * 4] = static_cast<uint8_t>(bits & 0xFF);
    out[i * 4 + 1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
    out[i * 4 + 2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
    out[i * 4 + 3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
  }
}

}  // namespace audio
}  // namespace duplex
