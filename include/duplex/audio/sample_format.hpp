#ifndef DUPLEX_AUDIO_SAMPLE_FORMAT_HPP_
#define DUPLEX_AUDIO_SAMPLE_FORMAT_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace duplex {
namespace audio {

/**
 * Raw sample layouts exchanged with the service
 *
 * - Uplink: signed 16-bit PCM, little-endian (capture device format)
 * - Downlink: IEEE-754 32-bit float, little-endian (playback device format)
 */

/**
 * Pack PCM16 samples into little-endian bytes
 * @param samples Capture samples
 * @param count Number of samples
 * @param out Output bytes (replaced, 2 * count long)
 */
void PackPcm16Le(const int16_t* samples, std::size_t count,
                 std::vector<uint8_t>& out);

/**
 * Unpack little-endian float32 samples
 * A trailing partial sample is ignored.
 * @param data Payload bytes
 * @param size Number of bytes
 * @param out Output samples (replaced, size / 4 long)
 * @return Number of samples unpacked
 */
std::size_t UnpackFloat32Le(const uint8_t* data, std::size_t size,
                            std::vector<float>& out);

/**
 * Pack float32 samples into little-endian bytes
 */
void PackFloat32Le(const float* samples, std::size_t count,
                   std::vector<uint8_t>& out);

}  // namespace audio
}  // namespace duplex

#endif  // DUPLEX_AUDIO_SAMPLE_FORMAT_HPP_
