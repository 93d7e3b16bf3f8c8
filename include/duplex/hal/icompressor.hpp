#ifndef DUPLEX_HAL_ICOMPRESSOR_HPP_
#define DUPLEX_HAL_ICOMPRESSOR_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace duplex {
namespace hal {

/**
 * ICompressor - Payload transform applied by the frame codec
 *
 * The codec compresses a payload before computing its length field and
 * decompresses it after reading it back, but only when the frame's
 * compression nibble is not None. Implementations are called from the
 * capture, control and receive contexts concurrently and must therefore
 * keep no unsynchronized mutable state.
 */
class ICompressor {
 public:
  virtual ~ICompressor() = default;

  /**
   * Compress a payload
   * @param data Input bytes
   * @param size Number of input bytes
   * @param out Output buffer (replaced)
   * @return true on success
   */
  virtual bool Compress(const uint8_t* data, std::size_t size,
                        std::vector<uint8_t>& out) const = 0;

  /**
   * Reverse Compress()
   * @return true on success, false on corrupt input
   */
  virtual bool Decompress(const uint8_t* data, std::size_t size,
                          std::vector<uint8_t>& out) const = 0;
};

}  // namespace hal
}  // namespace duplex

#endif  // DUPLEX_HAL_ICOMPRESSOR_HPP_
