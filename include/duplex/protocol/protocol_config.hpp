#ifndef DUPLEX_PROTOCOL_PROTOCOL_CONFIG_HPP_
#define DUPLEX_PROTOCOL_PROTOCOL_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace duplex {
namespace protocol {

enum class Version : uint8_t {
  kVersion1 = 0b0001,
  kVersion2 = 0b0010,
  kVersion3 = 0b0011,
  kVersion4 = 0b0100,
};

/**
 * Header size in 4-byte words
 */
enum class HeaderSize : uint8_t {
  kHeaderSize4 = 1,
  kHeaderSize8 = 2,
  kHeaderSize12 = 3,
  kHeaderSize16 = 4,
};

enum class Serialization : uint8_t {
  kRaw = 0b0000,
  kJson = 0b0001,
  kThrift = 0b0011,
  kCustom = 0b1111,
};

enum class Compression : uint8_t {
  kNone = 0b0000,
  kGzip = 0b0001,
  kCustom = 0b1111,
};

/**
 * ProtocolConfig - Header nibbles written into bytes 0 and 2 of a frame
 *
 * Each field occupies one nibble on the wire. Values outside the named
 * enumerators are allowed as long as they fit in four bits, so that a
 * decoded header can be reported back verbatim.
 */
struct ProtocolConfig {
  Version version = Version::kVersion1;
  HeaderSize header_size = HeaderSize::kHeaderSize4;
  Serialization serialization = Serialization::kJson;
  Compression compression = Compression::kNone;

  std::size_t HeaderBytes() const {
    return static_cast<std::size_t>(header_size) * 4;
  }

  bool IsValid() const {
    return static_cast<uint8_t>(version) <= 0x0F &&
           static_cast<uint8_t>(header_size) >= 1 &&
           static_cast<uint8_t>(header_size) <= 0x0F &&
           static_cast<uint8_t>(serialization) <= 0x0F &&
           static_cast<uint8_t>(compression) <= 0x0F;
  }
};

}  // namespace protocol
}  // namespace duplex

#endif  // DUPLEX_PROTOCOL_PROTOCOL_CONFIG_HPP_
