#ifndef QRDROP_RECV_DEFRAMER_HPP
#define QRDROP_RECV_DEFRAMER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "metadata.hpp"

namespace qrdrop::recv {

/// Tag byte leading every protocol frame.
enum class FrameTag : uint8_t {
    Metadata = 'M',
    Data     = 'D',
    Checksum = 'H',
};

/// Piece of the metadata record text carried by an 'M' frame.
struct MetadataFragment {
    std::string text;
};

/// One addressable chunk of the target file, carried by a 'D' frame.
struct ContentSegment {
    uint64_t             id = 0;
    std::vector<uint8_t> payload;
    std::vector<uint8_t> digest;
};

/// Whole-file MD5 carried by the terminal 'H' frame.
struct ChecksumSegment {
    std::vector<uint8_t> value;
    std::vector<uint8_t> digest;
};

using Segment = std::variant<MetadataFragment, ContentSegment, ChecksumSegment>;

/// Result of a deframe operation.
struct DeframeResult {
    bool                   valid = false;
    std::optional<Segment> segment;
    std::string            error;
};

/// Splits and verifies protocol frames.
///
/// Frame format: tag (1 byte) + body + digest (hash_length bytes), where
/// digest = BLAKE2b(tag + body) with an output length of hash_length.
/// 'D' bodies are an id_width-byte big-endian id followed by the payload.
class Deframer {
public:
    /// Check the trailing digest of `frame` for a digest length of `hash_len`.
    static bool verify(const std::vector<uint8_t>& frame, std::size_t hash_len);

    /// Recover the digest length of a frame whose metadata is not known yet:
    /// the shortest length in 1..min(size - 1, 64) for which the frame verifies.
    static std::optional<std::size_t> guess_hash_len(const std::vector<uint8_t>& frame);

    /// Verify and parse a frame. `metadata` is required for 'D' frames only.
    static DeframeResult deframe(const std::vector<uint8_t>& frame,
                                 std::size_t hash_len,
                                 const TransferMetadata* metadata = nullptr);

    /// Read an unsigned big-endian integer of `width` bytes (at most 8).
    static uint64_t read_be(const uint8_t* data, std::size_t width);
};

/// Printable name of a tag byte, for logs.
const char* tag_name(uint8_t tag);

} // namespace qrdrop::recv

#endif // QRDROP_RECV_DEFRAMER_HPP
