#ifndef QRDROP_RECV_METADATA_HPP
#define QRDROP_RECV_METADATA_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace qrdrop::recv {

/// Describes the whole transmission. Immutable once parsed.
struct TransferMetadata {
    uint64_t    segment_count = 0;
    std::size_t id_width      = 0;   // 1, 2, 4 or 8 bytes
    std::size_t hash_length   = 0;   // per-frame BLAKE2b digest length
};

/// Result of parsing the accumulated metadata text.
struct MetadataParseResult {
    bool             valid = false;
    TransferMetadata metadata;
    std::string      error;
};

/// Parser for the flat JSON record broadcast in 'M' frames:
///
///   {"segment_count":N,"id_width":W,"hash_length":H}
///
/// The field names of older senders are accepted too: "qrcode_count",
/// "hash_len", and "id_type" with a value of "u8", "u16", "u32" or "u64".
/// Unknown fields are skipped.
class MetadataParser {
public:
    static MetadataParseResult parse(std::string_view text);

    /// True once the accumulated text can be handed to parse().
    static bool is_terminated(std::string_view text);
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_METADATA_HPP
