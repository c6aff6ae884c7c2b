#include "deframer.hpp"

#include <algorithm>
#include <cstdio>

#include "checksum.hpp"

namespace qrdrop::recv {

bool Deframer::verify(const std::vector<uint8_t>& frame, std::size_t hash_len) {
    // Tag byte plus at least one digest byte.
    if (hash_len == 0 || frame.size() < hash_len + 1) return false;

    const std::size_t signed_len = frame.size() - hash_len;
    auto computed = Checksum::blake2b(frame.data(), signed_len, hash_len);
    if (computed.size() != hash_len) return false;

    return std::equal(computed.begin(), computed.end(),
                      frame.begin() + static_cast<std::ptrdiff_t>(signed_len));
}

std::optional<std::size_t> Deframer::guess_hash_len(const std::vector<uint8_t>& frame) {
    if (frame.size() < 2) return std::nullopt;

    const std::size_t max_len =
        std::min(frame.size() - 1, Checksum::kBlake2bMaxLen);
    for (std::size_t len = 1; len <= max_len; ++len) {
        if (verify(frame, len)) return len;
    }
    return std::nullopt;
}

uint64_t Deframer::read_be(const uint8_t* data, std::size_t width) {
    uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

DeframeResult Deframer::deframe(const std::vector<uint8_t>& frame,
                                std::size_t hash_len,
                                const TransferMetadata* metadata) {
    if (frame.size() < hash_len + 1) {
        return {false, std::nullopt, "frame too short"};
    }
    if (!verify(frame, hash_len)) {
        return {false, std::nullopt, "digest mismatch"};
    }

    // Body sits between the tag byte and the digest.
    auto body_begin = frame.begin() + 1;
    auto body_end   = frame.end() - static_cast<std::ptrdiff_t>(hash_len);
    std::vector<uint8_t> digest(body_end, frame.end());

    switch (static_cast<FrameTag>(frame[0])) {
        case FrameTag::Metadata:
            return {true, MetadataFragment{std::string(body_begin, body_end)}, {}};

        case FrameTag::Data: {
            if (!metadata) {
                return {false, std::nullopt, "data frame before metadata"};
            }
            const std::size_t body_len =
                static_cast<std::size_t>(body_end - body_begin);
            if (body_len < metadata->id_width) {
                return {false, std::nullopt, "data frame shorter than its id"};
            }
            uint64_t id = read_be(&*body_begin, metadata->id_width);
            if (id >= metadata->segment_count) {
                return {false, std::nullopt,
                        "segment id " + std::to_string(id) + " out of range"};
            }
            ContentSegment seg;
            seg.id = id;
            seg.payload.assign(body_begin + static_cast<std::ptrdiff_t>(metadata->id_width),
                               body_end);
            seg.digest = std::move(digest);
            return {true, std::move(seg), {}};
        }

        case FrameTag::Checksum: {
            ChecksumSegment seg;
            seg.value.assign(body_begin, body_end);
            seg.digest = std::move(digest);
            return {true, std::move(seg), {}};
        }
    }

    char msg[32];
    std::snprintf(msg, sizeof(msg), "unknown tag 0x%02x", frame[0]);
    return {false, std::nullopt, msg};
}

const char* tag_name(uint8_t tag) {
    switch (tag) {
        case 'M': return "metadata";
        case 'D': return "data";
        case 'H': return "checksum";
    }
    return "?";
}

} // namespace qrdrop::recv
