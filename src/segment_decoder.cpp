#include "segment_decoder.hpp"

#include <cstdio>
#include <utility>
#include <variant>

namespace qrdrop::recv {

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

DecodeResult SegmentDecoder::run(FrameCursor& cursor) const {
    DecodeResult result;

    // Stage 1: metadata.
    result.stage_reached = DecodeStage::AcquireMetadata;
    if (!acquire_metadata(result.state, cursor, result.error)) {
        result.fatal = true;
        result.state.stats.frames_seen = cursor.position();
        return result;
    }
    if (!result.state.metadata) {
        std::printf("[decoder] frames exhausted before metadata was complete\n");
        result.state.stats.frames_seen = cursor.position();
        return result;
    }

    const TransferMetadata& md = *result.state.metadata;
    std::printf("[decoder] metadata: %llu segments, %zu-byte ids, "
                "%zu-byte digests\n",
                static_cast<unsigned long long>(md.segment_count),
                md.id_width, md.hash_length);

    // Stage 2: content segments.
    result.stage_reached = DecodeStage::AcquireData;
    bool terminated = acquire_data(result.state, cursor);
    std::printf("[decoder] collected %zu/%llu segments\n",
                result.state.segments.size(),
                static_cast<unsigned long long>(md.segment_count));
    if (!terminated) {
        std::printf("[decoder] frames exhausted before the checksum frame\n");
        result.state.stats.frames_seen = cursor.position();
        return result;
    }

    // Stage 3: whole-file checksum.
    result.stage_reached = DecodeStage::AcquireChecksum;
    acquire_checksum(result.state, cursor);
    result.state.stats.frames_seen = cursor.position();
    if (!result.state.checksum) {
        std::printf("[decoder] no valid checksum frame found\n");
        return result;
    }

    result.stage_reached = DecodeStage::Complete;
    return result;
}

// ---------------------------------------------------------------------------
// Stage 1: metadata
// ---------------------------------------------------------------------------

bool SegmentDecoder::acquire_metadata(DecoderState& state, FrameCursor& cursor,
                                      std::string& error) const {
    while (auto frame = cursor.next()) {
        if (!frame->payload) {
            ++state.stats.frames_without_code;
            continue;
        }

        // The digest length is unknown until the record is parsed.
        auto hash_len = Deframer::guess_hash_len(*frame->payload);
        if (!hash_len) {
            ++state.stats.frames_rejected;
            if (verbose_) {
                std::printf("[decoder] %s: no digest length verifies\n",
                            frame->label.c_str());
            }
            continue;
        }

        auto deframed = Deframer::deframe(*frame->payload, *hash_len);
        if (!deframed.valid) {
            ++state.stats.frames_rejected;
            if (verbose_) {
                std::printf("[decoder] %s: rejected while waiting for "
                            "metadata: %s\n",
                            frame->label.c_str(), deframed.error.c_str());
            }
            continue;
        }
        if (!std::holds_alternative<MetadataFragment>(*deframed.segment)) {
            if (verbose_) {
                std::printf("[decoder] %s: skipped %s frame while waiting "
                            "for metadata\n",
                            frame->label.c_str(),
                            tag_name(frame->payload->front()));
            }
            continue;
        }

        const auto& fragment = std::get<MetadataFragment>(*deframed.segment);
        state.metadata_text += fragment.text;
        if (verbose_) {
            std::printf("[decoder] %s: metadata fragment (%zu chars, "
                        "%zu-byte digest)\n",
                        frame->label.c_str(), fragment.text.size(), *hash_len);
        }

        if (!MetadataParser::is_terminated(state.metadata_text)) continue;

        auto parsed = MetadataParser::parse(state.metadata_text);
        if (!parsed.valid) {
            error = "metadata: " + parsed.error;
            std::fprintf(stderr, "[decoder] invalid metadata \"%s\": %s\n",
                         state.metadata_text.c_str(), parsed.error.c_str());
            return false;
        }
        state.metadata = parsed.metadata;
        state.metadata_text.clear();
        return true;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Stage 2: content segments
// ---------------------------------------------------------------------------

bool SegmentDecoder::acquire_data(DecoderState& state, FrameCursor& cursor) const {
    const TransferMetadata& md = *state.metadata;

    while (auto frame = cursor.next()) {
        if (!frame->payload) {
            ++state.stats.frames_without_code;
            continue;
        }

        auto deframed = Deframer::deframe(*frame->payload, md.hash_length, &md);
        if (!deframed.valid) {
            ++state.stats.frames_rejected;
            if (verbose_) {
                std::printf("[decoder] %s: rejected: %s\n",
                            frame->label.c_str(), deframed.error.c_str());
            }
            continue;
        }

        if (std::holds_alternative<ChecksumSegment>(*deframed.segment)) {
            if (cursor.unread()) return true;

            // The rewind is spent; take the checksum from this frame.
            std::fprintf(stderr, "[decoder] cursor rewind refused at %s\n",
                         frame->label.c_str());
            state.checksum = std::get<ChecksumSegment>(std::move(*deframed.segment));
            return true;
        }

        if (auto* seg = std::get_if<ContentSegment>(&*deframed.segment)) {
            auto it = state.segments.find(seg->id);
            if (it != state.segments.end()) {
                ++state.stats.duplicate_segments;
                if (it->second.payload != seg->payload) {
                    ++state.stats.conflicting_segments;
                    std::fprintf(stderr, "[decoder] %s: segment %llu repeated "
                                 "with different content, keeping the newer one\n",
                                 frame->label.c_str(),
                                 static_cast<unsigned long long>(seg->id));
                }
            } else if (verbose_) {
                std::printf("[decoder] %s: got segment %llu (%zu bytes)\n",
                            frame->label.c_str(),
                            static_cast<unsigned long long>(seg->id),
                            seg->payload.size());
            }
            uint64_t id = seg->id;
            state.segments[id] = std::move(*seg);
        }
        // Repeated metadata broadcasts are ignored.
    }
    return false;
}

// ---------------------------------------------------------------------------
// Stage 3: checksum
// ---------------------------------------------------------------------------

void SegmentDecoder::acquire_checksum(DecoderState& state, FrameCursor& cursor) const {
    if (state.checksum) return;

    const TransferMetadata& md = *state.metadata;

    while (auto frame = cursor.next()) {
        if (!frame->payload) {
            ++state.stats.frames_without_code;
            continue;
        }

        auto deframed = Deframer::deframe(*frame->payload, md.hash_length, &md);
        if (!deframed.valid) {
            ++state.stats.frames_rejected;
            continue;
        }

        if (auto* seg = std::get_if<ChecksumSegment>(&*deframed.segment)) {
            if (verbose_) {
                std::printf("[decoder] %s: got checksum\n", frame->label.c_str());
            }
            state.checksum = std::move(*seg);
            return;
        }
    }
}

const char* stage_name(DecodeStage stage) {
    switch (stage) {
        case DecodeStage::None:            return "none";
        case DecodeStage::AcquireMetadata: return "acquire_metadata";
        case DecodeStage::AcquireData:     return "acquire_data";
        case DecodeStage::AcquireChecksum: return "acquire_checksum";
        case DecodeStage::Complete:        return "complete";
    }
    return "unknown";
}

} // namespace qrdrop::recv
