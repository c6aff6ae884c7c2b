#ifndef QRDROP_RECV_SEGMENT_DECODER_HPP
#define QRDROP_RECV_SEGMENT_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "deframer.hpp"
#include "frame_cursor.hpp"
#include "metadata.hpp"

namespace qrdrop::recv {

/// Phases of the segment decoder, in the order they are entered.
enum class DecodeStage {
    None,
    AcquireMetadata,
    AcquireData,
    AcquireChecksum,
    Complete
};

/// Counters collected while scanning.
struct ScanStats {
    std::size_t frames_seen          = 0;
    std::size_t frames_without_code  = 0;
    std::size_t frames_rejected      = 0;   // failed digest, tag or body checks
    std::size_t duplicate_segments   = 0;
    std::size_t conflicting_segments = 0;   // duplicates with a different payload
};

/// Everything accumulated during one run. Owned by the decoder while it
/// scans, then handed to the Reassembler.
struct DecoderState {
    std::string                         metadata_text;
    std::optional<TransferMetadata>     metadata;
    std::map<uint64_t, ContentSegment>  segments;
    std::optional<ChecksumSegment>      checksum;
    ScanStats                           stats;
};

/// Result of a decoder run, with the stage reached and, on a structural
/// failure, the reason.
struct DecodeResult {
    DecodeStage  stage_reached = DecodeStage::None;
    bool         fatal         = false;
    std::string  error;
    DecoderState state;
};

/// Segment protocol decoder: metadata -> data -> checksum.
///
/// Stages:
///   1. AcquireMetadata: collect 'M' fragments (digest length guessed per
///      frame) until the text closes with '}', then parse it.
///   2. AcquireData: collect verified 'D' segments until a verified 'H'
///      frame shows up; the cursor is rewound onto that frame.
///   3. AcquireChecksum: take the first verified 'H' frame as the
///      whole-file checksum.
/// Running out of frames ends the current stage without an error.
class SegmentDecoder {
public:
    explicit SegmentDecoder(bool verbose = false) : verbose_(verbose) {}

    /// Run all stages over the cursor.
    DecodeResult run(FrameCursor& cursor) const;

    /// Stage 1. Returns false on a structural metadata error.
    bool acquire_metadata(DecoderState& state, FrameCursor& cursor,
                          std::string& error) const;

    /// Stage 2. Returns true if it stopped on a checksum frame.
    bool acquire_data(DecoderState& state, FrameCursor& cursor) const;

    /// Stage 3.
    void acquire_checksum(DecoderState& state, FrameCursor& cursor) const;

private:
    bool verbose_;
};

/// Printable stage name, for reports.
const char* stage_name(DecodeStage stage);

} // namespace qrdrop::recv

#endif // QRDROP_RECV_SEGMENT_DECODER_HPP
