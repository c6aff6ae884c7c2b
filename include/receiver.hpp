#ifndef QRDROP_RECV_RECEIVER_HPP
#define QRDROP_RECV_RECEIVER_HPP

#include <string>

#include "frame_cursor.hpp"
#include "reassembler.hpp"
#include "segment_decoder.hpp"

namespace qrdrop::recv {

/// Configuration for a receive run.
struct ReceiverConfig {
    std::string output_path;      // empty = do not write the file
    bool        verbose = false;  // per-frame diagnostics
};

/// Everything a run produces: how far the decoder got, scan counters,
/// and the reassembly outcome (with the file bytes on success).
struct ReceiveReport {
    DecodeStage      stage_reached = DecodeStage::None;
    ScanStats        stats;
    ReassemblyResult reassembly;
};

/// Top-level orchestrator for one transmission.
///
/// Receive path:
///   frames (PayloadSource) -> FrameCursor -> SegmentDecoder
///          -> Reassembler -> output file
class Receiver {
public:
    explicit Receiver(const ReceiverConfig& cfg) : cfg_(cfg) {}

    /// Decode and reassemble from the start of `source`. The source is
    /// restarted first, so repeated calls see the same frames.
    ReceiveReport receive(PayloadSource& source) const;

    /// Write a successful reconstruction to cfg.output_path.
    bool write_output(const ReassemblyResult& result) const;

    const ReceiverConfig& config() const noexcept { return cfg_; }

private:
    ReceiverConfig cfg_;
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_RECEIVER_HPP
