#ifndef QRDROP_RECV_REASSEMBLER_HPP
#define QRDROP_RECV_REASSEMBLER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "segment_decoder.hpp"

namespace qrdrop::recv {

/// Outcome of a reconstruction attempt.
enum class ReassemblyStatus {
    Complete,
    NoTransmission,     // metadata never parsed
    ProtocolError,      // structural metadata failure
    MissingSegments,
    ChecksumMismatch
};

/// Inclusive run of absent segment ids.
struct IdRange {
    uint64_t first = 0;
    uint64_t last  = 0;

    bool operator==(const IdRange& o) const noexcept {
        return first == o.first && last == o.last;
    }
};

/// Structured report of a run. `file` is filled only when Complete.
struct ReassemblyResult {
    ReassemblyStatus      status = ReassemblyStatus::NoTransmission;
    std::vector<uint8_t>  file;
    std::vector<IdRange>  missing;         // ascending, non-adjacent
    uint64_t              missing_count = 0;
    std::string           expected_checksum;   // from the 'H' frame, lowercase hex
    std::string           computed_checksum;
    std::string           error;

    bool success() const noexcept { return status == ReassemblyStatus::Complete; }
};

/// Joins collected segments by ascending id and checks the whole-file MD5.
class Reassembler {
public:
    static ReassemblyResult reassemble(const DecoderState& state);

    /// Lowercase hex of a checksum segment value. Accepts the raw 16-byte
    /// digest or its 32-character hex text; anything else yields "".
    static std::string checksum_hex(const std::vector<uint8_t>& value);
};

/// Printable status name, for reports.
const char* status_name(ReassemblyStatus status);

} // namespace qrdrop::recv

#endif // QRDROP_RECV_REASSEMBLER_HPP
