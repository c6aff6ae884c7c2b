#include "reassembler.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

#include "checksum.hpp"

namespace qrdrop::recv {

std::string Reassembler::checksum_hex(const std::vector<uint8_t>& value) {
    if (value.size() == Checksum::kMd5Len) {
        return Checksum::to_hex(value);
    }

    // Senders that put the hex digest text in the frame.
    if (value.size() == 2 * Checksum::kMd5Len) {
        std::string hex;
        hex.reserve(value.size());
        for (uint8_t c : value) {
            if (!std::isxdigit(c)) return {};
            hex += static_cast<char>(std::tolower(c));
        }
        return hex;
    }
    return {};
}

ReassemblyResult Reassembler::reassemble(const DecoderState& state) {
    ReassemblyResult result;

    if (!state.metadata) {
        result.status = ReassemblyStatus::NoTransmission;
        result.error  = "no transmission detected";
        return result;
    }

    const TransferMetadata& md = *state.metadata;

    // Ids are unique and below segment_count, so equal counts mean no gaps.
    // Gaps are collected as ranges between known ids; the declared count
    // may be far larger than anything received.
    if (state.segments.size() != md.segment_count) {
        uint64_t next = 0;
        for (const auto& entry : state.segments) {
            uint64_t id = entry.first;
            if (id > next) {
                result.missing.push_back({next, id - 1});
                result.missing_count += id - next;
            }
            next = id + 1;
        }
        if (next < md.segment_count) {
            result.missing.push_back({next, md.segment_count - 1});
            result.missing_count += md.segment_count - next;
        }
        result.status = ReassemblyStatus::MissingSegments;
        result.error  = std::to_string(result.missing_count) +
                        " of " + std::to_string(md.segment_count) +
                        " segments missing";
        return result;
    }

    std::vector<uint8_t> joined;
    for (const auto& [id, seg] : state.segments) {
        joined.insert(joined.end(), seg.payload.begin(), seg.payload.end());
    }

    result.computed_checksum = Checksum::md5_hex(joined);
    if (state.checksum) {
        result.expected_checksum = checksum_hex(state.checksum->value);
    }

    if (!state.checksum || result.expected_checksum.empty() ||
        result.computed_checksum.empty() ||
        result.expected_checksum != result.computed_checksum) {
        result.status = ReassemblyStatus::ChecksumMismatch;
        result.error  = state.checksum ? "whole-file checksum mismatch"
                                       : "no checksum frame received";
        std::fprintf(stderr, "[reassembly] md5 not matched: expected '%s', "
                     "computed '%s'\n",
                     result.expected_checksum.c_str(),
                     result.computed_checksum.c_str());
        return result;
    }

    std::printf("[reassembly] md5 matched: %s (%zu bytes)\n",
                result.computed_checksum.c_str(), joined.size());
    result.status = ReassemblyStatus::Complete;
    result.file   = std::move(joined);
    return result;
}

const char* status_name(ReassemblyStatus status) {
    switch (status) {
        case ReassemblyStatus::Complete:         return "complete";
        case ReassemblyStatus::NoTransmission:   return "no_transmission";
        case ReassemblyStatus::ProtocolError:    return "protocol_error";
        case ReassemblyStatus::MissingSegments:  return "missing_segments";
        case ReassemblyStatus::ChecksumMismatch: return "checksum_mismatch";
    }
    return "unknown";
}

} // namespace qrdrop::recv
