#include "receiver.hpp"

#include <cstdio>

namespace qrdrop::recv {

// ---------------------------------------------------------------------------
// Receive path
// ---------------------------------------------------------------------------

ReceiveReport Receiver::receive(PayloadSource& source) const {
    source.restart();
    FrameCursor cursor(source);

    SegmentDecoder decoder(cfg_.verbose);
    DecodeResult decoded = decoder.run(cursor);

    ReceiveReport report;
    report.stage_reached = decoded.stage_reached;
    report.stats         = decoded.state.stats;

    if (decoded.fatal) {
        report.reassembly.status = ReassemblyStatus::ProtocolError;
        report.reassembly.error  = decoded.error;
        return report;
    }

    report.reassembly = Reassembler::reassemble(decoded.state);
    return report;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

bool Receiver::write_output(const ReassemblyResult& result) const {
    if (!result.success()) return false;
    if (cfg_.output_path.empty()) {
        std::fprintf(stderr, "[recv] no output path configured\n");
        return false;
    }

    std::FILE* fp = std::fopen(cfg_.output_path.c_str(), "wb");
    if (!fp) {
        std::fprintf(stderr, "[recv] cannot create '%s'\n",
                     cfg_.output_path.c_str());
        return false;
    }

    std::size_t written = result.file.empty()
        ? 0
        : std::fwrite(result.file.data(), 1, result.file.size(), fp);
    bool ok = (written == result.file.size());
    if (std::fclose(fp) != 0) ok = false;

    if (!ok) {
        std::fprintf(stderr, "[recv] short write to '%s'\n",
                     cfg_.output_path.c_str());
        return false;
    }

    std::printf("[recv] wrote %zu bytes to %s\n", result.file.size(),
                cfg_.output_path.c_str());
    return true;
}

} // namespace qrdrop::recv
