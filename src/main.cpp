#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include "checksum.hpp"
#include "deframer.hpp"
#include "frame_source.hpp"
#include "receiver.hpp"

static void print_usage() {
    std::puts(
        "qrdrop-recv v1.0.0\n"
        "Usage:\n"
        "  qrdrop-recv recv <image_dir> <output_file> [options]\n"
        "                                   Reassemble a file from QR frames\n"
        "  qrdrop-recv scan <image_dir> [options]\n"
        "                                   Classify each frame without reassembling\n"
        "Options:\n"
        "  --raw       QR content is the frame bytes (default: base64 text)\n"
        "  --verbose   Per-frame diagnostics\n"
    );
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static void print_report(const qrdrop::recv::ReceiveReport& report) {
    using qrdrop::recv::ReassemblyStatus;
    const auto& r = report.reassembly;

    std::printf("[recv] frames: %zu seen, %zu without code, %zu rejected, "
                "%zu duplicate segments\n",
                report.stats.frames_seen, report.stats.frames_without_code,
                report.stats.frames_rejected, report.stats.duplicate_segments);

    if (r.success()) {
        std::printf("[recv] status: %s\n", qrdrop::recv::status_name(r.status));
        return;
    }

    std::fprintf(stderr, "[recv] status: %s (decoder stage '%s'): %s\n",
                 qrdrop::recv::status_name(r.status),
                 qrdrop::recv::stage_name(report.stage_reached),
                 r.error.c_str());

    if (r.status == ReassemblyStatus::MissingSegments) {
        std::fprintf(stderr, "[recv] missing ids:");
        for (const auto& range : r.missing) {
            if (range.first == range.last) {
                std::fprintf(stderr, " %llu",
                             static_cast<unsigned long long>(range.first));
            } else {
                std::fprintf(stderr, " %llu-%llu",
                             static_cast<unsigned long long>(range.first),
                             static_cast<unsigned long long>(range.last));
            }
        }
        std::fprintf(stderr, "\n");
    } else if (r.status == ReassemblyStatus::ChecksumMismatch) {
        std::fprintf(stderr, "[recv] expected md5: %s\n",
                     r.expected_checksum.empty() ? "(none)"
                                                 : r.expected_checksum.c_str());
        std::fprintf(stderr, "[recv] computed md5: %s\n",
                     r.computed_checksum.c_str());
    }
}

static int cmd_recv(const qrdrop::recv::FrameSourceConfig& src_cfg,
                    const qrdrop::recv::ReceiverConfig& recv_cfg) {
    qrdrop::recv::ImageDirSource source;
    if (!source.open(src_cfg)) {
        std::fprintf(stderr, "error: cannot open image directory\n");
        return 1;
    }

    qrdrop::recv::Receiver receiver(recv_cfg);
    auto report = receiver.receive(source);
    print_report(report);

    if (!report.reassembly.success()) return 1;
    return receiver.write_output(report.reassembly) ? 0 : 1;
}

static int cmd_scan(const qrdrop::recv::FrameSourceConfig& src_cfg) {
    using qrdrop::recv::Deframer;

    qrdrop::recv::ImageDirSource source;
    if (!source.open(src_cfg)) {
        std::fprintf(stderr, "error: cannot open image directory\n");
        return 1;
    }

    std::size_t decoded = 0;
    while (auto frame = source.next()) {
        if (!frame->payload) {
            std::printf("  %-28s no code\n", frame->label.c_str());
            continue;
        }
        ++decoded;

        const auto& bytes = *frame->payload;
        auto hash_len = Deframer::guess_hash_len(bytes);
        if (!hash_len) {
            std::printf("  %-28s %zu bytes, unverified\n",
                        frame->label.c_str(), bytes.size());
            continue;
        }
        std::printf("  %-28s %-8s body %zu bytes, digest %zu bytes\n",
                    frame->label.c_str(), qrdrop::recv::tag_name(bytes.front()),
                    bytes.size() - 1 - *hash_len, *hash_len);
    }

    std::printf("[scan] %zu of %zu frames carried a code\n", decoded,
                source.frame_count());
    return 0;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    if (!qrdrop::recv::Checksum::short_digests_supported()) {
        std::fprintf(stderr, "[checksum] this libcrypto cannot produce BLAKE2b "
                     "digests shorter than 64 bytes; only 64-byte frames "
                     "will verify (OpenSSL 3.2+ required)\n");
    }

    const char* cmd = argv[1];

    qrdrop::recv::FrameSourceConfig src_cfg;
    qrdrop::recv::ReceiverConfig    recv_cfg;
    src_cfg.image_dir = argv[2];

    // Positional arguments first, then options.
    int first_opt = 3;
    if (std::strcmp(cmd, "recv") == 0) {
        if (argc < 4) {
            print_usage();
            return 1;
        }
        recv_cfg.output_path = argv[3];
        first_opt = 4;
    }

    for (int i = first_opt; i < argc; ++i) {
        if (std::strcmp(argv[i], "--raw") == 0) {
            src_cfg.encoding = qrdrop::recv::PayloadEncoding::Raw;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            src_cfg.verbose  = true;
            recv_cfg.verbose = true;
        } else {
            std::fprintf(stderr, "error: unknown option '%s'\n", argv[i]);
            print_usage();
            return 1;
        }
    }

    if (std::strcmp(cmd, "recv") == 0) {
        return cmd_recv(src_cfg, recv_cfg);
    }
    if (std::strcmp(cmd, "scan") == 0) {
        return cmd_scan(src_cfg);
    }

    print_usage();
    return 1;
}
