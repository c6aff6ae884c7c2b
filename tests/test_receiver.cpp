#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

#include "receiver.hpp"
#include "segment_decoder.hpp"
#include "test_util.hpp"

using namespace qrdrop::recv;
using namespace qrdrop::recv::test;

namespace {

constexpr std::size_t kHash = 4;

/// The two-segment "ABCD" transmission, metadata split over two frames.
MemorySource abcd_transmission(bool with_id1 = true,
                               const std::string& checksum_of = "ABCD") {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":2,\"id_wid", kHash));
    source.add(metadata_frame("th\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    if (with_id1) source.add(data_frame(1, 1, "CD", kHash));
    source.add(checksum_frame(checksum_of, kHash));
    return source;
}

ReceiveReport receive(MemorySource& source) {
    Receiver receiver(ReceiverConfig{});
    return receiver.receive(source);
}

} // namespace

// ---------------------------------------------------------------------------
// End-to-end scenarios
// ---------------------------------------------------------------------------

TEST(Receiver, ReassemblesSplitMetadataTransmission) {
    auto source = abcd_transmission();
    auto report = receive(source);

    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.reassembly.file, to_bytes("ABCD"));
    EXPECT_EQ(report.stage_reached, DecodeStage::Complete);
    EXPECT_EQ(report.stats.frames_seen, 5u);
    EXPECT_EQ(report.stats.frames_rejected, 0u);
}

TEST(Receiver, WrongEmbeddedChecksumIsReported) {
    auto source = abcd_transmission(true, "ABCE");
    auto report = receive(source);

    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::ChecksumMismatch);
    EXPECT_TRUE(report.reassembly.file.empty());
    EXPECT_EQ(report.reassembly.expected_checksum,
              Checksum::md5_hex(to_bytes("ABCE")));
    EXPECT_EQ(report.reassembly.computed_checksum,
              Checksum::md5_hex(to_bytes("ABCD")));
}

TEST(Receiver, MissingSegmentIsReported) {
    auto source = abcd_transmission(false);
    auto report = receive(source);

    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::MissingSegments);
    EXPECT_EQ(report.reassembly.missing, (std::vector<IdRange>{{1, 1}}));
    EXPECT_TRUE(report.reassembly.file.empty());
}

TEST(Receiver, MaximalSegmentCountIsReportedNotAllocated) {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":18446744073709551615,"
                              "\"id_width\":8,\"hash_length\":64}", 64));
    source.add(data_frame(0, 8, "AB", 64));

    auto report = receive(source);
    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::MissingSegments);
    ASSERT_EQ(report.reassembly.missing.size(), 1u);
    EXPECT_EQ(report.reassembly.missing[0].first, 1u);
    EXPECT_EQ(report.reassembly.missing[0].last,
              std::numeric_limits<uint64_t>::max() - 1);
    EXPECT_EQ(report.reassembly.missing_count,
              std::numeric_limits<uint64_t>::max() - 1);
    EXPECT_TRUE(report.reassembly.file.empty());
}

TEST(Receiver, AlteredPayloadWithValidDigestIsChecksumFailure) {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":2,\"id_width\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    source.add(data_frame(1, 1, "CE", kHash));  // resealed, wrong content
    source.add(checksum_frame("ABCD", kHash));

    auto report = receive(source);
    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::ChecksumMismatch);
    EXPECT_TRUE(report.reassembly.missing.empty());
}

TEST(Receiver, SkipsNoiseAndOrdersById) {
    auto corrupted = data_frame(1, 1, "CD", kHash);
    corrupted[2] ^= 0x40;

    MemorySource source;
    source.add_empty();
    source.add(metadata_frame("{\"segment_count\":3,", kHash));
    source.add_empty();
    source.add(metadata_frame("\"id_width\":2,\"hash_length\":4}", kHash));
    source.add(data_frame(2, 2, "EF", kHash));
    source.add(corrupted);
    source.add(metadata_frame("{\"segment_count\":3,", kHash));  // rebroadcast
    source.add_empty();
    source.add(data_frame(1, 2, "CD", kHash));
    source.add(seal('X', to_bytes("not ours"), kHash));
    source.add(data_frame(0, 2, "AB", kHash));
    source.add(checksum_frame("ABCDEF", kHash));

    auto report = receive(source);
    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.reassembly.file, to_bytes("ABCDEF"));
    EXPECT_EQ(report.stats.frames_without_code, 3u);
    EXPECT_EQ(report.stats.frames_rejected, 2u);  // corrupted + unknown tag
}

TEST(Receiver, ManySegmentsInShuffledOrder) {
    constexpr uint64_t kCount = 300;
    std::string expected;
    for (uint64_t id = 0; id < kCount; ++id) {
        expected += "<" + std::to_string(id) + ">";
    }

    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":300,\"id_width\":2,"
                              "\"hash_length\":16}", 16));
    for (uint64_t i = 0; i < kCount; ++i) {
        uint64_t id = (i * 7) % kCount;  // 7 is coprime with 300
        source.add(data_frame(id, 2, "<" + std::to_string(id) + ">", 16));
    }
    source.add(checksum_frame(expected, 16));

    auto report = receive(source);
    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.reassembly.file, to_bytes(expected));
}

TEST(Receiver, RepeatedRunsAreIdentical) {
    auto source = abcd_transmission();
    Receiver receiver(ReceiverConfig{});

    auto first  = receiver.receive(source);
    auto second = receiver.receive(source);
    ASSERT_TRUE(first.reassembly.success());
    ASSERT_TRUE(second.reassembly.success());
    EXPECT_EQ(first.reassembly.file, second.reassembly.file);
    EXPECT_EQ(first.stats.frames_seen, second.stats.frames_seen);
}

TEST(Receiver, NothingDecodableIsNoTransmission) {
    MemorySource source;
    source.add_empty();
    source.add(data_frame(0, 1, "AB", kHash));
    source.add_empty();

    auto report = receive(source);
    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::NoTransmission);
    EXPECT_EQ(report.stage_reached, DecodeStage::AcquireMetadata);
}

TEST(Receiver, MalformedMetadataIsProtocolError) {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":2,\"id_width\":3,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));

    auto report = receive(source);
    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::ProtocolError);
    EXPECT_NE(report.reassembly.error.find("id width"), std::string::npos);
}

TEST(Receiver, MissingChecksumFrameIsMismatch) {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":1,\"id_width\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));

    auto report = receive(source);
    EXPECT_EQ(report.stage_reached, DecodeStage::AcquireData);
    EXPECT_EQ(report.reassembly.status, ReassemblyStatus::ChecksumMismatch);
}

TEST(Receiver, WritesReconstructedFile) {
    auto path = std::filesystem::temp_directory_path() / "qrdrop_recv_output.bin";
    std::filesystem::remove(path);

    ReceiverConfig cfg;
    cfg.output_path = path.string();
    Receiver receiver(cfg);

    auto source = abcd_transmission();
    auto report = receiver.receive(source);
    ASSERT_TRUE(report.reassembly.success());
    ASSERT_TRUE(receiver.write_output(report.reassembly));

    std::ifstream in(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "ABCD");
    std::filesystem::remove(path);
}

TEST(Receiver, FailedRunWritesNothing) {
    auto path = std::filesystem::temp_directory_path() / "qrdrop_recv_missing.bin";
    std::filesystem::remove(path);

    ReceiverConfig cfg;
    cfg.output_path = path.string();
    Receiver receiver(cfg);

    auto source = abcd_transmission(false);
    auto report = receiver.receive(source);
    EXPECT_FALSE(receiver.write_output(report.reassembly));
    EXPECT_FALSE(std::filesystem::exists(path));
}

// ---------------------------------------------------------------------------
// Decoder stages
// ---------------------------------------------------------------------------

TEST(SegmentDecoder, ChecksumFrameIsReplayedAfterDataPhase) {
    auto source = abcd_transmission();
    source.add(data_frame(1, 1, "ZZ", kHash));  // after the terminal frame

    FrameCursor cursor(source);
    SegmentDecoder decoder;
    auto result = decoder.run(cursor);

    EXPECT_FALSE(result.fatal);
    EXPECT_EQ(result.stage_reached, DecodeStage::Complete);
    ASSERT_TRUE(result.state.checksum.has_value());
    EXPECT_EQ(Checksum::to_hex(result.state.checksum->value),
              Checksum::md5_hex(to_bytes("ABCD")));
    // Scanning stopped on the checksum frame.
    EXPECT_EQ(cursor.position(), 5u);
    EXPECT_EQ(result.state.segments.at(1).payload, to_bytes("CD"));
}

TEST(SegmentDecoder, FramesRejectedBeforeMetadataAreCounted) {
    MemorySource source;
    source.add(data_frame(0, 1, "AB", kHash));            // no metadata yet
    source.add(seal('X', to_bytes("stray"), kHash));      // unknown tag
    source.add(checksum_frame("ABCD", kHash));            // ignored, valid
    source.add(metadata_frame("{\"segment_count\":2,\"id_width\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    source.add(data_frame(1, 1, "CD", kHash));
    source.add(checksum_frame("ABCD", kHash));

    auto report = receive(source);
    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.stats.frames_rejected, 2u);
}

TEST(SegmentDecoder, CorruptChecksumFrameDoesNotEndDataPhase) {
    auto bad_h = checksum_frame("ABCD", kHash);
    bad_h.back() ^= 0xFF;

    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":2,\"id_width\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    source.add(bad_h);
    source.add(data_frame(1, 1, "CD", kHash));
    source.add(checksum_frame("ABCD", kHash));

    auto report = receive(source);
    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.reassembly.file, to_bytes("ABCD"));
}

TEST(SegmentDecoder, DuplicateIdKeepsLastSeen) {
    MemorySource source;
    source.add(metadata_frame("{\"segment_count\":2,\"id_width\":1,\"hash_length\":4}", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    source.add(data_frame(1, 1, "CD", kHash));
    source.add(data_frame(0, 1, "AB", kHash));
    source.add(data_frame(0, 1, "XY", kHash));
    source.add(checksum_frame("XYCD", kHash));

    auto report = receive(source);
    ASSERT_TRUE(report.reassembly.success()) << report.reassembly.error;
    EXPECT_EQ(report.reassembly.file, to_bytes("XYCD"));
    EXPECT_EQ(report.stats.duplicate_segments, 2u);
    EXPECT_EQ(report.stats.conflicting_segments, 1u);
}

TEST(SegmentDecoder, MetadataFragmentsJoinInArrivalOrder) {
    const std::string record =
        "{\"segment_count\":1,\"id_width\":8,\"hash_length\":12}";

    MemorySource source;
    for (std::size_t i = 0; i < record.size(); i += 17) {
        source.add(metadata_frame(record.substr(i, 17), 12));
    }

    FrameCursor cursor(source);
    DecoderState state;
    std::string error;
    SegmentDecoder decoder;
    ASSERT_TRUE(decoder.acquire_metadata(state, cursor, error)) << error;
    ASSERT_TRUE(state.metadata.has_value());
    EXPECT_EQ(state.metadata->segment_count, 1u);
    EXPECT_EQ(state.metadata->id_width, 8u);
    EXPECT_EQ(state.metadata->hash_length, 12u);
    EXPECT_TRUE(state.metadata_text.empty());
}
