#ifndef QRDROP_RECV_FRAME_SOURCE_HPP
#define QRDROP_RECV_FRAME_SOURCE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "frame_cursor.hpp"
#include "optical_decoder.hpp"

namespace qrdrop::recv {

/// Configuration for the image directory source.
struct FrameSourceConfig {
    std::string     image_dir;
    PayloadEncoding encoding = PayloadEncoding::Base64;
    bool            verbose  = false;
};

/// Frame supplier over a directory of captured stills.
///
/// Frames are the .png/.jpg/.jpeg files of the directory in ascending
/// filename order. Each is loaded and passed through the OpticalDecoder;
/// files that fail to load count as frames without a code.
class ImageDirSource : public PayloadSource {
public:
    ImageDirSource() = default;

    ImageDirSource(const ImageDirSource&) = delete;
    ImageDirSource& operator=(const ImageDirSource&) = delete;

    /// List and sort the directory. Returns false if it cannot be read.
    bool open(const FrameSourceConfig& cfg);

    std::optional<ScannedFrame> next() override;
    void restart() override { index_ = 0; }

    std::size_t frame_count() const noexcept { return files_.size(); }

private:
    FrameSourceConfig        cfg_;
    std::vector<std::string> files_;   // file names, sorted
    std::size_t              index_ = 0;
    OpticalDecoder           decoder_;
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_FRAME_SOURCE_HPP
