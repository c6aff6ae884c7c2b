#ifndef QRDROP_RECV_IMAGE_IO_HPP
#define QRDROP_RECV_IMAGE_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace qrdrop::recv {

/// 8-bit grayscale image, rows packed without padding.
struct Raster {
    int                  width  = 0;
    int                  height = 0;
    std::vector<uint8_t> pixels;
};

/// Result of loading one image file.
struct LoadResult {
    bool        ok = false;
    Raster      raster;
    std::string error;
};

/// Still-image loader: PNG through libpng, JPEG through TurboJPEG.
/// The format is chosen from the file extension.
class ImageLoader {
public:
    static LoadResult load(const std::string& path);

    static LoadResult load_png(const std::string& path);
    static LoadResult load_jpeg(const std::string& path);

    /// True for the extensions load() understands (.png, .jpg, .jpeg).
    static bool is_supported(const std::string& path);
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_IMAGE_IO_HPP
