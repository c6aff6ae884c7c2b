#include "image_io.hpp"

#include <algorithm>
#include <cctype>
#include <csetjmp>
#include <cstdio>

#include <png.h>
#include <turbojpeg.h>

namespace qrdrop::recv {

namespace {

std::string lower_extension(const std::string& path) {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return {};
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool read_file(const std::string& path, std::vector<unsigned char>& out) {
    std::FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) return false;

    unsigned char chunk[8192];
    std::size_t   n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0) {
        out.insert(out.end(), chunk, chunk + n);
    }
    bool ok = std::ferror(fp) == 0;
    std::fclose(fp);
    return ok;
}

} // namespace

bool ImageLoader::is_supported(const std::string& path) {
    std::string ext = lower_extension(path);
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

LoadResult ImageLoader::load(const std::string& path) {
    std::string ext = lower_extension(path);
    if (ext == ".png") return load_png(path);
    if (ext == ".jpg" || ext == ".jpeg") return load_jpeg(path);
    return {false, {}, "unsupported image type"};
}

// ---------------------------------------------------------------------------
// PNG (libpng)
// ---------------------------------------------------------------------------

LoadResult ImageLoader::load_png(const std::string& path) {
    LoadResult result;
    std::vector<png_bytep> rows;

    std::FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) {
        result.error = "cannot open file";
        return result;
    }

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING,
                                                 nullptr, nullptr, nullptr);
    if (!png_ptr) {
        std::fclose(fp);
        result.error = "png_create_read_struct failed";
        return result;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        std::fclose(fp);
        result.error = "png_create_info_struct failed";
        return result;
    }

    // libpng reports errors by longjmp; everything that owns memory is
    // declared above this point.
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        std::fclose(fp);
        result.ok     = false;
        result.raster = {};
        result.error  = "corrupt png";
        return result;
    }

    png_init_io(png_ptr, fp);
    png_read_info(png_ptr, info_ptr);

    const png_uint_32 w  = png_get_image_width(png_ptr, info_ptr);
    const png_uint_32 h  = png_get_image_height(png_ptr, info_ptr);
    const png_byte    ct = png_get_color_type(png_ptr, info_ptr);
    const png_byte    bd = png_get_bit_depth(png_ptr, info_ptr);

    // Normalise everything to 8-bit single-channel luma.
    if (bd == 16) png_set_strip_16(png_ptr);
    if (ct == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (ct == PNG_COLOR_TYPE_GRAY && bd < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (ct & PNG_COLOR_MASK_ALPHA) png_set_strip_alpha(png_ptr);
    if (ct == PNG_COLOR_TYPE_RGB || ct == PNG_COLOR_TYPE_RGB_ALPHA ||
        ct == PNG_COLOR_TYPE_PALETTE) {
        png_set_rgb_to_gray_fixed(png_ptr, 1, -1, -1);
    }
    png_read_update_info(png_ptr, info_ptr);

    if (png_get_channels(png_ptr, info_ptr) != 1 ||
        png_get_rowbytes(png_ptr, info_ptr) != w) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        std::fclose(fp);
        result.error = "unsupported png layout";
        return result;
    }

    result.raster.width  = static_cast<int>(w);
    result.raster.height = static_cast<int>(h);
    result.raster.pixels.resize(static_cast<std::size_t>(w) * h);
    rows.resize(h);
    for (png_uint_32 y = 0; y < h; ++y) {
        rows[y] = result.raster.pixels.data() + static_cast<std::size_t>(y) * w;
    }
    png_read_image(png_ptr, rows.data());

    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    std::fclose(fp);
    result.ok = true;
    return result;
}

// ---------------------------------------------------------------------------
// JPEG (TurboJPEG)
// ---------------------------------------------------------------------------

LoadResult ImageLoader::load_jpeg(const std::string& path) {
    LoadResult result;

    std::vector<unsigned char> jpeg;
    if (!read_file(path, jpeg) || jpeg.empty()) {
        result.error = "cannot read file";
        return result;
    }

    tjhandle handle = tjInitDecompress();
    if (!handle) {
        result.error = "tjInitDecompress failed";
        return result;
    }

    int width = 0, height = 0, subsamp = 0, colorspace = 0;
    int rc = tjDecompressHeader3(handle, jpeg.data(),
                                 static_cast<unsigned long>(jpeg.size()),
                                 &width, &height, &subsamp, &colorspace);
    if (rc != 0 || width <= 0 || height <= 0) {
        result.error = tjGetErrorStr2(handle);
        tjDestroy(handle);
        return result;
    }

    result.raster.width  = width;
    result.raster.height = height;
    result.raster.pixels.resize(static_cast<std::size_t>(width) * height);

    rc = tjDecompress2(handle, jpeg.data(),
                       static_cast<unsigned long>(jpeg.size()),
                       result.raster.pixels.data(), width, 0, height,
                       TJPF_GRAY, TJFLAG_ACCURATEDCT);
    if (rc != 0 && tjGetErrorCode(handle) == TJERR_FATAL) {
        result.error  = tjGetErrorStr2(handle);
        result.raster = {};
        tjDestroy(handle);
        return result;
    }

    tjDestroy(handle);
    result.ok = true;
    return result;
}

} // namespace qrdrop::recv
