#include "optical_decoder.hpp"

#include <cstdio>

#include <ZXing/BarcodeFormat.h>
#include <ZXing/ReadBarcode.h>
#include <ZXing/ReaderOptions.h>

#include "checksum.hpp"

namespace qrdrop::recv {

std::optional<std::vector<uint8_t>> OpticalDecoder::decode(const Raster& raster) const {
    if (raster.width <= 0 || raster.height <= 0 || raster.pixels.empty()) {
        return std::nullopt;
    }

    ZXing::ImageView view(raster.pixels.data(), raster.width, raster.height,
                          ZXing::ImageFormat::Lum);
    ZXing::ReaderOptions opts;
    opts.setFormats(ZXing::BarcodeFormat::QRCode);
    opts.setTryHarder(true);

    auto res = ZXing::ReadBarcode(view, opts);
    if (!res.isValid()) return std::nullopt;

    if (encoding_ == PayloadEncoding::Raw) {
        const auto& bytes = res.bytes();
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    auto decoded = Checksum::base64_decode(res.text());
    if (!decoded && verbose_) {
        std::printf("[optical] symbol text is not valid base64 (%zu chars)\n",
                    res.text().size());
    }
    return decoded;
}

} // namespace qrdrop::recv
