#ifndef QRDROP_RECV_OPTICAL_DECODER_HPP
#define QRDROP_RECV_OPTICAL_DECODER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "image_io.hpp"

namespace qrdrop::recv {

/// How frame bytes are carried inside the QR symbol.
enum class PayloadEncoding {
    Base64,   // symbol text is Base64 of the frame bytes
    Raw       // symbol byte segments are the frame bytes
};

/// QR symbol reader built on ZXing-C++.
class OpticalDecoder {
public:
    explicit OpticalDecoder(PayloadEncoding encoding = PayloadEncoding::Base64,
                            bool verbose = false)
        : encoding_(encoding), verbose_(verbose) {}

    /// Decode the first QR code found in the raster.
    /// Returns nullopt when no code is found or its content is not valid
    /// for the configured encoding.
    std::optional<std::vector<uint8_t>> decode(const Raster& raster) const;

private:
    PayloadEncoding encoding_;
    bool            verbose_;
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_OPTICAL_DECODER_HPP
