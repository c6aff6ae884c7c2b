#ifndef QRDROP_RECV_CHECKSUM_HPP
#define QRDROP_RECV_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qrdrop::recv {

/// Hash and transport-encoding primitives, backed by OpenSSL EVP.
class Checksum {
public:
    static constexpr std::size_t kBlake2bMaxLen = 64;
    static constexpr std::size_t kMd5Len        = 16;

    /// BLAKE2b with an output length of `out_len` bytes (1..64).
    /// Lengths below 64 need OpenSSL 3.2 or later. Returns empty on failure.
    static std::vector<uint8_t> blake2b(const uint8_t* data, std::size_t len,
                                        std::size_t out_len);

    static std::vector<uint8_t> blake2b(const std::vector<uint8_t>& data,
                                        std::size_t out_len) {
        return blake2b(data.data(), data.size(), out_len);
    }

    /// Whether the linked libcrypto accepts BLAKE2b outputs below 64 bytes.
    /// Checked on first call.
    static bool short_digests_supported();

    /// MD5 of the buffer as lowercase hex (32 chars), empty on failure.
    static std::string md5_hex(const std::vector<uint8_t>& data);

    /// Lowercase hex encoding.
    static std::string to_hex(const uint8_t* data, std::size_t len);

    static std::string to_hex(const std::vector<uint8_t>& data) {
        return to_hex(data.data(), data.size());
    }

    /// Base64 decode (standard alphabet, padding allowed, whitespace ignored).
    static std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_CHECKSUM_HPP
