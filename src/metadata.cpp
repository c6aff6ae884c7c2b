#include "metadata.hpp"

#include <cctype>
#include <limits>
#include <optional>
#include <utility>

#include "checksum.hpp"

namespace qrdrop::recv {

namespace {

/// One scalar value of the flat record.
struct Field {
    bool        is_number = false;
    uint64_t    number    = 0;
    std::string text;
};

/// Minimal cursor over a flat JSON object. Only what the metadata record
/// needs: string keys, unsigned integers, strings and literals.
class RecordScanner {
public:
    explicit RecordScanner(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    std::optional<std::string> string() {
        skip_ws();
        if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c == '\\') {
                if (pos_ >= text_.size()) return std::nullopt;
                char e = text_[pos_++];
                switch (e) {
                    case '"':  out += '"';  break;
                    case '\\': out += '\\'; break;
                    case '/':  out += '/';  break;
                    case 'n':  out += '\n'; break;
                    case 't':  out += '\t'; break;
                    case 'r':  out += '\r'; break;
                    default:   return std::nullopt;
                }
            } else {
                out += c;
            }
        }
        return std::nullopt; // unterminated
    }

    std::optional<uint64_t> number() {
        skip_ws();
        if (pos_ >= text_.size() ||
            !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            return std::nullopt;
        }
        uint64_t value = 0;
        while (pos_ < text_.size() &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            uint64_t digit = static_cast<uint64_t>(text_[pos_] - '0');
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
            ++pos_;
        }
        // Fractions and exponents are not valid for any metadata field.
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return std::nullopt;
        }
        return value;
    }

    bool literal() {
        skip_ws();
        for (std::string_view lit : {"true", "false", "null"}) {
            if (text_.substr(pos_, lit.size()) == lit) {
                pos_ += lit.size();
                return true;
            }
        }
        return false;
    }

    std::optional<Field> value() {
        skip_ws();
        if (pos_ >= text_.size()) return std::nullopt;

        Field field;
        char c = text_[pos_];
        if (c == '"') {
            auto s = string();
            if (!s) return std::nullopt;
            field.text = std::move(*s);
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            auto n = number();
            if (!n) return std::nullopt;
            field.is_number = true;
            field.number    = *n;
        } else if (!literal()) {
            return std::nullopt;
        }
        return field;
    }

private:
    std::string_view text_;
    std::size_t      pos_ = 0;
};

std::size_t width_from_id_type(const std::string& id_type) {
    if (id_type == "u8")  return 1;
    if (id_type == "u16") return 2;
    if (id_type == "u32") return 4;
    if (id_type == "u64") return 8;
    return 0;
}

} // namespace

bool MetadataParser::is_terminated(std::string_view text) {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return !text.empty() && text.back() == '}';
}

MetadataParseResult MetadataParser::parse(std::string_view text) {
    RecordScanner scan(text);

    if (!scan.consume('{')) {
        return {false, {}, "metadata does not start with '{'"};
    }

    std::optional<uint64_t> segment_count;
    std::optional<uint64_t> id_width;
    std::optional<uint64_t> hash_length;
    std::optional<std::string> id_type;

    if (!scan.consume('}')) {
        do {
            auto key = scan.string();
            if (!key) return {false, {}, "malformed field name"};
            if (!scan.consume(':')) {
                return {false, {}, "missing ':' after \"" + *key + "\""};
            }
            auto field = scan.value();
            if (!field) {
                return {false, {}, "malformed value for \"" + *key + "\""};
            }

            const std::string& k = *key;
            if (k == "segment_count" || k == "qrcode_count" ||
                k == "id_width" || k == "hash_length" || k == "hash_len") {
                if (!field->is_number) {
                    return {false, {}, "\"" + k + "\" must be an unsigned integer"};
                }
                if (k == "segment_count" || k == "qrcode_count") {
                    segment_count = field->number;
                } else if (k == "id_width") {
                    id_width = field->number;
                } else {
                    hash_length = field->number;
                }
            } else if (k == "id_type") {
                if (field->is_number) {
                    return {false, {}, "\"id_type\" must be a string"};
                }
                id_type = field->text;
            }
        } while (scan.consume(','));

        if (!scan.consume('}')) {
            return {false, {}, "metadata record is not closed"};
        }
    }

    if (!scan.at_end()) {
        return {false, {}, "trailing data after metadata record"};
    }

    if (!segment_count) return {false, {}, "missing \"segment_count\""};
    if (!hash_length)   return {false, {}, "missing \"hash_length\""};

    TransferMetadata md;
    md.segment_count = *segment_count;

    if (id_width) {
        md.id_width = static_cast<std::size_t>(*id_width);
    } else if (id_type) {
        md.id_width = width_from_id_type(*id_type);
        if (md.id_width == 0) {
            return {false, {}, "unsupported id type \"" + *id_type + "\""};
        }
    } else {
        return {false, {}, "missing \"id_width\""};
    }

    if (md.id_width != 1 && md.id_width != 2 &&
        md.id_width != 4 && md.id_width != 8) {
        return {false, {}, "unsupported id width " + std::to_string(md.id_width)};
    }

    if (*hash_length == 0 || *hash_length > Checksum::kBlake2bMaxLen) {
        return {false, {}, "unsupported hash length " +
                           std::to_string(*hash_length)};
    }
    md.hash_length = static_cast<std::size_t>(*hash_length);

    // Ids must be representable in the declared width.
    if (md.id_width < 8) {
        uint64_t id_space = uint64_t{1} << (8 * md.id_width);
        if (md.segment_count > id_space) {
            return {false, {}, "segment count " +
                               std::to_string(md.segment_count) +
                               " exceeds id width " +
                               std::to_string(md.id_width)};
        }
    }

    return {true, md, {}};
}

} // namespace qrdrop::recv
