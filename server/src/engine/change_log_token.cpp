#include "chronicle/change_log_token.hpp"
#include "chronicle/errors.hpp"
#include <openssl/evp.h>
#include <limits>

namespace chronicle {

namespace {

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        throw InvalidTokenError("not base64");
    }
    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw InvalidTokenError("not base64");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}

    uint8_t u8() {
        require(1);
        return bytes_[pos_++];
    }

    uint16_t u16() {
        require(2);
        uint16_t v = static_cast<uint16_t>((bytes_[pos_] << 8) | bytes_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    int64_t i64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | bytes_[pos_++];
        return static_cast<int64_t>(v);
    }

    std::string str(size_t length) {
        require(length);
        std::string s(bytes_.begin() + static_cast<long>(pos_), bytes_.begin() + static_cast<long>(pos_ + length));
        pos_ += length;
        return s;
    }

    bool at_end() const { return pos_ == bytes_.size(); }

private:
    void require(size_t n) const {
        if (bytes_.size() - pos_ < n) throw InvalidTokenError("truncated");
    }

    const std::vector<uint8_t>& bytes_;
    size_t pos_ = 0;
};

void put_u16(std::vector<uint8_t>& bytes, size_t value) {
    bytes.push_back(static_cast<uint8_t>(value >> 8));
    bytes.push_back(static_cast<uint8_t>(value & 0xFF));
}

void put_strings(std::vector<uint8_t>& bytes, const std::vector<std::string>& values, const char* what) {
    if (values.size() > std::numeric_limits<uint16_t>::max()) {
        throw InvalidArgumentError("Too many filters in change log token");
    }
    put_u16(bytes, values.size());
    for (const auto& value : values) {
        if (value.size() > std::numeric_limits<uint16_t>::max()) {
            throw InvalidArgumentError(std::string(what) + " too long: " + value.substr(0, 64));
        }
        put_u16(bytes, value.size());
        bytes.insert(bytes.end(), value.begin(), value.end());
    }
}

std::vector<std::string> get_strings(ByteReader& reader) {
    std::vector<std::string> values;
    uint16_t count = reader.u16();
    for (uint16_t i = 0; i < count; ++i) {
        uint16_t length = reader.u16();
        values.push_back(reader.str(length));
    }
    return values;
}

} // namespace

std::string ChangeLogToken::encode() const {
    if (record_types.size() > std::numeric_limits<uint8_t>::max()) {
        throw InvalidArgumentError("Too many filters in change log token");
    }

    std::vector<uint8_t> bytes;
    bytes.push_back(kVersion);

    uint64_t w = static_cast<uint64_t>(watermark);
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<uint8_t>((w >> shift) & 0xFF));
    }

    bytes.push_back(static_cast<uint8_t>(record_types.size()));
    for (RecordType type : record_types) {
        bytes.push_back(static_cast<uint8_t>(type));
    }

    put_strings(bytes, data_origin_filters, "Data origin");
    put_strings(bytes, withheld_record_ids, "Record id");

    return base64_encode(bytes);
}

ChangeLogToken ChangeLogToken::decode(const std::string& token) {
    std::vector<uint8_t> bytes = base64_decode(token);
    if (base64_encode(bytes) != token) {
        throw InvalidTokenError("not canonical base64");
    }

    ByteReader reader(bytes);
    if (reader.u8() != kVersion) {
        throw InvalidTokenError("unsupported version");
    }

    ChangeLogToken result;
    result.watermark = reader.i64();
    if (result.watermark < 0) {
        throw InvalidTokenError("negative watermark");
    }

    uint8_t type_count = reader.u8();
    if (type_count == 0) {
        throw InvalidTokenError("no record types");
    }
    for (uint8_t i = 0; i < type_count; ++i) {
        auto type = record_type_from_code(reader.u8());
        if (!type || is_umbrella_type(*type)) {
            throw InvalidTokenError("unknown record type");
        }
        result.record_types.push_back(*type);
    }

    result.data_origin_filters = get_strings(reader);
    result.withheld_record_ids = get_strings(reader);

    if (!reader.at_end()) {
        throw InvalidTokenError("trailing bytes");
    }
    return result;
}

} // namespace chronicle
