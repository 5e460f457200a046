#include "chronicle/uuid.hpp"
#include <openssl/rand.h>
#include <array>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace chronicle {

std::string generate_uuid_v7() {
    return generate_uuid_v7(now_instant());
}

std::string generate_uuid_v7(Instant now) {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;

    std::array<uint8_t, 16> bytes;
    if (RAND_bytes(bytes.data() + 8, 8) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating record id");
    }

    std::lock_guard<std::mutex> lock(uuid_mutex);

    uint64_t current_ms = static_cast<uint64_t>(to_epoch_millis(now));
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    // 48-bit unix_ts_ms (big-endian)
    for (int i = 0; i < 6; ++i) {
        bytes[i] = static_cast<uint8_t>((last_ms >> (40 - 8 * i)) & 0xFF);
    }

    // 4-bit version (0111) and 12-bit sequence
    uint16_t sequence_and_version = sequence & 0x0FFF;
    bytes[6] = static_cast<uint8_t>(0x70 | (sequence_and_version >> 8));
    bytes[7] = static_cast<uint8_t>(sequence_and_version & 0xFF);

    // 2-bit variant (10), rest random
    bytes[8] = static_cast<uint8_t>(0x80 | (bytes[8] & 0x3F));

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

} // namespace chronicle
