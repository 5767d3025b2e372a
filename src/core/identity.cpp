#include "taskproc/identity.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <unistd.h>

namespace taskproc {

std::string generate_task_id() {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    std::lock_guard<std::mutex> lock(uuid_mutex);

    auto now = std::chrono::system_clock::now();
    uint64_t current_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;

    // 48-bit unix_ts_ms (big-endian)
    bytes[0] = (last_ms >> 40) & 0xFF;
    bytes[1] = (last_ms >> 32) & 0xFF;
    bytes[2] = (last_ms >> 24) & 0xFF;
    bytes[3] = (last_ms >> 16) & 0xFF;
    bytes[4] = (last_ms >> 8) & 0xFF;
    bytes[5] = last_ms & 0xFF;

    // 4-bit version (0111) and 12-bit sequence
    uint16_t sequence_and_version = sequence & 0x0FFF;
    bytes[6] = 0x70 | (sequence_and_version >> 8);
    bytes[7] = sequence_and_version & 0xFF;

    // 2-bit variant (10) and 62-bits of random data
    uint64_t rand_data = gen();
    bytes[8] = 0x80 | ((rand_data >> 56) & 0x3F);
    for (int i = 9; i < 16; ++i) {
        bytes[i] = (rand_data >> (8 * (15 - i))) & 0xFF;
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return ss.str();
}

std::string local_hostname() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "localhost";
    }
    return std::string(buffer);
}

std::string make_worker_identity(const std::string& queue_name) {
    static std::atomic<uint32_t> counter{0};
    static std::random_device rd;

    // Per-process salt mixed with a call counter
    static const uint32_t salt = rd();
    uint32_t suffix = salt ^ (counter.fetch_add(1) * 2654435761u);

    std::stringstream ss;
    ss << queue_name << "@" << local_hostname() << "." << ::getpid() << "."
       << std::hex << std::setw(8) << std::setfill('0') << suffix;
    return ss.str();
}

} // namespace taskproc
