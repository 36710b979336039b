#include "scriptbox/ids.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace scriptbox {

static void fill_random(uint8_t* buf, size_t n) {
#if defined(__linux__)
    size_t got = 0;
    while (got < n) {
        ssize_t r = ::getrandom(buf + got, n - got, 0);
        if (r <= 0) break;
        got += (size_t)r;
    }
    if (got == n) return;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t read = std::fread(buf, 1, n, f);
        std::fclose(f);
        if (read == n) return;
    }
    throw std::runtime_error("gen_execution_id: cannot obtain random bytes");
}

std::string gen_execution_id() {
    std::array<uint8_t, 16> b{};
    fill_random(b.data(), b.size());
    b[6] = (uint8_t)((b[6] & 0x0f) | 0x40); // version 4
    b[8] = (uint8_t)((b[8] & 0x3f) | 0x80); // variant 10xx

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < b.size(); i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[b[i] >> 4]);
        out.push_back(hex[b[i] & 0x0f]);
    }
    return out;
}

bool is_execution_id(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
            continue;
        }
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // namespace scriptbox
