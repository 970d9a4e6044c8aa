/*
 * System.cpp - Operating system helpers
 * This file is part of TGStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Core {

void System::setThisThreadName(const std::string& name)
{
#if defined(__linux__)
    // Linux limits thread names to 16 bytes (including null terminator).
    std::string truncated_name = name.substr(0, 15);
    prctl(PR_SET_NAME, truncated_name.c_str(), 0, 0, 0);
#elif defined(__FreeBSD__)
    // FreeBSD also has a limit, typically MAXCOMLEN + 1 (16 bytes).
    std::string truncated_name = name.substr(0, 15);
    pthread_set_name_np(pthread_self(), truncated_name.c_str());
#else
    (void)name;
#endif
}

std::string System::randomHex(size_t bytes)
{
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        unsigned long err = ERR_get_error();
        char errbuf[256];
        ERR_error_string_n(err, errbuf, sizeof(errbuf));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + errbuf);
    }

    static const char hex_digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (unsigned char b : buffer) {
        out += hex_digits[b >> 4];
        out += hex_digits[b & 0x0F];
    }
    return out;
}

double System::unixTime()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
}

} // namespace Core
} // namespace TGStream
