/*
 * System.h - Operating system helpers
 * This file is part of TGStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef SYSTEM_H
#define SYSTEM_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

class System
{
    public:
        /**
         * @brief Name the calling thread for debuggers and top(1).
         * @param name Thread name, truncated to the platform limit.
         */
        static void setThisThreadName(const std::string& name);

        /**
         * @brief Generate a random identifier from the OpenSSL CSPRNG.
         * @param bytes Number of random bytes; the result has twice as many hex digits.
         * @return Lowercase hex string.
         * @throws std::runtime_error if the generator is not seeded.
         */
        static std::string randomHex(size_t bytes);

        /**
         * @brief Seconds since the Unix epoch, with sub-second precision.
         */
        static double unixTime();
};

} // namespace Core
} // namespace TGStream

#endif // SYSTEM_H
