/*
 * StatsSerializer.h - JSON views of stream records and pool state
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef STATSSERIALIZER_H
#define STATSSERIALIZER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Server {

class StatsSerializer {
public:
    /**
     * @brief Full record, as served by /stream/stats/{id}
     */
    static Json::Value recordToJson(const Stream::StreamRecord& record);

    /**
     * @brief Summary of an active stream
     */
    static Json::Value activeSummary(const Stream::StreamRecord& record);

    /**
     * @brief Summary of a retired stream
     */
    static Json::Value recentSummary(const Stream::StreamRecord& record);

    /**
     * @brief Body of /stream/stats
     */
    static Json::Value statsToJson(const std::vector<Stream::StreamRecord>& active,
                                   const std::vector<Stream::StreamRecord>& recent,
                                   const Stream::ClientPool& pool);

    static std::string write(const Json::Value& value);
};

} // namespace Server
} // namespace TGStream

#endif // STATSSERIALIZER_H
