/*
 * StreamRecord.h - Observable state of one stream
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef STREAMRECORD_H
#define STREAMRECORD_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

enum class StreamStatus {
    Active,
    Finished,
    Error,
    Cancelled
};

const char* toString(StreamStatus status);

inline bool isTerminal(StreamStatus status)
{
    return status != StreamStatus::Active;
}

/**
 * @brief Registry entry for one stream
 *
 * Timestamps are Unix seconds. end_time stays 0 while the stream is active.
 */
struct StreamRecord {
    std::string stream_id;
    int64_t chat_id = 0;
    int64_t message_id = 0;
    size_t client_index = 0;
    int target_dc = 0;
    StreamStatus status = StreamStatus::Active;

    uint64_t total_bytes = 0;
    double instant_mbps = 0.0;
    double avg_mbps = 0.0;
    double peak_mbps = 0.0;

    double start_time = 0.0;
    double last_update = 0.0;
    double end_time = 0.0;

    uint64_t range_start = 0;
    uint64_t range_end = 0;
    std::string file_name;
    std::string request_path;
    std::string client_host;
    std::string error;
};

} // namespace Stream
} // namespace TGStream

#endif // STREAMRECORD_H
