/*
 * StatsSerializer.cpp - JSON views of stream records and pool state
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Server {

using Stream::StreamRecord;

namespace {

double round3(double value)
{
    return std::round(value * 1000.0) / 1000.0;
}

Json::Value timestamp(double value)
{
    return value > 0.0 ? Json::Value(value) : Json::Value(Json::nullValue);
}

Json::Value duration(const StreamRecord& record)
{
    if (record.end_time <= 0.0) {
        return Json::Value(Json::nullValue);
    }
    return round3(record.end_time - record.start_time);
}

} // namespace

Json::Value StatsSerializer::recordToJson(const StreamRecord& record)
{
    Json::Value v;
    v["stream_id"] = record.stream_id;
    v["chat_id"] = Json::Int64(record.chat_id);
    v["msg_id"] = Json::Int64(record.message_id);
    v["client_index"] = Json::UInt64(record.client_index);
    v["dc_id"] = record.target_dc;
    v["status"] = Stream::toString(record.status);
    v["total_bytes"] = Json::UInt64(record.total_bytes);
    v["instant_mbps"] = round3(record.instant_mbps);
    v["avg_mbps"] = round3(record.avg_mbps);
    v["peak_mbps"] = round3(record.peak_mbps);
    v["start_ts"] = timestamp(record.start_time);
    v["last_ts"] = timestamp(record.last_update);
    v["end_ts"] = timestamp(record.end_time);
    v["duration"] = duration(record);
    v["range_start"] = Json::UInt64(record.range_start);
    v["range_end"] = Json::UInt64(record.range_end);
    v["file_name"] = record.file_name;
    v["path"] = record.request_path;
    v["client_host"] = record.client_host;
    if (!record.error.empty()) {
        v["error"] = record.error;
    }
    return v;
}

Json::Value StatsSerializer::activeSummary(const StreamRecord& record)
{
    Json::Value v;
    v["stream_id"] = record.stream_id;
    v["msg_id"] = Json::Int64(record.message_id);
    v["chat_id"] = Json::Int64(record.chat_id);
    v["client_index"] = Json::UInt64(record.client_index);
    v["dc_id"] = record.target_dc;
    v["status"] = Stream::toString(record.status);
    v["total_bytes"] = Json::UInt64(record.total_bytes);
    v["instant_mbps"] = round3(record.instant_mbps);
    v["avg_mbps"] = round3(record.avg_mbps);
    v["peak_mbps"] = round3(record.peak_mbps);
    v["start_ts"] = timestamp(record.start_time);
    return v;
}

Json::Value StatsSerializer::recentSummary(const StreamRecord& record)
{
    Json::Value v;
    v["stream_id"] = record.stream_id;
    v["msg_id"] = Json::Int64(record.message_id);
    v["chat_id"] = Json::Int64(record.chat_id);
    v["client_index"] = Json::UInt64(record.client_index);
    v["dc_id"] = record.target_dc;
    v["status"] = Stream::toString(record.status);
    v["total_bytes"] = Json::UInt64(record.total_bytes);
    v["duration"] = duration(record);
    v["avg_mbps"] = round3(record.avg_mbps);
    v["start_ts"] = timestamp(record.start_time);
    v["end_ts"] = timestamp(record.end_time);
    return v;
}

Json::Value StatsSerializer::statsToJson(const std::vector<StreamRecord>& active,
                                         const std::vector<StreamRecord>& recent,
                                         const Stream::ClientPool& pool)
{
    Json::Value root;
    root["active_streams"] = Json::Value(Json::arrayValue);
    for (const auto& record : active) {
        root["active_streams"].append(activeSummary(record));
    }

    // Most recently retired first
    root["recent_streams"] = Json::Value(Json::arrayValue);
    for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
        root["recent_streams"].append(recentSummary(*it));
    }

    root["client_dc_map"] = Json::Value(Json::objectValue);
    for (const auto& [index, dc] : pool.dcMap()) {
        root["client_dc_map"][std::to_string(index)] = dc;
    }
    root["work_loads"] = Json::Value(Json::objectValue);
    for (const auto& [index, load] : pool.workLoads()) {
        root["work_loads"][std::to_string(index)] = load;
    }
    return root;
}

std::string StatsSerializer::write(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace Server
} // namespace TGStream
