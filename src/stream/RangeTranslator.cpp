/*
 * RangeTranslator.cpp - HTTP Range parsing and chunk plan derivation
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Stream {

using Core::RangeNotSatisfiableException;

namespace {

bool parseNumber(const std::string& text, uint64_t& out)
{
    if (text.empty() || text.size() > 19 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = std::stoull(text);
    return true;
}

std::string trimmed(const std::string& s)
{
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

ByteRange RangeTranslator::parse(const std::string& header, uint64_t file_size)
{
    ByteRange range;
    std::string value = trimmed(header);

    if (value.empty()) {
        if (file_size == 0) {
            throw RangeNotSatisfiableException("File is empty", file_size);
        }
        range.start = 0;
        range.end = file_size - 1;
        range.partial = false;
        return range;
    }

    if (value.compare(0, 6, "bytes=") != 0) {
        throw RangeNotSatisfiableException("Unsupported range unit: " + value, file_size);
    }
    std::string byte_range = trimmed(value.substr(6));
    if (byte_range.find(',') != std::string::npos) {
        throw RangeNotSatisfiableException("Multiple ranges are not supported: " + value, file_size);
    }

    size_t dash = byte_range.find('-');
    if (dash == std::string::npos) {
        throw RangeNotSatisfiableException("Malformed range: " + value, file_size);
    }

    std::string start_text = trimmed(byte_range.substr(0, dash));
    std::string end_text = trimmed(byte_range.substr(dash + 1));

    // A leading '-' is either a suffix range or a negative start; neither is served
    if (!parseNumber(start_text, range.start)) {
        throw RangeNotSatisfiableException("Malformed range start: " + value, file_size);
    }

    if (end_text.empty()) {
        if (file_size == 0) {
            throw RangeNotSatisfiableException("File is empty", file_size);
        }
        range.end = file_size - 1;
    } else if (!parseNumber(end_text, range.end)) {
        throw RangeNotSatisfiableException("Malformed range end: " + value, file_size);
    }

    if (range.end >= file_size || range.end < range.start) {
        throw RangeNotSatisfiableException("Range " + std::to_string(range.start) + "-" +
                                           std::to_string(range.end) + " outside file of " +
                                           std::to_string(file_size) + " bytes", file_size);
    }

    range.partial = true;
    return range;
}

FetchPlan RangeTranslator::plan(const ByteRange& range, uint32_t chunk_size)
{
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }

    const uint64_t c = chunk_size;
    FetchPlan p;
    p.chunk_size = chunk_size;
    p.offset = range.start - range.start % c;
    p.first_cut = range.start - p.offset;
    p.last_cut = range.end % c + 1;
    p.length = range.end - range.start + 1;

    // ceil(end / c) - floor(offset / c)
    uint64_t count = (range.end + c - 1) / c - p.offset / c;
    // The formula undercounts when end sits on a chunk boundary
    uint64_t covered = range.end / c - p.offset / c + 1;
    p.chunk_count = std::max(count, covered);
    return p;
}

std::string RangeTranslator::contentRange(const ByteRange& range, uint64_t file_size)
{
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) +
           "/" + std::to_string(file_size);
}

std::string RangeTranslator::unsatisfiedContentRange(uint64_t file_size)
{
    return "bytes */" + std::to_string(file_size);
}

} // namespace Stream
} // namespace TGStream
