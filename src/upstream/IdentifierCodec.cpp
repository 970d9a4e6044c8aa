/*
 * IdentifierCodec.cpp - Stream identifier path segment codec
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Upstream {

using Core::InvalidRequestException;

namespace {

// Integers arrive either as JSON numbers or as digit strings
bool readInteger(const Json::Value& value, int64_t& out)
{
    if (value.isInt64()) {
        out = value.asInt64();
        return true;
    }
    if (value.isString()) {
        const std::string text = value.asString();
        if (text.empty() || text.size() > 18 || text.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        out = std::stoll(text);
        return true;
    }
    return false;
}

} // namespace

int64_t StreamIdentifier::fullChatId() const
{
    std::string digits = std::to_string(chat_id < 0 ? -chat_id : chat_id);
    if (digits.size() > 15) {
        throw InvalidRequestException("chat_id out of range: " + digits);
    }
    return std::stoll("-100" + digits);
}

StreamIdentifier IdentifierCodec::decode(const std::string& token)
{
    if (token.empty()) {
        throw InvalidRequestException("Missing stream identifier");
    }

    std::vector<uint8_t> raw = Core::Utility::Base64::decode(token);
    if (raw.empty()) {
        throw InvalidRequestException("Stream identifier is not valid base64");
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const char* begin = reinterpret_cast<const char*>(raw.data());
    if (!reader->parse(begin, begin + raw.size(), &root, &errors) || !root.isObject()) {
        throw InvalidRequestException("Stream identifier is not a JSON object");
    }

    StreamIdentifier id;
    if (!root.isMember("msg_id") || !readInteger(root["msg_id"], id.message_id) || id.message_id <= 0) {
        throw InvalidRequestException("Missing id");
    }
    if (!root.isMember("chat_id") || !readInteger(root["chat_id"], id.chat_id) || id.chat_id <= 0) {
        throw InvalidRequestException("Missing chat id");
    }
    if (root.isMember("hash")) {
        if (!root["hash"].isString()) {
            throw InvalidRequestException("Identifier hash must be a string");
        }
        id.hash = root["hash"].asString();
    }
    return id;
}

std::string IdentifierCodec::encode(const StreamIdentifier& id)
{
    Json::Value root;
    root["chat_id"] = Json::Int64(id.chat_id);
    root["msg_id"] = Json::Int64(id.message_id);
    if (!id.hash.empty()) {
        root["hash"] = id.hash;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string json = Json::writeString(builder, root);
    return Core::Utility::Base64::encodeUrl(std::vector<uint8_t>(json.begin(), json.end()));
}

void IdentifierCodec::verifyHash(const StreamIdentifier& id, const Stream::FileLocator& locator)
{
    if (id.hash.empty()) {
        return;
    }
    if (id.hash.size() != 6 || locator.unique_id.compare(0, 6, id.hash) != 0) {
        throw Core::HashMismatchException("Hash mismatch for message " + std::to_string(id.message_id));
    }
}

} // namespace Upstream
} // namespace TGStream
