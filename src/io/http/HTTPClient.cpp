/*
 * HTTPClient.cpp - libcurl-based HTTP client implementation
 * This file is part of TGStream.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"
#include <cstdio>

namespace TGStream {
namespace IO {
namespace HTTP {

// Global curl initialization plus a per-host pool of easy handles. Reusing a
// handle keeps its connection alive, which matters when every stream worker
// hits the same gateway once per chunk.
class CurlLifecycleManager {
private:
    static std::once_flag s_init_flag;
    static std::atomic<bool> s_initialized;

public:
    static std::mutex s_pool_mutex;
    static std::unordered_map<std::string, std::vector<CURL*>> s_connection_pool;
    static const size_t MAX_CONNECTIONS_PER_HOST = 32;

    CurlLifecycleManager() {
        std::call_once(s_init_flag, []() {
            CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
            s_initialized.store(result == CURLE_OK);
            if (s_initialized) {
                Debug::log("http", "CurlLifecycleManager: libcurl initialized successfully");
            } else {
                Debug::error("http", "CurlLifecycleManager: libcurl initialization failed: ", result);
            }
        });
    }

    static bool isInitialized() { return s_initialized.load(); }

    static CURL* acquireConnection(const std::string& host) {
        std::lock_guard<std::mutex> lock(s_pool_mutex);

        auto it = s_connection_pool.find(host);
        if (it != s_connection_pool.end() && !it->second.empty()) {
            CURL* handle = it->second.back();
            it->second.pop_back();
            return handle;
        }

        CURL* handle = curl_easy_init();
        if (handle) {
            Debug::log("http", "CurlLifecycleManager: Created new connection for host: ", host);
        }
        return handle;
    }

    static void releaseConnection(const std::string& host, CURL* handle) {
        if (!handle) return;

        std::lock_guard<std::mutex> lock(s_pool_mutex);

        auto& connections = s_connection_pool[host];
        if (s_initialized && connections.size() < MAX_CONNECTIONS_PER_HOST) {
            curl_easy_reset(handle);
            connections.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
            Debug::log("http", "CurlLifecycleManager: Pool full, cleaned up connection for host: ", host);
        }
    }

    static void shutdown() {
        std::lock_guard<std::mutex> lock(s_pool_mutex);
        for (auto& [host, connections] : s_connection_pool) {
            for (CURL* handle : connections) {
                curl_easy_cleanup(handle);
            }
            connections.clear();
        }
        s_connection_pool.clear();
        if (s_initialized.exchange(false)) {
            curl_global_cleanup();
            Debug::log("http", "CurlLifecycleManager: libcurl cleanup completed");
        }
    }
};

std::atomic<bool> CurlLifecycleManager::s_initialized{false};
std::once_flag CurlLifecycleManager::s_init_flag;
std::mutex CurlLifecycleManager::s_pool_mutex;
std::unordered_map<std::string, std::vector<CURL*>> CurlLifecycleManager::s_connection_pool;
static CurlLifecycleManager s_curl_manager;

static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t realsize = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userp);

    // Gateways answer with at most one chunk; anything this large is broken
    const size_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;
    if (buffer->size() + realsize > MAX_RESPONSE_SIZE) {
        Debug::log("http", "HTTPClient: Response size limit exceeded, aborting");
        return 0;
    }

    try {
        buffer->append(static_cast<const char*>(contents), realsize);
    } catch (const std::bad_alloc&) {
        Debug::error("http", "HTTPClient: Memory allocation failed during response processing");
        return 0;
    }
    return realsize;
}

static size_t headerCallback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t realsize = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userp);

    const size_t MAX_HEADER_SIZE = 1024 * 1024;
    if (buffer->size() + realsize > MAX_HEADER_SIZE) {
        Debug::log("http", "HTTPClient: Header size limit exceeded, aborting");
        return 0;
    }
    buffer->append(static_cast<const char*>(contents), realsize);
    return realsize;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
static int progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const std::atomic<bool>* cancel = static_cast<const std::atomic<bool>*>(clientp);
    return (cancel && cancel->load()) ? 1 : 0;
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string HTTPClient::Response::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? std::string() : it->second;
}

HTTPClient::Response HTTPClient::get(const std::string& url,
                                     const std::map<std::string, std::string>& headers,
                                     int timeoutSeconds,
                                     const std::atomic<bool>* cancel) {
    return performRequest("GET", url, "", headers, timeoutSeconds, cancel);
}

HTTPClient::Response HTTPClient::post(const std::string& url,
                                      const std::string& data,
                                      const std::string& contentType,
                                      const std::map<std::string, std::string>& headers,
                                      int timeoutSeconds) {
    std::map<std::string, std::string> postHeaders = headers;
    postHeaders["Content-Type"] = contentType;
    return performRequest("POST", url, data, postHeaders, timeoutSeconds, nullptr);
}

HTTPClient::Response HTTPClient::performRequest(const std::string& method,
                                                const std::string& url,
                                                const std::string& postData,
                                                const std::map<std::string, std::string>& headers,
                                                int timeoutSeconds,
                                                const std::atomic<bool>* cancel) {
    Response response;

    if (!CurlLifecycleManager::isInitialized()) {
        response.statusMessage = "libcurl initialization failed";
        return response;
    }

    std::string host;
    int port;
    std::string path;
    bool isHttps;
    if (!parseURL(url, host, port, path, isHttps)) {
        response.statusMessage = "Failed to parse URL";
        return response;
    }
    std::string pool_key = host + ":" + std::to_string(port);

    CURL *curl = CurlLifecycleManager::acquireConnection(pool_key);
    if (!curl) {
        response.statusMessage = "Failed to acquire curl handle";
        return response;
    }

    // Returns the handle to the pool on every exit path
    struct CurlHandleGuard {
        CURL* handle;
        struct curl_slist* headers;
        std::string key;

        CurlHandleGuard(CURL* h, const std::string& pool_key) : handle(h), headers(nullptr), key(pool_key) {}

        ~CurlHandleGuard() {
            if (headers) {
                curl_slist_free_all(headers);
            }
            CurlLifecycleManager::releaseConnection(key, handle);
        }

        CurlHandleGuard(const CurlHandleGuard&) = delete;
        CurlHandleGuard& operator=(const CurlHandleGuard&) = delete;
    } guard(curl, pool_key);

    std::string readBuffer;
    std::string headerBuffer;
    headerBuffer.reserve(4 * 1024);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headerBuffer);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, TGSTREAM_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, 256L * 1024L);

    if (cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel));
    }

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));
    }

    for (const auto& header : headers) {
        std::string headerStr = header.first + ": " + header.second;
        guard.headers = curl_slist_append(guard.headers, headerStr.c_str());
    }
    if (guard.headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, guard.headers);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
        response.statusMessage = "Transfer cancelled";
        return response;
    }
    if (res != CURLE_OK) {
        response.statusMessage = std::string("libcurl error: ") + curl_easy_strerror(res);
        return response;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.statusCode = static_cast<int>(http_code);
    response.body = std::move(readBuffer);
    response.success = (response.statusCode >= 200 && response.statusCode < 300);

    std::istringstream headerStream(headerBuffer);
    std::string headerLine;
    while (std::getline(headerStream, headerLine)) {
        if (!headerLine.empty() && headerLine.back() == '\r') {
            headerLine.pop_back();
        }
        if (headerLine.empty()) {
            continue;
        }
        if (headerLine.compare(0, 5, "HTTP/") == 0) {
            // Status line: "HTTP/1.1 303 See Other"
            size_t sp = headerLine.find(' ', 9);
            response.statusMessage = sp == std::string::npos ? "" : headerLine.substr(sp + 1);
            continue;
        }

        size_t colonPos = headerLine.find(':');
        if (colonPos != std::string::npos && colonPos > 0) {
            std::string name = lowercase(headerLine.substr(0, colonPos));
            std::string value = headerLine.substr(colonPos + 1);
            size_t start = value.find_first_not_of(" \t");
            if (start != std::string::npos) {
                size_t end = value.find_last_not_of(" \t");
                value = value.substr(start, end - start + 1);
            } else {
                value.clear();
            }
            if (response.headers.size() < 100) {
                response.headers[name] = value;
            }
        }
    }

    if (!response.success && response.statusMessage.empty()) {
        response.statusMessage = "HTTP " + std::to_string(response.statusCode);
    }
    return response;
}

std::string HTTPClient::urlEncode(const std::string& input) {
    // RFC 3986 unreserved characters pass through, everything else is escaped
    std::string result;
    result.reserve(input.length() * 3);
    for (unsigned char c : input) {
        if ((c >= '0' && c <= '9') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            c == '-' || c == '.' || c == '_' || c == '~') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

bool HTTPClient::parseURL(const std::string& url, std::string& host, int& port,
                          std::string& path, bool& isHttps) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return false;
    }

    std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        Debug::log("http", "HTTPClient::parseURL() - Unsupported scheme: ", scheme);
        return false;
    }

    isHttps = (scheme == "https");
    port = isHttps ? 443 : 80;

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        pathStart = url.length();
        path = "/";
    } else {
        path = url.substr(pathStart);
    }

    std::string hostPort = url.substr(hostStart, pathStart - hostStart);
    size_t portPos = hostPort.find(':');
    if (portPos != std::string::npos) {
        host = hostPort.substr(0, portPos);
        std::string portStr = hostPort.substr(portPos + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            portStr.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        port = std::stoi(portStr);
        if (port < 1 || port > 65535) {
            return false;
        }
    } else {
        host = hostPort;
    }

    return !host.empty();
}

void HTTPClient::closeAllConnections() {
    CurlLifecycleManager::shutdown();
}

} // namespace HTTP
} // namespace IO
} // namespace TGStream
