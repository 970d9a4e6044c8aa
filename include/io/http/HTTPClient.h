/*
 * HTTPClient.h - libcurl HTTP client for gateway and reporting traffic
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

// All external headers included via tgstream.h

namespace TGStream {
namespace IO {
namespace HTTP {

/**
 * @brief Blocking HTTP client with per-host handle reuse
 *
 * Thin static wrapper over libcurl easy handles. Redirects are never
 * followed: a 303 from a gateway carries meaning (file relocation) and must
 * reach the caller.
 */
class HTTPClient {
public:
    /**
     * @brief HTTP response structure
     *
     * Header names are stored lower-cased.
     */
    struct Response {
        int statusCode = 0;
        std::string statusMessage;
        std::map<std::string, std::string> headers;
        std::string body;
        bool success = false;       ///< Transfer completed and status is 2xx
        bool cancelled = false;     ///< Aborted through the cancel flag

        /**
         * @brief Look up a header by name, any case
         * @return Header value, or empty string if absent
         */
        std::string header(const std::string& name) const;
    };

    /**
     * @brief Perform HTTP GET request
     * @param url The complete URL to request
     * @param headers Optional additional headers
     * @param timeoutSeconds Request timeout in seconds (default: 30)
     * @param cancel Optional flag polled during the transfer; when it becomes
     *        true the transfer is aborted and Response::cancelled is set
     * @return HTTP response structure
     */
    static Response get(const std::string& url,
                        const std::map<std::string, std::string>& headers = {},
                        int timeoutSeconds = 30,
                        const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Perform HTTP POST request
     * @param url The complete URL to post to
     * @param data The POST body
     * @param contentType Content-Type header value
     * @param headers Optional additional headers
     * @param timeoutSeconds Request timeout in seconds (default: 30)
     * @return HTTP response structure
     */
    static Response post(const std::string& url,
                         const std::string& data,
                         const std::string& contentType = "application/json",
                         const std::map<std::string, std::string>& headers = {},
                         int timeoutSeconds = 30);

    /**
     * @brief URL encode a string for use in a query component
     */
    static std::string urlEncode(const std::string& input);

    /**
     * @brief Parse URL into components
     * @param url The URL to parse
     * @param host Output parameter for hostname
     * @param port Output parameter for port number
     * @param path Output parameter for path
     * @param isHttps Output parameter for HTTPS detection
     * @return true if parsing succeeded, false otherwise
     */
    static bool parseURL(const std::string& url, std::string& host, int& port,
                         std::string& path, bool& isHttps);

    /**
     * @brief Release every pooled handle and shut libcurl down
     */
    static void closeAllConnections();

private:
    static Response performRequest(const std::string& method,
                                   const std::string& url,
                                   const std::string& postData,
                                   const std::map<std::string, std::string>& headers,
                                   int timeoutSeconds,
                                   const std::atomic<bool>* cancel);
};

} // namespace HTTP
} // namespace IO
} // namespace TGStream

#endif // HTTPCLIENT_H
