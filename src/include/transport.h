#pragma once

#include <map>
#include <string>

using HttpHeaders = std::map<std::string, std::string>;

/// Outcome of one HTTP exchange.
struct HttpResponse {
    long statusCode = 0;   ///< HTTP status; 0 when no response was received.
    std::string body;      ///< Raw response body (binary safe).
    std::string error;     ///< Transport-level failure description; empty on success.
};

/**
 * @class Transport
 * @brief Blocking request/response capability used by the protocol client.
 *
 * Implementations report transport failures through HttpResponse::error rather
 * than throwing, so the caller decides how to classify them.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;

    virtual HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) = 0;
};

/**
 * @class CprTransport
 * @brief Transport over HTTP(S) using the cpr library.
 */
class CprTransport : public Transport {
public:
    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;

    HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) override;
};
