#include "../include/transport.h"

#include <cpr/cpr.h>

namespace {

cpr::Header toCprHeader(const HttpHeaders& headers) {
    cpr::Header header;
    for (const auto& [name, value] : headers) {
        header[name] = value;
    }
    return header;
}

HttpResponse fromCprResponse(const cpr::Response& response) {
    HttpResponse result;
    result.statusCode = response.status_code;
    result.body = response.text;
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "request failed" : response.error.message;
    }
    return result;
}

} // namespace

HttpResponse CprTransport::get(const std::string& url, const HttpHeaders& headers) {
    return fromCprResponse(cpr::Get(cpr::Url{url}, toCprHeader(headers)));
}

HttpResponse CprTransport::post(const std::string& url, const std::string& body, const HttpHeaders& headers) {
    return fromCprResponse(cpr::Post(cpr::Url{url}, toCprHeader(headers), cpr::Body{body}));
}
