#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>

// One GET against a quote endpoint. attempts counts the first try.
struct HttpGetRequest {
    std::string url;
    int attempts = 2;
    int timeout_seconds = 10;
    int retry_delay_ms = 500;
    bool verify_tls = true;
};

// Returns the body of the first attempt answering below HTTP 400.
// Throws std::runtime_error when every attempt fails or the body is empty.
std::string http_get(const HttpGetRequest& request);

// Percent-encodes characters outside the URL unreserved set (tickers such as ^GSPC or INR=X).
std::string url_encode_path_segment(const std::string& segment);

#endif // HTTP_UTILS_HPP
