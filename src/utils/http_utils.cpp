#include "http_utils.hpp"
#include <chrono>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <thread>
#include <curl/curl.h>

namespace {

struct CurlEasyCleanup {
    void operator()(CURL* curl_handle) const { curl_easy_cleanup(curl_handle); }
};

struct CurlHeaderListCleanup {
    void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyCleanup>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListCleanup>;

size_t append_body_chunk(char* chunk_data, size_t chunk_size, size_t chunk_count, void* body_pointer) {
    static_cast<std::string*>(body_pointer)->append(chunk_data, chunk_size * chunk_count);
    return chunk_size * chunk_count;
}

CurlHeaderList make_quote_headers() {
    curl_slist* header_list = curl_slist_append(nullptr, "Accept: application/json");
    if (header_list) {
        curl_slist* extended_list = curl_slist_append(header_list, "User-Agent: hybrid_trader/1.0");
        if (extended_list) {
            header_list = extended_list;
        }
    }
    return CurlHeaderList(header_list);
}

} // namespace

std::string http_get(const HttpGetRequest& request) {
    if (request.attempts < 1) {
        throw std::runtime_error("HTTP GET needs at least one attempt, got " + std::to_string(request.attempts));
    }

    CurlEasyHandle curl_handle(curl_easy_init());
    if (!curl_handle) {
        throw std::runtime_error("curl_easy_init failed for " + request.url);
    }
    CurlHeaderList header_list = make_quote_headers();

    std::string response_body;
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, append_body_chunk);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);

    std::string last_failure;
    for (int attempt_number = 1; attempt_number <= request.attempts; ++attempt_number) {
        response_body.clear();
        CURLcode transfer_result = curl_easy_perform(curl_handle.get());
        long status_code = 0;
        curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &status_code);

        if (transfer_result == CURLE_OK && status_code < 400) {
            if (response_body.empty()) {
                throw std::runtime_error("Empty response (HTTP " + std::to_string(status_code) + ") from " + request.url);
            }
            return response_body;
        }

        last_failure = transfer_result != CURLE_OK ? std::string(curl_easy_strerror(transfer_result))
                                                   : "HTTP " + std::to_string(status_code);
        if (attempt_number < request.attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(request.retry_delay_ms));
        }
    }

    throw std::runtime_error("GET " + request.url + " failed after " + std::to_string(request.attempts) +
                             " attempts: " + last_failure);
}

std::string url_encode_path_segment(const std::string& segment) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";
    std::string encoded_segment;
    for (unsigned char segment_character : segment) {
        bool is_unreserved = std::isalnum(segment_character) || segment_character == '-' || segment_character == '_' ||
                             segment_character == '.' || segment_character == '~';
        if (is_unreserved) {
            encoded_segment.push_back(static_cast<char>(segment_character));
        } else {
            encoded_segment.push_back('%');
            encoded_segment.push_back(HEX_DIGITS[segment_character >> 4]);
            encoded_segment.push_back(HEX_DIGITS[segment_character & 0x0F]);
        }
    }
    return encoded_segment;
}
