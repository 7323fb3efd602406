#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "include/config.hpp"

typedef void CURL;

namespace speedwatch {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// One curl easy handle; not safe to share between threads.
class HttpClient {
public:
    HttpClient();
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, std::string> post_json(const std::string& url,
                                                       const std::string& body,
                                                       const std::vector<std::string>& headers = {},
                                                       long timeout_sec = Config::HTTP_TIMEOUT_SEC);

private:
    std::unique_ptr<CURL, void(*)(CURL*)> handle_;

    std::expected<HttpResponse, std::string> perform(long timeout_sec);

    static size_t write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept;
};

}  // namespace speedwatch
