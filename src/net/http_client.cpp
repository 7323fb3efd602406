#include "include/http_client.hpp"
#include "include/interrupts.hpp"

#include <format>
#include <new>
#include <span>
#include <stdexcept>

#include <curl/curl.h>

namespace speedwatch {

namespace {

constexpr auto kUserAgent = "speedwatch/2 (+libcurl)";

struct CurlSlistDeleter {
    void operator()(struct curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

class CurlHeaders {
    std::unique_ptr<struct curl_slist, CurlSlistDeleter> list_;

public:
    void add(const std::string& header) {
        auto new_head = curl_slist_append(list_.get(), header.c_str());
        if (!new_head) {
            throw std::runtime_error("Failed to allocate curl header list");
        }
        if (!list_) {
            list_.reset(new_head);
        }
    }

    struct curl_slist* get() const { return list_.get(); }
};

}

HttpClient::HttpClient() : handle_(curl_easy_init(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept {
    try {
        size_t total_size = size * nmemb;
        std::span<const char> data_view(static_cast<const char*>(ptr), total_size);

        s->append(data_view.begin(), data_view.end());

        return total_size;
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

std::expected<HttpResponse, std::string> HttpClient::perform(long timeout_sec) {
    HttpResponse response;

    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle_.get(), CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(handle_.get(), CURLOPT_CONNECTTIMEOUT, Config::HTTP_CONNECT_TIMEOUT_SEC);
    curl_easy_setopt(handle_.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_NOSIGNAL, 1L);

    // Abort in-flight transfers once shutdown has been requested.
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION,
        +[](void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                return g_interrupted ? 1 : 0;
        });
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<HttpResponse, std::string> HttpClient::post_json(const std::string& url,
                                                               const std::string& body,
                                                               const std::vector<std::string>& headers,
                                                               long timeout_sec) {
    curl_easy_reset(handle_.get());

    CurlHeaders header_list;
    try {
        header_list.add("Content-Type: application/json");
        header_list.add("Accept: application/json");
        for (const auto& h : headers) header_list.add(h);
    } catch (const std::runtime_error& e) {
        return std::unexpected(e.what());
    }

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, header_list.get());
    return perform(timeout_sec);
}

}  // namespace speedwatch
