#include "api/http_client.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace premium {
namespace client {

namespace {

std::once_flag curl_init_flag;

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_secret_header(const std::string& name) {
    std::string lower = to_lower(name);
    return lower == "authorization" || lower == "cookie";
}

// Frees a header list when the request scope ends
struct HeaderList {
    curl_slist* list = nullptr;

    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    void append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            throw HttpClientError("Failed to build request headers");
        }
        list = next;
    }
};

} // anonymous namespace

// CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // Parse header line: "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = to_lower(header.substr(0, colon_pos));
        std::string value = header.substr(colon_pos + 1);

        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        (*headers)[name] = value;
    }

    return total_size;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        // Process-wide init; libcurl requires it before any thread uses a handle
        std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms, RetryPolicy retry)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , retry_(std::move(retry))
    , debug_(false)
{
    // Remove trailing slash from base_url
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

HttpResponse HttpClient::execute_once(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    auto start = std::chrono::steady_clock::now();
    std::string url = base_url_ + path;

    CURL* curl = impl_->curl;
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    HeaderList curl_headers;
    bool has_content_type = false;
    for (const auto& [key, value] : headers) {
        if (debug_) {
            std::cerr << "[HttpClient] Header: " << key << ": "
                      << (is_secret_header(key) ? "[REDACTED]" : value) << std::endl;
        }
        if (to_lower(key) == "content-type") {
            has_content_type = true;
        }
        // "Name:" with no value suppresses a header curl would add itself
        curl_headers.append(value.empty() ? key + ":" : key + ": " + value);
    }
    if (method == "POST" && !has_content_type) {
        curl_headers.append("Content-Type: application/json");
    }
    if (curl_headers.list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    if (debug_) {
        std::cerr << "[HttpClient] " << method << " " << url << std::endl;
        if (!body.empty()) {
            std::cerr << "[HttpClient] Body: " << body << std::endl;
        }
    }

    CURLcode res = curl_easy_perform(curl);
    response.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (res != CURLE_OK) {
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        throw HttpClientError(error_msg);
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = static_cast<int>(status_code);

    if (debug_) {
        std::cerr << "[HttpClient] Status: " << status_code
                  << " (" << response.duration.count() << "ms)" << std::endl;
    }

    if (status_code < 200 || status_code >= 300) {
        std::ostringstream oss;
        oss << method << " " << path << " returned HTTP " << status_code;
        if (!response.body.empty()) {
            oss << ": " << response.body;
        }
        throw HttpClientError(oss.str(), response.status_code, response.body);
    }

    return response;
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    int attempts = retry_.max_attempts();

    for (int attempt = 0; ; ++attempt) {
        try {
            return execute_once(method, path, body, headers);
        } catch (const HttpClientError& e) {
            // Transport errors and client errors are not retried
            if (!should_retry(e.status_code()) || attempt + 1 >= attempts) {
                throw;
            }

            int delay_ms = retry_.delays_ms[static_cast<size_t>(attempt)];
            if (debug_) {
                std::cerr << "[HttpClient] Error: " << e.what()
                          << " - retrying in " << delay_ms << "ms..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
}

HttpResponse HttpClient::get(
    const std::string& path,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("GET", path, "", headers);
}

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("POST", path, body, headers);
}

} // namespace client
} // namespace premium
