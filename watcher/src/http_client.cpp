#include "http_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(util::to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string url_escape(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        throw std::runtime_error("Failed to URL-encode value");
    }
    std::string result(escaped);
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

CurlHttpClient::CurlHttpClient(long timeout_ms, const std::string& user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(user_agent)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

size_t CurlHttpClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* response = static_cast<HttpResponse*>(userp);
    std::string line(buffer, size * nitems);

    // A new status line means a redirect or 100-continue; keep only the last set
    if (line.rfind("HTTP/", 0) == 0) {
        response->headers.clear();
        return size * nitems;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = util::to_lower(util::trim(line.substr(0, colon)));
        response->headers[name] = util::trim(line.substr(colon + 1));
    }
    return size * nitems;
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    return perform(url, headers, nullptr);
}

HttpResponse CurlHttpClient::post_form(const std::string& url,
                                       const std::string& body,
                                       const HttpHeaders& headers) {
    return perform(url, headers, &body);
}

HttpResponse CurlHttpClient::perform(const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string* post_body) {
    HttpResponse response;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (post_body) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        response.status = 0;
        response.error = curl_easy_strerror(res);
        spdlog::warn("HTTP request failed: {}", response.error);
        return response;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("HTTP {} {} -> {}", post_body ? "POST" : "GET", url, response.status);
    return response;
}
