#pragma once

#include <curl/curl.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;                              // 0 when no response arrived
    std::string body;
    std::map<std::string, std::string> headers;   // names lower-cased
    std::string error;                            // transport failure text

    bool reached_server() const { return status > 0; }
    bool is_success() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& name) const;
};

// "Name: value" lines
using HttpHeaders = std::vector<std::string>;

// Percent-encodes a query or form value with libcurl
std::string url_escape(const std::string& value);

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
    virtual HttpResponse post_form(const std::string& url,
                                   const std::string& body,
                                   const HttpHeaders& headers) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_ms = 15000,
                            const std::string& user_agent = "dealscout/" DEALSCOUT_VERSION);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
    HttpResponse post_form(const std::string& url,
                           const std::string& body,
                           const HttpHeaders& headers) override;

private:
    long timeout_ms_;
    std::string user_agent_;
    CURL* curl_;

    HttpResponse perform(const std::string& url,
                         const HttpHeaders& headers,
                         const std::string* post_body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};
