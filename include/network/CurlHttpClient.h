#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace chainshuttle {
namespace network {

class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(const std::string& proxy = "", long timeout_seconds = 30);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {}
    ) override;

    HttpResponse post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    std::string proxy_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace chainshuttle
