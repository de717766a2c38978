#include "network/CurlHttpClient.h"
#include "execution/ExternalCallError.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chainshuttle {
namespace network {

namespace {
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string HttpResponse::header(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return "";
}

CurlHttpClient::CurlHttpClient(const std::string& proxy, long timeout_seconds)
    : proxy_(proxy)
    , timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 30)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers
) {
    return performRequest("GET", url, "", headers);
}

HttpResponse CurlHttpClient::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers
) {
    return performRequest("POST", url, body, headers);
}

HttpResponse CurlHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    if (!proxy_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_PROXY, proxy_.c_str());
    }

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        throw execution::ExternalCallError(
            execution::ErrorClass::TRANSIENT,
            method + " " + url + " failed: " + std::string(curl_easy_strerror(res))
        );
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;
    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace chainshuttle
