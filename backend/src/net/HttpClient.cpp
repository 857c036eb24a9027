#include "net/HttpClient.hpp"

#include <curl/curl.h>
#include <mutex>

namespace tvlink::net {

namespace {

size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

void apply_common(CURL* curl, const std::string& url, std::string& response, std::chrono::milliseconds timeout) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    // no SIGALRM-based timeouts: requests run on probe worker threads
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
}

HttpResult perform(CURL* curl, std::string& response) {
    HttpResult out;
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.code);
        out.body = std::move(response);
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
        out.error = "connection timed out";
    } else {
        out.error = curl_easy_strerror(res);
    }
    return out;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    static std::once_flag init_once;
    std::call_once(init_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResult CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    std::string response;
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    apply_common(curl, url, response, timeout);

    HttpResult out = perform(curl, response);
    curl_easy_cleanup(curl);
    return out;
}

HttpResult CurlHttpClient::post(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    std::string response;
    struct curl_slist* headers = nullptr;
    if (!body.empty()) headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    apply_common(curl, url, response, timeout);

    HttpResult out = perform(curl, response);

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return out;
}

} // namespace tvlink::net
