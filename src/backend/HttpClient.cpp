#include "backend/HttpClient.hpp"
#include "util/Logger.hpp"
#include <curl/curl.h>
#include <mutex>

namespace listui::backend {

namespace {

std::once_flag curl_init_flag;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

}  // namespace

struct HttpClient::Impl {
    CURL* curl = nullptr;
    std::chrono::seconds timeout{20};
};

HttpClient::HttpClient(std::chrono::seconds timeout) : pimpl_(std::make_unique<Impl>()) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    pimpl_->curl = curl_easy_init();
    pimpl_->timeout = timeout;
    if (!pimpl_->curl) {
        listui::util::Logger::error("HttpClient: curl_easy_init failed");
    }
}

HttpClient::~HttpClient() {
    if (pimpl_->curl) {
        curl_easy_cleanup(pimpl_->curl);
    }
}

std::optional<HttpResponse> HttpClient::get(const std::string& url) {
    if (!pimpl_->curl) return std::nullopt;

    HttpResponse response;
    curl_easy_reset(pimpl_->curl);

    curl_easy_setopt(pimpl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pimpl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(pimpl_->curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(pimpl_->curl, CURLOPT_TIMEOUT, static_cast<long>(pimpl_->timeout.count()));
    curl_easy_setopt(pimpl_->curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(pimpl_->curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(pimpl_->curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(pimpl_->curl, CURLOPT_USERAGENT, "listui/0.4");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(pimpl_->curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(pimpl_->curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        listui::util::Logger::warn("HttpClient: GET " + url + " failed: " + curl_easy_strerror(res));
        return std::nullopt;
    }

    curl_easy_getinfo(pimpl_->curl, CURLINFO_RESPONSE_CODE, &response.status);
    listui::util::Logger::debug("HttpClient: GET " + url + " -> " + std::to_string(response.status) +
                                " (" + std::to_string(response.body.size()) + " bytes)");
    return response;
}

std::string HttpClient::escape(const std::string& value) {
    std::string out;
    CURL* curl = curl_easy_init();
    if (!curl) return value;
    char* encoded = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (encoded) {
        out = encoded;
        curl_free(encoded);
    }
    curl_easy_cleanup(curl);
    return out;
}

}  // namespace listui::backend
