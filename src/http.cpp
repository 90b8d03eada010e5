#include "http.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace taleweave {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t append_to_body(char* data, size_t size, size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
}

// curl_slist_append returns null on allocation failure and leaves the old list intact
bool add_headers(HeaderList& list, const std::vector<Header>& headers) {
    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* grown = curl_slist_append(list.get(), line.c_str());
        if (!grown) return false;
        list.release();
        list.reset(grown);
    }
    return true;
}

} // namespace

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    EasyHandle easy(curl_easy_init());
    HeaderList header_list;
    if (!easy || !add_headers(header_list, headers)) return {};

    HttpResponse response;
    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_COPYPOSTFIELDS, body.data());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_to_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    if (curl_easy_perform(h) != CURLE_OK) {
        response.body.clear();
        return response;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace taleweave
