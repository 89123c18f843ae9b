/*
 * HiveMem C++ - HTTP client Implementation
 */
#include <hivemem/core/http_client.hpp>
#include <hivemem/core/logger.hpp>
#include <curl/curl.h>

namespace hivemem {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

int check_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const std::atomic<bool>* cancel = static_cast<const std::atomic<bool>*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return (cancel && cancel->load()) ? 1 : 0;
}

} // anonymous namespace

Json HttpResponse::json() const {
    Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Json();
    }
    return parsed;
}

HttpClient::HttpClient()
    : timeout_ms_(3000)
    , connect_timeout_ms_(3000)
    , cancel_(nullptr)
{}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    bool has_content_type = false;
    for (const auto& kv : headers) {
        if (kv.first == "Content-Type") has_content_type = true;
        std::string line = kv.first + ": " + kv.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (!has_content_type) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }
    // The sync listener never sends 100 Continue
    header_list = curl_slist_append(header_list, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (cancel_) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancel);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel_));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    } else {
        response.status_code = 0;
        response.aborted = (rc == CURLE_ABORTED_BY_CALLBACK);
        response.error = curl_easy_strerror(rc);
        LOG_DEBUG("[HttpClient] POST %s failed: %s", url.c_str(), response.error.c_str());
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace hivemem
