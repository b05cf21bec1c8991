#include "net/ExplainerClient.hpp"

#include "core/ErrorCatalog.hpp"

#include <curl/curl.h>

#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace wmn {

static size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse curl_post_json(const std::string& url, const std::string& body, long timeout_s) {
    ensure_curl_global_init();
    HttpResponse out;
    CURL* curl = curl_easy_init();
    if (!curl) {
        out.transport_error = "curl_easy_init failed";
        return out;
    }
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    } else {
        out.transport_error = curl_easy_strerror(res);
    }

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return out;
}

ExplainerClient::ExplainerClient(ExplainerConfig cfg, Transport transport)
: cfg_(std::move(cfg)), transport_(std::move(transport)) {
    if (!transport_) transport_ = curl_post_json;
    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();
}

std::string ExplainerClient::endpoint() const {
    return cfg_.base_url + "/explain";
}

ExplainResult ExplainerClient::explain(const json& request) const {
    ExplainResult r;
    if (!configured()) {
        r.error_code = errors::E3100_EXPLAINER_NOT_CONFIGURED;
        r.error = errors::D3100_NOT_CONFIGURED;
        return r;
    }

    HttpResponse resp = transport_(endpoint(), request.dump(), cfg_.timeout_s);
    r.http_status = resp.status;
    if (!resp.transport_error.empty() || resp.status == 0) {
        r.error_code = errors::E3110_EXPLAINER_TRANSPORT;
        r.error = resp.transport_error.empty() ? std::string("no response from ") + endpoint() : resp.transport_error;
        std::cerr << "ExplainerClient: " << endpoint() << ": " << r.error << std::endl;
        return r;
    }
    if (resp.status < 200 || resp.status >= 300) {
        r.error_code = errors::E3120_EXPLAINER_HTTP_STATUS;
        r.error = "explainer returned HTTP " + std::to_string(resp.status);
        // keep whatever the service said about it
        json j = json::parse(resp.body, nullptr, false);
        r.body = j.is_discarded() ? json(resp.body) : j;
        return r;
    }
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        r.error_code = errors::E3130_EXPLAINER_NOT_JSON;
        r.error = errors::D3130_NOT_JSON;
        r.body = resp.body;
        return r;
    }
    r.ok = true;
    r.body = std::move(j);
    return r;
}

json to_json(const ExplainResult& r) {
    json out = {
        {"ok", r.ok},
        {"http_status", r.http_status},
        {"response", r.body}
    };
    if (!r.ok) {
        out["error_code"] = r.error_code;
        out["error"] = r.error;
    }
    return out;
}

} // namespace wmn
