#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"

namespace wmn {

struct HttpResponse {
    // 0 when the request never produced a response
    long status = 0;
    std::string body;
    // transport error text (libcurl), empty on success
    std::string transport_error;
};

struct ExplainResult {
    bool ok = false;
    long http_status = 0;
    nlohmann::json body;        // the explainer's response, opaque to the backend
    int error_code = 0;
    std::string error;
};

/**
 * @brief Forwards explanation requests to the external explainer service.
 *
 * POSTs to <base_url>/explain. Every failure comes back as an ExplainResult
 * with a catalogued E31xx code; nothing is thrown to the caller.
 */
class ExplainerClient {
public:
    using Transport = std::function<HttpResponse(const std::string& url, const std::string& body, long timeout_s)>;

    // Transport defaults to a libcurl POST.
    explicit ExplainerClient(ExplainerConfig cfg, Transport transport = {});

    bool configured() const { return !cfg_.base_url.empty(); }
    std::string endpoint() const;

    ExplainResult explain(const nlohmann::json& request) const;

private:
    ExplainerConfig cfg_;
    Transport transport_;
};

HttpResponse curl_post_json(const std::string& url, const std::string& body, long timeout_s);

nlohmann::json to_json(const ExplainResult& r);

} // namespace wmn
