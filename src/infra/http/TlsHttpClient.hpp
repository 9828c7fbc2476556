#pragma once

#include <string>

namespace infra::http {

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string used_weight_header;
    std::string retry_after_header;
    std::string final_host;
    std::string final_target;
};

// HTTPS GET following up to five same-scheme redirects. Any HTTP status is
// returned to the caller; DNS, connect, TLS, timeout and read failures throw
// domain::TransportError.
JsonResponse https_get_json_response(const std::string& host, const std::string& target, int timeout_sec = 20);

}  // namespace infra::http
