#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "domain/Errors.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

domain::TransportError makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "GET https://" << host << target << " failed: " << message;
    return domain::TransportError(oss.str());
}

struct RedirectTarget {
    std::string host;
    std::string target;
};

RedirectTarget parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw domain::TransportError("redirect without Location header");
    }

    RedirectTarget result{};
    if (location.rfind("https://", 0) == 0) {
        const std::string rest = location.substr(std::string{"https://"}.size());
        const auto slash = rest.find('/');
        std::string hostPart = slash == std::string::npos ? rest : rest.substr(0, slash);
        if (const auto colon = hostPart.find(':'); colon != std::string::npos) {
            if (hostPart.substr(colon + 1) != "443") {
                throw domain::TransportError("redirect to unsupported port: " + location);
            }
            hostPart.resize(colon);
        }
        if (hostPart.empty()) {
            throw domain::TransportError("redirect without host: " + location);
        }
        result.host = hostPart;
        result.target = slash == std::string::npos ? std::string{"/"} : rest.substr(slash);
    } else if (location.rfind("http://", 0) == 0) {
        throw domain::TransportError("refusing insecure redirect: " + location);
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }
    return result;
}

http::response<http::string_body> performRequest(const std::string& host, const std::string& target, int timeoutSec) {
    if (timeoutSec <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::rfc2818_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        throw makeError(host, target, std::string{"cannot set SNI host name"} + (reason ? std::string{": "} + reason : ""));
    }

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "connect error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "tfsync/1.0");
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(host, target, "read error: " + ec.message());
    }

    // Servers commonly drop the connection without close_notify; the body is
    // already complete at this point.
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        throw makeError(host, target, "TLS shutdown error: " + ec.message());
    }

    return response;
}

}  // namespace

JsonResponse https_get_json_response(const std::string& host, const std::string& target, int timeout_sec) {
    if (host.empty()) {
        throw domain::TransportError("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
        auto response = performRequest(currentHost, currentTarget, timeout_sec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            const auto next =
                parseRedirectLocation(std::string(response.base()[http::field::location]), currentHost);
            currentHost = next.host;
            currentTarget = next.target;
            continue;
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.used_weight_header = std::string{it->value()};
        }
        if (auto it = response.base().find(http::field::retry_after); it != response.base().end()) {
            result.retry_after_header = std::string{it->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "too many redirects");
}

}  // namespace infra::http
