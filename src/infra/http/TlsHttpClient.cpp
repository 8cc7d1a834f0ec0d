#include "infra/http/TlsHttpClient.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

std::runtime_error requestError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "GET https://" << host << target << ": " << message;
    return std::runtime_error(oss.str());
}

std::string lastOpenSslReason() {
    const unsigned long err = ::ERR_get_error();
    const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
    return reason != nullptr ? std::string{reason} : std::string{"unknown"};
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 307U || status == 308U;
}

// Resolves a Location header against the current host. Only https:// on port
// 443 and relative locations are followed.
std::pair<std::string, std::string> resolveLocation(const std::string& location, const std::string& currentHost) {
    static const std::string kHttps = "https://";
    if (location.empty()) {
        throw std::runtime_error("redirect without Location header");
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("refusing redirect to plain HTTP");
    }
    if (location.rfind(kHttps, 0) != 0) {
        return {currentHost, location.front() == '/' ? location : "/" + location};
    }

    const auto rest = location.substr(kHttps.size());
    const auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (const auto colon = authority.find(':'); colon != std::string::npos) {
        if (authority.substr(colon + 1) != "443") {
            throw std::runtime_error("redirect to unsupported port in " + location);
        }
        authority.resize(colon);
    }
    if (authority.empty()) {
        throw std::runtime_error("redirect without host: " + location);
    }
    return {authority, slash == std::string::npos ? std::string{"/"} : rest.substr(slash)};
}

bhttp::response<bhttp::string_body> fetchOnce(const TlsClientOptions& options,
                                              const std::string& host,
                                              const std::string& target) {
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (options.verifyPeer) {
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(ssl::verify_peer);
    }
    else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw requestError(host, target, "SNI setup failed: " + lastOpenSslReason());
    }
    if (options.verifyPeer) {
        stream.set_verify_callback(ssl::host_name_verification(host));
    }

    beast::error_code ec;
    net::ip::tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(host, "443", ec);
    if (ec) {
        throw requestError(host, target, "resolve: " + ec.message());
    }

    auto& socket = beast::get_lowest_layer(stream);
    socket.expires_after(options.timeout);
    socket.connect(endpoints, ec);
    if (ec) {
        throw requestError(host, target, "connect: " + ec.message());
    }

    socket.expires_after(options.timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw requestError(host, target, "handshake: " + ec.message());
    }

    bhttp::request<bhttp::empty_body> request{bhttp::verb::get, target, 11};
    request.set(bhttp::field::host, host);
    request.set(bhttp::field::user_agent, options.userAgent);
    request.set(bhttp::field::accept, "application/json");
    request.set(bhttp::field::connection, "close");

    socket.expires_after(options.timeout);
    bhttp::write(stream, request, ec);
    if (ec) {
        throw requestError(host, target, "write: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    socket.expires_after(options.timeout);
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw requestError(host, target, "read: " + ec.message());
    }

    stream.shutdown(ec);
    // Servers commonly close without close_notify.
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("TLS shutdown for " << host << " reported " << ec.message());
    }

    return response;
}

}  // namespace

TlsHttpClient::TlsHttpClient(TlsClientOptions options)
    : options_(std::move(options)) {}

HttpsResponse TlsHttpClient::get(const std::string& host, const std::string& target) const {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a host");
    }
    if (options_.timeout.count() <= 0) {
        throw requestError(host, target, "timeout must be positive");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() || target.front() != '/' ? "/" + target : target;

    for (int hop = 0; hop <= options_.maxRedirects; ++hop) {
        auto response = fetchOnce(options_, currentHost, currentTarget);
        const auto status = static_cast<unsigned>(response.result_int());

        if (isRedirect(status)) {
            try {
                const auto location = response.base()[bhttp::field::location];
                auto next = resolveLocation(std::string(location.data(), location.size()), currentHost);
                LOG_DEBUG("Redirect " << currentHost << currentTarget << " -> " << next.first << next.second);
                currentHost = std::move(next.first);
                currentTarget = std::move(next.second);
                continue;
            } catch (const std::exception& ex) {
                throw requestError(currentHost, currentTarget, ex.what());
            }
        }

        HttpsResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.host = currentHost;
        result.target = currentTarget;
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.usedWeight = std::string(it->value().data(), it->value().size());
        }
        return result;
    }

    throw requestError(currentHost, currentTarget, "too many redirects");
}

std::string TlsHttpClient::getBody(const std::string& host, const std::string& target) const {
    auto response = get(host, target);
    if (response.status >= 400U) {
        throw requestError(response.host, response.target, "HTTP status " + std::to_string(response.status));
    }
    return std::move(response.body);
}

}  // namespace infra::http
