#pragma once

#include <chrono>
#include <string>

namespace infra::http {

struct TlsClientOptions {
    std::chrono::milliseconds timeout{20000};
    bool verifyPeer = true;
    int maxRedirects = 5;
    std::string userAgent = "ChartDataService/1.0";
};

struct HttpsResponse {
    unsigned status = 0U;
    std::string body;
    std::string host;
    std::string target;
    std::string usedWeight;  // X-MBX-USED-WEIGHT-1M when present
};

// Blocking HTTPS GET over Beast + OpenSSL. Follows 301/302/307/308 to HTTPS
// locations only. Throws std::runtime_error on transport errors.
class TlsHttpClient {
public:
    TlsHttpClient() = default;
    explicit TlsHttpClient(TlsClientOptions options);

    HttpsResponse get(const std::string& host, const std::string& target) const;

    // Same as get() but also throws for HTTP status >= 400.
    std::string getBody(const std::string& host, const std::string& target) const;

    const TlsClientOptions& options() const noexcept { return options_; }

private:
    TlsClientOptions options_{};
};

}  // namespace infra::http
