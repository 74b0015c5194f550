#ifndef WZB_HTTP_CLIENT_HPP
#define WZB_HTTP_CLIENT_HPP

#include <cstdint>
#include <string>

#include "transport.hpp"

struct Url {
    bool tls = true;
    std::string host;
    uint16_t port = 443;
    std::string target = "/";  // path and query
};

// Accepts http:// and https:// URLs; throws TransportError otherwise.
Url parse_url(const std::string& url);

/**
 * @brief Serializes a request as HTTP/1.1 with Host, Content-Length and Connection: close.
 */
std::string build_http_request(const Url& url, const HttpRequest& request);

/**
 * @brief Parses a complete HTTP/1.1 response read until connection close.
 *
 * Honors chunked transfer coding and Content-Length; otherwise the body is
 * everything after the header block, accepted only if the stream closed cleanly.
 * @throws TransportError on a malformed status line, header block or chunk.
 */
HttpResponse parse_http_response(const std::string& raw, bool closed_cleanly = true);

// One-shot HTTP/1.1 client over asio; every send opens and closes its own
// connection on a private io_context, bounded by the request timeout.
class HttpClient : public Transport {
public:
    struct Options {
        std::string ca_file;      // empty: system trust store
        bool verify_peer = true;
    };

    HttpClient();
    explicit HttpClient(Options options);

    HttpResponse send(const HttpRequest& request) override;

private:
    Options options_;
};

#endif // WZB_HTTP_CLIENT_HPP
