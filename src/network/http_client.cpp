#include "network/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <sstream>
#include <type_traits>

using asio::ip::tcp;

namespace {

template <typename Stream>
struct is_tls_stream : std::false_type {};

template <typename Next>
struct is_tls_stream<asio::ssl::stream<Next>> : std::true_type {};

// Drives resolve -> connect -> [TLS handshake] -> write -> read-until-close on one stream.
template <typename Stream>
class Exchange {
public:
    Exchange(asio::io_context& io_context, Stream& stream, const Url& url, std::string payload)
        : resolver_(io_context), stream_(stream), url_(url), payload_(std::move(payload)) {}

    void start() {
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [this](const asio::error_code& error, tcp::resolver::results_type endpoints) {
                if (error) {
                    return finish(error, "resolve");
                }
                asio::async_connect(stream_.lowest_layer(), endpoints,
                    [this](const asio::error_code& error, const tcp::endpoint& endpoint) {
                        if (error) {
                            return finish(error, "connect");
                        }
                        LOG_DEBUG("Connected to ", endpoint);
                        handshake();
                    });
            });
    }

    void cancel() {
        asio::error_code ignored;
        resolver_.cancel();
        stream_.lowest_layer().close(ignored);
    }

    bool done() const { return done_; }
    const asio::error_code& error() const { return error_; }
    const std::string& failed_step() const { return failed_step_; }
    bool truncated() const { return truncated_; }
    std::string& response() { return response_; }

private:
    void handshake() {
        if constexpr (is_tls_stream<Stream>::value) {
            stream_.async_handshake(asio::ssl::stream_base::client,
                [this](const asio::error_code& error) {
                    if (error) {
                        return finish(error, "TLS handshake");
                    }
                    write();
                });
        } else {
            write();
        }
    }

    void write() {
        asio::async_write(stream_, asio::buffer(payload_),
            [this](const asio::error_code& error, size_t /*bytes_transferred*/) {
                if (error) {
                    return finish(error, "write");
                }
                read();
            });
    }

    void read() {
        asio::async_read(stream_, asio::dynamic_buffer(response_),
            [this](const asio::error_code& error, size_t /*bytes_transferred*/) {
                // Connection: close, so the peer closing the stream ends the response.
                // Servers that skip TLS close_notify surface as stream_truncated; the
                // body is then only trusted when its framing can be checked.
                if (error == asio::ssl::error::stream_truncated) {
                    truncated_ = true;
                    return finish(asio::error_code(), "");
                }
                if (error == asio::error::eof) {
                    return finish(asio::error_code(), "");
                }
                finish(error, "read");
            });
    }

    void finish(const asio::error_code& error, const char* step) {
        done_ = true;
        error_ = error;
        failed_step_ = step;
    }

    tcp::resolver resolver_;
    Stream& stream_;
    const Url& url_;
    std::string payload_;
    std::string response_;
    asio::error_code error_;
    std::string failed_step_;
    bool done_ = false;
    bool truncated_ = false;
};

template <typename Stream>
std::string run_exchange(asio::io_context& io_context, Stream& stream, const Url& url,
                         std::string payload, std::chrono::milliseconds timeout, bool& truncated) {
    Exchange<Stream> exchange(io_context, stream, url, std::move(payload));
    exchange.start();
    io_context.run_for(timeout);

    if (!exchange.done()) {
        exchange.cancel();
        throw TransportError("Request to " + url.host + " timed out after " +
                             std::to_string(timeout.count()) + " ms");
    }
    if (exchange.error()) {
        throw TransportError(exchange.failed_step() + " failed for " + url.host + ": " +
                             exchange.error().message());
    }
    truncated = exchange.truncated();
    if (truncated) {
        LOG_WARN("TLS stream from ", url.host, " ended without close_notify");
    }
    return std::move(exchange.response());
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string decode_chunked(const std::string& body) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw TransportError("Truncated chunk size line");
        }
        std::string size_line = body.substr(pos, line_end - pos);
        size_t ext = size_line.find(';');
        if (ext != std::string::npos) {
            size_line.resize(ext);
        }
        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(trim(size_line), nullptr, 16);
        } catch (const std::exception&) {
            throw TransportError("Invalid chunk size: " + size_line);
        }
        pos = line_end + 2;
        if (chunk_size == 0) {
            break;
        }
        if (pos + chunk_size > body.size()) {
            throw TransportError("Truncated chunk body");
        }
        out.append(body, pos, chunk_size);
        pos += chunk_size + 2;
    }
    return out;
}

} // namespace

Url parse_url(const std::string& url) {
    Url parsed;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        parsed.tls = true;
        parsed.port = 443;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        parsed.tls = false;
        parsed.port = 80;
        rest = url.substr(7);
    } else {
        throw TransportError("Unsupported URL scheme: " + url);
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        try {
            unsigned long port = std::stoul(port_str);
            if (port == 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            parsed.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            throw TransportError("Invalid port in URL: " + url);
        }
        authority.resize(colon);
    }
    if (authority.empty()) {
        throw TransportError("URL has no host: " + url);
    }
    parsed.host = authority;
    return parsed;
}

std::string build_http_request(const Url& url, const HttpRequest& request) {
    std::ostringstream oss;
    oss << request.method << " " << url.target << " HTTP/1.1\r\n";
    oss << "Host: " << url.host;
    if ((url.tls && url.port != 443) || (!url.tls && url.port != 80)) {
        oss << ":" << url.port;
    }
    oss << "\r\n";
    for (const auto& [name, value] : request.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << request.body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << request.body;
    return oss.str();
}

HttpResponse parse_http_response(const std::string& raw, bool closed_cleanly) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw TransportError("Incomplete HTTP response header");
    }
    if (raw.compare(0, 5, "HTTP/") != 0) {
        throw TransportError("Response does not start with an HTTP status line");
    }

    HttpResponse response;
    size_t line_end = raw.find("\r\n");
    std::string status_line = raw.substr(0, line_end);
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || status_line.size() < sp + 4) {
        throw TransportError("Malformed status line: " + status_line);
    }
    try {
        response.status = std::stoi(status_line.substr(sp + 1, 3));
    } catch (const std::exception&) {
        throw TransportError("Malformed status code: " + status_line);
    }

    size_t pos = line_end + 2;
    while (pos < header_end) {
        size_t end = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, end - pos);
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw TransportError("Malformed header line: " + line);
        }
        response.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        pos = end + 2;
    }

    std::string body = raw.substr(header_end + 4);
    const std::string* transfer_encoding = find_header_ci(response.headers, "Transfer-Encoding");
    const std::string* content_length = find_header_ci(response.headers, "Content-Length");
    if (transfer_encoding && transfer_encoding->find("chunked") != std::string::npos) {
        body = decode_chunked(body);
    } else if (content_length) {
        size_t length = 0;
        try {
            length = std::stoul(*content_length);
        } catch (const std::exception&) {
            throw TransportError("Invalid Content-Length: " + *content_length);
        }
        if (length > body.size()) {
            throw TransportError("Response body shorter than Content-Length");
        }
        body.resize(length);
    } else if (!closed_cleanly) {
        throw TransportError("Response without length framing ended by a truncated stream");
    }
    response.body = std::move(body);
    return response;
}

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

HttpResponse HttpClient::send(const HttpRequest& request) {
    Url url = parse_url(request.url);
    std::string payload = build_http_request(url, request);
    asio::io_context io_context;
    std::string raw;
    bool truncated = false;

    if (url.tls) {
        asio::ssl::context ssl_context(asio::ssl::context::tls_client);
        try {
            ssl_context.set_options(asio::ssl::context::default_workarounds
                                    | asio::ssl::context::no_sslv2
                                    | asio::ssl::context::no_sslv3
                                    | asio::ssl::context::no_tlsv1
                                    | asio::ssl::context::no_tlsv1_1);
            if (options_.verify_peer) {
                if (options_.ca_file.empty()) {
                    ssl_context.set_default_verify_paths();
                } else {
                    ssl_context.load_verify_file(options_.ca_file);
                }
                ssl_context.set_verify_mode(asio::ssl::verify_peer);
            } else {
                LOG_WARN("TLS peer verification is disabled for ", url.host);
                ssl_context.set_verify_mode(asio::ssl::verify_none);
            }
        } catch (const asio::system_error& e) {
            throw TransportError(std::string("TLS setup failed: ") + e.what());
        }

        asio::ssl::stream<tcp::socket> stream(io_context, ssl_context);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw TransportError("Cannot set TLS SNI host name " + url.host);
        }
        if (options_.verify_peer) {
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        }
        raw = run_exchange(io_context, stream, url, std::move(payload), request.timeout, truncated);
    } else {
        tcp::socket socket(io_context);
        raw = run_exchange(io_context, socket, url, std::move(payload), request.timeout, truncated);
    }

    HttpResponse response = parse_http_response(raw, !truncated);
    LOG_DEBUG("HTTP ", response.status, " from ", url.host, url.target, " (", response.body.size(), " bytes)");
    return response;
}
