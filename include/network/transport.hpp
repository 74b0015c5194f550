#ifndef WZB_TRANSPORT_HPP
#define WZB_TRANSPORT_HPP

#include <chrono>
#include <string>

#include "protocol.hpp"

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    HeaderList headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status = 0;
    HeaderList headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Moves one request to the gateway and returns whatever came back, any status.
// Connection-level failures are raised as TransportError.
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

#endif // WZB_TRANSPORT_HPP
