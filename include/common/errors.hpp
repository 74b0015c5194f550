#ifndef WZB_ERRORS_HPP
#define WZB_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

// Phase of a gateway call in which an error was raised.
enum class CallPhase {
    CONFIG,
    BUILDING,
    ENCODE,
    ENCRYPT,
    SIGN,
    TRANSPORT,
    PARSE,
    VERIFY,
    DECRYPT
};

const char* phase_to_string(CallPhase phase);

// Base class for every error surfaced by the client.
class BankError : public std::runtime_error {
public:
    BankError(CallPhase phase, const std::string& message)
        : std::runtime_error(message), phase_(phase) {}

    CallPhase phase() const { return phase_; }

private:
    CallPhase phase_;
};

class ConfigError : public BankError {
public:
    explicit ConfigError(const std::string& message)
        : BankError(CallPhase::CONFIG, message) {}
};

// Raised by endpoint wrappers when a required business field is missing.
class RequestError : public BankError {
public:
    explicit RequestError(const std::string& message)
        : BankError(CallPhase::BUILDING, message) {}
};

class EncodeError : public BankError {
public:
    explicit EncodeError(const std::string& message)
        : BankError(CallPhase::ENCODE, message) {}
};

class DecodeError : public BankError {
public:
    explicit DecodeError(const std::string& message)
        : BankError(CallPhase::PARSE, message) {}
};

class EncryptError : public BankError {
public:
    explicit EncryptError(const std::string& message)
        : BankError(CallPhase::ENCRYPT, message) {}
};

class DecryptError : public BankError {
public:
    explicit DecryptError(const std::string& message)
        : BankError(CallPhase::DECRYPT, message) {}
};

class SignatureError : public BankError {
public:
    SignatureError(CallPhase phase, const std::string& message)
        : BankError(phase, message) {}
};

// Connection, TLS, timeout or framing failure below the HTTP status level.
class TransportError : public BankError {
public:
    explicit TransportError(const std::string& message)
        : BankError(CallPhase::TRANSPORT, message) {}
};

class HttpError : public BankError {
public:
    HttpError(int status_code, std::string body, CallPhase phase = CallPhase::TRANSPORT)
        : BankError(phase, "HTTP " + std::to_string(status_code) + ": " + body),
          status_code_(status_code), body_(std::move(body)) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    int status_code_;
    std::string body_;
};

#endif // WZB_ERRORS_HPP
