/*
 * sandforge - HTTP Client (libcurl)
 *
 * Thin synchronous wrapper over a libcurl easy handle. Used for the Docker
 * Engine API (over a unix socket or TCP) and for the managed sandbox REST
 * APIs. One HttpClient must not be shared between threads without external
 * locking; callers in this project serialize through their own mutexes.
 */
#ifndef sandforge_CORE_HTTP_CLIENT_HPP
#define sandforge_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>

namespace sandforge {

struct HttpResponse {
    long status_code;                           // 0 when the transfer itself failed
    std::string body;
    std::map<std::string, std::string> headers; // Keys as sent by the server
    std::string error;                          // libcurl error text
    bool timed_out;

    HttpResponse() : status_code(0), timed_out(false) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Case-insensitive header lookup; empty when missing
    std::string header(const std::string& name) const;

    // Best human-readable failure text: the API's JSON "message" (top level
    // or under "error"), else the raw body, else the transport error
    std::string error_message() const;
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Route every request through this unix domain socket (Docker daemon)
    void set_unix_socket(const std::string& path) { unix_socket_ = path; }
    const std::string& unix_socket() const { return unix_socket_; }

    // Default total-transfer timeout; 0 disables
    void set_timeout_ms(long ms) { timeout_ms_ = ms; }
    void set_connect_timeout_ms(long ms) { connect_timeout_ms_ = ms; }

    void set_user_agent(const std::string& ua) { user_agent_ = ua; }

    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>(),
                     const std::string& proxy = "");

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    HttpResponse del(const std::string& url,
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    // Generic request. timeout_ms overrides the default when > 0.
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers,
                         const std::string& proxy = "",
                         long timeout_ms = 0);

    // Percent-encode a query string component
    static std::string url_encode(const std::string& value);

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    void* curl_;            // CURL*, reused between requests for keep-alive
    std::string unix_socket_;
    long timeout_ms_;
    long connect_timeout_ms_;
    std::string user_agent_;
};

} // namespace sandforge

#endif // sandforge_CORE_HTTP_CLIENT_HPP
