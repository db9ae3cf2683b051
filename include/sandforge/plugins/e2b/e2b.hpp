/*
 * sandforge - E2B sandbox provider
 *
 * Lifecycle through the E2B REST API (POST/GET/DELETE /sandboxes), commands
 * through the in-sandbox envd daemon at https://<envd_port>-<id>.<domain>
 * using the Connect protocol: process.Process/Start is a server stream of
 * enveloped JSON messages (1 flag byte + 4-byte big-endian length + JSON)
 * carrying start/data/end events, with output bytes base64 encoded.
 *
 * Config:
 *   sandbox.e2b.api_key     - API key (or E2B_API_KEY)
 *   sandbox.e2b.template    - Template id, "base" by default
 *   sandbox.e2b.timeout_ms  - Sandbox lifetime (30 min by default)
 *   sandbox.e2b.domain      - "e2b.app" by default (or E2B_DOMAIN)
 */
#ifndef sandforge_PLUGINS_E2B_HPP
#define sandforge_PLUGINS_E2B_HPP

#include <sandforge/sandbox/bridged_provider.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/core/http_client.hpp>
#include <sandforge/core/json.hpp>
#include <string>

namespace sandforge {

namespace e2b {

// Connect streaming envelope flags
const unsigned char FLAG_END_STREAM = 0x02;

std::string encode_envelope(const Json& message, unsigned char flags = 0);

// Decode a process.Process/Start response stream into result. Returns true
// once the end event was seen; trailer errors are returned in error.
bool decode_process_stream(const std::string& body, ExecResult& result, std::string& error);

// Request message for process.Process/Start
Json build_start_request(const std::vector<std::string>& argv, const std::string& cwd);

// https://<port>-<sandbox_id>.<domain>
std::string sandbox_host_url(int port, const std::string& sandbox_id, const std::string& domain);

} // namespace e2b

class E2BProvider : public BridgedProvider {
public:
    explicit E2BProvider(const E2BConfig& config);
    ~E2BProvider() override;

    ProviderKind kind() const override { return ProviderKind::E2B; }

    const E2BConfig& config() const { return config_; }

    // Request body for POST /sandboxes
    Json build_create_body() const;

protected:
    Provisioned provision_backend() override;
    ExecResult exec_backend(const std::string& handle,
                            const std::vector<std::string>& argv,
                            long timeout_ms) override;
    void reap_backend(const std::string& handle, const ExecResult& timed_out) override;
    void destroy_backend(const std::string& handle) override;
    bool probe_backend(const std::string& handle) override;

private:
    E2BConfig config_;
    std::string envd_token_;    // Set at provision time, read under the exec lock

    HttpResponse api_call(const std::string& method,
                          const std::string& path,
                          const std::string& body,
                          long timeout_ms);
    HttpResponse envd_call(const std::string& handle,
                           const std::string& rpc,
                           const std::string& content_type,
                           const std::string& body,
                           long timeout_ms);
};

} // namespace sandforge

#endif // sandforge_PLUGINS_E2B_HPP
