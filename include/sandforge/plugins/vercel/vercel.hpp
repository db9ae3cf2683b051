/*
 * sandforge - Vercel Sandbox provider
 *
 * Managed micro-VMs behind the Vercel REST API
 * (https://api.vercel.com/v1/sandboxes). Commands are started detached,
 * awaited with ?wait=true and their output collected from the NDJSON log
 * stream. File operations use the shell bridge over the same channel.
 *
 * Config:
 *   sandbox.vercel.token        - API token (or VERCEL_TOKEN)
 *   sandbox.vercel.team_id      - Team scope (or VERCEL_TEAM_ID), optional
 *   sandbox.vercel.project_id   - Project (or VERCEL_PROJECT_ID)
 *   sandbox.vercel.runtime      - "node22" by default
 *   sandbox.vercel.vcpus        - 2 by default
 *   sandbox.vercel.timeout_ms   - Sandbox lifetime (30 min by default)
 */
#ifndef sandforge_PLUGINS_VERCEL_HPP
#define sandforge_PLUGINS_VERCEL_HPP

#include <sandforge/sandbox/bridged_provider.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/core/http_client.hpp>
#include <sandforge/core/json.hpp>
#include <string>

namespace sandforge {

namespace vercel {

// Split a command's NDJSON log stream ({"stream":"stdout","data":"..."})
void parse_command_logs(const std::string& ndjson, std::string& out, std::string& err);

// Preview URL for the route exposing port, empty when there is none
std::string preview_url(const Json& create_response, int port);

} // namespace vercel

class VercelProvider : public BridgedProvider {
public:
    explicit VercelProvider(const VercelConfig& config);
    ~VercelProvider() override;

    ProviderKind kind() const override { return ProviderKind::VERCEL; }

    const VercelConfig& config() const { return config_; }

    // Request body for POST /v1/sandboxes
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
    VercelConfig config_;

    std::string url(const std::string& path) const;
    HttpResponse call(const std::string& method,
                      const std::string& path,
                      const std::string& body,
                      long timeout_ms);
};

} // namespace sandforge

#endif // sandforge_PLUGINS_VERCEL_HPP
