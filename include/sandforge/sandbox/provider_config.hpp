/*
 * sandforge - Provider configuration
 *
 * Parsed once from the JSON Config when a provider is constructed and
 * read-only afterwards, so one instance may be shared between providers.
 *
 * Config:
 *   sandbox.provider                   - "vercel" | "e2b" | "self-hosted"
 *   sandbox.self_hosted.docker.*       - socket_path, host, port, api_version
 *   sandbox.self_hosted.resources.*    - memory (bytes), cpu_quota, cpu_period, timeout (ms)
 *   sandbox.self_hosted.network.*      - mode, allowed_ports
 *   sandbox.self_hosted.*              - base_image, working_dir, dev_port, volumes, env,
 *                                        keep_alive_cmd, pull_policy, public_host,
 *                                        package_manager, dev_server_settle_ms,
 *                                        dev_server_startup_ms
 *   sandbox.vercel.*                   - token, team_id, project_id, runtime, vcpus,
 *                                        timeout_ms, api_url, working_dir, dev_port,
 *                                        command_timeout_ms
 *   sandbox.e2b.*                      - api_key, template, timeout_ms, api_url, domain,
 *                                        working_dir, dev_port, command_timeout_ms
 */
#ifndef sandforge_SANDBOX_PROVIDER_CONFIG_HPP
#define sandforge_SANDBOX_PROVIDER_CONFIG_HPP

#include <sandforge/core/config.hpp>
#include <sandforge/sandbox/types.hpp>
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace sandforge {

struct DockerConnection {
    std::string socket_path;    // Used when host is empty
    std::string host;           // TCP host (DOCKER_HOST)
    int port;
    std::string api_version;

    DockerConnection()
        : socket_path("/var/run/docker.sock")
        , port(2376)
        , api_version("v1.41") {}

    bool uses_socket() const { return host.empty(); }

    // http://localhost/v1.41 for the socket, http://host:port/v1.41 for TCP
    std::string base_url() const;

    // Accepts "unix:///path", "tcp://host:port" or "host:port"
    void apply_docker_host(const std::string& value);
};

struct ResourceLimits {
    int64_t memory_bytes;
    int64_t cpu_quota;          // Microseconds per cpu_period
    int64_t cpu_period;
    long command_timeout_ms;

    ResourceLimits()
        : memory_bytes(512LL * 1024 * 1024)
        , cpu_quota(50000)
        , cpu_period(100000)
        , command_timeout_ms(30000) {}
};

struct NetworkPolicy {
    std::string mode;
    std::vector<int> allowed_ports;

    NetworkPolicy() : mode("bridge") {
        allowed_ports.push_back(3000);
        allowed_ports.push_back(4000);
        allowed_ports.push_back(5000);
        allowed_ports.push_back(8000);
        allowed_ports.push_back(8080);
    }
};

enum class PullPolicy {
    MISSING,    // Pull only when the image is not present locally
    ALWAYS,
    NEVER
};

PullPolicy parse_pull_policy(const std::string& value);

// Settings shared by the dev-server bootstrapper on every backend
struct DevServerOptions {
    int port;
    int settle_ms;              // Pause between killing and restarting
    std::string package_manager;
    std::string log_path;

    DevServerOptions()
        : port(3000)
        , settle_ms(1000)
        , package_manager("npm")
        , log_path("/tmp/dev-server.log") {}
};

struct SelfHostedConfig {
    DockerConnection docker;
    ResourceLimits resources;
    NetworkPolicy network;
    std::string base_image;
    std::string working_dir;
    std::vector<std::string> volumes;                         // "host:container[:ro]"
    std::vector<std::pair<std::string, std::string> > env;
    std::vector<std::string> keep_alive_cmd;
    PullPolicy pull_policy;
    std::string public_host;                                  // Host part of preview URLs
    int dev_server_startup_ms;
    DevServerOptions dev_server;

    SelfHostedConfig()
        : base_image("node:18-alpine")
        , working_dir("/app")
        , pull_policy(PullPolicy::MISSING)
        , public_host("localhost")
        , dev_server_startup_ms(7000) {
        env.push_back(std::make_pair(std::string("NODE_ENV"), std::string("development")));
        keep_alive_cmd.push_back("tail");
        keep_alive_cmd.push_back("-f");
        keep_alive_cmd.push_back("/dev/null");
    }
};

struct VercelConfig {
    std::string token;
    std::string team_id;
    std::string project_id;
    std::string runtime;
    int vcpus;
    int64_t timeout_ms;         // Sandbox lifetime
    long command_timeout_ms;
    std::string api_url;
    std::string working_dir;
    DevServerOptions dev_server;

    VercelConfig()
        : runtime("node22")
        , vcpus(2)
        , timeout_ms(30LL * 60 * 1000)
        , command_timeout_ms(30000)
        , api_url("https://api.vercel.com")
        , working_dir("/vercel/sandbox") {}
};

struct E2BConfig {
    std::string api_key;
    std::string template_id;
    int64_t timeout_ms;         // Sandbox lifetime
    long command_timeout_ms;
    std::string api_url;
    std::string domain;
    int envd_port;
    std::string working_dir;
    DevServerOptions dev_server;

    E2BConfig()
        : template_id("base")
        , timeout_ms(30LL * 60 * 1000)
        , command_timeout_ms(30000)
        , api_url("https://api.e2b.dev")
        , domain("e2b.app")
        , envd_port(49983)
        , working_dir("/home/user") {}
};

struct SandboxProviderConfig {
    ProviderKind provider;
    SelfHostedConfig self_hosted;
    VercelConfig vercel;
    E2BConfig e2b;

    SandboxProviderConfig() : provider(ProviderKind::SELF_HOSTED) {}

    // Throws std::invalid_argument for an unknown sandbox.provider value
    static SandboxProviderConfig from_config(const Config& cfg);
};

} // namespace sandforge

#endif // sandforge_SANDBOX_PROVIDER_CONFIG_HPP
