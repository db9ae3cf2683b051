/*
 * sandforge - Self-hosted sandbox engine
 *
 * One long-running container per sandbox, driven through a ContainerClient
 * (the Docker Engine API in production, a fake in tests).
 *
 * Provisioning:
 *   ping -> ensure image (pull policy) -> create (limits, ports, env)
 *   -> start -> seed working dir + package.json -> resolve preview URL
 *
 * Every command runs under a small sh wrapper that records its PID in the
 * container; a command that outlives its timeout is killed together with
 * its direct children.
 */
#ifndef sandforge_SANDBOX_SELF_HOSTED_PROVIDER_HPP
#define sandforge_SANDBOX_SELF_HOSTED_PROVIDER_HPP

#include <sandforge/sandbox/bridged_provider.hpp>
#include <sandforge/sandbox/container_client.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <memory>
#include <string>

namespace sandforge {

// "sandbox-<unix ms>-<9 base36 chars>"
std::string generate_sandbox_id();

class SelfHostedProvider : public BridgedProvider {
public:
    SelfHostedProvider(const SelfHostedConfig& config, std::unique_ptr<ContainerClient> client);
    explicit SelfHostedProvider(const SelfHostedConfig& config);
    ~SelfHostedProvider() override;

    ProviderKind kind() const override { return ProviderKind::SELF_HOSTED; }

    const SelfHostedConfig& config() const { return config_; }

    // Container spec used for a new sandbox
    ContainerSpec build_container_spec(const std::string& sandbox_id) const;

    // Path of the PID file written by the exec wrapper
    static const char* pid_file();

protected:
    Provisioned provision_backend() override;
    void after_provision(Provisioned& provisioned) override;
    ExecResult exec_backend(const std::string& handle,
                            const std::vector<std::string>& argv,
                            long timeout_ms) override;
    void reap_backend(const std::string& handle, const ExecResult& timed_out) override;
    void destroy_backend(const std::string& handle) override;
    bool probe_backend(const std::string& handle) override;
    std::optional<std::string> resolve_url_backend(const std::string& handle,
                                                   const SandboxInfo& info) override;

private:
    SelfHostedConfig config_;
    std::unique_ptr<ContainerClient> client_;

    void ensure_image();
    void seed_working_dir(const std::string& handle);
    std::optional<std::string> published_url(const std::string& handle);
};

} // namespace sandforge

#endif // sandforge_SANDBOX_SELF_HOSTED_PROVIDER_HPP
