/*
 * sandforge - Common provider base
 *
 * Implements the provider contract once on top of a small set of backend
 * hooks (provision, exec, destroy, probe). File operations go through the
 * shell bridge over the backend's exec channel.
 *
 * Locking: exec_mutex_ serializes every backend operation on the sandbox
 * (create, commands, file ops, terminate). state_mutex_ guards handle_,
 * info_ and state_. Lock order is exec_mutex_ then state_mutex_.
 *
 * A timed-out command is reaped on reaper_, off the caller's thread. The
 * next holder of exec_mutex_ joins it before touching the backend.
 */
#ifndef sandforge_SANDBOX_BRIDGED_PROVIDER_HPP
#define sandforge_SANDBOX_BRIDGED_PROVIDER_HPP

#include <sandforge/sandbox/provider.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/sandbox/container_client.hpp>
#include <sandforge/sandbox/dev_server.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sandforge {

class BridgedProvider : public SandboxProvider {
public:
    using SandboxProvider::list_files;

    BridgedProvider(const std::string& working_dir,
                    long command_timeout_ms,
                    const DevServerOptions& dev_options);
    ~BridgedProvider() override;

    SandboxInfo create_sandbox() override;

    CommandResult run_command(const std::string& command) override;
    CommandResult run_command_argv(const std::vector<std::string>& argv) override;

    void write_file(const std::string& path, const std::string& content) override;
    std::string read_file(const std::string& path) override;
    std::vector<std::string> list_files(const std::string& directory) override;

    CommandResult install_packages(const std::vector<std::string>& packages) override;

    std::optional<std::string> sandbox_url() override;
    std::optional<SandboxInfo> sandbox_info() const override;

    void terminate() override;
    bool is_alive() override;

    DevServerCapable* dev_server() override { return &dev_server_; }

    SandboxState state() const;
    const std::string& working_dir() const { return working_dir_; }
    long command_timeout_ms() const { return command_timeout_ms_; }

protected:
    struct Provisioned {
        std::string handle;         // Backend reference (container id, remote sandbox id)
        std::string sandbox_id;
        std::string url;            // May be empty
    };

    // Acquire backend resources. Any exception becomes a ProvisionError.
    virtual Provisioned provision_backend() = 0;

    // Runs after provisioning with the sandbox usable through execute().
    // Exceptions are logged, not raised.
    virtual void after_provision(Provisioned&) {}

    // Run argv, waiting at most timeout_ms. Timeouts are reported through
    // ExecResult::timed_out; backend failures throw.
    virtual ExecResult exec_backend(const std::string& handle,
                                    const std::vector<std::string>& argv,
                                    long timeout_ms) = 0;

    // Stop whatever a timed-out exec left running. Runs on the reaper
    // thread, never concurrently with another backend call.
    virtual void reap_backend(const std::string&, const ExecResult&) {}

    // Release backend resources; may throw, the caller logs
    virtual void destroy_backend(const std::string& handle) = 0;

    virtual bool probe_backend(const std::string& handle) = 0;

    // Current preview URL; defaults to the one recorded at provision time
    virtual std::optional<std::string> resolve_url_backend(const std::string& handle,
                                                           const SandboxInfo& info);

    // Run without taking exec_mutex_; callers hold it
    CommandResult execute(const std::string& handle,
                          const std::vector<std::string>& argv,
                          long timeout_ms);

    // Destructors of derived classes call this before their backend goes away
    void release_on_destroy();

private:
    struct Active {
        std::string handle;
        std::string sandbox_id;
    };

    std::string working_dir_;
    long command_timeout_ms_;
    DevServerBootstrapper dev_server_;

    mutable std::mutex state_mutex_;
    std::mutex exec_mutex_;
    std::string handle_;
    std::optional<SandboxInfo> info_;
    SandboxState state_;
    std::thread reaper_;        // Guarded by exec_mutex_

    Active require_active(const char* operation) const;
    void set_state(SandboxState state);
    void join_reaper();
    CommandResult run_locked(const char* operation, const std::vector<std::string>& argv);
};

} // namespace sandforge

#endif // sandforge_SANDBOX_BRIDGED_PROVIDER_HPP
