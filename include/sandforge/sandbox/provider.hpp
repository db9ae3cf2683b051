/*
 * sandforge - Sandbox provider contract
 *
 * One interface over every backend (managed cloud sandboxes, self-hosted
 * containers). A provider instance owns at most one live sandbox.
 *
 * Errors:
 *   create_sandbox           -> ProvisionError
 *   any op before create     -> NotProvisionedError
 *   file operations          -> IOError
 *   run_command              -> never throws on command failure, see CommandResult
 *   terminate / is_alive     -> never throw
 */
#ifndef sandforge_SANDBOX_PROVIDER_HPP
#define sandforge_SANDBOX_PROVIDER_HPP

#include <sandforge/sandbox/types.hpp>
#include <sandforge/sandbox/errors.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandforge {

// Optional capability: scaffold a Vite + React app and (re)start its dev server
class DevServerCapable {
public:
    virtual ~DevServerCapable() {}

    virtual void setup_dev_app() = 0;
    virtual void restart_dev_server() = 0;
};

class SandboxProvider {
public:
    virtual ~SandboxProvider() {}

    virtual ProviderKind kind() const = 0;
    std::string name() const { return provider_kind_to_string(kind()); }

    // Provision one sandbox. Rejected while a sandbox is already live.
    virtual SandboxInfo create_sandbox() = 0;

    // Whitespace-split argv, no quoting. Use run_command_argv for arguments
    // that contain spaces.
    virtual CommandResult run_command(const std::string& command) = 0;
    virtual CommandResult run_command_argv(const std::vector<std::string>& argv) = 0;

    // Paths are relative to the sandbox working directory unless absolute
    virtual void write_file(const std::string& path, const std::string& content) = 0;
    virtual std::string read_file(const std::string& path) = 0;
    virtual std::vector<std::string> list_files(const std::string& directory) = 0;
    std::vector<std::string> list_files() { return list_files(""); }

    // "<package manager> install <names...>"
    virtual CommandResult install_packages(const std::vector<std::string>& packages) = 0;

    virtual std::optional<std::string> sandbox_url() = 0;
    virtual std::optional<SandboxInfo> sandbox_info() const = 0;

    // Idempotent; teardown failures are logged, never raised
    virtual void terminate() = 0;

    // Liveness probe; failures mean "not alive"
    virtual bool is_alive() = 0;

    // Capability probe: nullptr when the backend cannot run a dev server
    virtual DevServerCapable* dev_server() { return nullptr; }

    void setup_dev_app() {
        DevServerCapable* cap = dev_server();
        if (!cap) throw UnsupportedOperation("setup_dev_app", name());
        cap->setup_dev_app();
    }

    void restart_dev_server() {
        DevServerCapable* cap = dev_server();
        if (!cap) throw UnsupportedOperation("restart_dev_server", name());
        cap->restart_dev_server();
    }
};

} // namespace sandforge

#endif // sandforge_SANDBOX_PROVIDER_HPP
