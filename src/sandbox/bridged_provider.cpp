#include <sandforge/sandbox/bridged_provider.hpp>
#include <sandforge/sandbox/shell_bridge.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

namespace sandforge {

BridgedProvider::BridgedProvider(const std::string& working_dir,
                                 long command_timeout_ms,
                                 const DevServerOptions& dev_options)
    : working_dir_(working_dir)
    , command_timeout_ms_(command_timeout_ms)
    , dev_server_(*this, dev_options)
    , state_(SandboxState::UNPROVISIONED)
{}

BridgedProvider::~BridgedProvider() {
    join_reaper();
}

// ============================================================================
// State helpers
// ============================================================================

SandboxState BridgedProvider::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void BridgedProvider::set_state(SandboxState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

void BridgedProvider::join_reaper() {
    if (reaper_.joinable()) {
        reaper_.join();
    }
}

BridgedProvider::Active BridgedProvider::require_active(const char* operation) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (handle_.empty() || !info_) {
        throw NotProvisionedError(operation);
    }
    Active active;
    active.handle = handle_;
    active.sandbox_id = info_->sandbox_id;
    return active;
}

// ============================================================================
// Lifecycle
// ============================================================================

SandboxInfo BridgedProvider::create_sandbox() {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!handle_.empty()) {
            throw ProvisionError("create_sandbox: sandbox " +
                                 (info_ ? info_->sandbox_id : handle_) +
                                 " is still live, call terminate() first");
        }
        state_ = SandboxState::PROVISIONING;
    }

    LOG_INFO("Provisioning %s sandbox", name().c_str());

    Provisioned provisioned;
    try {
        provisioned = provision_backend();
    } catch (const ProvisionError& e) {
        set_state(SandboxState::UNPROVISIONED);
        LOG_ERROR("Provisioning failed: %s", e.what());
        throw;
    } catch (const std::exception& e) {
        set_state(SandboxState::UNPROVISIONED);
        LOG_ERROR("Provisioning failed: %s", e.what());
        throw ProvisionError(name() + ": " + e.what());
    }

    try {
        after_provision(provisioned);
    } catch (const std::exception& e) {
        LOG_WARN("Sandbox %s: post-provision step failed: %s",
                 provisioned.sandbox_id.c_str(), e.what());
    }

    SandboxInfo info;
    info.sandbox_id = provisioned.sandbox_id;
    info.url = provisioned.url;
    info.provider = kind();
    info.created_at = current_timestamp_ms();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle_ = provisioned.handle;
        info_ = info;
        state_ = SandboxState::READY;
    }

    LOG_INFO("Sandbox %s ready%s%s", info.sandbox_id.c_str(),
             info.url.empty() ? "" : " at ", info.url.c_str());
    return info;
}

void BridgedProvider::terminate() {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();

    std::string handle;
    std::string sandbox_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (handle_.empty()) {
            state_ = SandboxState::UNPROVISIONED;
            return;
        }
        handle = handle_;
        sandbox_id = info_ ? info_->sandbox_id : handle_;
        state_ = SandboxState::TERMINATING;
    }

    LOG_INFO("Terminating sandbox %s", sandbox_id.c_str());
    try {
        destroy_backend(handle);
    } catch (const std::exception& e) {
        LOG_WARN("Sandbox %s: teardown failed: %s", sandbox_id.c_str(), e.what());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    handle_.clear();
    info_.reset();
    state_ = SandboxState::UNPROVISIONED;
}

void BridgedProvider::release_on_destroy() {
    terminate();
}

bool BridgedProvider::is_alive() {
    std::string handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle = handle_;
    }
    if (handle.empty()) {
        return false;
    }
    try {
        return probe_backend(handle);
    } catch (const std::exception& e) {
        LOG_DEBUG("Liveness probe failed: %s", e.what());
        return false;
    }
}

std::optional<SandboxInfo> BridgedProvider::sandbox_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return info_;
}

std::optional<std::string> BridgedProvider::sandbox_url() {
    std::string handle;
    SandboxInfo info;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (handle_.empty() || !info_) {
            return std::nullopt;
        }
        handle = handle_;
        info = *info_;
    }

    std::optional<std::string> url;
    try {
        url = resolve_url_backend(handle, info);
    } catch (const std::exception& e) {
        LOG_DEBUG("Sandbox %s: URL not resolvable yet: %s", info.sandbox_id.c_str(), e.what());
        return std::nullopt;
    }

    if (url && !url->empty()) {
        return url;
    }
    return std::nullopt;
}

std::optional<std::string> BridgedProvider::resolve_url_backend(const std::string&,
                                                                const SandboxInfo& info) {
    if (info.url.empty()) {
        return std::nullopt;
    }
    return info.url;
}

// ============================================================================
// Commands
// ============================================================================

CommandResult BridgedProvider::execute(const std::string& handle,
                                       const std::vector<std::string>& argv,
                                       long timeout_ms) {
    ExecResult exec;
    try {
        exec = exec_backend(handle, argv, timeout_ms);
    } catch (const std::exception& e) {
        LOG_WARN("exec '%s' failed: %s", join(argv, " ").c_str(), e.what());
        return CommandResult::failure(e.what());
    }

    if (exec.timed_out) {
        LOG_WARN("Command timed out after %ld ms: %s", timeout_ms,
                 truncate_safe(join(argv, " "), 200).c_str());
        join_reaper();
        reaper_ = std::thread([this, handle, exec]() {
            try {
                reap_backend(handle, exec);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to stop timed-out command: %s", e.what());
            }
        });
        return CommandResult::from_exit(exec.stdout_text, "Command timeout", TIMEOUT_EXIT_CODE);
    }

    return CommandResult::from_exit(exec.stdout_text, exec.stderr_text, exec.exit_code);
}

CommandResult BridgedProvider::run_locked(const char* operation, const std::vector<std::string>& argv) {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();
    Active active = require_active(operation);

    if (argv.empty()) {
        return CommandResult::failure("empty command");
    }

    set_state(SandboxState::BUSY);
    LOG_DEBUG("[%s] %s", active.sandbox_id.c_str(), truncate_safe(join(argv, " "), 200).c_str());
    CommandResult result = execute(active.handle, argv, command_timeout_ms_);
    set_state(SandboxState::READY);
    return result;
}

CommandResult BridgedProvider::run_command(const std::string& command) {
    return run_locked("run_command", split_whitespace(command));
}

CommandResult BridgedProvider::run_command_argv(const std::vector<std::string>& argv) {
    return run_locked("run_command", argv);
}

CommandResult BridgedProvider::install_packages(const std::vector<std::string>& packages) {
    std::vector<std::string> argv;
    argv.push_back(dev_server_.options().package_manager);
    argv.push_back("install");
    argv.insert(argv.end(), packages.begin(), packages.end());

    LOG_INFO("Installing packages: %s", join(packages, " ").c_str());
    return run_locked("install_packages", argv);
}

// ============================================================================
// Files
// ============================================================================

void BridgedProvider::write_file(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();
    Active active = require_active("write_file");

    shell_bridge::validate_content(path, content);
    std::string target = shell_bridge::resolve_path(working_dir_, path);

    set_state(SandboxState::BUSY);
    CommandResult result = execute(active.handle, shell_bridge::write_file_argv(target, content),
                                   command_timeout_ms_);
    set_state(SandboxState::READY);

    if (!result.success) {
        throw IOError("write_file " + target + " in " + active.sandbox_id + ": " +
                      (result.stderr_text.empty() ? "exit code " + std::to_string(result.exit_code)
                                                  : trim(result.stderr_text)));
    }
    LOG_DEBUG("Wrote %zu bytes to %s", content.size(), target.c_str());
}

std::string BridgedProvider::read_file(const std::string& path) {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();
    Active active = require_active("read_file");

    std::string target = shell_bridge::resolve_path(working_dir_, path);

    set_state(SandboxState::BUSY);
    CommandResult result = execute(active.handle, shell_bridge::read_file_argv(target),
                                   command_timeout_ms_);
    set_state(SandboxState::READY);

    if (!result.success) {
        throw IOError("read_file " + target + " in " + active.sandbox_id + ": " +
                      (result.stderr_text.empty() ? "exit code " + std::to_string(result.exit_code)
                                                  : trim(result.stderr_text)));
    }
    return result.stdout_text;
}

std::vector<std::string> BridgedProvider::list_files(const std::string& directory) {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    join_reaper();
    Active active = require_active("list_files");

    std::string target = shell_bridge::resolve_path(working_dir_, directory);

    set_state(SandboxState::BUSY);
    CommandResult result = execute(active.handle, shell_bridge::list_files_argv(target),
                                   command_timeout_ms_);
    set_state(SandboxState::READY);

    if (!result.success) {
        throw IOError("list_files " + target + " in " + active.sandbox_id + ": " +
                      (result.stderr_text.empty() ? "exit code " + std::to_string(result.exit_code)
                                                  : trim(result.stderr_text)));
    }
    return shell_bridge::parse_ls_output(result.stdout_text);
}

} // namespace sandforge
