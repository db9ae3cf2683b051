#include <sandforge/sandbox/self_hosted_provider.hpp>
#include <sandforge/sandbox/docker_client.hpp>
#include <sandforge/sandbox/shell_bridge.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

#include <algorithm>

namespace sandforge {

namespace {

// Budget for the in-container kill after a timeout
const long REAP_TIMEOUT_MS = 5000;

// Budget for the seeding steps at create time
const long SEED_TIMEOUT_MS = 30000;

} // namespace

std::string generate_sandbox_id() {
    return "sandbox-" + std::to_string(current_timestamp_ms()) + "-" + random_base36(9);
}

SelfHostedProvider::SelfHostedProvider(const SelfHostedConfig& config,
                                       std::unique_ptr<ContainerClient> client)
    : BridgedProvider(config.working_dir, config.resources.command_timeout_ms, config.dev_server)
    , config_(config)
    , client_(std::move(client))
{}

SelfHostedProvider::SelfHostedProvider(const SelfHostedConfig& config)
    : SelfHostedProvider(config, std::unique_ptr<ContainerClient>(new DockerClient(config.docker)))
{}

SelfHostedProvider::~SelfHostedProvider() {
    release_on_destroy();
}

const char* SelfHostedProvider::pid_file() {
    return "/tmp/.sandforge-exec.pid";
}

ContainerSpec SelfHostedProvider::build_container_spec(const std::string& sandbox_id) const {
    ContainerSpec spec;
    spec.name = sandbox_id;
    spec.image = config_.base_image;
    spec.cmd = config_.keep_alive_cmd;
    spec.working_dir = config_.working_dir;
    spec.volumes = config_.volumes;
    spec.labels["sandforge.sandbox_id"] = sandbox_id;

    // NODE_ENV first; configured entries override by name
    spec.env.push_back(std::make_pair(std::string("NODE_ENV"), std::string("development")));
    for (size_t i = 0; i < config_.env.size(); ++i) {
        bool replaced = false;
        for (size_t j = 0; j < spec.env.size(); ++j) {
            if (spec.env[j].first == config_.env[i].first) {
                spec.env[j].second = config_.env[i].second;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            spec.env.push_back(config_.env[i]);
        }
    }

    spec.exposed_ports.push_back(config_.dev_server.port);
    for (size_t i = 0; i < config_.network.allowed_ports.size(); ++i) {
        int port = config_.network.allowed_ports[i];
        if (std::find(spec.exposed_ports.begin(), spec.exposed_ports.end(), port) == spec.exposed_ports.end()) {
            spec.exposed_ports.push_back(port);
        }
    }

    spec.memory_bytes = config_.resources.memory_bytes;
    spec.cpu_quota = config_.resources.cpu_quota;
    spec.cpu_period = config_.resources.cpu_period;
    spec.network_mode = config_.network.mode;
    spec.auto_remove = true;
    return spec;
}

// ============================================================================
// Provisioning
// ============================================================================

void SelfHostedProvider::ensure_image() {
    const std::string& image = config_.base_image;

    if (config_.pull_policy == PullPolicy::ALWAYS) {
        client_->pull_image(image);
        return;
    }
    if (client_->image_exists(image)) {
        LOG_DEBUG("Image %s present locally", image.c_str());
        return;
    }
    if (config_.pull_policy == PullPolicy::NEVER) {
        throw ProvisionError("image " + image + " not present locally and pull_policy is 'never'");
    }
    client_->pull_image(image);
}

BridgedProvider::Provisioned SelfHostedProvider::provision_backend() {
    if (!client_->ping()) {
        throw ProvisionError("engine unreachable");
    }

    try {
        ensure_image();
    } catch (const EngineError& e) {
        throw ProvisionError("image " + config_.base_image + ": " + e.what());
    }

    Provisioned provisioned;
    provisioned.sandbox_id = generate_sandbox_id();

    ContainerSpec spec = build_container_spec(provisioned.sandbox_id);
    try {
        provisioned.handle = client_->create_container(spec);
    } catch (const EngineError& e) {
        throw ProvisionError("create container for " + provisioned.sandbox_id + ": " + e.what());
    }
    LOG_INFO("Created container %s for %s", provisioned.handle.substr(0, 12).c_str(),
             provisioned.sandbox_id.c_str());

    try {
        client_->start_container(provisioned.handle);
    } catch (const EngineError& e) {
        try {
            client_->remove_container(provisioned.handle);
        } catch (const std::exception& cleanup) {
            LOG_WARN("Failed to remove unstarted container %s: %s",
                     provisioned.handle.c_str(), cleanup.what());
        }
        throw ProvisionError("start container for " + provisioned.sandbox_id + ": " + e.what());
    }

    return provisioned;
}

void SelfHostedProvider::seed_working_dir(const std::string& handle) {
    const std::string& dir = config_.working_dir;

    CommandResult mk = execute(handle, shell_bridge::mkdir_argv(dir), SEED_TIMEOUT_MS);
    if (!mk.success) {
        LOG_WARN("mkdir %s failed: %s", dir.c_str(), trim(mk.stderr_text).c_str());
        return;
    }

    std::string manifest_path = join_path(dir, "package.json");
    CommandResult exists = execute(handle, shell_bridge::file_exists_argv(manifest_path), SEED_TIMEOUT_MS);
    if (exists.success) {
        LOG_DEBUG("%s already present", manifest_path.c_str());
        return;
    }

    std::string manifest = shell_bridge::default_manifest().dump(2);
    CommandResult written = execute(handle, shell_bridge::write_file_argv(manifest_path, manifest),
                                    SEED_TIMEOUT_MS);
    if (!written.success) {
        LOG_WARN("Writing default %s failed: %s", manifest_path.c_str(), trim(written.stderr_text).c_str());
    }
}

void SelfHostedProvider::after_provision(Provisioned& provisioned) {
    seed_working_dir(provisioned.handle);

    try {
        std::optional<std::string> url = published_url(provisioned.handle);
        if (url) {
            provisioned.url = *url;
        } else {
            LOG_WARN("Sandbox %s: dev port %d not published yet", provisioned.sandbox_id.c_str(),
                     config_.dev_server.port);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Sandbox %s: URL resolution failed: %s", provisioned.sandbox_id.c_str(), e.what());
    }
}

std::optional<std::string> SelfHostedProvider::published_url(const std::string& handle) {
    ContainerInspection inspection = client_->inspect(handle);
    std::string host_port = inspection.host_port(config_.dev_server.port);
    if (host_port.empty()) {
        return std::nullopt;
    }
    return "http://" + config_.public_host + ":" + host_port;
}

// ============================================================================
// Backend hooks
// ============================================================================

ExecResult SelfHostedProvider::exec_backend(const std::string& handle,
                                            const std::vector<std::string>& argv,
                                            long timeout_ms) {
    return client_->exec(handle, shell_bridge::exec_wrapper_argv(pid_file(), argv), timeout_ms);
}

void SelfHostedProvider::reap_backend(const std::string& handle, const ExecResult&) {
    ExecResult killed = client_->exec(handle, shell_bridge::kill_argv(pid_file()), REAP_TIMEOUT_MS);
    if (killed.timed_out) {
        LOG_WARN("Kill of timed-out command in %s did not finish", handle.substr(0, 12).c_str());
    } else {
        LOG_DEBUG("Reaped timed-out command in %s", handle.substr(0, 12).c_str());
    }
}

void SelfHostedProvider::destroy_backend(const std::string& handle) {
    try {
        client_->stop_container(handle);
    } catch (const std::exception& e) {
        LOG_WARN("Stop container %s failed: %s", handle.substr(0, 12).c_str(), e.what());
    }
    try {
        client_->remove_container(handle);
    } catch (const std::exception& e) {
        LOG_WARN("Remove container %s failed: %s", handle.substr(0, 12).c_str(), e.what());
    }
}

bool SelfHostedProvider::probe_backend(const std::string& handle) {
    ContainerInspection inspection = client_->inspect(handle);
    return inspection.running || inspection.status == "running";
}

std::optional<std::string> SelfHostedProvider::resolve_url_backend(const std::string& handle,
                                                                   const SandboxInfo&) {
    return published_url(handle);
}

} // namespace sandforge
