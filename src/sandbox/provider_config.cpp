#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

#include <cstdlib>
#include <stdexcept>

namespace sandforge {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return fallback;
}

// Read "sandbox.<section>.env" as either {"K": "v"} or ["K=v", ...]
void read_env(const Config& cfg, const std::string& key,
              std::vector<std::pair<std::string, std::string> >& env) {
    Json node = cfg.get_json(key);
    if (node.is_object()) {
        for (Json::const_iterator it = node.begin(); it != node.end(); ++it) {
            if (it.value().is_string()) {
                env.push_back(std::make_pair(it.key(), it.value().get<std::string>()));
            }
        }
    } else if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            if (!node[i].is_string()) continue;
            std::string entry = node[i].get<std::string>();
            size_t eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                LOG_WARN("Ignoring malformed env entry '%s' in %s", entry.c_str(), key.c_str());
                continue;
            }
            env.push_back(std::make_pair(entry.substr(0, eq), entry.substr(eq + 1)));
        }
    }
}

void read_dev_server(const Config& cfg, const std::string& prefix, DevServerOptions& opts) {
    opts.port = static_cast<int>(cfg.get_int(prefix + ".dev_port", opts.port));
    opts.settle_ms = static_cast<int>(cfg.get_int(prefix + ".dev_server_settle_ms", opts.settle_ms));
    opts.package_manager = cfg.get_string(prefix + ".package_manager", opts.package_manager);
    opts.log_path = cfg.get_string(prefix + ".dev_server_log", opts.log_path);
}

} // namespace

std::string DockerConnection::base_url() const {
    if (uses_socket()) {
        // Host part is ignored by the daemon when talking over the socket
        return "http://localhost/" + api_version;
    }
    return "http://" + host + ":" + std::to_string(port) + "/" + api_version;
}

void DockerConnection::apply_docker_host(const std::string& value) {
    std::string v = trim(value);
    if (v.empty()) return;

    if (starts_with(v, "unix://")) {
        socket_path = v.substr(7);
        host.clear();
        return;
    }
    if (starts_with(v, "tcp://")) {
        v = v.substr(6);
    } else if (starts_with(v, "http://")) {
        v = v.substr(7);
    }
    while (!v.empty() && v[v.size() - 1] == '/') {
        v.erase(v.size() - 1);
    }

    size_t colon = v.rfind(':');
    if (colon != std::string::npos) {
        try {
            port = std::stoi(v.substr(colon + 1));
        } catch (const std::exception&) {
            LOG_WARN("Invalid port in docker host '%s', keeping %d", value.c_str(), port);
        }
        host = v.substr(0, colon);
    } else {
        host = v;
    }
}

PullPolicy parse_pull_policy(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "always") return PullPolicy::ALWAYS;
    if (v == "never") return PullPolicy::NEVER;
    return PullPolicy::MISSING;
}

SandboxProviderConfig SandboxProviderConfig::from_config(const Config& cfg) {
    SandboxProviderConfig out;

    std::string provider = cfg.get_string("sandbox.provider", "self-hosted");
    if (!provider_kind_from_string(provider, out.provider)) {
        throw std::invalid_argument("Unknown sandbox provider: " + provider);
    }

    // ── Self-hosted ──
    SelfHostedConfig& sh = out.self_hosted;
    const std::string s = "sandbox.self_hosted";

    sh.docker.socket_path = cfg.get_string(s + ".docker.socket_path",
                                           env_or("DOCKER_SOCKET_PATH", sh.docker.socket_path));
    std::string docker_host = cfg.get_string(s + ".docker.host", env_or("DOCKER_HOST", ""));
    sh.docker.apply_docker_host(docker_host);
    std::string docker_port = env_or("DOCKER_PORT", "");
    if (!docker_port.empty() && !sh.docker.uses_socket()) {
        try {
            sh.docker.port = std::stoi(docker_port);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid DOCKER_PORT '%s'", docker_port.c_str());
        }
    }
    sh.docker.port = static_cast<int>(cfg.get_int(s + ".docker.port", sh.docker.port));
    sh.docker.api_version = cfg.get_string(s + ".docker.api_version", sh.docker.api_version);

    sh.resources.memory_bytes = cfg.get_int(s + ".resources.memory", sh.resources.memory_bytes);
    sh.resources.cpu_quota = cfg.get_int(s + ".resources.cpu_quota", sh.resources.cpu_quota);
    sh.resources.cpu_period = cfg.get_int(s + ".resources.cpu_period", sh.resources.cpu_period);
    sh.resources.command_timeout_ms = static_cast<long>(
        cfg.get_int(s + ".resources.timeout", sh.resources.command_timeout_ms));

    sh.network.mode = cfg.get_string(s + ".network.mode", sh.network.mode);
    if (cfg.has(s + ".network.allowed_ports")) {
        std::vector<int64_t> ports = cfg.get_int_list(s + ".network.allowed_ports");
        sh.network.allowed_ports.clear();
        for (size_t i = 0; i < ports.size(); ++i) {
            if (ports[i] > 0 && ports[i] < 65536) {
                sh.network.allowed_ports.push_back(static_cast<int>(ports[i]));
            } else {
                LOG_WARN("Ignoring out-of-range allowed port %lld", static_cast<long long>(ports[i]));
            }
        }
    }

    sh.base_image = cfg.get_string(s + ".base_image", sh.base_image);
    sh.working_dir = cfg.get_string(s + ".working_dir", sh.working_dir);
    sh.volumes = cfg.get_string_list(s + ".volumes");
    read_env(cfg, s + ".env", sh.env);
    if (cfg.has(s + ".keep_alive_cmd")) {
        std::vector<std::string> cmd = cfg.get_string_list(s + ".keep_alive_cmd");
        if (!cmd.empty()) {
            sh.keep_alive_cmd = cmd;
        }
    }
    sh.pull_policy = parse_pull_policy(cfg.get_string(s + ".pull_policy", "missing"));
    sh.public_host = cfg.get_string(s + ".public_host", sh.public_host);
    sh.dev_server_startup_ms = static_cast<int>(
        cfg.get_int(s + ".dev_server_startup_ms", sh.dev_server_startup_ms));
    read_dev_server(cfg, s, sh.dev_server);

    // ── Vercel ──
    VercelConfig& vc = out.vercel;
    const std::string v = "sandbox.vercel";
    vc.token = cfg.get_string(v + ".token", env_or("VERCEL_TOKEN", ""));
    vc.team_id = cfg.get_string(v + ".team_id", env_or("VERCEL_TEAM_ID", ""));
    vc.project_id = cfg.get_string(v + ".project_id", env_or("VERCEL_PROJECT_ID", ""));
    vc.runtime = cfg.get_string(v + ".runtime", vc.runtime);
    vc.vcpus = static_cast<int>(cfg.get_int(v + ".vcpus", vc.vcpus));
    vc.timeout_ms = cfg.get_int(v + ".timeout_ms", vc.timeout_ms);
    vc.command_timeout_ms = static_cast<long>(cfg.get_int(v + ".command_timeout_ms", vc.command_timeout_ms));
    vc.api_url = cfg.get_string(v + ".api_url", vc.api_url);
    vc.working_dir = cfg.get_string(v + ".working_dir", vc.working_dir);
    read_dev_server(cfg, v, vc.dev_server);

    // ── E2B ──
    E2BConfig& eb = out.e2b;
    const std::string e = "sandbox.e2b";
    eb.api_key = cfg.get_string(e + ".api_key", env_or("E2B_API_KEY", ""));
    eb.template_id = cfg.get_string(e + ".template", eb.template_id);
    eb.timeout_ms = cfg.get_int(e + ".timeout_ms", eb.timeout_ms);
    eb.command_timeout_ms = static_cast<long>(cfg.get_int(e + ".command_timeout_ms", eb.command_timeout_ms));
    eb.api_url = cfg.get_string(e + ".api_url", eb.api_url);
    eb.domain = cfg.get_string(e + ".domain", env_or("E2B_DOMAIN", eb.domain));
    eb.envd_port = static_cast<int>(cfg.get_int(e + ".envd_port", eb.envd_port));
    eb.working_dir = cfg.get_string(e + ".working_dir", eb.working_dir);
    read_dev_server(cfg, e, eb.dev_server);

    // Remove trailing slash from URLs
    while (!vc.api_url.empty() && vc.api_url[vc.api_url.length() - 1] == '/') {
        vc.api_url.erase(vc.api_url.length() - 1);
    }
    while (!eb.api_url.empty() && eb.api_url[eb.api_url.length() - 1] == '/') {
        eb.api_url.erase(eb.api_url.length() - 1);
    }

    return out;
}

} // namespace sandforge
