/*
 * sandforge - Docker Engine API client implementation
 */
#include <sandforge/sandbox/docker_client.hpp>
#include <sandforge/sandbox/errors.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

#include <sstream>

namespace sandforge {

// ============================================================================
// Wire-format helpers
// ============================================================================

namespace docker {

bool demux_stream(const std::string& raw, std::string& out, std::string& err) {
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < 8) {
            if (pos == 0) {
                out.append(raw);
                return true;
            }
            return false;
        }

        unsigned char type = static_cast<unsigned char>(raw[pos]);
        bool header_ok = type <= 2 &&
                         raw[pos + 1] == '\0' && raw[pos + 2] == '\0' && raw[pos + 3] == '\0';
        if (!header_ok) {
            // Not multiplexed (TTY exec): everything is stdout
            if (pos == 0) {
                out.append(raw);
                return true;
            }
            out.append(raw, pos, std::string::npos);
            return false;
        }

        size_t size = (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 4])) << 24) |
                      (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 5])) << 16) |
                      (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 6])) << 8) |
                       static_cast<size_t>(static_cast<unsigned char>(raw[pos + 7]));
        pos += 8;

        std::string& target = (type == 2) ? err : out;
        if (raw.size() - pos < size) {
            target.append(raw, pos, std::string::npos);
            return false;
        }
        target.append(raw, pos, size);
        pos += size;
    }
    return true;
}

void split_image_reference(const std::string& image, std::string& repo, std::string& tag) {
    if (image.find('@') != std::string::npos) {
        repo = image;
        tag.clear();
        return;
    }
    size_t colon = image.rfind(':');
    size_t slash = image.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        repo = image.substr(0, colon);
        tag = image.substr(colon + 1);
    } else {
        repo = image;
        tag = "latest";
    }
}

Json build_create_body(const ContainerSpec& spec) {
    Json body = Json::object();
    body["Image"] = spec.image;
    if (!spec.cmd.empty()) {
        body["Cmd"] = spec.cmd;
    }
    if (!spec.env.empty()) {
        Json env = Json::array();
        for (size_t i = 0; i < spec.env.size(); ++i) {
            env.push_back(spec.env[i].first + "=" + spec.env[i].second);
        }
        body["Env"] = env;
    }
    if (!spec.working_dir.empty()) {
        body["WorkingDir"] = spec.working_dir;
    }
    if (!spec.labels.empty()) {
        Json labels = Json::object();
        for (std::map<std::string, std::string>::const_iterator it = spec.labels.begin();
             it != spec.labels.end(); ++it) {
            labels[it->first] = it->second;
        }
        body["Labels"] = labels;
    }

    Json host = Json::object();
    if (!spec.volumes.empty()) {
        host["Binds"] = spec.volumes;
    }
    if (!spec.exposed_ports.empty()) {
        Json exposed = Json::object();
        Json bindings = Json::object();
        for (size_t i = 0; i < spec.exposed_ports.size(); ++i) {
            std::string key = std::to_string(spec.exposed_ports[i]) + "/tcp";
            exposed[key] = Json::object();
            Json binding = Json::object();
            binding["HostIp"] = "";
            binding["HostPort"] = "0";  // Engine picks a free host port
            bindings[key] = Json::array({binding});
        }
        body["ExposedPorts"] = exposed;
        host["PortBindings"] = bindings;
    }
    if (spec.memory_bytes > 0) {
        host["Memory"] = spec.memory_bytes;
    }
    if (spec.cpu_quota > 0) {
        host["CpuQuota"] = spec.cpu_quota;
    }
    if (spec.cpu_period > 0) {
        host["CpuPeriod"] = spec.cpu_period;
    }
    if (!spec.network_mode.empty()) {
        host["NetworkMode"] = spec.network_mode;
    }
    host["AutoRemove"] = spec.auto_remove;
    body["HostConfig"] = host;

    return body;
}

ContainerInspection parse_inspection(const Json& body) {
    ContainerInspection info;
    if (!body.is_object()) {
        return info;
    }

    info.id = body.value("Id", std::string(""));
    if (body.contains("State") && body["State"].is_object()) {
        const Json& state = body["State"];
        info.status = state.value("Status", std::string(""));
        info.running = state.value("Running", false);
    }

    if (body.contains("NetworkSettings") && body["NetworkSettings"].is_object() &&
        body["NetworkSettings"].contains("Ports") && body["NetworkSettings"]["Ports"].is_object()) {
        const Json& ports = body["NetworkSettings"]["Ports"];
        for (Json::const_iterator it = ports.begin(); it != ports.end(); ++it) {
            const Json& list = it.value();
            if (!list.is_array() || list.empty()) {
                continue;   // Exposed but not (yet) published
            }
            // Prefer the IPv4 wildcard binding when the daemon publishes both families
            size_t chosen = 0;
            for (size_t i = 0; i < list.size(); ++i) {
                if (list[i].is_object() && list[i].value("HostIp", std::string("")) == "0.0.0.0") {
                    chosen = i;
                    break;
                }
            }
            if (!list[chosen].is_object()) {
                continue;
            }
            PortBinding binding;
            binding.host_ip = list[chosen].value("HostIp", std::string(""));
            binding.host_port = list[chosen].value("HostPort", std::string(""));
            if (!binding.host_port.empty()) {
                info.ports[it.key()] = binding;
            }
        }
    }
    return info;
}

bool check_pull_progress(const std::string& body, std::string& error) {
    std::vector<std::string> lines = split(body, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) continue;

        Json event;
        try {
            event = Json::parse(line);
        } catch (const std::exception&) {
            continue;
        }
        if (!event.is_object()) continue;

        if (event.contains("error")) {
            error = event["error"].is_string() ? event["error"].get<std::string>() : event["error"].dump();
            return false;
        }
        std::string status = event.value("status", std::string(""));
        if (!status.empty() && !event.contains("progressDetail")) {
            LOG_DEBUG("pull: %s", status.c_str());
        }
    }
    return true;
}

std::string error_message(const HttpResponse& response) {
    if (response.status_code == 0) {
        return response.error.empty() ? "no response from engine" : response.error;
    }
    return response.error_message();
}

} // namespace docker

// ============================================================================
// DockerClient
// ============================================================================

namespace {

const long CONTROL_TIMEOUT_MS = 60000;

void throw_engine_error(const std::string& what, const HttpResponse& response) {
    throw EngineError(what + ": " + docker::error_message(response), response.status_code);
}

} // namespace

DockerClient::DockerClient(const DockerConnection& connection)
    : connection_(connection)
    , base_url_(connection.base_url())
    , pull_timeout_ms_(10 * 60 * 1000)
    , stop_grace_seconds_(5)
{
    LOG_DEBUG("Docker client using %s%s", base_url_.c_str(),
              connection_.uses_socket() ? (" via " + connection_.socket_path).c_str() : "");
}

HttpResponse DockerClient::call(const std::string& method,
                                const std::string& path,
                                const std::string& body,
                                long timeout_ms) {
    HttpClient http;
    if (connection_.uses_socket()) {
        http.set_unix_socket(connection_.socket_path);
    }
    http.set_timeout_ms(timeout_ms);

    std::map<std::string, std::string> headers;
    if (!body.empty()) {
        headers["Content-Type"] = "application/json";
    }

    LOG_DEBUG("▶ %s %s (%zu bytes)", method.c_str(), path.c_str(), body.size());
    HttpResponse response = http.request(method, base_url_ + path, body, headers);
    LOG_DEBUG("◀ %s %s: HTTP %ld (%zu bytes)%s", method.c_str(), path.c_str(),
              response.status_code, response.body.size(), response.timed_out ? " [timeout]" : "");
    return response;
}

bool DockerClient::ping() {
    HttpResponse response = call("GET", "/_ping", "", 5000);
    if (response.status_code == 200) {
        return true;
    }
    LOG_WARN("Docker ping failed: %s", docker::error_message(response).c_str());
    return false;
}

bool DockerClient::image_exists(const std::string& image) {
    HttpResponse response = call("GET", "/images/" + image + "/json", "", CONTROL_TIMEOUT_MS);
    if (response.status_code == 200) {
        return true;
    }
    if (response.status_code == 404) {
        return false;
    }
    throw_engine_error("inspect image " + image, response);
    return false;
}

void DockerClient::pull_image(const std::string& image) {
    std::string repo;
    std::string tag;
    docker::split_image_reference(image, repo, tag);

    std::string path = "/images/create?fromImage=" + HttpClient::url_encode(repo);
    if (!tag.empty()) {
        path += "&tag=" + HttpClient::url_encode(tag);
    }

    LOG_INFO("Pulling image %s", image.c_str());
    HttpResponse response = call("POST", path, "", pull_timeout_ms_);
    if (!response.ok()) {
        throw_engine_error("pull " + image, response);
    }

    // The daemon answers 200 and reports failures inside the progress stream
    std::string error;
    if (!docker::check_pull_progress(response.body, error)) {
        throw EngineError("pull " + image + ": " + error, response.status_code);
    }
    LOG_INFO("Pulled image %s", image.c_str());
}

std::string DockerClient::create_container(const ContainerSpec& spec) {
    std::string path = "/containers/create";
    if (!spec.name.empty()) {
        path += "?name=" + HttpClient::url_encode(spec.name);
    }

    Json body = docker::build_create_body(spec);
    HttpResponse response = call("POST", path, body.dump(), CONTROL_TIMEOUT_MS);
    if (response.status_code != 201) {
        throw_engine_error("create container from " + spec.image, response);
    }

    Json resp;
    try {
        resp = Json::parse(response.body);
    } catch (const std::exception& e) {
        throw EngineError(std::string("create container: invalid response: ") + e.what(),
                          response.status_code);
    }

    std::string id = resp.value("Id", std::string(""));
    if (id.empty()) {
        throw EngineError("create container: response has no Id", response.status_code);
    }

    if (resp.contains("Warnings") && resp["Warnings"].is_array()) {
        for (size_t i = 0; i < resp["Warnings"].size(); ++i) {
            if (resp["Warnings"][i].is_string()) {
                LOG_WARN("Docker: %s", resp["Warnings"][i].get<std::string>().c_str());
            }
        }
    }
    return id;
}

void DockerClient::start_container(const std::string& id) {
    HttpResponse response = call("POST", "/containers/" + id + "/start", "", CONTROL_TIMEOUT_MS);
    // 304: already started
    if (response.status_code != 204 && response.status_code != 304) {
        throw_engine_error("start container " + id, response);
    }
}

void DockerClient::stop_container(const std::string& id) {
    std::string path = "/containers/" + id + "/stop?t=" + std::to_string(stop_grace_seconds_);
    HttpResponse response = call("POST", path, "", CONTROL_TIMEOUT_MS + stop_grace_seconds_ * 1000);
    // 304: already stopped
    if (response.status_code != 204 && response.status_code != 304) {
        throw_engine_error("stop container " + id, response);
    }
}

void DockerClient::remove_container(const std::string& id) {
    HttpResponse response = call("DELETE", "/containers/" + id + "?force=true", "", CONTROL_TIMEOUT_MS);
    if (response.status_code == 204) {
        return;
    }
    // Auto-removed containers disappear on stop
    if (response.status_code == 404 || response.status_code == 409) {
        LOG_DEBUG("Container %s already removed (HTTP %ld)", id.c_str(), response.status_code);
        return;
    }
    throw_engine_error("remove container " + id, response);
}

ExecResult DockerClient::exec(const std::string& id,
                              const std::vector<std::string>& argv,
                              long timeout_ms) {
    ExecResult result;

    // One deadline covers create, start and the exit-code poll
    int64_t deadline = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;

    Json create = Json::object();
    create["AttachStdin"] = false;
    create["AttachStdout"] = true;
    create["AttachStderr"] = true;
    create["Tty"] = false;
    create["Cmd"] = argv;

    long budget = remaining_ms(deadline, CONTROL_TIMEOUT_MS);
    if (budget == 0) {
        result.timed_out = true;
        return result;
    }
    HttpResponse created = call("POST", "/containers/" + id + "/exec", create.dump(), budget);
    if (created.timed_out) {
        result.timed_out = true;
        return result;
    }
    if (created.status_code != 201) {
        throw_engine_error("create exec in " + id, created);
    }

    std::string exec_id;
    try {
        exec_id = Json::parse(created.body).value("Id", std::string(""));
    } catch (const std::exception& e) {
        throw EngineError(std::string("create exec: invalid response: ") + e.what(), created.status_code);
    }
    if (exec_id.empty()) {
        throw EngineError("create exec: response has no Id", created.status_code);
    }
    result.process_ref = exec_id;

    Json start = Json::object();
    start["Detach"] = false;
    start["Tty"] = false;

    // Without a deadline the stream stays open as long as the process runs
    budget = remaining_ms(deadline, 0);
    if (deadline != 0 && budget == 0) {
        result.timed_out = true;
        return result;
    }
    HttpResponse stream = call("POST", "/exec/" + exec_id + "/start", start.dump(), budget);
    if (stream.timed_out) {
        docker::demux_stream(stream.body, result.stdout_text, result.stderr_text);
        result.timed_out = true;
        return result;
    }
    if (!stream.ok()) {
        throw_engine_error("start exec in " + id, stream);
    }
    if (!docker::demux_stream(stream.body, result.stdout_text, result.stderr_text)) {
        LOG_WARN("Exec stream from %s ended mid-frame", id.c_str());
    }

    // The stream closes when the process exits; the exit code can lag briefly
    for (int attempt = 0; attempt < 20; ++attempt) {
        budget = remaining_ms(deadline, CONTROL_TIMEOUT_MS);
        if (budget == 0) {
            result.timed_out = true;
            return result;
        }
        HttpResponse inspected = call("GET", "/exec/" + exec_id + "/json", "", budget);
        if (inspected.timed_out) {
            result.timed_out = true;
            return result;
        }
        if (!inspected.ok()) {
            throw_engine_error("inspect exec in " + id, inspected);
        }
        Json body;
        try {
            body = Json::parse(inspected.body);
        } catch (const std::exception& e) {
            throw EngineError(std::string("inspect exec: invalid response: ") + e.what(),
                              inspected.status_code);
        }
        if (!body.value("Running", false) && body.contains("ExitCode") && body["ExitCode"].is_number()) {
            result.exit_code = body["ExitCode"].get<int>();
            return result;
        }
        sleep_ms(10);
    }

    throw EngineError("exec in " + id + ": exit code not available");
}

ContainerInspection DockerClient::inspect(const std::string& id) {
    HttpResponse response = call("GET", "/containers/" + id + "/json", "", CONTROL_TIMEOUT_MS);
    if (!response.ok()) {
        throw_engine_error("inspect container " + id, response);
    }
    Json body;
    try {
        body = Json::parse(response.body);
    } catch (const std::exception& e) {
        throw EngineError(std::string("inspect container: invalid response: ") + e.what(),
                          response.status_code);
    }
    return docker::parse_inspection(body);
}

} // namespace sandforge
