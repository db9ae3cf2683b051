#include <sandforge/plugins/vercel/vercel.hpp>
#include <sandforge/sandbox/errors.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

namespace sandforge {

namespace {

const long CONTROL_TIMEOUT_MS = 60000;

// Budget for killing a timed-out command
const long REAP_TIMEOUT_MS = 5000;

void throw_api_error(const std::string& what, const HttpResponse& response) {
    throw EngineError("Vercel " + what + ": " + response.error_message(), response.status_code);
}

Json parse_body(const std::string& what, const HttpResponse& response) {
    try {
        return Json::parse(response.body);
    } catch (const std::exception& e) {
        throw EngineError("Vercel " + what + ": invalid response: " + e.what(), response.status_code);
    }
}

// Responses wrap the object ({"command": {...}}) on newer API versions
const Json& unwrap(const Json& body, const char* key) {
    if (body.is_object() && body.contains(key) && body[key].is_object()) {
        return body[key];
    }
    return body;
}

} // namespace

// ============================================================================
// Wire helpers
// ============================================================================

namespace vercel {

void parse_command_logs(const std::string& ndjson, std::string& out, std::string& err) {
    std::vector<std::string> lines = split(ndjson, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty()) continue;

        Json entry;
        try {
            entry = Json::parse(line);
        } catch (const std::exception&) {
            LOG_DEBUG("Skipping malformed log line");
            continue;
        }
        if (!entry.is_object() || !entry.contains("data") || !entry["data"].is_string()) {
            continue;
        }
        std::string stream = entry.value("stream", std::string("stdout"));
        if (stream == "stderr") {
            err += entry["data"].get<std::string>();
        } else {
            out += entry["data"].get<std::string>();
        }
    }
}

std::string preview_url(const Json& create_response, int port) {
    if (!create_response.is_object() || !create_response.contains("routes") ||
        !create_response["routes"].is_array()) {
        return "";
    }
    const Json& routes = create_response["routes"];
    for (size_t i = 0; i < routes.size(); ++i) {
        const Json& route = routes[i];
        if (!route.is_object() || route.value("port", 0) != port) {
            continue;
        }
        std::string url = route.value("url", std::string(""));
        if (!url.empty()) {
            return url;
        }
        std::string subdomain = route.value("subdomain", std::string(""));
        if (!subdomain.empty()) {
            return "https://" + subdomain + ".vercel.run";
        }
    }
    return "";
}

} // namespace vercel

// ============================================================================
// VercelProvider
// ============================================================================

VercelProvider::VercelProvider(const VercelConfig& config)
    : BridgedProvider(config.working_dir, config.command_timeout_ms, config.dev_server)
    , config_(config)
{
    if (config_.token.empty()) {
        LOG_WARN("Vercel: no API token configured (set sandbox.vercel.token or VERCEL_TOKEN)");
    }
}

VercelProvider::~VercelProvider() {
    release_on_destroy();
}

std::string VercelProvider::url(const std::string& path) const {
    std::string full = config_.api_url + path;
    if (!config_.team_id.empty()) {
        full += (path.find('?') == std::string::npos ? "?" : "&");
        full += "teamId=" + HttpClient::url_encode(config_.team_id);
    }
    return full;
}

HttpResponse VercelProvider::call(const std::string& method,
                                  const std::string& path,
                                  const std::string& body,
                                  long timeout_ms) {
    HttpClient http;
    http.set_timeout_ms(timeout_ms);

    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + config_.token;
    if (!body.empty()) {
        headers["Content-Type"] = "application/json";
    }

    LOG_DEBUG("▶ Vercel %s %s", method.c_str(), path.c_str());
    HttpResponse response = http.request(method, url(path), body, headers);
    LOG_DEBUG("◀ Vercel %s %s: HTTP %ld%s", method.c_str(), path.c_str(), response.status_code,
              response.timed_out ? " [timeout]" : "");
    return response;
}

Json VercelProvider::build_create_body() const {
    Json body = Json::object();
    if (!config_.project_id.empty()) {
        body["projectId"] = config_.project_id;
    }
    body["ports"] = Json::array({config_.dev_server.port});
    body["runtime"] = config_.runtime;
    body["timeout"] = config_.timeout_ms;
    body["resources"] = {{"vcpus", config_.vcpus}};
    return body;
}

BridgedProvider::Provisioned VercelProvider::provision_backend() {
    if (config_.token.empty()) {
        throw ProvisionError("Vercel: missing API token (sandbox.vercel.token or VERCEL_TOKEN)");
    }
    if (config_.project_id.empty()) {
        throw ProvisionError("Vercel: missing project id (sandbox.vercel.project_id or VERCEL_PROJECT_ID)");
    }

    HttpResponse response = call("POST", "/v1/sandboxes", build_create_body().dump(), CONTROL_TIMEOUT_MS);
    if (!response.ok()) {
        throw ProvisionError("Vercel: create sandbox: " + response.error_message());
    }

    Json body = parse_body("create sandbox", response);
    const Json& sandbox = unwrap(body, "sandbox");

    Provisioned provisioned;
    provisioned.handle = sandbox.value("id", std::string(""));
    if (provisioned.handle.empty()) {
        throw ProvisionError("Vercel: create sandbox: response has no id");
    }
    provisioned.sandbox_id = provisioned.handle;
    provisioned.url = vercel::preview_url(body, config_.dev_server.port);
    return provisioned;
}

ExecResult VercelProvider::exec_backend(const std::string& handle,
                                        const std::vector<std::string>& argv,
                                        long timeout_ms) {
    ExecResult result;

    // One deadline covers starting, waiting and fetching the logs
    int64_t deadline = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;

    Json request = Json::object();
    request["command"] = argv.empty() ? std::string("") : argv[0];
    request["args"] = argv.empty() ? std::vector<std::string>()
                                   : std::vector<std::string>(argv.begin() + 1, argv.end());
    request["cwd"] = working_dir();
    request["env"] = Json::object();
    request["sudo"] = false;

    std::string base = "/v1/sandboxes/" + handle + "/cmd";
    long budget = remaining_ms(deadline, CONTROL_TIMEOUT_MS);
    if (budget == 0) {
        result.timed_out = true;
        return result;
    }
    HttpResponse created = call("POST", base, request.dump(), budget);
    if (created.timed_out) {
        result.timed_out = true;
        return result;
    }
    if (!created.ok()) {
        throw_api_error("start command", created);
    }
    const Json command = unwrap(parse_body("start command", created), "command");
    std::string cmd_id = command.value("id", command.value("cmdId", std::string("")));
    if (cmd_id.empty()) {
        throw EngineError("Vercel start command: response has no id", created.status_code);
    }
    result.process_ref = cmd_id;

    budget = remaining_ms(deadline, 0);
    if (deadline != 0 && budget == 0) {
        result.timed_out = true;
        return result;
    }
    HttpResponse waited = call("GET", base + "/" + cmd_id + "?wait=true", "", budget);
    if (waited.timed_out) {
        result.timed_out = true;
        return result;
    }
    if (!waited.ok()) {
        throw_api_error("wait for command", waited);
    }
    const Json finished = unwrap(parse_body("wait for command", waited), "command");
    if (!finished.contains("exitCode") || !finished["exitCode"].is_number()) {
        throw EngineError("Vercel wait for command: no exit code", waited.status_code);
    }
    result.exit_code = finished["exitCode"].get<int>();

    budget = remaining_ms(deadline, CONTROL_TIMEOUT_MS);
    if (budget == 0) {
        result.timed_out = true;
        return result;
    }
    HttpResponse logs = call("GET", base + "/" + cmd_id + "/logs", "", budget);
    if (logs.timed_out) {
        result.timed_out = true;
        return result;
    }
    if (logs.ok()) {
        vercel::parse_command_logs(logs.body, result.stdout_text, result.stderr_text);
    } else {
        LOG_WARN("Vercel: logs for command %s unavailable: %s", cmd_id.c_str(),
                 logs.error_message().c_str());
    }
    return result;
}

void VercelProvider::reap_backend(const std::string& handle, const ExecResult& timed_out) {
    if (timed_out.process_ref.empty()) {
        return;
    }
    Json body = {{"signal", 9}};
    HttpResponse response = call("POST", "/v1/sandboxes/" + handle + "/cmd/" + timed_out.process_ref + "/kill",
                                 body.dump(), REAP_TIMEOUT_MS);
    if (!response.ok()) {
        throw_api_error("kill command " + timed_out.process_ref, response);
    }
}

void VercelProvider::destroy_backend(const std::string& handle) {
    HttpResponse response = call("POST", "/v1/sandboxes/" + handle + "/stop", "", CONTROL_TIMEOUT_MS);
    if (!response.ok() && response.status_code != 404) {
        throw_api_error("stop sandbox " + handle, response);
    }
}

bool VercelProvider::probe_backend(const std::string& handle) {
    HttpResponse response = call("GET", "/v1/sandboxes/" + handle, "", CONTROL_TIMEOUT_MS);
    if (!response.ok()) {
        return false;
    }
    const Json sandbox = unwrap(parse_body("get sandbox", response), "sandbox");
    return sandbox.value("status", std::string("")) == "running";
}

} // namespace sandforge
