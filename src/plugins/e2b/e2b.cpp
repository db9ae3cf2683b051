#include <sandforge/plugins/e2b/e2b.hpp>
#include <sandforge/sandbox/errors.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

namespace sandforge {

namespace {

const long CONTROL_TIMEOUT_MS = 60000;

// Budget for killing a timed-out process
const long REAP_TIMEOUT_MS = 5000;

// Default user inside E2B templates; envd authenticates with "user:"
const char* const ENVD_USER = "user";

void throw_api_error(const std::string& what, const HttpResponse& response) {
    throw EngineError("E2B " + what + ": " + response.error_message(), response.status_code);
}

std::string decode_output(const Json& value) {
    if (!value.is_string()) {
        return "";
    }
    std::string decoded;
    if (!base64_decode(value.get<std::string>(), decoded)) {
        LOG_WARN("E2B: undecodable output chunk");
        return "";
    }
    return decoded;
}

} // namespace

// ============================================================================
// Connect protocol helpers
// ============================================================================

namespace e2b {

std::string encode_envelope(const Json& message, unsigned char flags) {
    std::string payload = message.dump();
    uint32_t size = static_cast<uint32_t>(payload.size());

    std::string frame;
    frame.reserve(payload.size() + 5);
    frame.push_back(static_cast<char>(flags));
    frame.push_back(static_cast<char>((size >> 24) & 0xff));
    frame.push_back(static_cast<char>((size >> 16) & 0xff));
    frame.push_back(static_cast<char>((size >> 8) & 0xff));
    frame.push_back(static_cast<char>(size & 0xff));
    frame += payload;
    return frame;
}

bool decode_process_stream(const std::string& body, ExecResult& result, std::string& error) {
    bool ended = false;
    size_t pos = 0;

    while (body.size() - pos >= 5) {
        unsigned char flags = static_cast<unsigned char>(body[pos]);
        size_t size = (static_cast<size_t>(static_cast<unsigned char>(body[pos + 1])) << 24) |
                      (static_cast<size_t>(static_cast<unsigned char>(body[pos + 2])) << 16) |
                      (static_cast<size_t>(static_cast<unsigned char>(body[pos + 3])) << 8) |
                       static_cast<size_t>(static_cast<unsigned char>(body[pos + 4]));
        pos += 5;
        if (body.size() - pos < size) {
            break;  // Truncated by a timeout
        }

        Json message;
        try {
            message = Json::parse(body.substr(pos, size));
        } catch (const std::exception& e) {
            error = std::string("malformed stream message: ") + e.what();
            return ended;
        }
        pos += size;

        if (flags & FLAG_END_STREAM) {
            if (message.is_object() && message.contains("error")) {
                const Json& err = message["error"];
                error = err.is_object() ? err.value("message", err.value("code", std::string("unknown")))
                                        : err.dump();
            }
            break;
        }

        if (!message.is_object() || !message.contains("event") || !message["event"].is_object()) {
            continue;
        }
        const Json& event = message["event"];

        if (event.contains("start") && event["start"].is_object()) {
            const Json& start = event["start"];
            if (start.contains("pid") && start["pid"].is_number()) {
                result.process_ref = std::to_string(start["pid"].get<long long>());
            }
        } else if (event.contains("data") && event["data"].is_object()) {
            const Json& data = event["data"];
            if (data.contains("stdout")) {
                result.stdout_text += decode_output(data["stdout"]);
            }
            if (data.contains("stderr")) {
                result.stderr_text += decode_output(data["stderr"]);
            }
        } else if (event.contains("end") && event["end"].is_object()) {
            // proto3 JSON omits zero values, so a missing exitCode is 0
            result.exit_code = event["end"].value("exitCode", 0);
            ended = true;
        }
    }
    return ended;
}

Json build_start_request(const std::vector<std::string>& argv, const std::string& cwd) {
    Json process = Json::object();
    process["cmd"] = argv.empty() ? std::string("") : argv[0];
    process["args"] = argv.empty() ? std::vector<std::string>()
                                   : std::vector<std::string>(argv.begin() + 1, argv.end());
    process["envs"] = Json::object();
    if (!cwd.empty()) {
        process["cwd"] = cwd;
    }

    Json request = Json::object();
    request["process"] = process;
    return request;
}

std::string sandbox_host_url(int port, const std::string& sandbox_id, const std::string& domain) {
    return "https://" + std::to_string(port) + "-" + sandbox_id + "." + domain;
}

} // namespace e2b

// ============================================================================
// E2BProvider
// ============================================================================

E2BProvider::E2BProvider(const E2BConfig& config)
    : BridgedProvider(config.working_dir, config.command_timeout_ms, config.dev_server)
    , config_(config)
{
    if (config_.api_key.empty()) {
        LOG_WARN("E2B: no API key configured (set sandbox.e2b.api_key or E2B_API_KEY)");
    }
}

E2BProvider::~E2BProvider() {
    release_on_destroy();
}

HttpResponse E2BProvider::api_call(const std::string& method,
                                   const std::string& path,
                                   const std::string& body,
                                   long timeout_ms) {
    HttpClient http;
    http.set_timeout_ms(timeout_ms);

    std::map<std::string, std::string> headers;
    headers["X-API-Key"] = config_.api_key;
    if (!body.empty()) {
        headers["Content-Type"] = "application/json";
    }

    LOG_DEBUG("▶ E2B %s %s", method.c_str(), path.c_str());
    HttpResponse response = http.request(method, config_.api_url + path, body, headers);
    LOG_DEBUG("◀ E2B %s %s: HTTP %ld", method.c_str(), path.c_str(), response.status_code);
    return response;
}

HttpResponse E2BProvider::envd_call(const std::string& handle,
                                    const std::string& rpc,
                                    const std::string& content_type,
                                    const std::string& body,
                                    long timeout_ms) {
    HttpClient http;
    http.set_timeout_ms(timeout_ms);

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = content_type;
    headers["Connect-Protocol-Version"] = "1";
    headers["Authorization"] = "Basic " + base64_encode(std::string(ENVD_USER) + ":");
    if (!envd_token_.empty()) {
        headers["X-Access-Token"] = envd_token_;
    }

    std::string url = e2b::sandbox_host_url(config_.envd_port, handle, config_.domain) + "/" + rpc;
    LOG_DEBUG("▶ envd %s (%zu bytes)", rpc.c_str(), body.size());
    HttpResponse response = http.request("POST", url, body, headers);
    LOG_DEBUG("◀ envd %s: HTTP %ld%s", rpc.c_str(), response.status_code,
              response.timed_out ? " [timeout]" : "");
    return response;
}

Json E2BProvider::build_create_body() const {
    Json body = Json::object();
    body["templateID"] = config_.template_id;
    body["timeout"] = static_cast<int64_t>(config_.timeout_ms / 1000);
    return body;
}

BridgedProvider::Provisioned E2BProvider::provision_backend() {
    if (config_.api_key.empty()) {
        throw ProvisionError("E2B: missing API key (sandbox.e2b.api_key or E2B_API_KEY)");
    }

    HttpResponse response = api_call("POST", "/sandboxes", build_create_body().dump(), CONTROL_TIMEOUT_MS);
    if (!response.ok()) {
        throw ProvisionError("E2B: create sandbox: " + response.error_message());
    }

    Json body;
    try {
        body = Json::parse(response.body);
    } catch (const std::exception& e) {
        throw ProvisionError(std::string("E2B: create sandbox: invalid response: ") + e.what());
    }

    Provisioned provisioned;
    provisioned.handle = body.value("sandboxID", std::string(""));
    if (provisioned.handle.empty()) {
        throw ProvisionError("E2B: create sandbox: response has no sandboxID");
    }
    provisioned.sandbox_id = provisioned.handle;
    provisioned.url = e2b::sandbox_host_url(config_.dev_server.port, provisioned.handle, config_.domain);

    envd_token_.clear();
    if (body.contains("envdAccessToken") && body["envdAccessToken"].is_string()) {
        envd_token_ = body["envdAccessToken"].get<std::string>();
    }
    return provisioned;
}

ExecResult E2BProvider::exec_backend(const std::string& handle,
                                     const std::vector<std::string>& argv,
                                     long timeout_ms) {
    ExecResult result;
    std::string request = e2b::encode_envelope(e2b::build_start_request(argv, working_dir()));

    HttpResponse response = envd_call(handle, "process.Process/Start", "application/connect+json",
                                      request, timeout_ms);
    if (response.timed_out) {
        std::string ignored;
        e2b::decode_process_stream(response.body, result, ignored);
        result.timed_out = true;
        return result;
    }
    if (!response.ok()) {
        throw_api_error("start process", response);
    }

    std::string error;
    bool ended = e2b::decode_process_stream(response.body, result, error);
    if (!error.empty()) {
        throw EngineError("E2B process stream: " + error, response.status_code);
    }
    if (!ended) {
        throw EngineError("E2B process stream ended without an exit event", response.status_code);
    }
    return result;
}

void E2BProvider::reap_backend(const std::string& handle, const ExecResult& timed_out) {
    if (timed_out.process_ref.empty()) {
        return;
    }

    Json request = Json::object();
    request["process"] = {{"pid", std::stoll(timed_out.process_ref)}};
    request["signal"] = "SIGNAL_SIGKILL";

    HttpResponse response = envd_call(handle, "process.Process/SendSignal", "application/json",
                                      request.dump(), REAP_TIMEOUT_MS);
    if (!response.ok()) {
        throw_api_error("kill process " + timed_out.process_ref, response);
    }
}

void E2BProvider::destroy_backend(const std::string& handle) {
    HttpResponse response = api_call("DELETE", "/sandboxes/" + handle, "", CONTROL_TIMEOUT_MS);
    envd_token_.clear();
    if (!response.ok() && response.status_code != 404) {
        throw_api_error("kill sandbox " + handle, response);
    }
}

bool E2BProvider::probe_backend(const std::string& handle) {
    HttpResponse response = api_call("GET", "/sandboxes/" + handle, "", CONTROL_TIMEOUT_MS);
    if (!response.ok()) {
        return false;
    }
    Json body = Json::parse(response.body);
    std::string state = body.value("state", std::string("running"));
    return state == "running";
}

} // namespace sandforge
