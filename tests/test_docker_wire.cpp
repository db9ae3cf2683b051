#include <sandforge/sandbox/docker_client.hpp>
#include <sandforge/core/http_client.hpp>
#include <sandforge/core/utils.hpp>
#include "scripted_http_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <unistd.h>

namespace sandforge {
namespace {

std::string frame(unsigned char stream, const std::string& payload) {
    std::string out;
    out.push_back(static_cast<char>(stream));
    out.append(3, '\0');
    size_t n = payload.size();
    out.push_back(static_cast<char>((n >> 24) & 0xff));
    out.push_back(static_cast<char>((n >> 16) & 0xff));
    out.push_back(static_cast<char>((n >> 8) & 0xff));
    out.push_back(static_cast<char>(n & 0xff));
    out.append(payload);
    return out;
}

// ============================================================================
// Exec stream demultiplexing
// ============================================================================

TEST(DemuxStreamTest, SplitsStdoutAndStderr) {
    std::string raw = frame(1, "hello ") + frame(2, "warning\n") + frame(1, "world\n");
    std::string out, err;

    EXPECT_TRUE(docker::demux_stream(raw, out, err));
    EXPECT_EQ("hello world\n", out);
    EXPECT_EQ("warning\n", err);
}

TEST(DemuxStreamTest, LargeFrame) {
    std::string payload(70000, 'z');
    std::string out, err;

    EXPECT_TRUE(docker::demux_stream(frame(1, payload), out, err));
    EXPECT_EQ(payload, out);
    EXPECT_TRUE(err.empty());
}

TEST(DemuxStreamTest, RawTtyOutputIsStdout) {
    std::string out, err;
    EXPECT_TRUE(docker::demux_stream("v18.20.4\n", out, err));
    EXPECT_EQ("v18.20.4\n", out);
    EXPECT_TRUE(err.empty());

    out.clear();
    EXPECT_TRUE(docker::demux_stream("ok", out, err));
    EXPECT_EQ("ok", out);
}

TEST(DemuxStreamTest, TruncatedFrameKeepsPartialOutput) {
    std::string raw = frame(1, "complete\n") + frame(2, "cut off here").substr(0, 8 + 3);
    std::string out, err;

    EXPECT_FALSE(docker::demux_stream(raw, out, err));
    EXPECT_EQ("complete\n", out);
    EXPECT_EQ("cut", err);
}

TEST(DemuxStreamTest, EmptyStream) {
    std::string out, err;
    EXPECT_TRUE(docker::demux_stream("", out, err));
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(err.empty());
}

// ============================================================================
// Image references
// ============================================================================

TEST(ImageReferenceTest, Split) {
    std::string repo, tag;

    docker::split_image_reference("node:18-alpine", repo, tag);
    EXPECT_EQ("node", repo);
    EXPECT_EQ("18-alpine", tag);

    docker::split_image_reference("ghcr.io/acme/runner", repo, tag);
    EXPECT_EQ("ghcr.io/acme/runner", repo);
    EXPECT_EQ("latest", tag);

    docker::split_image_reference("registry.local:5000/node", repo, tag);
    EXPECT_EQ("registry.local:5000/node", repo);
    EXPECT_EQ("latest", tag);

    docker::split_image_reference("registry.local:5000/node:20", repo, tag);
    EXPECT_EQ("registry.local:5000/node", repo);
    EXPECT_EQ("20", tag);

    docker::split_image_reference("node@sha256:abcd", repo, tag);
    EXPECT_EQ("node@sha256:abcd", repo);
    EXPECT_TRUE(tag.empty());
}

// ============================================================================
// Container create body
// ============================================================================

TEST(CreateBodyTest, CarriesContainerSpec) {
    ContainerSpec spec;
    spec.name = "sandbox-1-abc";
    spec.image = "node:18-alpine";
    spec.cmd = {"tail", "-f", "/dev/null"};
    spec.env.push_back(std::make_pair(std::string("NODE_ENV"), std::string("development")));
    spec.working_dir = "/app";
    spec.volumes.push_back("/srv/cache:/cache:ro");
    spec.exposed_ports = {3000, 8080};
    spec.labels["sandforge.sandbox_id"] = "sandbox-1-abc";
    spec.memory_bytes = 536870912;
    spec.cpu_quota = 50000;
    spec.cpu_period = 100000;
    spec.network_mode = "bridge";

    Json body = docker::build_create_body(spec);

    EXPECT_EQ("node:18-alpine", body["Image"].get<std::string>());
    EXPECT_EQ(3u, body["Cmd"].size());
    EXPECT_EQ("NODE_ENV=development", body["Env"][0].get<std::string>());
    EXPECT_EQ("/app", body["WorkingDir"].get<std::string>());
    EXPECT_EQ("sandbox-1-abc", body["Labels"]["sandforge.sandbox_id"].get<std::string>());
    EXPECT_TRUE(body["ExposedPorts"].contains("3000/tcp"));
    EXPECT_TRUE(body["ExposedPorts"].contains("8080/tcp"));

    const Json& host = body["HostConfig"];
    EXPECT_EQ(536870912, host["Memory"].get<int64_t>());
    EXPECT_EQ(50000, host["CpuQuota"].get<int64_t>());
    EXPECT_EQ(100000, host["CpuPeriod"].get<int64_t>());
    EXPECT_EQ("bridge", host["NetworkMode"].get<std::string>());
    EXPECT_TRUE(host["AutoRemove"].get<bool>());
    EXPECT_EQ("/srv/cache:/cache:ro", host["Binds"][0].get<std::string>());
    EXPECT_EQ("0", host["PortBindings"]["3000/tcp"][0]["HostPort"].get<std::string>());
}

TEST(CreateBodyTest, OmitsUnsetLimits) {
    ContainerSpec spec;
    spec.image = "alpine";

    Json body = docker::build_create_body(spec);
    EXPECT_FALSE(body.contains("Cmd"));
    EXPECT_FALSE(body.contains("ExposedPorts"));
    EXPECT_FALSE(body["HostConfig"].contains("Memory"));
    EXPECT_FALSE(body["HostConfig"].contains("NetworkMode"));
}

// ============================================================================
// Inspection
// ============================================================================

TEST(InspectionTest, PublishedPorts) {
    Json body = Json::parse(R"({
        "Id": "c0ffee",
        "State": {"Status": "running", "Running": true},
        "NetworkSettings": {"Ports": {
            "3000/tcp": [{"HostIp": "::", "HostPort": "49154"},
                         {"HostIp": "0.0.0.0", "HostPort": "49153"}],
            "4000/tcp": null,
            "5000/tcp": [],
            "8080/tcp": [{"HostIp": "", "HostPort": "49160"}]
        }}
    })");

    ContainerInspection info = docker::parse_inspection(body);
    EXPECT_EQ("c0ffee", info.id);
    EXPECT_EQ("running", info.status);
    EXPECT_TRUE(info.running);
    EXPECT_EQ("49153", info.host_port(3000));
    EXPECT_EQ("49160", info.host_port(8080));
    EXPECT_EQ("", info.host_port(4000));
    EXPECT_EQ("", info.host_port(5000));
    EXPECT_EQ("", info.host_port(9999));
}

TEST(InspectionTest, StoppedContainerWithoutNetwork) {
    Json body = Json::parse(R"({"Id": "dead", "State": {"Status": "exited", "Running": false}})");

    ContainerInspection info = docker::parse_inspection(body);
    EXPECT_FALSE(info.running);
    EXPECT_EQ("exited", info.status);
    EXPECT_TRUE(info.ports.empty());

    EXPECT_FALSE(docker::parse_inspection(Json()).running);
}

// ============================================================================
// Pull progress and errors
// ============================================================================

TEST(PullProgressTest, Success) {
    std::string body =
        "{\"status\":\"Pulling from library/node\",\"id\":\"18-alpine\"}\n"
        "{\"status\":\"Downloading\",\"progressDetail\":{\"current\":1,\"total\":2}}\n"
        "{\"status\":\"Status: Downloaded newer image for node:18-alpine\"}\n";
    std::string error;
    EXPECT_TRUE(docker::check_pull_progress(body, error));
    EXPECT_TRUE(error.empty());
}

TEST(PullProgressTest, ErrorInsideOkResponse) {
    std::string body =
        "{\"status\":\"Pulling from library/nope\"}\n"
        "{\"errorDetail\":{\"message\":\"manifest unknown\"},\"error\":\"manifest unknown\"}\n";
    std::string error;
    EXPECT_FALSE(docker::check_pull_progress(body, error));
    EXPECT_EQ("manifest unknown", error);
}

TEST(ErrorMessageTest, DockerBodies) {
    HttpResponse not_found;
    not_found.status_code = 404;
    not_found.body = "{\"message\":\"No such container: abc\"}";
    EXPECT_EQ("No such container: abc", docker::error_message(not_found));

    HttpResponse transport;
    transport.status_code = 0;
    transport.error = "Couldn't connect to server";
    EXPECT_EQ("Couldn't connect to server", docker::error_message(transport));

    HttpResponse plain;
    plain.status_code = 500;
    plain.body = "  page not found\n";
    EXPECT_EQ("page not found", docker::error_message(plain));

    HttpResponse empty;
    empty.status_code = 502;
    EXPECT_EQ("HTTP 502", docker::error_message(empty));
}

TEST(ErrorMessageTest, ApiErrorObjects) {
    HttpResponse nested;
    nested.status_code = 403;
    nested.body = "{\"error\":{\"code\":\"forbidden\",\"message\":\"Not authorized\"}}";
    EXPECT_EQ("Not authorized", nested.error_message());

    HttpResponse flat;
    flat.status_code = 400;
    flat.body = "{\"error\":\"bad template\"}";
    EXPECT_EQ("bad template", flat.error_message());
}

TEST(HttpResponseTest, HeaderLookupIgnoresCase) {
    HttpResponse response;
    response.headers["Content-Type"] = "application/json";
    EXPECT_EQ("application/json", response.header("content-type"));
    EXPECT_EQ("", response.header("x-missing"));
}

// ============================================================================
// Exec deadline against a slow engine
// ============================================================================

std::string engine_socket(const char* name) {
    return "/tmp/sandforge-" + std::string(name) + "-" + std::to_string(getpid()) + ".sock";
}

long elapsed_since(std::chrono::steady_clock::time_point started) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
}

TEST(DockerExecDeadlineTest, SlowExecCreateIsCutAtTimeout) {
    fakes::ScriptedHttpServer engine(engine_socket("create"));
    engine.route("POST /v1.41/containers/c0ffee/exec", 201, "{\"Id\":\"e1\"}", 1000);
    ASSERT_TRUE(engine.listening());
    engine.start();

    DockerConnection connection;
    connection.socket_path = engine_socket("create");
    DockerClient client(connection);

    auto started = std::chrono::steady_clock::now();
    ExecResult result = client.exec("c0ffee", {"sleep", "5"}, 100);

    EXPECT_TRUE(result.timed_out);
    EXPECT_LE(elapsed_since(started), 150);
    EXPECT_FALSE(engine.received("POST /v1.41/exec/e1/start"));
}

TEST(DockerExecDeadlineTest, SlowExitCodePollIsCutAtTimeout) {
    fakes::ScriptedHttpServer engine(engine_socket("poll"));
    engine.route("POST /v1.41/containers/c0ffee/exec", 201, "{\"Id\":\"e1\"}");
    engine.route("POST /v1.41/exec/e1/start", 200, frame(1, "partial\n"));
    engine.route("GET /v1.41/exec/e1/json", 200, "{\"Running\":false,\"ExitCode\":0}", 1000);
    ASSERT_TRUE(engine.listening());
    engine.start();

    DockerConnection connection;
    connection.socket_path = engine_socket("poll");
    DockerClient client(connection);

    auto started = std::chrono::steady_clock::now();
    ExecResult result = client.exec("c0ffee", {"true"}, 200);

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ("partial\n", result.stdout_text);
    EXPECT_LE(elapsed_since(started), 250);
}

TEST(DockerExecDeadlineTest, FastEngineReportsExitCode) {
    fakes::ScriptedHttpServer engine(engine_socket("fast"));
    engine.route("POST /v1.41/containers/c0ffee/exec", 201, "{\"Id\":\"e1\"}");
    engine.route("POST /v1.41/exec/e1/start", 200, frame(1, "out\n") + frame(2, "err\n"));
    engine.route("GET /v1.41/exec/e1/json", 200, "{\"Running\":false,\"ExitCode\":3}");
    ASSERT_TRUE(engine.listening());
    engine.start();

    DockerConnection connection;
    connection.socket_path = engine_socket("fast");
    DockerClient client(connection);

    ExecResult result = client.exec("c0ffee", {"sh", "-c", "exit 3"}, 5000);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(3, result.exit_code);
    EXPECT_EQ("out\n", result.stdout_text);
    EXPECT_EQ("err\n", result.stderr_text);
    EXPECT_EQ("e1", result.process_ref);
}

} // namespace
} // namespace sandforge
