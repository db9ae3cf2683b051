/*
 * sandforge - Docker Engine API client
 *
 * Talks HTTP to the Docker daemon through libcurl, either over the unix
 * socket (default /var/run/docker.sock) or over TCP (DOCKER_HOST).
 *
 * Endpoints used:
 *   GET    /_ping
 *   GET    /images/{name}/json          POST /images/create?fromImage=&tag=
 *   POST   /containers/create?name=     POST /containers/{id}/start|stop
 *   DELETE /containers/{id}?force=true  GET  /containers/{id}/json
 *   POST   /containers/{id}/exec        POST /exec/{id}/start   GET /exec/{id}/json
 */
#ifndef sandforge_SANDBOX_DOCKER_CLIENT_HPP
#define sandforge_SANDBOX_DOCKER_CLIENT_HPP

#include <sandforge/sandbox/container_client.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/core/http_client.hpp>
#include <sandforge/core/json.hpp>
#include <string>

namespace sandforge {

// Wire-format helpers, exposed for tests
namespace docker {

// Split the multiplexed exec stream (8-byte frame headers, stream id 1 =
// stdout, 2 = stderr). Data without valid frame headers is treated as raw
// stdout (TTY mode). Returns false if the stream ends mid-frame.
bool demux_stream(const std::string& raw, std::string& out, std::string& err);

// "node:18-alpine" -> ("node", "18-alpine"); "repo/img" -> ("repo/img", "latest").
// Digests ("img@sha256:...") are returned whole with an empty tag.
void split_image_reference(const std::string& image, std::string& repo, std::string& tag);

// Body for POST /containers/create
Json build_create_body(const ContainerSpec& spec);

// Parse the body of GET /containers/{id}/json
ContainerInspection parse_inspection(const Json& body);

// Scan the NDJSON progress stream of an image pull. Returns false and sets
// error when the daemon reported a failure inside a 200 response.
bool check_pull_progress(const std::string& body, std::string& error);

// Human-readable message from a Docker error body ({"message": "..."})
std::string error_message(const HttpResponse& response);

} // namespace docker

class DockerClient : public ContainerClient {
public:
    explicit DockerClient(const DockerConnection& connection);

    bool ping() override;
    void pull_image(const std::string& image) override;
    bool image_exists(const std::string& image) override;

    std::string create_container(const ContainerSpec& spec) override;
    void start_container(const std::string& id) override;
    void stop_container(const std::string& id) override;
    void remove_container(const std::string& id) override;

    ExecResult exec(const std::string& id,
                    const std::vector<std::string>& argv,
                    long timeout_ms) override;

    ContainerInspection inspect(const std::string& id) override;

    const DockerConnection& connection() const { return connection_; }

private:
    DockerConnection connection_;
    std::string base_url_;
    long pull_timeout_ms_;
    long stop_grace_seconds_;

    // Fresh client per call; curl easy handles are not shared across threads
    HttpResponse call(const std::string& method,
                      const std::string& path,
                      const std::string& body = "",
                      long timeout_ms = 0);
};

} // namespace sandforge

#endif // sandforge_SANDBOX_DOCKER_CLIENT_HPP
