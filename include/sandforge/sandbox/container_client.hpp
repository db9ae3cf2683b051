/*
 * sandforge - Container engine client interface
 *
 * Pure mechanism against a container runtime: no policy, no retries.
 * Failures are reported by throwing EngineError, except exec() where a
 * timeout is data (ExecResult::timed_out).
 */
#ifndef sandforge_SANDBOX_CONTAINER_CLIENT_HPP
#define sandforge_SANDBOX_CONTAINER_CLIENT_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <cstdint>

namespace sandforge {

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> cmd;
    std::vector<std::pair<std::string, std::string> > env;
    std::string working_dir;
    std::vector<std::string> volumes;       // Bind mounts "host:container[:ro]"
    std::vector<int> exposed_ports;         // TCP, each bound to an engine-assigned host port
    std::map<std::string, std::string> labels;

    // Host configuration (enforced by the runtime)
    int64_t memory_bytes;
    int64_t cpu_quota;
    int64_t cpu_period;
    std::string network_mode;
    bool auto_remove;

    ContainerSpec()
        : memory_bytes(0)
        , cpu_quota(0)
        , cpu_period(0)
        , auto_remove(true) {}
};

struct ExecResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code;
    bool timed_out;             // Output is partial, exit_code is meaningless
    std::string process_ref;    // Backend reference used to reap a timed-out process

    ExecResult() : exit_code(0), timed_out(false) {}
};

struct PortBinding {
    std::string host_ip;
    std::string host_port;
};

struct ContainerInspection {
    std::string id;
    std::string status;         // "created", "running", "exited", ...
    bool running;
    std::map<std::string, PortBinding> ports;  // "3000/tcp" -> first published binding

    ContainerInspection() : running(false) {}

    // Host port published for a container TCP port; empty when unassigned
    std::string host_port(int container_port) const;
};

class ContainerClient {
public:
    virtual ~ContainerClient() {}

    // Connectivity probe; never throws
    virtual bool ping() = 0;

    // Blocks until the pull completes
    virtual void pull_image(const std::string& image) = 0;
    virtual bool image_exists(const std::string& image) = 0;

    // Returns the runtime's container id
    virtual std::string create_container(const ContainerSpec& spec) = 0;
    virtual void start_container(const std::string& id) = 0;
    virtual void stop_container(const std::string& id) = 0;
    virtual void remove_container(const std::string& id) = 0;

    // Run argv inside the container, waiting at most timeout_ms (0 = no limit)
    virtual ExecResult exec(const std::string& id,
                            const std::vector<std::string>& argv,
                            long timeout_ms) = 0;

    virtual ContainerInspection inspect(const std::string& id) = 0;
};

} // namespace sandforge

#endif // sandforge_SANDBOX_CONTAINER_CLIENT_HPP
