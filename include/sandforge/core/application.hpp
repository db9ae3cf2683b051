/*
 * sandforge - Application
 *
 * Central application singleton: parses the command line, loads the
 * configuration, builds the sandbox provider and drives one sandbox
 * through its lifecycle.
 *
 * Modes:
 *   exec <cmd>...  provision, run each command, print results, tear down
 *   serve          provision, scaffold the dev app, start the dev server,
 *                  print the preview URL and wait for SIGINT/SIGTERM
 */
#ifndef sandforge_CORE_APPLICATION_HPP
#define sandforge_CORE_APPLICATION_HPP

#include <sandforge/core/config.hpp>
#include <sandforge/sandbox/provider.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sandforge {

struct AppInfo {
    static constexpr const char* NAME = "sandforge";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

// SIGINT/SIGTERM handler: stops the main loop, nothing else
void handle_shutdown_signal(int sig);

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit without calling run()
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::string provider_override_;
    std::string mode_;
    std::vector<std::string> commands_;
    std::unique_ptr<SandboxProvider> provider_;

    bool parse_args(int argc, char* argv[]);
    void setup_logging();

    int run_exec();
    int run_serve();

    // Sleep in short slices so a signal cuts the wait short
    void wait_ms(int64_t total_ms);
};

} // namespace sandforge

#endif // sandforge_CORE_APPLICATION_HPP
