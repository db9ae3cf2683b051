/*
 * sandforge - Application Implementation
 *
 * Central application singleton managing the lifecycle of one sandbox.
 */
#include <sandforge/core/application.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>
#include <sandforge/sandbox/factory.hpp>
#include <sandforge/sandbox/provider_config.hpp>

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <curl/curl.h>

namespace sandforge {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Sandboxes for generated code\n\n"
              << "Usage: " << prog << " [options] exec <command>...\n"
              << "       " << prog << " [options] serve\n\n"
              << "Options:\n"
              << "  --config FILE    Configuration file (default: config.json)\n"
              << "  --provider NAME  Override sandbox.provider (vercel, e2b, self-hosted)\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n\n"
              << "Example:\n"
              << "  " << prog << " exec \"node --version\" \"ls -la\"\n"
              << "  " << prog << " --provider self-hosted serve\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

// Only flags the main loop; logging here could re-enter the logger's lock
void handle_shutdown_signal(int sig) {
    (void)sig;
    Application::instance().stop();
}

namespace {
    void print_result(const std::string& command, const CommandResult& result) {
        std::cout << "$ " << command << "\n";
        if (!result.stdout_text.empty()) {
            std::cout << result.stdout_text;
            if (result.stdout_text[result.stdout_text.size() - 1] != '\n') std::cout << "\n";
        }
        if (!result.stderr_text.empty()) {
            std::cerr << result.stderr_text;
            if (result.stderr_text[result.stderr_text.size() - 1] != '\n') std::cerr << "\n";
        }
        std::cout << "[exit " << result.exit_code << "]\n";
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json")
    , config_explicit_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_override_ = std::string(argv[++i]);
            continue;
        }
        if (mode_.empty()) {
            mode_ = argv[i];
            continue;
        }
        commands_.push_back(argv[i]);
    }

    if (mode_ != "exec" && mode_ != "serve") {
        print_usage(argv[0]);
        return false;
    }
    if (mode_ == "exec" && commands_.empty()) {
        std::cerr << "exec: no commands given\n";
        return false;
    }
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");
    const char* env_level = getenv("SANDFORGE_LOG_LEVEL");
    if (env_level && env_level[0] != '\0') {
        log_level = env_level;
    }
    Logger::instance().set_level(parse_log_level(to_lower(log_level)));
    if (config_.has("log_color")) {
        Logger::instance().set_color(config_.get_bool("log_color", false));
    }
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before any provider exists)
    curl_global_init(CURL_GLOBAL_ALL);

    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, handle_shutdown_signal);
    signal(SIGTERM, handle_shutdown_signal);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!config_.load_file(config_file_)) {
        if (config_explicit_) {
            LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
            return false;
        }
        LOG_WARN("No usable %s, using defaults and environment", config_file_.c_str());
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    if (!provider_override_.empty()) {
        config_.set_string("sandbox.provider", provider_override_);
    }

    setup_logging();

    try {
        provider_ = create_provider(config_);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot create sandbox provider: %s", e.what());
        return false;
    }
    LOG_INFO("Sandbox provider: %s", provider_->name().c_str());
    return true;
}

void Application::wait_ms(int64_t total_ms) {
    int64_t deadline = current_timestamp_ms() + total_ms;
    while (running_.load() && current_timestamp_ms() < deadline) {
        sleep_ms(100);
    }
}

int Application::run_exec() {
    SandboxInfo info = provider_->create_sandbox();
    std::cout << "sandbox " << info.sandbox_id << " (" << provider_->name() << ")\n";

    int failures = 0;
    for (size_t i = 0; i < commands_.size() && running_.load(); ++i) {
        CommandResult result = provider_->run_command(commands_[i]);
        print_result(commands_[i], result);
        if (!result.success) {
            ++failures;
        }
    }
    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
        return 1;
    }
    return failures == 0 ? 0 : 1;
}

int Application::run_serve() {
    SandboxInfo info = provider_->create_sandbox();
    LOG_INFO("Sandbox %s created", info.sandbox_id.c_str());

    if (!provider_->dev_server()) {
        LOG_ERROR("The %s provider cannot run a dev server", provider_->name().c_str());
        return 1;
    }
    provider_->setup_dev_app();
    provider_->restart_dev_server();

    SandboxProviderConfig pcfg = SandboxProviderConfig::from_config(config_);
    int64_t startup_ms = config_.get_int("sandbox.dev_server_startup_ms",
                                         pcfg.self_hosted.dev_server_startup_ms);
    LOG_INFO("Waiting %lld ms for the dev server", static_cast<long long>(startup_ms));
    wait_ms(startup_ms);
    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
        return 0;
    }

    std::optional<std::string> url = provider_->sandbox_url();
    if (url) {
        std::cout << "Preview: " << *url << "\n" << std::flush;
    } else {
        LOG_WARN("Preview URL not available yet");
    }

    LOG_INFO("Serving (poll interval: 100ms), press Ctrl+C to stop");
    int checks = 0;
    while (running_.load()) {
        sleep_ms(100);

        // Liveness check (~10 seconds)
        if (++checks >= 100) {
            checks = 0;
            if (!provider_->is_alive()) {
                LOG_ERROR("Sandbox %s is no longer running", info.sandbox_id.c_str());
                return 1;
            }
        }
    }
    LOG_INFO("Received shutdown signal");
    return 0;
}

int Application::run() {
    try {
        if (mode_ == "exec") {
            return run_exec();
        }
        return run_serve();
    } catch (const ProvisionError& e) {
        LOG_ERROR("Provisioning failed: %s", e.what());
    } catch (const SandboxError& e) {
        LOG_ERROR("%s", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: %s", e.what());
    }
    return 1;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (provider_) {
        provider_->terminate();
        provider_.reset();
    }

    // Cleanup libcurl
    curl_global_cleanup();

    LOG_INFO("Goodbye!");
}

} // namespace sandforge
