/*
 * sandforge - Dev-server bootstrapper
 *
 * Scaffolds a Vite + React app inside any sandbox and (re)starts its dev
 * server, using only the provider contract (install, write, read, run).
 *
 * setup_dev_app() aborts at the first failing step; files already written
 * stay in place. restart_dev_server() is best-effort: kill by name, fixed
 * settle delay, start detached.
 */
#ifndef sandforge_SANDBOX_DEV_SERVER_HPP
#define sandforge_SANDBOX_DEV_SERVER_HPP

#include <sandforge/sandbox/provider.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <string>
#include <vector>

namespace sandforge {

class DevServerBootstrapper : public DevServerCapable {
public:
    DevServerBootstrapper(SandboxProvider& provider, const DevServerOptions& options);

    void setup_dev_app() override;
    void restart_dev_server() override;

    const DevServerOptions& options() const { return options_; }

    // Packages installed by setup_dev_app
    static std::vector<std::string> toolchain_packages();

    // Scaffold file contents
    std::string vite_config() const;
    static std::string main_jsx();
    static std::string app_jsx();
    static std::string index_css();
    static std::string index_html();

    // "vite --host 0.0.0.0 --port <port>"
    std::string dev_script() const;

private:
    SandboxProvider& provider_;
    DevServerOptions options_;

    void write_or_throw(const std::string& path, const std::string& content);
    void rewrite_manifest();
};

} // namespace sandforge

#endif // sandforge_SANDBOX_DEV_SERVER_HPP
