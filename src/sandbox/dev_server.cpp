#include <sandforge/sandbox/dev_server.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>
#include <sandforge/core/json.hpp>

namespace sandforge {

DevServerBootstrapper::DevServerBootstrapper(SandboxProvider& provider, const DevServerOptions& options)
    : provider_(provider)
    , options_(options)
{}

std::vector<std::string> DevServerBootstrapper::toolchain_packages() {
    std::vector<std::string> packages;
    packages.push_back("vite");
    packages.push_back("@vitejs/plugin-react");
    packages.push_back("react");
    packages.push_back("react-dom");
    return packages;
}

std::string DevServerBootstrapper::dev_script() const {
    return "vite --host 0.0.0.0 --port " + std::to_string(options_.port);
}

// ============================================================================
// Scaffold files
// ============================================================================

std::string DevServerBootstrapper::vite_config() const {
    return "import { defineConfig } from 'vite'\n"
           "import react from '@vitejs/plugin-react'\n"
           "\n"
           "export default defineConfig({\n"
           "  plugins: [react()],\n"
           "  server: {\n"
           "    host: '0.0.0.0',\n"
           "    port: " + std::to_string(options_.port) + "\n"
           "  }\n"
           "})\n";
}

std::string DevServerBootstrapper::main_jsx() {
    return "import React from 'react'\n"
           "import ReactDOM from 'react-dom/client'\n"
           "import App from './App.jsx'\n"
           "import './index.css'\n"
           "\n"
           "ReactDOM.createRoot(document.getElementById('root')).render(\n"
           "  <React.StrictMode>\n"
           "    <App />\n"
           "  </React.StrictMode>,\n"
           ")\n";
}

std::string DevServerBootstrapper::app_jsx() {
    return "import React from 'react'\n"
           "\n"
           "function App() {\n"
           "  return (\n"
           "    <div className=\"App\">\n"
           "      <h1>Hello from your sandbox!</h1>\n"
           "      <p>Edit src/App.jsx and the page reloads.</p>\n"
           "    </div>\n"
           "  )\n"
           "}\n"
           "\n"
           "export default App\n";
}

std::string DevServerBootstrapper::index_css() {
    return ":root {\n"
           "  font-family: Inter, system-ui, Avenir, Helvetica, Arial, sans-serif;\n"
           "  line-height: 1.5;\n"
           "  font-weight: 400;\n"
           "  color-scheme: light dark;\n"
           "  color: rgba(255, 255, 255, 0.87);\n"
           "  background-color: #242424;\n"
           "}\n"
           "\n"
           "* {\n"
           "  margin: 0;\n"
           "  padding: 0;\n"
           "  box-sizing: border-box;\n"
           "}\n"
           "\n"
           "body {\n"
           "  min-height: 100vh;\n"
           "  display: flex;\n"
           "  place-items: center;\n"
           "}\n"
           "\n"
           ".App {\n"
           "  text-align: center;\n"
           "  padding: 2rem;\n"
           "}\n"
           "\n"
           "h1 {\n"
           "  font-size: 3.2em;\n"
           "  line-height: 1.1;\n"
           "  margin-bottom: 1rem;\n"
           "}\n"
           "\n"
           "p {\n"
           "  font-size: 1.2em;\n"
           "}\n";
}

std::string DevServerBootstrapper::index_html() {
    return "<!DOCTYPE html>\n"
           "<html lang=\"en\">\n"
           "  <head>\n"
           "    <meta charset=\"UTF-8\" />\n"
           "    <link rel=\"icon\" type=\"image/svg+xml\" href=\"/vite.svg\" />\n"
           "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\" />\n"
           "    <title>Sandbox</title>\n"
           "  </head>\n"
           "  <body>\n"
           "    <div id=\"root\"></div>\n"
           "    <script type=\"module\" src=\"/src/main.jsx\"></script>\n"
           "  </body>\n"
           "</html>\n";
}

// ============================================================================
// Operations
// ============================================================================

void DevServerBootstrapper::write_or_throw(const std::string& path, const std::string& content) {
    LOG_DEBUG("Scaffolding %s", path.c_str());
    provider_.write_file(path, content);
}

void DevServerBootstrapper::rewrite_manifest() {
    std::string raw = provider_.read_file("package.json");

    Json manifest;
    try {
        manifest = Json::parse(raw);
    } catch (const std::exception& e) {
        throw IOError(std::string("package.json is not valid JSON: ") + e.what());
    }
    if (!manifest.is_object()) {
        throw IOError("package.json is not a JSON object");
    }
    if (!manifest.contains("scripts") || !manifest["scripts"].is_object()) {
        manifest["scripts"] = Json::object();
    }
    manifest["scripts"]["dev"] = dev_script();

    provider_.write_file("package.json", manifest.dump(2));
}

void DevServerBootstrapper::setup_dev_app() {
    LOG_INFO("Setting up Vite + React app on port %d", options_.port);

    CommandResult installed = provider_.install_packages(toolchain_packages());
    if (!installed.success) {
        throw IOError("installing dev toolchain failed (exit " + std::to_string(installed.exit_code) +
                      "): " + truncate_safe(trim(installed.stderr_text), 500));
    }

    write_or_throw("vite.config.js", vite_config());

    std::vector<std::string> mkdir_src;
    mkdir_src.push_back("mkdir");
    mkdir_src.push_back("-p");
    mkdir_src.push_back("src");
    CommandResult made = provider_.run_command_argv(mkdir_src);
    if (!made.success) {
        throw IOError("mkdir src failed: " + trim(made.stderr_text));
    }

    write_or_throw("src/main.jsx", main_jsx());
    write_or_throw("src/App.jsx", app_jsx());
    write_or_throw("src/index.css", index_css());
    write_or_throw("index.html", index_html());

    rewrite_manifest();
    LOG_INFO("Vite app scaffolded");
}

void DevServerBootstrapper::restart_dev_server() {
    // "[v]ite" keeps pkill from matching the shell that runs it
    std::vector<std::string> kill;
    kill.push_back("pkill");
    kill.push_back("-f");
    kill.push_back("[v]ite");
    CommandResult killed = provider_.run_command_argv(kill);
    LOG_DEBUG("pkill vite: exit %d", killed.exit_code);

    sleep_ms(options_.settle_ms);

    std::vector<std::string> start;
    start.push_back("sh");
    start.push_back("-c");
    start.push_back("nohup " + options_.package_manager + " run dev > " + options_.log_path + " 2>&1 &");
    CommandResult started = provider_.run_command_argv(start);
    if (!started.success) {
        throw IOError("starting dev server failed: " + trim(started.stderr_text));
    }
    LOG_INFO("Dev server starting on port %d (log: %s)", options_.port, options_.log_path.c_str());
}

} // namespace sandforge
