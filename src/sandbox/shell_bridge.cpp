#include <sandforge/sandbox/shell_bridge.hpp>
#include <sandforge/sandbox/errors.hpp>
#include <sandforge/core/utils.hpp>

namespace sandforge {
namespace shell_bridge {

const char* const WRITE_SCRIPT =
    "mkdir -p \"$(dirname \"$2\")\" && printf %s \"$1\" > \"$2\"";

// The command leads its own process group, so the recorded pid is also
// the group id and a kill reaches everything it spawned.
const char* const EXEC_WRAPPER_SCRIPT =
    "setsid \"$@\" & p=$!; echo $p > \"$0\"; wait $p; rc=$?; rm -f \"$0\"; exit $rc";

const char* const KILL_SCRIPT =
    "p=$(cat \"$1\" 2>/dev/null) || exit 0; "
    "kill -s KILL -- \"-$p\" 2>/dev/null || kill -s KILL \"$p\" 2>/dev/null; "
    "rm -f \"$1\"; exit 0";

std::vector<std::string> write_file_argv(const std::string& path, const std::string& content) {
    std::vector<std::string> argv;
    argv.push_back("sh");
    argv.push_back("-c");
    argv.push_back(WRITE_SCRIPT);
    argv.push_back("sh");
    argv.push_back(content);
    argv.push_back(path);
    return argv;
}

std::vector<std::string> read_file_argv(const std::string& path) {
    std::vector<std::string> argv;
    argv.push_back("cat");
    argv.push_back(path);
    return argv;
}

std::vector<std::string> list_files_argv(const std::string& directory) {
    std::vector<std::string> argv;
    argv.push_back("ls");
    argv.push_back("-la");
    argv.push_back(directory);
    return argv;
}

std::vector<std::string> mkdir_argv(const std::string& directory) {
    std::vector<std::string> argv;
    argv.push_back("mkdir");
    argv.push_back("-p");
    argv.push_back(directory);
    return argv;
}

std::vector<std::string> file_exists_argv(const std::string& path) {
    std::vector<std::string> argv;
    argv.push_back("test");
    argv.push_back("-f");
    argv.push_back(path);
    return argv;
}

std::vector<std::string> exec_wrapper_argv(const std::string& pid_file,
                                           const std::vector<std::string>& argv) {
    std::vector<std::string> wrapped;
    wrapped.reserve(argv.size() + 4);
    wrapped.push_back("sh");
    wrapped.push_back("-c");
    wrapped.push_back(EXEC_WRAPPER_SCRIPT);
    wrapped.push_back(pid_file);
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());
    return wrapped;
}

std::vector<std::string> kill_argv(const std::string& pid_file) {
    std::vector<std::string> argv;
    argv.push_back("sh");
    argv.push_back("-c");
    argv.push_back(KILL_SCRIPT);
    argv.push_back("sh");
    argv.push_back(pid_file);
    return argv;
}

void validate_content(const std::string& path, const std::string& content) {
    if (content.find('\0') != std::string::npos) {
        throw IOError("write_file " + path + ": content contains NUL bytes");
    }
    if (content.size() >= MAX_ARG_BYTES) {
        throw IOError("write_file " + path + ": content is " + std::to_string(content.size()) +
                      " bytes, limit is " + std::to_string(MAX_ARG_BYTES - 1));
    }
}

std::string resolve_path(const std::string& working_dir, const std::string& path) {
    if (path.empty() || path == ".") {
        return working_dir;
    }
    if (path[0] == '/') {
        return path;
    }
    std::string rel = path;
    while (starts_with(rel, "./")) {
        rel = rel.substr(2);
    }
    return join_path(working_dir, rel);
}

std::vector<std::string> parse_ls_output(const std::string& output) {
    std::vector<std::string> names;
    std::vector<std::string> lines = split(output, '\n');

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = rtrim(lines[i]);
        if (trim(line).empty() || starts_with(trim(line), "total ")) {
            continue;
        }

        // Locate the start of each whitespace-separated column
        std::vector<size_t> starts;
        size_t pos = 0;
        while (pos < line.size()) {
            while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;
            if (pos >= line.size()) break;
            starts.push_back(pos);
            while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t') ++pos;
        }

        // perms links owner group size month day time|year name
        size_t name_column = 8;
        if (starts.size() > 5) {
            // Device nodes print "major, minor" in place of the size
            std::string size_col = line.substr(starts[4], starts[5] - starts[4]);
            if (ends_with(trim(size_col), ",")) {
                name_column = 9;
            }
        }

        std::string name;
        if (starts.size() > name_column) {
            name = line.substr(starts[name_column]);
            if (!line.empty() && line[starts[0]] == 'l') {
                size_t arrow = name.find(" -> ");
                if (arrow != std::string::npos) {
                    name = name.substr(0, arrow);
                }
            }
        } else {
            name = trim(line);
        }

        if (name.empty() || name == "." || name == "..") {
            continue;
        }
        names.push_back(name);
    }
    return names;
}

Json default_manifest() {
    Json scripts = Json::object();
    scripts["dev"] = "vite";
    scripts["build"] = "vite build";
    scripts["preview"] = "vite preview";

    Json manifest = Json::object();
    manifest["name"] = "sandbox-project";
    manifest["version"] = "1.0.0";
    manifest["scripts"] = scripts;
    manifest["dependencies"] = Json::object();
    return manifest;
}

} // namespace shell_bridge
} // namespace sandforge
