/*
 * sandforge - Filesystem bridge over a command channel
 *
 * Backends only give us "run argv, collect output". File operations are
 * expressed as argv vectors for standard POSIX tools found in any node
 * image (sh, cat, ls, mkdir, test, pkill).
 *
 * Content is passed as a single argv element, never through a shell
 * string, so no escaping is involved. Limits that follow from that:
 *   - no NUL bytes (argv strings are C strings)
 *   - at most MAX_ARG_BYTES per write (Linux MAX_ARG_STRLEN)
 */
#ifndef sandforge_SANDBOX_SHELL_BRIDGE_HPP
#define sandforge_SANDBOX_SHELL_BRIDGE_HPP

#include <sandforge/core/json.hpp>
#include <string>
#include <vector>

namespace sandforge {
namespace shell_bridge {

// Largest single argv element the kernel accepts, NUL terminator included
const size_t MAX_ARG_BYTES = 128 * 1024;

// sh -c WRITE_SCRIPT sh <content> <path>
extern const char* const WRITE_SCRIPT;

// sh -c EXEC_WRAPPER_SCRIPT <pid_file> <argv...>
// Runs argv under setsid and records its PID, which is also its process
// group id, so a timed-out command can be reaped with its children.
extern const char* const EXEC_WRAPPER_SCRIPT;

// sh -c KILL_SCRIPT sh <pid_file>
// SIGKILLs the recorded process group; a no-op when the file is gone.
extern const char* const KILL_SCRIPT;

std::vector<std::string> write_file_argv(const std::string& path, const std::string& content);
std::vector<std::string> read_file_argv(const std::string& path);
std::vector<std::string> list_files_argv(const std::string& directory);
std::vector<std::string> mkdir_argv(const std::string& directory);
std::vector<std::string> file_exists_argv(const std::string& path);

std::vector<std::string> exec_wrapper_argv(const std::string& pid_file,
                                           const std::vector<std::string>& argv);
std::vector<std::string> kill_argv(const std::string& pid_file);

// Throws IOError when content cannot travel as one argv element
void validate_content(const std::string& path, const std::string& content);

// Relative paths resolve against the sandbox working directory
std::string resolve_path(const std::string& working_dir, const std::string& path);

// Entry names from `ls -la` output. Skips "total" lines, "." and "..".
// The name is everything after the date column, so names containing
// spaces survive; "name -> target" symlink suffixes are stripped. Lines
// with fewer columns than a long listing are taken whole.
std::vector<std::string> parse_ls_output(const std::string& output);

// package.json seeded into a fresh working directory
Json default_manifest();

} // namespace shell_bridge
} // namespace sandforge

#endif // sandforge_SANDBOX_SHELL_BRIDGE_HPP
