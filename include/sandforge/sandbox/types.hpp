/*
 * sandforge - Sandbox data model
 *
 *   SandboxInfo   - caller's handle into one running sandbox (immutable)
 *   CommandResult - outcome of a process run inside a sandbox
 *   SandboxState  - lifecycle of a provider instance
 */
#ifndef sandforge_SANDBOX_TYPES_HPP
#define sandforge_SANDBOX_TYPES_HPP

#include <sandforge/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace sandforge {

enum class ProviderKind {
    VERCEL,
    E2B,
    SELF_HOSTED
};

std::string provider_kind_to_string(ProviderKind kind);

// Accepts "vercel", "e2b", "self-hosted" (also "self_hosted", "docker").
// Returns false for anything else.
bool provider_kind_from_string(const std::string& name, ProviderKind& out);

struct SandboxInfo {
    std::string sandbox_id;
    std::string url;            // Empty until the preview port is resolved
    ProviderKind provider;
    int64_t created_at;         // Unix ms

    SandboxInfo() : provider(ProviderKind::SELF_HOSTED), created_at(0) {}

    Json to_json() const;
};

struct CommandResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code;
    bool success;               // exit_code == 0

    CommandResult() : exit_code(0), success(true) {}

    static CommandResult from_exit(const std::string& out, const std::string& err, int code) {
        CommandResult r;
        r.stdout_text = out;
        r.stderr_text = err;
        r.exit_code = code;
        r.success = (code == 0);
        return r;
    }

    static CommandResult failure(const std::string& err, int code = 1) {
        return from_exit("", err, code);
    }
};

// Exit code reported for commands cut off by the command timeout
// (same convention as coreutils timeout(1))
const int TIMEOUT_EXIT_CODE = 124;

enum class SandboxState {
    UNPROVISIONED,
    PROVISIONING,
    READY,
    BUSY,
    TERMINATING
};

const char* sandbox_state_to_string(SandboxState state);

} // namespace sandforge

#endif // sandforge_SANDBOX_TYPES_HPP
