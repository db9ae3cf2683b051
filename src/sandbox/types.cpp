#include <sandforge/sandbox/types.hpp>
#include <sandforge/core/utils.hpp>

namespace sandforge {

std::string provider_kind_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::VERCEL: return "vercel";
        case ProviderKind::E2B: return "e2b";
        case ProviderKind::SELF_HOSTED: return "self-hosted";
        default: return "self-hosted";
    }
}

bool provider_kind_from_string(const std::string& name, ProviderKind& out) {
    std::string n = to_lower(trim(name));
    if (n == "vercel") {
        out = ProviderKind::VERCEL;
        return true;
    }
    if (n == "e2b") {
        out = ProviderKind::E2B;
        return true;
    }
    if (n == "self-hosted" || n == "self_hosted" || n == "selfhosted" || n == "docker") {
        out = ProviderKind::SELF_HOSTED;
        return true;
    }
    return false;
}

Json SandboxInfo::to_json() const {
    Json j = Json::object();
    j["sandbox_id"] = sandbox_id;
    j["url"] = url;
    j["provider"] = provider_kind_to_string(provider);
    j["created_at"] = format_timestamp(created_at / 1000);
    return j;
}

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::UNPROVISIONED: return "unprovisioned";
        case SandboxState::PROVISIONING: return "provisioning";
        case SandboxState::READY: return "ready";
        case SandboxState::BUSY: return "busy";
        case SandboxState::TERMINATING: return "terminating";
        default: return "unknown";
    }
}

} // namespace sandforge
