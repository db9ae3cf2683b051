#include <sandforge/sandbox/factory.hpp>
#include <sandforge/sandbox/self_hosted_provider.hpp>
#include <sandforge/plugins/vercel/vercel.hpp>
#include <sandforge/plugins/e2b/e2b.hpp>
#include <sandforge/core/logger.hpp>

#include <stdexcept>

namespace sandforge {

std::unique_ptr<SandboxProvider> create_provider(const SandboxProviderConfig& config) {
    LOG_DEBUG("Creating %s provider", provider_kind_to_string(config.provider).c_str());

    switch (config.provider) {
        case ProviderKind::VERCEL:
            return std::unique_ptr<SandboxProvider>(new VercelProvider(config.vercel));
        case ProviderKind::E2B:
            return std::unique_ptr<SandboxProvider>(new E2BProvider(config.e2b));
        case ProviderKind::SELF_HOSTED:
            return std::unique_ptr<SandboxProvider>(new SelfHostedProvider(config.self_hosted));
    }
    throw std::invalid_argument("Unknown sandbox provider kind");
}

std::unique_ptr<SandboxProvider> create_provider(const Config& cfg) {
    return create_provider(SandboxProviderConfig::from_config(cfg));
}

} // namespace sandforge
