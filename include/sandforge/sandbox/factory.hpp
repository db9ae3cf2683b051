/*
 * sandforge - Provider factory
 *
 * Picks the backend named by sandbox.provider ("vercel", "e2b",
 * "self-hosted"; self-hosted when unset) and hands it its config subtree.
 */
#ifndef sandforge_SANDBOX_FACTORY_HPP
#define sandforge_SANDBOX_FACTORY_HPP

#include <sandforge/sandbox/provider.hpp>
#include <sandforge/sandbox/provider_config.hpp>
#include <sandforge/core/config.hpp>
#include <memory>

namespace sandforge {

// Throws std::invalid_argument for an unknown provider name
std::unique_ptr<SandboxProvider> create_provider(const Config& cfg);

std::unique_ptr<SandboxProvider> create_provider(const SandboxProviderConfig& config);

} // namespace sandforge

#endif // sandforge_SANDBOX_FACTORY_HPP
