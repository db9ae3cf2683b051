#include <sandforge/sandbox/self_hosted_provider.hpp>
#include <sandforge/core/json.hpp>
#include "fake_container_client.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <regex>
#include <thread>

namespace sandforge {
namespace {

using fakes::FakeContainerClient;

class SelfHostedProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.dev_server.settle_ms = 0;
        rebuild();
    }

    void rebuild() {
        provider_.reset();
        fake_ = new FakeContainerClient;
        provider_.reset(new SelfHostedProvider(config_, std::unique_ptr<ContainerClient>(fake_)));
    }

    SelfHostedConfig config_;
    FakeContainerClient* fake_ = nullptr;   // Owned by provider_
    std::unique_ptr<SelfHostedProvider> provider_;
};

// ============================================================================
// Before create / after terminate
// ============================================================================

TEST_F(SelfHostedProviderTest, OperationsBeforeCreateThrowNotProvisioned) {
    EXPECT_THROW(provider_->run_command("echo hi"), NotProvisionedError);
    EXPECT_THROW(provider_->run_command_argv({"echo", "hi"}), NotProvisionedError);
    EXPECT_THROW(provider_->write_file("a.txt", "x"), NotProvisionedError);
    EXPECT_THROW(provider_->read_file("a.txt"), NotProvisionedError);
    EXPECT_THROW(provider_->list_files(), NotProvisionedError);
    EXPECT_THROW(provider_->install_packages({"left-pad"}), NotProvisionedError);

    EXPECT_FALSE(provider_->is_alive());
    EXPECT_FALSE(provider_->sandbox_info().has_value());
    EXPECT_FALSE(provider_->sandbox_url().has_value());
    EXPECT_EQ(SandboxState::UNPROVISIONED, provider_->state());
    EXPECT_TRUE(fake_->commands.empty());
}

TEST_F(SelfHostedProviderTest, NotProvisionedNamesTheOperation) {
    try {
        provider_->read_file("package.json");
        FAIL() << "expected NotProvisionedError";
    } catch (const NotProvisionedError& e) {
        EXPECT_EQ("read_file", e.operation());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("create_sandbox"));
    }
}

TEST_F(SelfHostedProviderTest, TerminateWithoutSandboxIsNoop) {
    EXPECT_NO_THROW(provider_->terminate());
    EXPECT_TRUE(fake_->stopped.empty());
    EXPECT_TRUE(fake_->removed.empty());
}

// ============================================================================
// Provisioning
// ============================================================================

TEST_F(SelfHostedProviderTest, CreateReturnsLiveSandbox) {
    SandboxInfo info = provider_->create_sandbox();

    EXPECT_TRUE(std::regex_match(info.sandbox_id, std::regex("sandbox-[0-9]+-[0-9a-z]{9}")))
        << info.sandbox_id;
    EXPECT_EQ(ProviderKind::SELF_HOSTED, info.provider);
    EXPECT_EQ("http://localhost:32768", info.url);
    EXPECT_GT(info.created_at, 0);

    EXPECT_TRUE(provider_->is_alive());
    EXPECT_EQ(SandboxState::READY, provider_->state());

    std::optional<SandboxInfo> current = provider_->sandbox_info();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(info.sandbox_id, current->sandbox_id);

    provider_->run_command("echo still here");
    ASSERT_TRUE(provider_->sandbox_info().has_value());
    EXPECT_EQ(info.sandbox_id, provider_->sandbox_info()->sandbox_id);
}

TEST_F(SelfHostedProviderTest, ContainerSpecCarriesLimitsPortsAndEnv) {
    config_.resources.memory_bytes = 256LL * 1024 * 1024;
    config_.resources.cpu_quota = 25000;
    config_.network.mode = "none";
    config_.env.push_back(std::make_pair(std::string("API_BASE"), std::string("http://example.test")));
    rebuild();

    SandboxInfo info = provider_->create_sandbox();
    ASSERT_EQ(1u, fake_->created.size());
    const ContainerSpec& spec = fake_->created[0];

    EXPECT_EQ(info.sandbox_id, spec.name);
    EXPECT_EQ("node:18-alpine", spec.image);
    EXPECT_EQ("/app", spec.working_dir);
    EXPECT_EQ(std::vector<std::string>({"tail", "-f", "/dev/null"}), spec.cmd);
    EXPECT_EQ(256LL * 1024 * 1024, spec.memory_bytes);
    EXPECT_EQ(25000, spec.cpu_quota);
    EXPECT_EQ(100000, spec.cpu_period);
    EXPECT_EQ("none", spec.network_mode);
    EXPECT_TRUE(spec.auto_remove);

    ASSERT_FALSE(spec.exposed_ports.empty());
    EXPECT_EQ(3000, spec.exposed_ports[0]);
    EXPECT_EQ(1, std::count(spec.exposed_ports.begin(), spec.exposed_ports.end(), 3000));
    EXPECT_NE(spec.exposed_ports.end(), std::find(spec.exposed_ports.begin(), spec.exposed_ports.end(), 8080));

    bool node_env = false;
    bool api_base = false;
    for (size_t i = 0; i < spec.env.size(); ++i) {
        if (spec.env[i].first == "NODE_ENV" && spec.env[i].second == "development") node_env = true;
        if (spec.env[i].first == "API_BASE" && spec.env[i].second == "http://example.test") api_base = true;
    }
    EXPECT_TRUE(node_env);
    EXPECT_TRUE(api_base);
}

TEST_F(SelfHostedProviderTest, CreateSeedsDefaultManifest) {
    provider_->create_sandbox();

    Json manifest = Json::parse(provider_->read_file("package.json"));
    EXPECT_EQ("sandbox-project", manifest["name"]);
    EXPECT_EQ("1.0.0", manifest["version"]);
    EXPECT_EQ("vite", manifest["scripts"]["dev"]);
    EXPECT_EQ("vite build", manifest["scripts"]["build"]);
    EXPECT_EQ("vite preview", manifest["scripts"]["preview"]);
    EXPECT_TRUE(manifest["dependencies"].is_object());
    EXPECT_TRUE(manifest["dependencies"].empty());
}

TEST_F(SelfHostedProviderTest, UnreachableEngineFailsProvisioning) {
    fake_->reachable = false;

    try {
        provider_->create_sandbox();
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("engine unreachable"));
    }
    EXPECT_TRUE(fake_->created.empty());
    EXPECT_EQ(SandboxState::UNPROVISIONED, provider_->state());
    EXPECT_FALSE(provider_->sandbox_info().has_value());
}

TEST_F(SelfHostedProviderTest, MissingImageIsPulled) {
    fake_->image_present = false;

    provider_->create_sandbox();
    ASSERT_EQ(1u, fake_->pulled.size());
    EXPECT_EQ("node:18-alpine", fake_->pulled[0]);
}

TEST_F(SelfHostedProviderTest, PresentImageIsNotPulled) {
    provider_->create_sandbox();
    EXPECT_TRUE(fake_->pulled.empty());
}

TEST_F(SelfHostedProviderTest, PullPolicyAlwaysPulls) {
    config_.pull_policy = PullPolicy::ALWAYS;
    rebuild();

    provider_->create_sandbox();
    EXPECT_EQ(1u, fake_->pulled.size());
}

TEST_F(SelfHostedProviderTest, PullPolicyNeverRejectsMissingImage) {
    config_.pull_policy = PullPolicy::NEVER;
    rebuild();
    fake_->image_present = false;

    EXPECT_THROW(provider_->create_sandbox(), ProvisionError);
    EXPECT_TRUE(fake_->pulled.empty());
    EXPECT_TRUE(fake_->created.empty());
}

TEST_F(SelfHostedProviderTest, PullFailureIsProvisionError) {
    fake_->image_present = false;
    fake_->fail_pull = true;

    EXPECT_THROW(provider_->create_sandbox(), ProvisionError);
    EXPECT_TRUE(fake_->created.empty());
}

TEST_F(SelfHostedProviderTest, CreateFailureIsProvisionError) {
    fake_->fail_create = true;

    EXPECT_THROW(provider_->create_sandbox(), ProvisionError);
    EXPECT_EQ(SandboxState::UNPROVISIONED, provider_->state());
}

TEST_F(SelfHostedProviderTest, StartFailureRemovesHalfCreatedContainer) {
    fake_->fail_start = true;

    EXPECT_THROW(provider_->create_sandbox(), ProvisionError);
    ASSERT_EQ(1u, fake_->created.size());
    ASSERT_EQ(1u, fake_->removed.size());
    EXPECT_FALSE(provider_->is_alive());
    EXPECT_FALSE(provider_->sandbox_info().has_value());
}

TEST_F(SelfHostedProviderTest, UnpublishedPortLeavesUrlEmpty) {
    fake_->published_host_port = "";

    SandboxInfo info = provider_->create_sandbox();
    EXPECT_TRUE(info.url.empty());
    EXPECT_FALSE(provider_->sandbox_url().has_value());

    // Mapping shows up later; the URL is read at call time
    fake_->published_host_port = "49153";
    std::optional<std::string> url = provider_->sandbox_url();
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ("http://localhost:49153", *url);

    // The info handed out at create time does not change afterwards
    ASSERT_TRUE(provider_->sandbox_info().has_value());
    EXPECT_TRUE(provider_->sandbox_info()->url.empty());
    EXPECT_EQ(info.sandbox_id, provider_->sandbox_info()->sandbox_id);
}

TEST_F(SelfHostedProviderTest, PublicHostIsUsedInUrl) {
    config_.public_host = "sandbox.internal";
    rebuild();

    SandboxInfo info = provider_->create_sandbox();
    EXPECT_EQ("http://sandbox.internal:32768", info.url);
}

// Decision: a second create while a sandbox is live is rejected
TEST_F(SelfHostedProviderTest, SecondCreateIsRejected) {
    SandboxInfo first = provider_->create_sandbox();

    EXPECT_THROW(provider_->create_sandbox(), ProvisionError);

    EXPECT_EQ(1u, fake_->created.size());
    EXPECT_TRUE(provider_->is_alive());
    ASSERT_TRUE(provider_->sandbox_info().has_value());
    EXPECT_EQ(first.sandbox_id, provider_->sandbox_info()->sandbox_id);
}

TEST_F(SelfHostedProviderTest, CreateAfterTerminateProvisionsFreshSandbox) {
    SandboxInfo first = provider_->create_sandbox();
    provider_->terminate();

    SandboxInfo second = provider_->create_sandbox();
    EXPECT_NE(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(2u, fake_->created.size());
    EXPECT_TRUE(provider_->is_alive());
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(SelfHostedProviderTest, TerminateTwiceIsSafe) {
    provider_->create_sandbox();

    EXPECT_NO_THROW(provider_->terminate());
    EXPECT_NO_THROW(provider_->terminate());

    EXPECT_FALSE(provider_->is_alive());
    EXPECT_FALSE(provider_->sandbox_info().has_value());
    EXPECT_EQ(SandboxState::UNPROVISIONED, provider_->state());
    EXPECT_EQ(1u, fake_->stopped.size());
    EXPECT_EQ(1u, fake_->removed.size());
}

TEST_F(SelfHostedProviderTest, TerminateSwallowsTeardownFailures) {
    provider_->create_sandbox();
    fake_->fail_stop = true;
    fake_->fail_remove = true;

    EXPECT_NO_THROW(provider_->terminate());
    EXPECT_FALSE(provider_->sandbox_info().has_value());
    EXPECT_THROW(provider_->run_command("echo hi"), NotProvisionedError);
}

TEST_F(SelfHostedProviderTest, IsAliveFalseWhenInspectFails) {
    provider_->create_sandbox();
    fake_->fail_inspect = true;

    EXPECT_FALSE(provider_->is_alive());
    EXPECT_FALSE(provider_->sandbox_url().has_value());
}

// ============================================================================
// Commands
// ============================================================================

TEST_F(SelfHostedProviderTest, RunCommandCapturesOutput) {
    provider_->create_sandbox();

    CommandResult result = provider_->run_command("echo hello world");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ("hello world\n", result.stdout_text);
}

TEST_F(SelfHostedProviderTest, RunCommandRunsUnderPidWrapper) {
    provider_->create_sandbox();
    size_t before = fake_->pid_files.size();

    provider_->run_command("true");
    ASSERT_EQ(before + 1, fake_->pid_files.size());
    EXPECT_EQ(SelfHostedProvider::pid_file(), fake_->pid_files.back());
}

// Whitespace splitting does not understand quotes
TEST_F(SelfHostedProviderTest, RunCommandSplitsOnWhitespaceOnly) {
    provider_->create_sandbox();

    provider_->run_command("  echo   'a b'  ");
    EXPECT_EQ(std::vector<std::string>({"echo", "'a", "b'"}), fake_->last_command());

    provider_->run_command_argv({"echo", "a b"});
    EXPECT_EQ(std::vector<std::string>({"echo", "a b"}), fake_->last_command());
}

TEST_F(SelfHostedProviderTest, NonZeroExitIsReturnedNotThrown) {
    provider_->create_sandbox();

    CommandResult failed = provider_->run_command("false");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(1, failed.exit_code);

    CommandResult missing = provider_->run_command("no-such-tool --flag");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(127, missing.exit_code);
    EXPECT_NE(std::string::npos, missing.stderr_text.find("not found"));
}

TEST_F(SelfHostedProviderTest, EmptyCommandFails) {
    provider_->create_sandbox();

    CommandResult result = provider_->run_command("   ");
    EXPECT_FALSE(result.success);
    EXPECT_NE(0, result.exit_code);
}

TEST_F(SelfHostedProviderTest, BackendErrorBecomesFailedResult) {
    provider_->create_sandbox();
    fake_->fail_exec = true;

    CommandResult result = provider_->run_command("echo hi");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(1, result.exit_code);
    EXPECT_NE(std::string::npos, result.stderr_text.find("container is restarting"));
}

TEST_F(SelfHostedProviderTest, TimeoutReturnsPromptlyAndReapsProcess) {
    config_.resources.command_timeout_ms = 100;
    rebuild();
    provider_->create_sandbox();

    auto started = std::chrono::steady_clock::now();
    CommandResult result = provider_->run_command("sleep 5");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    EXPECT_FALSE(result.success);
    EXPECT_NE(0, result.exit_code);
    EXPECT_EQ(TIMEOUT_EXIT_CODE, result.exit_code);
    EXPECT_NE(std::string::npos, to_lower(result.stderr_text).find("timeout"));
    EXPECT_LE(elapsed, 150);

    // The sandbox stays usable after a timeout; the next command waits
    // for the kill to land
    EXPECT_EQ(SandboxState::READY, provider_->state());
    CommandResult after = provider_->run_command("echo ok");
    EXPECT_TRUE(after.success);
    EXPECT_EQ("ok\n", after.stdout_text);
    EXPECT_EQ(1, fake_->kills);
}

TEST_F(SelfHostedProviderTest, SlowEngineDoesNotDelayTimeout) {
    config_.resources.command_timeout_ms = 100;
    rebuild();
    provider_->create_sandbox();

    // Exec create alone outlasts the timeout, and the kill is slow too
    fake_->exec_create_delay_ms = 300;
    fake_->kill_delay_ms = 400;

    auto started = std::chrono::steady_clock::now();
    CommandResult result = provider_->run_command("sleep 5");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    EXPECT_EQ(TIMEOUT_EXIT_CODE, result.exit_code);
    EXPECT_EQ("Command timeout", result.stderr_text);
    EXPECT_LE(elapsed, 150);

    fake_->exec_create_delay_ms = 0;
    fake_->kill_delay_ms = 0;
    CommandResult after = provider_->run_command("echo ok");
    EXPECT_TRUE(after.success);
    EXPECT_EQ(1, fake_->kills);
}

TEST_F(SelfHostedProviderTest, CreateLatencyCountsAgainstTimeout) {
    config_.resources.command_timeout_ms = 100;
    rebuild();
    provider_->create_sandbox();
    fake_->exec_create_delay_ms = 60;

    auto started = std::chrono::steady_clock::now();
    CommandResult result = provider_->run_command("sleep 0.08");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    EXPECT_EQ(TIMEOUT_EXIT_CODE, result.exit_code);
    EXPECT_LE(elapsed, 150);
}

TEST_F(SelfHostedProviderTest, TerminateWaitsForPendingKill) {
    config_.resources.command_timeout_ms = 50;
    rebuild();
    provider_->create_sandbox();
    fake_->kill_delay_ms = 200;

    CommandResult result = provider_->run_command("sleep 5");
    EXPECT_EQ(TIMEOUT_EXIT_CODE, result.exit_code);

    provider_->terminate();
    EXPECT_EQ(1, fake_->kills);
    EXPECT_EQ(1u, fake_->removed.size());
    EXPECT_EQ(SandboxState::UNPROVISIONED, provider_->state());
}

TEST_F(SelfHostedProviderTest, CommandsWithinTimeoutComplete) {
    config_.resources.command_timeout_ms = 500;
    rebuild();
    provider_->create_sandbox();

    CommandResult result = provider_->run_command("sleep 0.01");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(0, fake_->kills);
}

TEST_F(SelfHostedProviderTest, ConcurrentCallersAreSerialized) {
    provider_->create_sandbox();

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.push_back(std::thread([this]() {
            provider_->run_command("sleep 0.05");
        }));
    }
    threads.push_back(std::thread([this]() {
        provider_->write_file("concurrent.txt", "x");
    }));
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }

    EXPECT_EQ(1, fake_->max_concurrent_execs.load());
    EXPECT_EQ("x", provider_->read_file("concurrent.txt"));
}

TEST_F(SelfHostedProviderTest, InstallPackagesIssuesManagerInstall) {
    provider_->create_sandbox();
    fake_->package_manager_exit_code = 0;

    CommandResult ok = provider_->install_packages({"left-pad"});
    EXPECT_EQ(std::vector<std::string>({"npm", "install", "left-pad"}), fake_->last_command());
    EXPECT_TRUE(ok.success);

    fake_->package_manager_exit_code = 3;
    CommandResult failed = provider_->install_packages({"left-pad"});
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(3, failed.exit_code);
}

TEST_F(SelfHostedProviderTest, InstallPackagesUsesConfiguredManager) {
    config_.dev_server.package_manager = "pnpm";
    rebuild();
    provider_->create_sandbox();

    provider_->install_packages({"react", "react-dom"});
    EXPECT_EQ(std::vector<std::string>({"pnpm", "install", "react", "react-dom"}), fake_->last_command());
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SelfHostedProviderTest, WriteThenReadRoundTrips) {
    provider_->create_sandbox();

    const std::string content =
        "const greeting = \"hello\";\n"
        "const tpl = `${greeting} $HOME 'quoted' \\n`;\n"
        "// ünïcödé and tabs\t\n"
        "echo $(rm -rf /) ; && || > <\n";
    provider_->write_file("src/app.js", content);
    EXPECT_EQ(content, provider_->read_file("src/app.js"));
    EXPECT_EQ(content, provider_->read_file("/app/src/app.js"));

    provider_->write_file("empty.txt", "");
    EXPECT_EQ("", provider_->read_file("empty.txt"));
}

// Content travels as one argv element: NUL bytes cannot be represented
TEST_F(SelfHostedProviderTest, WriteRejectsContentTheBridgeCannotCarry) {
    provider_->create_sandbox();

    EXPECT_THROW(provider_->write_file("bin.dat", std::string("a\0b", 3)), IOError);
    EXPECT_THROW(provider_->write_file("big.txt", std::string(shell_bridge::MAX_ARG_BYTES, 'x')), IOError);
    EXPECT_NO_THROW(provider_->write_file("fits.txt", std::string(shell_bridge::MAX_ARG_BYTES - 1, 'x')));
}

TEST_F(SelfHostedProviderTest, ReadMissingFileThrowsIOError) {
    provider_->create_sandbox();

    try {
        provider_->read_file("missing.txt");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        std::string what = e.what();
        EXPECT_NE(std::string::npos, what.find("/app/missing.txt"));
        EXPECT_NE(std::string::npos, what.find("No such file"));
    }
}

TEST_F(SelfHostedProviderTest, ListFilesOnFreshSandboxShowsManifest) {
    provider_->create_sandbox();

    std::vector<std::string> names = provider_->list_files();
    EXPECT_NE(names.end(), std::find(names.begin(), names.end(), "package.json"));
    EXPECT_EQ(names.end(), std::find(names.begin(), names.end(), "."));
    EXPECT_EQ(names.end(), std::find(names.begin(), names.end(), ".."));
}

TEST_F(SelfHostedProviderTest, ListFilesOfSubdirectory) {
    provider_->create_sandbox();
    provider_->write_file("src/main.jsx", "x");
    provider_->write_file("src/my component.jsx", "y");

    std::vector<std::string> names = provider_->list_files("src");
    ASSERT_EQ(2u, names.size());
    EXPECT_EQ("main.jsx", names[0]);
    EXPECT_EQ("my component.jsx", names[1]);

    std::vector<std::string> root = provider_->list_files();
    EXPECT_NE(root.end(), std::find(root.begin(), root.end(), "src"));
}

TEST_F(SelfHostedProviderTest, ListMissingDirectoryThrowsIOError) {
    provider_->create_sandbox();
    EXPECT_THROW(provider_->list_files("nope"), IOError);
}

TEST(GenerateSandboxIdTest, FormatAndUniqueness) {
    std::string a = generate_sandbox_id();
    std::string b = generate_sandbox_id();
    EXPECT_TRUE(std::regex_match(a, std::regex("sandbox-[0-9]{13,}-[0-9a-z]{9}"))) << a;
    EXPECT_NE(a, b);
}

} // namespace
} // namespace sandforge
