/*
 * sandforge - Sandbox error taxonomy
 *
 * Provisioning and file operations fail with exceptions; command execution
 * never does (see CommandResult).
 */
#ifndef sandforge_SANDBOX_ERRORS_HPP
#define sandforge_SANDBOX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sandforge {

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& what) : std::runtime_error(what) {}
};

// create_sandbox failed: engine unreachable, image pull failed, quota, ...
class ProvisionError : public SandboxError {
public:
    explicit ProvisionError(const std::string& what) : SandboxError(what) {}
};

// Operation called before create_sandbox or after terminate
class NotProvisionedError : public SandboxError {
public:
    explicit NotProvisionedError(const std::string& operation)
        : SandboxError(operation + ": sandbox not created, call create_sandbox() first")
        , operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// File read/write/list failure against a live sandbox
class IOError : public SandboxError {
public:
    explicit IOError(const std::string& what) : SandboxError(what) {}
};

// Optional capability not offered by the active backend
class UnsupportedOperation : public SandboxError {
public:
    UnsupportedOperation(const std::string& operation, const std::string& provider)
        : SandboxError(operation + " is not supported by the " + provider + " provider") {}
};

// Container engine / remote API failure (raised by backend clients)
class EngineError : public SandboxError {
public:
    EngineError(const std::string& what, long status = 0)
        : SandboxError(what), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

} // namespace sandforge

#endif // sandforge_SANDBOX_ERRORS_HPP
