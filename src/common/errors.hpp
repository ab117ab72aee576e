#pragma once

#include <stdexcept>
#include <string>

namespace pkgsnap {

// Base for every error that aborts a snapshot run.
class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedBackendError : public SnapshotError {
public:
    using SnapshotError::SnapshotError;
};

class MissingToolError : public SnapshotError {
public:
    MissingToolError(const std::string &tool)
        : SnapshotError("Required executable not found on PATH: " + tool)
        , m_tool(tool)
    {
    }

    const std::string &tool() const
    {
        return m_tool;
    }

private:
    std::string m_tool;
};

class ExternalCommandError : public SnapshotError {
public:
    ExternalCommandError(const std::string &program, int exitCode,
                         const std::string &message, bool retryable = false)
        : SnapshotError(message)
        , m_program(program)
        , m_exitCode(exitCode)
        , m_retryable(retryable)
    {
    }

    const std::string &program() const
    {
        return m_program;
    }

    // -1 when the process never exited normally.
    int exitCode() const
    {
        return m_exitCode;
    }

    // Timeouts are retryable; bad exit codes and unparsable output are not.
    bool isRetryable() const
    {
        return m_retryable;
    }

private:
    std::string m_program;
    int m_exitCode = -1;
    bool m_retryable = false;
};

class EmptyInventoryError : public SnapshotError {
public:
    EmptyInventoryError()
        : SnapshotError("No installed packages were enumerated")
    {
    }
};

class WriteError : public SnapshotError {
public:
    using SnapshotError::SnapshotError;
};

} // namespace pkgsnap
