#pragma once

/**
 * Errors.hpp
 *
 * Exception types raised by the transfer manager.
 */

#include <stdexcept>
#include <string>

namespace fetchkit::core {

/**
 * Base class for all fetchkit errors
 */
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A task with the same id is already registered
 */
class DuplicateTaskError : public FetchError {
public:
    explicit DuplicateTaskError(const std::string& taskId)
        : FetchError("Task already exists: " + taskId), m_taskId(taskId) {}

    const std::string& taskId() const { return m_taskId; }

private:
    std::string m_taskId;
};

/**
 * No task is registered under the given id
 */
class NotFoundError : public FetchError {
public:
    explicit NotFoundError(const std::string& taskId)
        : FetchError("Task not found: " + taskId), m_taskId(taskId) {}

    const std::string& taskId() const { return m_taskId; }

private:
    std::string m_taskId;
};

/**
 * Network or file I/O failure during a transfer.
 * Never escapes a worker; it is turned into task status and events.
 */
class TransferError : public FetchError {
public:
    explicit TransferError(const std::string& message)
        : FetchError(message) {}
};

} // namespace fetchkit::core
