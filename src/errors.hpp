#pragma once
#include <stdexcept>
#include <string>

namespace agentmem {

// Caller supplied an unusable argument (empty agent id, empty key, ...).
// Never retried.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// A collaborator (store, embedding provider) failed, timed out or the call was
// cancelled. Retry policy belongs to the caller.
class DependencyUnavailable : public std::runtime_error {
public:
    explicit DependencyUnavailable(const std::string& what) : std::runtime_error(what) {}
};

} // namespace agentmem
