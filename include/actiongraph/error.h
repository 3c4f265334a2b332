#pragma once

#include <stdexcept>
#include <string>

namespace actiongraph {

/// Base class for every failure raised while interning or dumping the graph.
class InternError : public std::runtime_error {
public:
    explicit InternError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A domain object could not be turned into its serialized form.
class MalformedKeyError : public InternError {
public:
    explicit MalformedKeyError(const std::string& message)
        : InternError("malformed key: " + message) {}
};

/// A construct function asked its own cache for another key on the same
/// thread. Construction must only delegate to other cache instances.
class ReentrantInternError : public InternError {
public:
    explicit ReentrantInternError(const std::string& cacheName)
        : InternError("reentrant intern call on cache '" + cacheName + "'"),
          cacheName_(cacheName) {}

    const std::string& cacheName() const { return cacheName_; }

private:
    std::string cacheName_;
};

/// Appending to a sink or writing the finished container failed.
class OutputError : public InternError {
public:
    explicit OutputError(const std::string& message)
        : InternError("output: " + message) {}
};

} // namespace actiongraph
