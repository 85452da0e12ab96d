#pragma once
// Error taxonomy
//
// Fatal conditions are exceptions. Per-candidate conditions
// (cross-category edges, ambiguous verdicts, conflicting mutations)
// are values recorded on the graph, verdict or round report instead.

#include <stdexcept>
#include <string>

namespace viveka {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed or inconsistent configuration. Raised before any processing.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what)
        : Error("configuration: " + what) {}
};

// Vector, rerank or adjudicator provider could not be reached
class ProviderUnavailable : public Error {
public:
    ProviderUnavailable(const std::string& provider, const std::string& what)
        : Error(provider + " unavailable: " + what), provider_(provider) {}

    const std::string& provider() const { return provider_; }

private:
    std::string provider_;
};

// Persistence collaborator refused an operation that has no bool channel
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what) : Error("store: " + what) {}
};

} // namespace viveka
