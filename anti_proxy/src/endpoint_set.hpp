#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct Endpoint {
    std::string address;
    std::size_t ordinal;
};

// Ordered upstream addresses, tried first to last
class EndpointSet {
public:
    explicit EndpointSet(const std::vector<std::string>& addresses);

    std::size_t size() const { return endpoints_.size(); }
    const Endpoint& at(std::size_t ordinal) const { return endpoints_.at(ordinal); }

    std::vector<Endpoint>::const_iterator begin() const { return endpoints_.begin(); }
    std::vector<Endpoint>::const_iterator end() const { return endpoints_.end(); }

private:
    const std::vector<Endpoint> endpoints_;

    static std::vector<Endpoint> make_endpoints(const std::vector<std::string>& addresses);
};
