#include "endpoint_set.hpp"
#include <stdexcept>

EndpointSet::EndpointSet(const std::vector<std::string>& addresses)
    : endpoints_(make_endpoints(addresses)) {}

std::vector<Endpoint> EndpointSet::make_endpoints(const std::vector<std::string>& addresses) {
    if (addresses.empty()) {
        throw std::invalid_argument("Endpoint set must contain at least one address");
    }

    std::vector<Endpoint> endpoints;
    endpoints.reserve(addresses.size());
    for (std::size_t i = 0; i < addresses.size(); ++i) {
        endpoints.push_back(Endpoint{addresses[i], i});
    }
    return endpoints;
}
