#pragma once
#include <string>

namespace routesim::net {

// Outbound half of one client connection.
class IClientChannel {
public:
    virtual ~IClientChannel() = default;
    // Queue a text frame for delivery without waiting for it to be written.
    // Returns false once the connection is closed.
    virtual bool send(const std::string& payload) = 0;
};

} // namespace routesim::net
