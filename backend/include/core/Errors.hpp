#pragma once
#include <stdexcept>
#include <string>

namespace routesim {

// A start request that cannot create a session (reported to the client as ERROR).
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An inbound message that cannot be decoded (logged and dropped).
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An uploaded coordinate file that cannot be parsed.
class CoordinateParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace routesim
