#pragma once

#include <stdexcept>
#include <string>

namespace nhdsync {

// Raised by DeviceApi implementations when a call to the controller fails
// as a whole (connection lost, session timeout, rejected command).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when fetched data violates a snapshot invariant. The section being
// refreshed keeps its previous value.
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace nhdsync
