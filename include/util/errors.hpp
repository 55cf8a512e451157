#pragma once

#include <stdexcept>
#include <string>

namespace ib {

// Device unreachable or the connection dropped mid-request.
struct ConnectivityError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A unit of work (HTTP request, conversion) exceeded its wall-clock budget.
struct TimeoutError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The device answered, but not with what the protocol promises.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const long status, const std::string& msg) : std::runtime_error(msg), status_(status) {}

    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

struct ConversionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Aggregate failure of a transfer batch.
struct TransferError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
