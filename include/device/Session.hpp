#pragma once

#include <chrono>
#include <string>

namespace ib::device {

// One live connection to a tablet; created on detection, dropped on eject.
struct Session {
    std::string address;
    std::string id;
    std::chrono::system_clock::time_point connected_at;

    explicit Session(std::string address);

    [[nodiscard]] std::string str() const;
};

}
