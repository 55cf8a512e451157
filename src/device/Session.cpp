#include "device/Session.hpp"
#include "device/Api.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

using namespace ib::device;

Session::Session(std::string address)
    : address(std::move(address)),
      id(boost::uuids::to_string(boost::uuids::random_generator()())),
      connected_at(std::chrono::system_clock::now()) {}

std::string Session::str() const {
    return fmt::format("reMarkable at {} (session={})", api::baseUrl(address), id);
}
