#pragma once
#include <stdexcept>
#include <string>

namespace fzd {

// Raised for dt <= 0, malformed controller/vehicle configuration and
// anything else the core refuses to run with.
class InvalidParameter : public std::invalid_argument {
public:
  explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace fzd
