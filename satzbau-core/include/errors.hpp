#pragma once

#include <stdexcept>
#include <string>

namespace Satzbau {

// Invalid catalog, collocation table or configuration file.
class CatalogError : public std::runtime_error {
public:
  explicit CatalogError(const std::string &what) : std::runtime_error(what) {}
};

// Sentence payload that violates the upstream token contract.
class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace Satzbau
