#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace scalarnet {

struct Error : std::runtime_error {
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Output register written by two steps with different widths.
struct WidthMismatchError : Error {
  WidthMismatchError(const std::string &reg, int64_t expected, int64_t got);

  std::string register_name;
  int64_t expected;
  int64_t got;
};

struct RegisterSpecError : Error {
  using Error::Error;
};

struct UnknownRegisterError : Error {
  explicit UnknownRegisterError(const std::string &reg,
                                const std::string &reason);

  std::string register_name;
};

struct InvalidWidthError : Error {
  using Error::Error;
};

struct UnsetRegisterReadError : Error {
  UnsetRegisterReadError(const std::string &reg, size_t step);

  std::string register_name;
  size_t step;
};

struct OutputUnwrittenError : Error {
  OutputUnwrittenError();
};

struct InputWidthMismatchError : Error {
  InputWidthMismatchError(size_t expected, size_t got);

  size_t expected;
  size_t got;
};

} // namespace scalarnet
