#pragma once

#include "value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace scalarnet {

struct Module {
  virtual ~Module() = default;
  virtual std::vector<Value> parameters() const = 0;
  virtual std::string to_string() const = 0;

  void print() const;
  void zero_grad() const;
  size_t num_parameters() const { return parameters().size(); }
};

} // namespace scalarnet
