#pragma once

#include "value.hpp"

#include <vector>

namespace scalarnet {

struct Function {
  virtual ~Function() = default;
  // Local gradients of the inputs, given the gradient of the output.
  virtual std::vector<double> backward(double grad_output) = 0;
  virtual const char *name() const noexcept = 0;

  std::vector<Value> inputs;
};

// Specific function implementations
struct AddFunction : Function {
  AddFunction(const Value &lhs, const Value &rhs);
  std::vector<double> backward(double grad_output) override;
  const char *name() const noexcept override { return "+"; }
};

struct MulFunction : Function {
  MulFunction(const Value &lhs, const Value &rhs);
  std::vector<double> backward(double grad_output) override;
  const char *name() const noexcept override { return "*"; }
};

struct PowFunction : Function {
  PowFunction(const Value &base, double exponent);
  std::vector<double> backward(double grad_output) override;
  const char *name() const noexcept override { return "pow"; }

private:
  double exponent_;
};

struct ReLUFunction : Function {
  ReLUFunction(const Value &input);
  std::vector<double> backward(double grad_output) override;
  const char *name() const noexcept override { return "ReLU"; }
};

struct TanhFunction : Function {
  TanhFunction(const Value &input, double output);
  std::vector<double> backward(double grad_output) override;
  const char *name() const noexcept override { return "tanh"; }

private:
  double output_;
};

// Autograd engine functions
std::vector<ValueImpl *> topological_order(const Value &root);
void backward(const Value &root, double grad_output = 1.0);

} // namespace scalarnet
