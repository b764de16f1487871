#include "autograd.hpp"
#include "helpers.hpp"

#include <cmath>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace scalarnet {

// AddFunction implementation
AddFunction::AddFunction(const Value &lhs, const Value &rhs) {
  inputs = {lhs, rhs};
}

std::vector<double> AddFunction::backward(double grad_output) {
  return {grad_output, grad_output};
}

// MulFunction implementation
MulFunction::MulFunction(const Value &lhs, const Value &rhs) {
  inputs = {lhs, rhs};
}

std::vector<double> MulFunction::backward(double grad_output) {
  // dL/dlhs = dL/dz * rhs, dL/drhs = dL/dz * lhs
  return {grad_output * inputs[1].data(), grad_output * inputs[0].data()};
}

// PowFunction implementation
PowFunction::PowFunction(const Value &base, double exponent)
    : exponent_(exponent) {
  inputs = {base};
}

std::vector<double> PowFunction::backward(double grad_output) {
  return {grad_output * exponent_ *
          std::pow(inputs[0].data(), exponent_ - 1.0)};
}

// ReLUFunction implementation
ReLUFunction::ReLUFunction(const Value &input) { inputs = {input}; }

std::vector<double> ReLUFunction::backward(double grad_output) {
  return {inputs[0].data() > 0.0 ? grad_output : 0.0};
}

// TanhFunction implementation
TanhFunction::TanhFunction(const Value &input, double output)
    : output_(output) {
  inputs = {input};
}

std::vector<double> TanhFunction::backward(double grad_output) {
  return {grad_output * (1.0 - output_ * output_)};
}

// Depth-first post-order: every node appears after all of its inputs.
std::vector<ValueImpl *> topological_order(const Value &root) {
  std::vector<ValueImpl *> order;
  std::unordered_set<ValueImpl *> visited;
  std::vector<std::pair<ValueImpl *, size_t>> stack;

  stack.emplace_back(root.impl(), 0);
  visited.insert(root.impl());

  while (!stack.empty()) {
    auto *node = stack.back().first;
    auto &next = stack.back().second;
    auto *fn = node->autograd.grad_fn.get();

    if (fn && next < fn->inputs.size()) {
      auto *input = fn->inputs[next++].impl();
      if (visited.insert(input).second) {
        stack.emplace_back(input, 0);
      }
      continue;
    }

    order.push_back(node);
    stack.pop_back();
  }

  return order;
}

void backward(const Value &root, double grad_output) {
  ASSERT(root.initialized(), "Calling backward on uninitialized Value");

  auto order = topological_order(root);
  root.accumulate_grad(grad_output);

  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    auto &meta = (*it)->autograd;
    if (meta.is_leaf || !meta.grad_fn) {
      continue;
    }

    auto input_grads = meta.grad_fn->backward(meta.grad);
    ASSERT(input_grads.size() == meta.grad_fn->inputs.size(),
           fmt::format("{} returned {} gradients for {} inputs",
                       meta.grad_fn->name(), input_grads.size(),
                       meta.grad_fn->inputs.size()));

    for (size_t i = 0; i < input_grads.size(); ++i) {
      meta.grad_fn->inputs[i].accumulate_grad(input_grads[i]);
    }
  }
}

} // namespace scalarnet
