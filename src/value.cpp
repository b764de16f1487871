#include "value.hpp"
#include "autograd.hpp"
#include "helpers.hpp"

#include <cmath>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace scalarnet {

template <typename GradF, typename... Args>
Value SetupAutograd(double data, Args &&...args) {
  Value out(data);
  auto *meta = out.autograd();

  meta->grad_fn = std::make_shared<GradF>(std::forward<Args>(args)...);
  meta->is_leaf = false;

  return out;
}

/*
  VALUE IMPL
*/

// Nodes owned only by the graph being released are stripped of their grad_fn
// before they drop, so no destructor below this one has work to recurse into.
ValueImpl::~ValueImpl() {
  if (!autograd.grad_fn) {
    return;
  }

  std::vector<std::shared_ptr<Function>> pending;
  pending.push_back(std::move(autograd.grad_fn));

  while (!pending.empty()) {
    auto fn = std::move(pending.back());
    pending.pop_back();
    if (fn.use_count() > 1) {
      continue;
    }

    auto inputs = std::move(fn->inputs);
    fn.reset();

    // Popping one handle at a time lets the last of several aliasing
    // handles see use_count() == 1.
    while (!inputs.empty()) {
      auto node = std::move(inputs.back().impl_);
      inputs.pop_back();
      if (node && node.use_count() == 1 && node->autograd.grad_fn) {
        pending.push_back(std::move(node->autograd.grad_fn));
      }
    }
  }
}

/*
  VALUE
*/

Value::Value() : impl_(nullptr) {}
Value::Value(double data) : impl_(std::make_shared<ValueImpl>(data)) {}
Value::Value(std::shared_ptr<ValueImpl> impl) : impl_(std::move(impl)) {}

bool Value::initialized() const noexcept { return impl_ != nullptr; }

ValueImpl *Value::impl() const noexcept {
  ASSERT(impl_, "Trying to use uninitialized Value!");
  return impl_.get();
}

bool Value::is_leaf() const noexcept { return impl()->autograd.is_leaf; }

double Value::data() const noexcept { return impl()->data; }

void Value::set_data(double d) const noexcept { impl()->data = d; }

double Value::grad() const noexcept { return impl()->autograd.grad; }

void Value::accumulate_grad(double g) const noexcept {
  impl()->autograd.grad += g;
}

AutogradMeta *Value::autograd() const noexcept { return &impl()->autograd; }

Function *Value::grad_fn() const noexcept {
  return impl()->autograd.grad_fn.get();
}

void Value::backward(double grad_output) const {
  ::scalarnet::backward(*this, grad_output);
}

void Value::zero_grad() const noexcept { impl()->autograd.grad = 0.0; }

std::string Value::to_string() const {
  if (!initialized()) {
    return "Value(uninitialized)";
  }
  return fmt::format("Value(data={}, grad={})", data(), grad());
}

void Value::print() const { fmt::print("{}\n", to_string()); }

Value Value::add(const Value &other) const {
  return SetupAutograd<AddFunction>(data() + other.data(), *this, other);
}

Value Value::sub(const Value &other) const { return add(other.neg()); }

Value Value::mul(const Value &other) const {
  return SetupAutograd<MulFunction>(data() * other.data(), *this, other);
}

Value Value::div(const Value &other) const { return mul(other.pow(-1.0)); }

Value Value::neg() const { return mul(Value(-1.0)); }

Value Value::pow(double exponent) const {
  return SetupAutograd<PowFunction>(std::pow(data(), exponent), *this,
                                    exponent);
}

Value Value::relu() const {
  return SetupAutograd<ReLUFunction>(data() > 0.0 ? data() : 0.0, *this);
}

Value Value::tanh() const {
  const double t = std::tanh(data());
  return SetupAutograd<TanhFunction>(t, *this, t);
}

/*
  FREE FUNCTIONS
*/

Value relu(const Value &v) { return v.relu(); }
Value tanh(const Value &v) { return v.tanh(); }

Value operator+(const Value &l, const Value &r) { return l.add(r); }
Value operator-(const Value &l, const Value &r) { return l.sub(r); }
Value operator*(const Value &l, const Value &r) { return l.mul(r); }
Value operator/(const Value &l, const Value &r) { return l.div(r); }
Value operator-(const Value &v) { return v.neg(); }

Value operator+(const Value &l, double r) { return l.add(Value(r)); }
Value operator-(const Value &l, double r) { return l.sub(Value(r)); }
Value operator*(const Value &l, double r) { return l.mul(Value(r)); }
Value operator/(const Value &l, double r) { return l.div(Value(r)); }
Value operator+(double l, const Value &r) { return Value(l).add(r); }
Value operator-(double l, const Value &r) { return Value(l).sub(r); }
Value operator*(double l, const Value &r) { return Value(l).mul(r); }
Value operator/(double l, const Value &r) { return Value(l).div(r); }

std::vector<Value> values(const std::vector<double> &data) {
  std::vector<Value> out;
  out.reserve(data.size());
  for (double d : data) {
    out.emplace_back(d);
  }
  return out;
}

std::vector<double> data_of(const std::vector<Value> &vals) {
  std::vector<double> out;
  out.reserve(vals.size());
  for (const auto &v : vals) {
    out.push_back(v.data());
  }
  return out;
}

} // namespace scalarnet
