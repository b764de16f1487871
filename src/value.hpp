#pragma once

#include <memory>
#include <string>
#include <vector>

namespace scalarnet {

struct Function;

// Autograd metadata for scalars
struct AutogradMeta {
  std::shared_ptr<Function> grad_fn = nullptr;
  double grad = 0.0;
  bool is_leaf = true;
};

struct ValueImpl {
  double data = 0.0;
  AutogradMeta autograd;

  ValueImpl() = default;
  explicit ValueImpl(double d) : data(d) {}
  ValueImpl(const ValueImpl &) = delete;
  ValueImpl &operator=(const ValueImpl &) = delete;
  // Releases the producing graph without recursing through it.
  ~ValueImpl();
};

class Value {
  std::shared_ptr<ValueImpl> impl_ = nullptr;

  friend struct ValueImpl;

public:
  explicit Value();
  explicit Value(double data);
  explicit Value(std::shared_ptr<ValueImpl> impl);

  Value &operator=(const Value &o) noexcept = default;
  Value &operator=(Value &&o) noexcept = default;

  Value(const Value &o) = default;
  Value(Value &&o) = default;

  ~Value() = default;

  ValueImpl *impl() const noexcept;
  bool initialized() const noexcept;
  bool is_leaf() const noexcept;
  double data() const noexcept;
  void set_data(double d) const noexcept;
  double grad() const noexcept;
  void accumulate_grad(double g) const noexcept;
  AutogradMeta *autograd() const noexcept;
  Function *grad_fn() const noexcept;
  void backward(double grad_output = 1.0) const;
  void zero_grad() const noexcept;
  std::string to_string() const;
  void print() const;

  Value add(const Value &other) const;
  Value sub(const Value &other) const;
  Value mul(const Value &other) const;
  Value div(const Value &other) const;
  Value neg() const;
  Value pow(double exponent) const;
  Value relu() const;
  Value tanh() const;
};

/*
  FREE FUNCTIONS
*/

// Activation functions
Value relu(const Value &v);
Value tanh(const Value &v);

// Operation functions
Value operator+(const Value &l, const Value &r);
Value operator-(const Value &l, const Value &r);
Value operator*(const Value &l, const Value &r);
Value operator/(const Value &l, const Value &r);
Value operator-(const Value &v);

Value operator+(const Value &l, double r);
Value operator-(const Value &l, double r);
Value operator*(const Value &l, double r);
Value operator/(const Value &l, double r);
Value operator+(double l, const Value &r);
Value operator-(double l, const Value &r);
Value operator*(double l, const Value &r);
Value operator/(double l, const Value &r);

// Create functions
std::vector<Value> values(const std::vector<double> &data);
std::vector<double> data_of(const std::vector<Value> &vals);

} // namespace scalarnet
