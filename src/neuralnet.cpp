#include "neuralnet.hpp"
#include "errors.hpp"

#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace scalarnet {

namespace {

void check_width(int64_t width, const char *what) {
  if (width < 1) {
    throw InvalidWidthError(
        fmt::format("{} must be at least 1 (got {})", what, width));
  }
}

template <typename Modules>
std::string join_modules(const Modules &modules) {
  std::vector<std::string> parts;
  parts.reserve(modules.size());
  for (const auto &m : modules) {
    parts.push_back(m.to_string());
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

} // namespace

void Module::print() const { fmt::print("{}\n", to_string()); }

void Module::zero_grad() const {
  for (const auto &p : parameters()) {
    p.zero_grad();
  }
}

/*
  NEURON
*/

Neuron::Neuron(int64_t nin, RandomSource &rng, UnitOptions options)
    : bias(0.0), options(options) {
  check_width(nin, "neuron input width");

  weights.reserve(static_cast<size_t>(nin));
  for (int64_t i = 0; i < nin; ++i) {
    weights.emplace_back(rng.uniform(-1.0, 1.0));
  }
}

Value Neuron::forward(const std::vector<Value> &x) const {
  if (x.size() != weights.size()) {
    throw InputWidthMismatchError(weights.size(), x.size());
  }

  Value act = bias;
  for (size_t i = 0; i < weights.size(); ++i) {
    act = act + weights[i] * x[i];
  }

  switch (options.activation) {
  case Activation::ReLU:
    return act.relu();
  case Activation::Tanh:
    return act.tanh();
  case Activation::Linear:
  default:
    return act;
  }
}

std::vector<Value> Neuron::parameters() const {
  std::vector<Value> params(weights);
  params.push_back(bias);
  return params;
}

std::string Neuron::to_string() const {
  return fmt::format("{}Neuron({})", get_name(options.activation),
                     weights.size());
}

/*
  LAYER
*/

Layer::Layer(int64_t nin, int64_t nout, RandomSource &rng, UnitOptions options)
    : nin_(nin) {
  check_width(nin, "layer input width");
  check_width(nout, "layer output width");

  neurons.reserve(static_cast<size_t>(nout));
  for (int64_t i = 0; i < nout; ++i) {
    neurons.emplace_back(nin, rng, options);
  }
}

std::vector<Value> Layer::forward(const std::vector<Value> &x) const {
  std::vector<Value> out;
  out.reserve(neurons.size());
  for (const auto &n : neurons) {
    out.push_back(n.forward(x));
  }
  return out;
}

std::vector<Value> Layer::parameters() const {
  std::vector<Value> params;
  params.reserve(layer_parameter_count(nin_, nout()));

  for (const auto &n : neurons) {
    auto neuron_params = n.parameters();
    params.insert(params.end(), neuron_params.begin(), neuron_params.end());
  }

  return params;
}

std::string Layer::to_string() const {
  return fmt::format("Layer of [{}]", join_modules(neurons));
}

ConjoinLayer::ConjoinLayer(const Layer &l1, const Layer &l2, int64_t nout,
                           RandomSource &rng, UnitOptions options)
    : Layer(l1.nout() + l2.nout(), nout, rng, options) {}

RegisterConjoinLayer::RegisterConjoinLayer(int64_t nin1, int64_t nin2,
                                           int64_t nout, RandomSource &rng,
                                           UnitOptions options)
    : Layer(nin1 + nin2, nout, rng, options) {}

/*
  MLP
*/

MLP::MLP(int64_t nin, const std::vector<int64_t> &nouts, RandomSource &rng) {
  if (nouts.empty()) {
    throw InvalidWidthError("MLP needs at least one layer");
  }

  layers_.reserve(nouts.size());
  int64_t in = nin;
  for (size_t i = 0; i < nouts.size(); ++i) {
    const bool last = i + 1 == nouts.size();
    layers_.emplace_back(in, nouts[i], rng,
                         last ? UnitOptions::linear() : UnitOptions::relu());
    in = nouts[i];
  }
}

MLP::MLP(std::vector<Layer> &&layers) : layers_(std::move(layers)) {
  if (layers_.empty()) {
    throw InvalidWidthError("MLP needs at least one layer");
  }

  for (size_t i = 1; i < layers_.size(); ++i) {
    if (layers_[i].nin() != layers_[i - 1].nout()) {
      throw InvalidWidthError(fmt::format(
          "layer {} expects {} inputs but layer {} produces {}", i,
          layers_[i].nin(), i - 1, layers_[i - 1].nout()));
    }
  }
}

std::vector<Value> MLP::forward(const std::vector<Value> &input) const {
  std::vector<Value> output = input;
  for (const auto &layer : layers_) {
    output = layer.forward(output);
  }
  return output;
}

std::vector<Value> MLP::parameters() const {
  std::vector<Value> params;

  for (const auto &layer : layers_) {
    auto layer_params = layer.parameters();
    params.insert(params.end(), layer_params.begin(), layer_params.end());
  }

  return params;
}

std::string MLP::to_string() const {
  return fmt::format("MLP of [{}]", join_modules(layers_));
}

} // namespace scalarnet
