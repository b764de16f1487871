#pragma once

#include "module.hpp"
#include "random.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scalarnet {

struct Neuron : Module {
  Neuron(int64_t nin, RandomSource &rng, UnitOptions options = {});

  Value forward(const std::vector<Value> &x) const;
  std::vector<Value> parameters() const override;
  std::string to_string() const override;

  int64_t nin() const noexcept { return static_cast<int64_t>(weights.size()); }
  bool nonlin() const noexcept { return options.nonlin(); }

  std::vector<Value> weights;
  Value bias;
  UnitOptions options;
};

// Always returns nout values, also for a single neuron.
struct Layer : Module {
  Layer(int64_t nin, int64_t nout, RandomSource &rng, UnitOptions options = {});

  std::vector<Value> forward(const std::vector<Value> &x) const;
  std::vector<Value> parameters() const override;
  std::string to_string() const override;

  int64_t nin() const noexcept { return nin_; }
  int64_t nout() const noexcept {
    return static_cast<int64_t>(neurons.size());
  }

  std::vector<Neuron> neurons;

private:
  int64_t nin_;
};

// Input is the concatenation of two layers' outputs. Only their widths are
// used; no reference to l1 or l2 is kept.
struct ConjoinLayer : Layer {
  ConjoinLayer(const Layer &l1, const Layer &l2, int64_t nout,
               RandomSource &rng, UnitOptions options = {});
};

struct RegisterConjoinLayer : Layer {
  RegisterConjoinLayer(int64_t nin1, int64_t nin2, int64_t nout,
                       RandomSource &rng, UnitOptions options = {});
};

class MLP : public Module {
public:
  MLP(int64_t nin, const std::vector<int64_t> &nouts, RandomSource &rng);
  explicit MLP(std::vector<Layer> &&layers);

  std::vector<Value> forward(const std::vector<Value> &input) const;
  std::vector<Value> parameters() const override;
  std::string to_string() const override;

  const std::vector<Layer> &layers() const noexcept { return layers_; }

private:
  std::vector<Layer> layers_;
};

} // namespace scalarnet
