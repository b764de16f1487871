#pragma once

#include "module.hpp"
#include "neuralnet.hpp"
#include "random.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace scalarnet {

// One call of the architecture: read `inputs` (one register, or two that are
// concatenated in order), run a layer of `width` neurons, write `output`.
struct ArchitectureStep {
  std::vector<std::string> inputs;
  int64_t width = 0;
  std::string output;
  UnitOptions options = {};
};

using Architecture = std::vector<ArchitectureStep>;

/*
  Dataflow graph of layers addressed by named registers.

  Register "I" holds the input of forward() and is never written by a step.
  The content of register "O" after the last step is the result. Steps run in
  the order they are listed; there is no dependency-based reordering, so a
  step must only read registers written by an earlier step (or "I").

  Example for a split layer:

    {{{"I"}, 4, "r0"}, {{"I"}, 4, "r1"}, {{"r0", "r1"}, 4, "O"}}
*/
class ArchitecturalModel : public Module {
public:
  static constexpr const char *kInputRegister = "I";
  static constexpr const char *kOutputRegister = "O";

  struct Step {
    std::vector<std::string> inputs;
    std::unique_ptr<Layer> layer;
    std::string output;
  };

  ArchitecturalModel(int64_t nin, const std::vector<std::string> &registers,
                     const Architecture &architecture, RandomSource &rng);

  std::vector<Value> forward(const std::vector<Value> &input) const;
  std::vector<Value> parameters() const override;
  std::string to_string() const override;

  int64_t nin() const noexcept { return nin_; }
  const std::vector<Step> &steps() const noexcept { return steps_; }
  std::vector<std::string> registers() const;
  bool has_register(const std::string &name) const;
  int64_t register_width(const std::string &name) const;

private:
  void infer_register_widths(const Architecture &architecture);
  int64_t input_width(const std::string &name) const;

  int64_t nin_;
  std::map<std::string, int64_t> widths_;
  std::vector<std::string> registers_;
  std::vector<Step> steps_;
};

} // namespace scalarnet
