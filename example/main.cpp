#include <scalarnet.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace scalarnet;

int main() {
  constexpr int64_t input_size = 4;

  RandomSource rng(1337);

  // Two parallel branches over the input, merged into the output register.
  Architecture arch = {
      {{"I"}, 4, "r0", UnitOptions::relu()},
      {{"I"}, 4, "r1", UnitOptions{Activation::Tanh}},
      {{"r0", "r1"}, 2, "O", UnitOptions::linear()},
  };
  auto net = ArchitecturalModel(input_size, {"r0", "r1"}, arch, rng);
  net.print();

  for (const auto &step : net.steps()) {
    fmt::print("step {} -> {}: {} inputs, {} outputs\n",
               fmt::join(step.inputs, "+"), step.output, step.layer->nin(),
               step.layer->nout());
  }

  auto input = values({0.5, -1.0, 2.0, 0.25});

  for (int iter = 0; iter < 3; ++iter) {
    net.zero_grad();

    auto out = net.forward(input);
    Value total = out[0];
    for (size_t i = 1; i < out.size(); ++i) {
      total = total + out[i];
    }
    total.backward();

    double grad_norm = 0.0;
    for (const auto &p : net.parameters()) {
      grad_norm += p.grad() * p.grad();
    }
    fmt::print("iter[{}]: output sum = {}, squared grad norm = {}\n", iter,
               total.data(), grad_norm);
  }

  fmt::print("{} parameters\n", net.num_parameters());
}
