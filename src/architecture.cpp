#include "architecture.hpp"
#include "errors.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace scalarnet {

using RegisterFile = std::map<std::string, std::optional<std::vector<Value>>>;

ArchitecturalModel::ArchitecturalModel(
    int64_t nin, const std::vector<std::string> &registers,
    const Architecture &architecture, RandomSource &rng)
    : nin_(nin) {
  if (nin < 1) {
    throw InvalidWidthError(
        fmt::format("input register width must be at least 1 (got {})", nin));
  }

  registers_ = {kInputRegister, kOutputRegister};
  for (const auto &r : registers) {
    if (!has_register(r)) {
      registers_.push_back(r);
    }
  }

  infer_register_widths(architecture);

  steps_.reserve(architecture.size());
  for (const auto &step : architecture) {
    std::unique_ptr<Layer> layer;

    if (step.inputs.size() == 1) {
      layer = std::make_unique<Layer>(input_width(step.inputs[0]), step.width,
                                      rng, step.options);
    } else if (step.inputs.size() == 2) {
      layer = std::make_unique<RegisterConjoinLayer>(
          input_width(step.inputs[0]), input_width(step.inputs[1]),
          step.width, rng, step.options);
    } else {
      throw RegisterSpecError(fmt::format(
          "step writing '{}' has {} input registers; the input registers "
          "must be either a single register or a pair of registers",
          step.output, step.inputs.size()));
    }

    steps_.push_back({step.inputs, std::move(layer), step.output});
  }
}

// The first step writing a register fixes its width; later writers must agree.
void ArchitecturalModel::infer_register_widths(
    const Architecture &architecture) {
  widths_[kInputRegister] = nin_;

  for (const auto &step : architecture) {
    if (step.output == kInputRegister) {
      throw RegisterSpecError("register 'I' holds the input and cannot be "
                              "written by a step");
    }
    if (!has_register(step.output)) {
      throw UnknownRegisterError(step.output, "written but never declared");
    }
    if (step.width < 1) {
      throw InvalidWidthError(
          fmt::format("register '{}' declared with width {}", step.output,
                      step.width));
    }

    auto it = widths_.find(step.output);
    if (it == widths_.end()) {
      widths_.emplace(step.output, step.width);
    } else if (it->second != step.width) {
      throw WidthMismatchError(step.output, it->second, step.width);
    }
  }
}

int64_t ArchitecturalModel::input_width(const std::string &name) const {
  if (!has_register(name)) {
    throw UnknownRegisterError(name, "read but never declared");
  }
  return register_width(name);
}

std::vector<Value>
ArchitecturalModel::forward(const std::vector<Value> &input) const {
  if (static_cast<int64_t>(input.size()) != nin_) {
    throw InputWidthMismatchError(static_cast<size_t>(nin_), input.size());
  }

  RegisterFile file;
  for (const auto &r : registers_) {
    file.emplace(r, std::nullopt);
  }
  file[kInputRegister] = input;

  auto read = [&file](const std::string &name,
                      size_t step) -> const std::vector<Value> & {
    const auto &slot = file.at(name);
    if (!slot) {
      throw UnsetRegisterReadError(name, step);
    }
    return *slot;
  };

  for (size_t i = 0; i < steps_.size(); ++i) {
    const auto &step = steps_[i];

    std::vector<Value> x;
    if (step.inputs.size() == 2) {
      const auto &a = read(step.inputs[0], i);
      const auto &b = read(step.inputs[1], i);
      x.reserve(a.size() + b.size());
      x.insert(x.end(), a.begin(), a.end());
      x.insert(x.end(), b.begin(), b.end());
    } else {
      x = read(step.inputs[0], i);
    }

    file[step.output] = step.layer->forward(x);
  }

  auto &out = file.at(kOutputRegister);
  if (!out) {
    throw OutputUnwrittenError();
  }
  return std::move(*out);
}

std::vector<Value> ArchitecturalModel::parameters() const {
  std::vector<Value> params;

  for (const auto &step : steps_) {
    auto layer_params = step.layer->parameters();
    params.insert(params.end(), layer_params.begin(), layer_params.end());
  }

  return params;
}

std::string ArchitecturalModel::to_string() const {
  std::vector<std::string> parts;
  parts.reserve(steps_.size());
  for (const auto &step : steps_) {
    parts.push_back(step.layer->to_string());
  }
  return fmt::format("ArchitecturalModel of [{}]", fmt::join(parts, ", "));
}

std::vector<std::string> ArchitecturalModel::registers() const {
  auto names = registers_;
  std::sort(names.begin(), names.end());
  return names;
}

bool ArchitecturalModel::has_register(const std::string &name) const {
  return std::find(registers_.begin(), registers_.end(), name) !=
         registers_.end();
}

int64_t ArchitecturalModel::register_width(const std::string &name) const {
  auto it = widths_.find(name);
  if (it == widths_.end()) {
    throw UnknownRegisterError(
        name, has_register(name) ? "no step writes it, so its width is unknown"
                                 : "not a declared register");
  }
  return it->second;
}

} // namespace scalarnet
