#pragma once

#include <cstddef>
#include <cstdint>

namespace scalarnet {

enum class Activation
{
   Linear,
   ReLU,
   Tanh
};

constexpr const char*
get_name(Activation a) noexcept
{
   switch (a)
   {
      case Activation::Linear:
         return "Linear";
      case Activation::ReLU:
         return "ReLU";
      case Activation::Tanh:
         return "Tanh";
      default:
         return "UnknownActivation";
   }
}

// Options forwarded unchanged to every Neuron a layer (or graph step) builds.
struct UnitOptions
{
   Activation activation = Activation::ReLU;

   constexpr bool
   nonlin() const noexcept
   {
      return activation != Activation::Linear;
   }

   static constexpr UnitOptions
   linear() noexcept
   {
      return UnitOptions{Activation::Linear};
   }

   static constexpr UnitOptions
   relu() noexcept
   {
      return UnitOptions{Activation::ReLU};
   }
};

inline constexpr size_t
layer_parameter_count(int64_t nin, int64_t nout) noexcept
{
   return static_cast< size_t >(nout) * (static_cast< size_t >(nin) + 1);
}

} // namespace scalarnet
