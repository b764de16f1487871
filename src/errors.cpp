#include "errors.hpp"

#include <fmt/format.h>

namespace scalarnet {

WidthMismatchError::WidthMismatchError(const std::string &reg,
                                       int64_t expected, int64_t got)
    : Error(fmt::format("register '{}' input mismatch (got {} expected {})",
                        reg, got, expected)),
      register_name(reg), expected(expected), got(got) {}

UnknownRegisterError::UnknownRegisterError(const std::string &reg,
                                           const std::string &reason)
    : Error(fmt::format("register '{}': {}", reg, reason)),
      register_name(reg) {}

UnsetRegisterReadError::UnsetRegisterReadError(const std::string &reg,
                                               size_t step)
    : Error(fmt::format("step {} reads register '{}' before it was written",
                        step, reg)),
      register_name(reg), step(step) {}

OutputUnwrittenError::OutputUnwrittenError()
    : Error("evaluation finished without writing register 'O'") {}

InputWidthMismatchError::InputWidthMismatchError(size_t expected, size_t got)
    : Error(fmt::format("input width mismatch: expected {} values, got {}",
                        expected, got)),
      expected(expected), got(got) {}

} // namespace scalarnet
