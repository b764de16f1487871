#pragma once

#include "architecture.hpp"
#include "autograd.hpp"
#include "errors.hpp"
#include "module.hpp"
#include "neuralnet.hpp"
#include "random.hpp"
#include "types.hpp"
#include "value.hpp"
