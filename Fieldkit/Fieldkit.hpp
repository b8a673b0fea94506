#pragma once

#include "Core/Tensor.hpp"
#include "Core/Serialize.hpp"
#include "Fields/Output.hpp"
#include "Fields/Field.hpp"
#include "Fields/ContinuousField.hpp"
#include "Fields/DiscreteField.hpp"
#include "Fields/BitField.hpp"
