#pragma once

#include <string>

#include "Fieldkit_export.h"

namespace fk
{

std::string FIELDKIT_EXPORT demangle(const char* name);

//Visitor helper for std::visit over the native value variant
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}
