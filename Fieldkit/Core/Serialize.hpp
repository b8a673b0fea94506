#pragma once

#include <map>
#include <any>
#include <string>

#include "Error.hpp"

#include "Fieldkit_export.h"

namespace fk
{

using StateDict = std::map<std::string, std::any>;

//Writes a StateDict. Paths ending in .json are written as JSON, anything else as portable binary
void FIELDKIT_EXPORT save(const StateDict& dict, const std::string& path);
StateDict FIELDKIT_EXPORT load(const std::string& path);

//Typed lookup into a StateDict. Throws InvalidConfigError when the key is missing or holds another type
template <typename T>
T stateAt(const StateDict& states, const std::string& key)
{
	auto it = states.find(key);
	if(it == states.end())
		throw InvalidConfigError("Saved state has no key \"" + key + "\"");
	const T* value = std::any_cast<T>(&it->second);
	if(value == nullptr)
		throw InvalidConfigError("Saved state key \"" + key + "\" does not hold the expected type");
	return *value;
}

}
