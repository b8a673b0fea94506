#pragma once

#include <optional>
#include <ostream>
#include <string>

#include <Fieldkit/Core/Error.hpp>

namespace fk
{

enum class OutputType
{
	Continuous = 0,
	Discrete,
};

enum class Normalization
{
	ZeroOne = 0,
	MinusOneOne,
};

inline std::string to_string(OutputType type)
{
	if(type == OutputType::Continuous)
		return "continuous";
	else if(type == OutputType::Discrete)
		return "discrete";
	return "unknown";
}

inline std::string to_string(Normalization norm)
{
	if(norm == Normalization::ZeroOne)
		return "zero_one";
	else if(norm == Normalization::MinusOneOne)
		return "minusone_one";
	return "unknown";
}

inline Normalization normalizationFromString(const std::string& str)
{
	if(str == "zero_one")
		return Normalization::ZeroOne;
	else if(str == "minusone_one")
		return Normalization::MinusOneOne;
	throw InvalidConfigError("Not a valid normalization option: \"" + str + "\"");
}

// Describes one encoded sub-tensor to the model-construction layer
struct Output
{
	OutputType type;
	size_t dim;
	std::optional<Normalization> normalization;

	bool operator== (const Output& other) const
	{
		return type == other.type && dim == other.dim && normalization == other.normalization;
	}
	bool operator!= (const Output& other) const { return !(*this == other); }
};

inline std::string to_string(const Output& out)
{
	std::string res = "{" + to_string(out.type) + ", dim=" + std::to_string(out.dim);
	if(out.normalization.has_value())
		res += ", " + to_string(out.normalization.value());
	return res + "}";
}

inline std::ostream& operator<< (std::ostream& os, const Output& out)
{
	os << to_string(out);
	return os;
}

}
