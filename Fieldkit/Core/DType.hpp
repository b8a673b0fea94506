#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

namespace fk
{

// Element types a tensor can hold. Field encodings are always Double, indices are Int32
enum class DType
{
	Unknown = -1,
	Bool = 0,
	Int32,
	Float,
	Double,
};

template <typename T>
constexpr inline DType typeToDType()
{
	using U = std::remove_cv_t<T>;
	if constexpr(std::is_same_v<U, bool> || std::is_same_v<U, uint8_t>)
		return DType::Bool;
	else if constexpr(std::is_same_v<U, int32_t>)
		return DType::Int32;
	else if constexpr(std::is_same_v<U, float>)
		return DType::Float;
	else if constexpr(std::is_same_v<U, double>)
		return DType::Double;
	else
		return DType::Unknown;
}

inline constexpr size_t dtypeToSize(DType dtype)
{
	switch(dtype) {
		case DType::Bool: return sizeof(bool);
		case DType::Int32: return sizeof(int32_t);
		case DType::Float: return sizeof(float);
		case DType::Double: return sizeof(double);
		default: return 0;
	}
}

inline std::string to_string(DType dtype)
{
	switch(dtype) {
		case DType::Bool: return "bool";
		case DType::Int32: return "int32";
		case DType::Float: return "float";
		case DType::Double: return "double";
		default: return "unknown";
	}
}

}
