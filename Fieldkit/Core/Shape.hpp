#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "Fieldkit_export.h"

namespace fk
{

// Dimensions of a tensor, outermost first
class FIELDKIT_EXPORT Shape : public std::vector<intmax_t>
{
public:
	Shape() = default;
	Shape(std::initializer_list<intmax_t> dims) : std::vector<intmax_t>(dims) {}

	template<class InputIt>
	Shape(InputIt first, InputIt last) : std::vector<intmax_t>(first, last) {}

	explicit Shape(size_t n, intmax_t init=0) : std::vector<intmax_t>(n, init) {}

	intmax_t volume() const
	{
		return std::accumulate(begin(), end(), intmax_t(1), std::multiplies<intmax_t>());
	}

	bool operator== (const Shape& other) const
	{
		return size() == other.size() && std::equal(begin(), end(), other.begin());
	}

	bool operator!= (const Shape& other) const {return !(*this == other);}

	bool contains(intmax_t dim) const {return std::find(begin(), end(), dim) != end();}

	//Size of the last dimension, the number of slots per sample in a field encoding.
	//0 for a shape without dimensions
	intmax_t trailing() const {return empty() ? 0 : back();}

	//Appends dimensions
	Shape operator+ (intmax_t dim) const
	{
		Shape res = *this;
		res.push_back(dim);
		return res;
	}

	Shape operator+ (const Shape& dims) const
	{
		Shape res = *this;
		res.insert(res.end(), dims.begin(), dims.end());
		return res;
	}

	void operator+= (intmax_t dim) {push_back(dim);}
	void operator+= (const Shape& dims) {insert(end(), dims.begin(), dims.end());}
};

inline std::string to_string(const Shape& s)
{
	std::string res;
	for(auto dim : s)
		res += (res.empty() ? "" : ", ") + std::to_string(dim);
	return "{" + res + "}";
}

inline std::ostream& operator<< (std::ostream& os, const Shape& s)
{
	return os << to_string(s);
}

}
