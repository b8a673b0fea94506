#include "ContinuousField.hpp"

#include <cmath>

using namespace fk;

ContinuousField::ContinuousField(std::string name, double min, double max, Normalization normalization, size_t width)
	: Field(std::move(name)), min_(min), max_(max), normalization_(normalization), width_(width)
{
	fk_require(std::isfinite(min) && std::isfinite(max), InvalidConfigError
		, "Range of field " + name_ + " must be finite. Got [" + std::to_string(min) + ", " + std::to_string(max) + "]");
	fk_require(max != min, ArithmeticError, "Field " + name_ + " has an empty range. min == max == " + std::to_string(min));
	fk_require(width != 0, InvalidConfigError, "Field " + name_ + " must have a width of at least 1");
	fk_require(normalization == Normalization::ZeroOne || normalization == Normalization::MinusOneOne, InvalidConfigError
		, "Not valid normalization option for field " + name_);
}

void ContinuousField::checkDimension(const Tensor& x) const
{
	fk_check(x.pimpl() != nullptr, "Field " + name_ + " got a tensor without storage");
	requireProperties(x.pimpl(), IsDType{DType::Int32, DType::Float, DType::Double});
	intmax_t dim = x.shape().trailing();
	if(dim != (intmax_t)width_) {
		throw DimensionError("Dimension is " + std::to_string(dim) + ". Expected dimension is "
			+ std::to_string(width_));
	}
}

Tensor ContinuousField::encode(const Tensor& x) const
{
	checkDimension(x);

	switch(normalization_) {
		case Normalization::ZeroOne:
			return rescale(x, min_, max_-min_, 1, 0);
		case Normalization::MinusOneOne:
			return rescale(x, min_, max_-min_, 2, -1);
	}
	throw InvalidConfigError("Not valid normalization option!");
}

Tensor ContinuousField::decode(const Tensor& y) const
{
	checkDimension(y);

	switch(normalization_) {
		case Normalization::ZeroOne:
			return rescale(y, 0, 1, max_-min_, min_);
		case Normalization::MinusOneOne:
			return rescale(y, -1, 2, max_-min_, min_);
	}
	throw InvalidConfigError("Not valid normalization option!");
}

Tensor ContinuousField::normalize(const Value& x) const
{
	const Tensor* t = std::get_if<Tensor>(&x);
	if(t == nullptr)
		throw InvalidConfigError("ContinuousField " + name_ + " normalizes tensors, got " + valueKind(x));
	return encode(*t);
}

ContinuousField ContinuousField::fromStates(const StateDict& states)
{
	int32_t width = stateAt<int32_t>(states, "width");
	fk_require(width > 0, InvalidConfigError, "Saved width must be positive. Got " + std::to_string(width));
	return ContinuousField(stateAt<std::string>(states, "name"), stateAt<double>(states, "min")
		, stateAt<double>(states, "max"), normalizationFromString(stateAt<std::string>(states, "normalization"))
		, (size_t)width);
}
