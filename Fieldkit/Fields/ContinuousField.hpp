#pragma once

#include "Field.hpp"

namespace fk
{

// Scales real values from [min, max] into [0, 1] or [-1, 1]. Values outside of the range are
// extrapolated, not clamped
struct FIELDKIT_EXPORT ContinuousField : public Field
{
	ContinuousField(std::string name, double min, double max, Normalization normalization=Normalization::ZeroOne
		, size_t width=1);

	Tensor encode(const Tensor& x) const;
	Tensor decode(const Tensor& y) const;

	Tensor normalize(const Value& x) const override;
	Value denormalize(const Tensor& x) const override { return decode(x); }
	std::vector<Output> describe() const override
	{
		return {Output{OutputType::Continuous, width_, normalization_}};
	}

	size_t width() const override { return width_; }
	std::string type() const override { return "continuous"; }

	double min() const { return min_; }
	double max() const { return max_; }
	Normalization normalization() const { return normalization_; }

	StateDict states() const override
	{
		return {{"type", type()}, {"name", name_}, {"min", min_}, {"max", max_}
			, {"normalization", to_string(normalization_)}, {"width", (int32_t)width_}};
	}
	static ContinuousField fromStates(const StateDict& states);

protected:
	void checkDimension(const Tensor& x) const;

	double min_;
	double max_;
	Normalization normalization_;
	size_t width_;
};

}
