#pragma once

#include "Field.hpp"

namespace fk
{

// Encodes a non-negative integer as num_bits one-hot pairs, most significant bit first.
// A 0 bit is [1, 0] and a 1 bit is [0, 1]
struct FIELDKIT_EXPORT BitField : public Field
{
	BitField(std::string name, size_t num_bits);

	Tensor encode(intmax_t x) const;
	intmax_t decode(const Tensor& y) const;

	Tensor normalize(const Value& x) const override;
	Value denormalize(const Tensor& x) const override { return decode(x); }
	std::vector<Output> describe() const override;

	size_t width() const override { return 2*num_bits_; }
	std::string type() const override { return "bit"; }

	size_t numBits() const { return num_bits_; }
	//Largest encodable value
	intmax_t maxValue() const { return (intmax_t(1) << num_bits_) - 1; }

	StateDict states() const override
	{
		return {{"type", type()}, {"name", name_}, {"num_bits", (int32_t)num_bits_}};
	}
	static BitField fromStates(const StateDict& states);

	static constexpr size_t MAX_BITS = 62;

protected:
	size_t num_bits_;
};

}
