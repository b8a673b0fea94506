#include "BitField.hpp"

using namespace fk;

BitField::BitField(std::string name, size_t num_bits)
	: Field(std::move(name)), num_bits_(num_bits)
{
	fk_require(num_bits >= 1 && num_bits <= MAX_BITS, InvalidConfigError, "Field " + name_ + " needs between 1 and "
		+ std::to_string(MAX_BITS) + " bits, got " + std::to_string(num_bits));
}

Tensor BitField::encode(intmax_t x) const
{
	if(x < 0 || x > maxValue()) {
		throw RangeError(std::to_string(x) + " can't be represented with " + std::to_string(num_bits_)
			+ " bits. Valid range is [0, " + std::to_string(maxValue()) + "]");
	}

	std::vector<int32_t> bits(num_bits_);
	for(size_t i=0;i<num_bits_;i++)
		bits[i] = int32_t((x >> (num_bits_-1-i)) & 1);
	return oneHot(Tensor(bits), 2).flatten();
}

intmax_t BitField::decode(const Tensor& y) const
{
	fk_check(y.pimpl() != nullptr, "Field " + name_ + " got a tensor without storage");
	if(y.size() != width()) {
		throw LengthError("Expected " + std::to_string(width()) + " values for " + std::to_string(num_bits_)
			+ " bits, got " + std::to_string(y.size()));
	}
	fk_require(y.dimensions() == 1, DimensionError, "Bit encodings are flat, got shape " + to_string(y.shape()));
	requireProperties(y.pimpl(), IsDType{DType::Int32, DType::Float, DType::Double});

	std::vector<int32_t> bits = argmax(y.reshape({(intmax_t)num_bits_, 2})).toHost<int32_t>();
	intmax_t res = 0;
	for(auto b : bits)
		res = (res << 1) | b;
	return res;
}

Tensor BitField::normalize(const Value& x) const
{
	const intmax_t* v = std::get_if<intmax_t>(&x);
	if(v == nullptr)
		throw InvalidConfigError("BitField " + name_ + " normalizes integers, got " + valueKind(x));
	return encode(*v);
}

std::vector<Output> BitField::describe() const
{
	return std::vector<Output>(num_bits_, Output{OutputType::Discrete, 2, std::nullopt});
}

BitField BitField::fromStates(const StateDict& states)
{
	int32_t num_bits = stateAt<int32_t>(states, "num_bits");
	fk_require(num_bits > 0, InvalidConfigError, "Saved num_bits must be positive. Got " + std::to_string(num_bits));
	return BitField(stateAt<std::string>(states, "name"), (size_t)num_bits);
}
