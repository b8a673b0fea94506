#include "DiscreteField.hpp"

#include <limits>

using namespace fk;

DiscreteField::DiscreteField(std::string name, std::vector<std::string> vocabulary)
	: Field(std::move(name)), vocabulary_(std::move(vocabulary))
{
	fk_require(vocabulary_.empty() == false, InvalidConfigError, "Field " + name_ + " needs at least one label");
	fk_require(vocabulary_.size() < (size_t)std::numeric_limits<int32_t>::max(), InvalidConfigError
		, "Vocabulary of field " + name_ + " is too large");

	for(size_t i=0;i<vocabulary_.size();i++) {
		auto [it, inserted] = index_.emplace(vocabulary_[i], (int32_t)i);
		if(inserted == false)
			throw InvalidConfigError("Label \"" + vocabulary_[i] + "\" appears more than once in field " + name_);
	}
}

int32_t DiscreteField::indexOf(const std::string& label) const
{
	auto it = index_.find(label);
	if(it == index_.end())
		return -1;
	return it->second;
}

Tensor DiscreteField::encode(const std::string& label) const
{
	return encode(std::vector<std::string>{label}).reshape({(intmax_t)vocabulary_.size()});
}

Tensor DiscreteField::encode(const std::vector<std::string>& labels) const
{
	std::vector<int32_t> indices(labels.size());
	for(size_t i=0;i<labels.size();i++)
		indices[i] = indexOf(labels[i]);
	return oneHot(Tensor({(intmax_t)indices.size()}, indices.data()), vocabulary_.size());
}

Tensor DiscreteField::rowsArgmax(const Tensor& y) const
{
	fk_check(y.pimpl() != nullptr, "Field " + name_ + " got a tensor without storage");
	requireProperties(y.pimpl(), IsDType{DType::Int32, DType::Float, DType::Double});
	intmax_t dim = y.shape().trailing();
	if(dim != (intmax_t)vocabulary_.size()) {
		throw DimensionError("Dimension is " + std::to_string(dim) + ". Expected dimension is "
			+ std::to_string(vocabulary_.size()));
	}
	if(y.size() == 0)
		return Tensor(Shape{0}, DType::Int32);
	return argmax(y);
}

std::string DiscreteField::decode(const Tensor& y) const
{
	Tensor index = rowsArgmax(y);
	fk_require(y.dimensions() == 1, DimensionError, "decode() takes a single row, got shape " + to_string(y.shape())
		+ ". Use decodeRows() for batches");
	return vocabulary_[index.item<int32_t>()];
}

std::vector<std::string> DiscreteField::decodeRows(const Tensor& y) const
{
	std::vector<int32_t> indices = rowsArgmax(y).toHost<int32_t>();
	std::vector<std::string> res;
	res.reserve(indices.size());
	for(auto i : indices)
		res.push_back(vocabulary_[i]);
	return res;
}

Tensor DiscreteField::normalize(const Value& x) const
{
	return std::visit(overloaded {
		[this](const std::string& label) { return encode(label); },
		[this](const std::vector<std::string>& labels) { return encode(labels); },
		[this, &x](const auto&) -> Tensor {
			throw InvalidConfigError("DiscreteField " + name_ + " normalizes labels, got " + valueKind(x));
		}
	}, x);
}

Value DiscreteField::denormalize(const Tensor& x) const
{
	if(x.pimpl() != nullptr && x.dimensions() == 1)
		return decode(x);
	return decodeRows(x);
}

DiscreteField DiscreteField::fromStates(const StateDict& states)
{
	return DiscreteField(stateAt<std::string>(states, "name"), stateAt<std::vector<std::string>>(states, "vocabulary"));
}
