#pragma once

#include <unordered_map>

#include "Field.hpp"

namespace fk
{

// One-hot codec over a fixed, ordered vocabulary of labels
struct FIELDKIT_EXPORT DiscreteField : public Field
{
	DiscreteField(std::string name, std::vector<std::string> vocabulary);

	//A label not in the vocabulary encodes to an all zero row
	Tensor encode(const std::string& label) const;
	Tensor encode(const std::vector<std::string>& labels) const;

	//Decodes a single row of shape {V}
	std::string decode(const Tensor& y) const;
	//Decodes every row of a tensor of shape {..., V}
	std::vector<std::string> decodeRows(const Tensor& y) const;

	Tensor normalize(const Value& x) const override;
	Value denormalize(const Tensor& x) const override;
	std::vector<Output> describe() const override
	{
		return {Output{OutputType::Discrete, vocabulary_.size(), std::nullopt}};
	}

	size_t width() const override { return vocabulary_.size(); }
	std::string type() const override { return "discrete"; }

	const std::vector<std::string>& vocabulary() const { return vocabulary_; }
	//Position of a label in the vocabulary, -1 if it is unknown
	int32_t indexOf(const std::string& label) const;

	StateDict states() const override
	{
		return {{"type", type()}, {"name", name_}, {"vocabulary", vocabulary_}};
	}
	static DiscreteField fromStates(const StateDict& states);

protected:
	Tensor rowsArgmax(const Tensor& y) const;

	std::vector<std::string> vocabulary_;
	std::unordered_map<std::string, int32_t> index_;
};

}
