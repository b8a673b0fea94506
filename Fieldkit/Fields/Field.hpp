#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <Fieldkit/Core/Tensor.hpp>
#include <Fieldkit/Core/Serialize.hpp>
#include "Output.hpp"

#include "Fieldkit_export.h"

namespace fk
{

//A value in the native domain of a field. Continuous fields work on tensors, bit fields on
//integers and discrete fields on a single label or a list of labels
using Value = std::variant<Tensor, intmax_t, std::string, std::vector<std::string>>;

FIELDKIT_EXPORT std::string valueKind(const Value& v);

//A named, immutable codec between a column's native values and a fixed width numeric encoding
struct FIELDKIT_EXPORT Field
{
	explicit Field(std::string name) : name_(std::move(name)) {}
	virtual ~Field() = default;

	const std::string& name() const { return name_; }

	virtual Tensor normalize(const Value& x) const = 0;
	virtual Value denormalize(const Tensor& x) const = 0;
	virtual std::vector<Output> describe() const = 0;

	//Number of numeric slots a single sample occupies
	virtual size_t width() const = 0;
	virtual std::string type() const = 0;
	virtual StateDict states() const = 0;

protected:
	std::string name_;
};

//Rebuilds the field a states() snapshot was taken from
FIELDKIT_EXPORT std::shared_ptr<Field> fieldFromStates(const StateDict& states);

}
