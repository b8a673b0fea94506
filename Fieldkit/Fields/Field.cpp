#include "Field.hpp"

#include "ContinuousField.hpp"
#include "DiscreteField.hpp"
#include "BitField.hpp"

using namespace fk;

std::string fk::valueKind(const Value& v)
{
	return std::visit(overloaded {
		[](const Tensor& t) { return "a tensor of shape " + to_string(t.shape()); },
		[](intmax_t) { return std::string("an integer"); },
		[](const std::string&) { return std::string("a label"); },
		[](const std::vector<std::string>& l) { return "a list of " + std::to_string(l.size()) + " labels"; }
	}, v);
}

std::shared_ptr<Field> fk::fieldFromStates(const StateDict& states)
{
	std::string type = stateAt<std::string>(states, "type");
	if(type == "continuous")
		return std::make_shared<ContinuousField>(ContinuousField::fromStates(states));
	else if(type == "discrete")
		return std::make_shared<DiscreteField>(DiscreteField::fromStates(states));
	else if(type == "bit")
		return std::make_shared<BitField>(BitField::fromStates(states));
	throw InvalidConfigError("Unknown field type \"" + type + "\"");
}
