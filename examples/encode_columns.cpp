#include <Fieldkit/Fieldkit.hpp>
using namespace fk;

#include <iostream>
#include <memory>
#include <vector>

int main()
{
	//One field per column of a table of weather records
	std::vector<std::shared_ptr<Field>> schema = {
		std::make_shared<ContinuousField>("temperature", -20, 45, Normalization::MinusOneOne),
		std::make_shared<DiscreteField>("sky", std::vector<std::string>{"clear", "cloudy", "rain", "snow"}),
		std::make_shared<BitField>("station", 8)
	};

	std::vector<Value> row = {Tensor(21.5), std::string("rain"), intmax_t(173)};

	for(size_t i=0;i<schema.size();i++) {
		const auto& field = schema[i];
		Tensor encoded = field->normalize(row[i]);
		std::cout << field->name() << " (" << field->type() << ")" << std::endl;
		std::cout << "  encoded: " << encoded << std::endl;
		for(const auto& out : field->describe())
			std::cout << "  output: " << out << std::endl;

		Value decoded = field->denormalize(encoded);
		std::visit(overloaded {
			[](const Tensor& t) { std::cout << "  decoded: " << t << std::endl; },
			[](intmax_t v) { std::cout << "  decoded: " << v << std::endl; },
			[](const std::string& s) { std::cout << "  decoded: " << s << std::endl; },
			[](const std::vector<std::string>& v) { std::cout << "  decoded: " << v.size() << " labels" << std::endl; }
		}, decoded);
	}

	StateDict states;
	for(const auto& field : schema)
		states[field->name()] = field->states();
	save(states, "weather_schema.json");

	auto restored = fieldFromStates(std::any_cast<StateDict>(load("weather_schema.json").at("sky")));
	std::cout << "restored " << restored->name() << " with " << restored->width() << " labels" << std::endl;
}
