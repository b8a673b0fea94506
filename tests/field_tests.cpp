#include <catch2/catch.hpp>

#include <Fieldkit/Fieldkit.hpp>

#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <thread>

using namespace fk;

TEST_CASE("Output descriptors", "[Output]")
{
	Output c = {OutputType::Continuous, 3, Normalization::MinusOneOne};
	Output d = {OutputType::Discrete, 2, std::nullopt};

	CHECK(c == Output{OutputType::Continuous, 3, Normalization::MinusOneOne});
	CHECK(c != d);
	CHECK(c != Output{OutputType::Continuous, 3, Normalization::ZeroOne});
	CHECK(to_string(c) == "{continuous, dim=3, minusone_one}");
	CHECK(to_string(d) == "{discrete, dim=2}");

	CHECK(normalizationFromString("zero_one") == Normalization::ZeroOne);
	CHECK(normalizationFromString(to_string(Normalization::MinusOneOne)) == Normalization::MinusOneOne);
	CHECK_THROWS_AS(normalizationFromString("zero_to_one"), InvalidConfigError);
}

TEST_CASE("ContinuousField", "[ContinuousField]")
{
	SECTION("zero one boundaries") {
		ContinuousField f("temperature", 0, 10, Normalization::ZeroOne);
		CHECK(f.normalize(Tensor(0.0)).item<double>() == 0.0);
		CHECK(f.normalize(Tensor(10.0)).item<double>() == 1.0);
		CHECK(f.normalize(Tensor(5.0)).item<double>() == 0.5);
	}

	SECTION("minus one one boundaries") {
		ContinuousField f("temperature", 0, 10, Normalization::MinusOneOne);
		CHECK(f.normalize(Tensor(0.0)).item<double>() == -1.0);
		CHECK(f.normalize(Tensor(10.0)).item<double>() == 1.0);
		CHECK(f.normalize(Tensor(5.0)).item<double>() == 0.0);
	}

	SECTION("output shape and dtype") {
		ContinuousField f("xyz", -1, 1, Normalization::ZeroOne, 3);
		Tensor x = Tensor({2, 3}, std::vector<float>{-1, 0, 1, 0.5f, -0.5f, 0}.data());
		Tensor y = f.normalize(x);
		CHECK(y.dtype() == DType::Double);
		CHECK(y.shape() == Shape({2, 3}));
		CHECK(y.toHost<double>() == std::vector<double>({0, 0.5, 1, 0.75, 0.25, 0.5}));
	}

	SECTION("integer inputs") {
		ContinuousField f("count", 0, 4);
		CHECK(f.normalize(Tensor(std::vector<int>{0, 1, 4}).reshape({3, 1})).toHost<double>()
			== std::vector<double>({0, 0.25, 1}));
	}

	SECTION("round trip") {
		for(auto mode : {Normalization::ZeroOne, Normalization::MinusOneOne}) {
			ContinuousField f("price", -3.7, 1234.5, mode, 4);
			std::vector<double> v = {-3.7, 0.0, 17.125, 1234.5, 600.3, 1e-3, -1.0, 42.0};
			Tensor x = Tensor({2, 4}, v.data());
			Tensor back = std::get<Tensor>(f.denormalize(f.normalize(x)));
			CHECK(back.shape() == x.shape());
			CHECK(allclose(back, x, 1e-9, 1e-9));
		}
	}

	SECTION("denormalize") {
		ContinuousField f("temperature", 20, 30, Normalization::MinusOneOne);
		CHECK(f.decode(Tensor(0.0)).item<double>() == 25.0);
		CHECK(f.decode(Tensor(-1.0)).item<double>() == 20.0);
		CHECK(f.decode(Tensor(1.0)).item<double>() == 30.0);

		ContinuousField g("temperature", 20, 30);
		CHECK(g.decode(Tensor(0.5)).item<double>() == 25.0);
	}

	SECTION("values outside the range are extrapolated") {
		ContinuousField f("temperature", 0, 10);
		CHECK(f.normalize(Tensor(20.0)).item<double>() == 2.0);
		CHECK(f.normalize(Tensor(-5.0)).item<double>() == -0.5);
	}

	SECTION("inverted range") {
		ContinuousField f("depth", 10, 0);
		CHECK(f.normalize(Tensor(10.0)).item<double>() == 0.0);
		CHECK(f.normalize(Tensor(0.0)).item<double>() == 1.0);
	}

	SECTION("dimension mismatch") {
		ContinuousField f("pair", 0, 1, Normalization::ZeroOne, 2);
		CHECK_THROWS_AS(f.normalize(Tensor(1.0)), DimensionError);
		CHECK_THROWS_AS(f.denormalize(Tensor(std::vector<double>{0.1, 0.2, 0.3})), DimensionError);
		CHECK_NOTHROW(f.normalize(Tensor(std::vector<double>{0.1, 0.2})));
	}

	SECTION("empty batch") {
		ContinuousField f("pair", 0, 1, Normalization::ZeroOne, 2);
		Tensor y = f.normalize(Tensor(Shape({0, 2}), DType::Double));
		CHECK(y.shape() == Shape({0, 2}));
	}

	SECTION("describe") {
		ContinuousField f("xyz", 0, 1, Normalization::MinusOneOne, 3);
		auto outputs = f.describe();
		REQUIRE(outputs.size() == 1);
		CHECK(outputs[0] == Output{OutputType::Continuous, 3, Normalization::MinusOneOne});
		CHECK(f.width() == 3);
		CHECK(f.type() == "continuous");
		CHECK(f.name() == "xyz");
	}

	SECTION("configuration errors") {
		CHECK_THROWS_AS(ContinuousField("x", 5, 5), ArithmeticError);
		CHECK_THROWS_AS(ContinuousField("x", 0, 1, Normalization::ZeroOne, 0), InvalidConfigError);
		CHECK_THROWS_AS(ContinuousField("x", 0, std::numeric_limits<double>::infinity()), InvalidConfigError);
		CHECK_THROWS_AS(ContinuousField("x", std::nan(""), 1), InvalidConfigError);
		CHECK_THROWS_AS(ContinuousField("x", 0, 1, static_cast<Normalization>(7)), InvalidConfigError);
	}

	SECTION("wrong kind of value") {
		ContinuousField f("x", 0, 1);
		CHECK_THROWS_AS(f.normalize(std::string("hot")), InvalidConfigError);
		CHECK_THROWS_AS(f.normalize(intmax_t(3)), InvalidConfigError);
		CHECK_THROWS(f.normalize(Tensor(std::vector<uint8_t>{1})));
	}
}

TEST_CASE("DiscreteField", "[DiscreteField]")
{
	DiscreteField f("letter", {"a", "b", "c"});

	SECTION("single label") {
		Tensor y = f.normalize(std::string("b"));
		CHECK(y.shape() == Shape({3}));
		CHECK(y.dtype() == DType::Double);
		CHECK(y.toHost<double>() == std::vector<double>({0, 1, 0}));
		CHECK(f.normalize("a").toHost<double>() == std::vector<double>({1, 0, 0}));
	}

	SECTION("list of labels") {
		Tensor y = f.normalize(std::vector<std::string>{"a", "c"});
		CHECK(y.shape() == Shape({2, 3}));
		CHECK(y.toHost<double>() == std::vector<double>({1, 0, 0, 0, 0, 1}));

		CHECK(f.encode(std::vector<std::string>{}).shape() == Shape({0, 3}));
	}

	SECTION("unknown labels") {
		CHECK(f.normalize("z").toHost<double>() == std::vector<double>({0, 0, 0}));
		CHECK(f.indexOf("z") == -1);
		CHECK(f.indexOf("c") == 2);
		Tensor y = f.encode(std::vector<std::string>{"c", "A"});
		CHECK(y.toHost<double>() == std::vector<double>({0, 0, 1, 0, 0, 0}));
	}

	SECTION("denormalize") {
		CHECK(std::get<std::string>(f.denormalize(Tensor(std::vector<double>{0, 1, 0}))) == "b");
		CHECK(f.decode(Tensor(std::vector<double>{0.1, 0.2, 0.7})) == "c");
		CHECK(f.decode(Tensor(std::vector<float>{0.4f, 0.4f, 0.2f})) == "a");
		CHECK(f.decode(Tensor(std::vector<int>{0, 0, 3})) == "c");
		// All zero rows still decode to a label
		CHECK(f.decode(zeros({3}, DType::Double)) == "a");
	}

	SECTION("denormalize batches") {
		double data[] = {0.1, 0.8, 0.1,
			0.0, 0.0, 1.0,
			0.9, 0.05, 0.05};
		Tensor y = Tensor({3, 3}, data);
		CHECK(std::get<std::vector<std::string>>(f.denormalize(y)) == std::vector<std::string>{"b", "c", "a"});
		CHECK(f.decodeRows(y.reshape({3, 1, 3})) == std::vector<std::string>{"b", "c", "a"});
		CHECK(f.decodeRows(Tensor(Shape({0, 3}), DType::Double)).empty());
		CHECK_THROWS_AS(f.decode(y), DimensionError);
	}

	SECTION("round trip") {
		std::vector<std::string> labels = {"c", "a", "b", "b"};
		CHECK(f.decodeRows(f.encode(labels)) == labels);
		for(const auto& label : f.vocabulary())
			CHECK(f.decode(f.encode(label)) == label);
	}

	SECTION("dimension mismatch") {
		CHECK_THROWS_AS(f.denormalize(Tensor(std::vector<double>{0, 1})), DimensionError);
		CHECK_THROWS_AS(f.denormalize(ones({2, 4}, DType::Double)), DimensionError);
	}

	SECTION("describe") {
		auto outputs = f.describe();
		REQUIRE(outputs.size() == 1);
		CHECK(outputs[0] == Output{OutputType::Discrete, 3, std::nullopt});
		CHECK(f.width() == 3);
		CHECK(f.type() == "discrete");
	}

	SECTION("configuration errors") {
		CHECK_THROWS_AS(DiscreteField("empty", {}), InvalidConfigError);
		CHECK_THROWS_AS(DiscreteField("dup", {"a", "b", "a"}), InvalidConfigError);
	}

	SECTION("wrong kind of value") {
		CHECK_THROWS_AS(f.normalize(intmax_t(1)), InvalidConfigError);
		CHECK_THROWS_AS(f.normalize(Tensor(1.0)), InvalidConfigError);
	}
}

TEST_CASE("BitField", "[BitField]")
{
	SECTION("encoding") {
		BitField f("flags", 4);
		Tensor y = f.normalize(intmax_t(5));
		CHECK(y.shape() == Shape({8}));
		CHECK(y.dtype() == DType::Double);
		CHECK(y.toHost<double>() == std::vector<double>({1, 0, 0, 1, 1, 0, 0, 1}));
		CHECK(f.encode(0).toHost<double>() == std::vector<double>({1, 0, 1, 0, 1, 0, 1, 0}));
		CHECK(f.encode(15).toHost<double>() == std::vector<double>({0, 1, 0, 1, 0, 1, 0, 1}));
	}

	SECTION("decoding") {
		BitField f("flags", 4);
		CHECK(std::get<intmax_t>(f.denormalize(Tensor(std::vector<double>{1, 0, 0, 1, 1, 0, 0, 1}))) == 5);
		CHECK(f.decode(Tensor(std::vector<float>{0.2f, 0.8f, 0.9f, 0.1f, 0.4f, 0.6f, 0.7f, 0.3f})) == 10);
		// Ties and all zero pairs decode to 0
		CHECK(f.decode(zeros({8}, DType::Double)) == 0);
		CHECK(f.decode(Tensor(std::vector<double>{0.5, 0.5, 0, 1, 0.5, 0.5, 0, 1})) == 5);
	}

	SECTION("round trip") {
		BitField f("flags", 6);
		for(intmax_t d=0;d<64;d++)
			CHECK(f.decode(f.encode(d)) == d);
	}

	SECTION("wide fields") {
		BitField f("id", BitField::MAX_BITS);
		CHECK(f.maxValue() == (intmax_t(1) << 62) - 1);
		intmax_t big = f.maxValue() - 12345;
		CHECK(f.decode(f.encode(big)) == big);
		CHECK(f.decode(f.encode(f.maxValue())) == f.maxValue());
	}

	SECTION("range errors") {
		BitField f("flags", 3);
		CHECK_THROWS_AS(f.normalize(intmax_t(8)), RangeError);
		CHECK_THROWS_AS(f.normalize(intmax_t(-1)), RangeError);
		CHECK_NOTHROW(f.normalize(intmax_t(7)));
	}

	SECTION("length errors") {
		BitField f("flags", 3);
		CHECK_THROWS_AS(f.denormalize(Tensor(std::vector<double>{1, 0, 0, 1})), LengthError);
		CHECK_THROWS_AS(f.denormalize(ones({8}, DType::Double)), LengthError);
		CHECK_THROWS_AS(f.denormalize(ones({3, 2}, DType::Double)), DimensionError);
	}

	SECTION("describe") {
		BitField f("flags", 4);
		auto outputs = f.describe();
		REQUIRE(outputs.size() == 4);
		for(const auto& out : outputs)
			CHECK(out == Output{OutputType::Discrete, 2, std::nullopt});
		CHECK(f.width() == 8);
		CHECK(f.type() == "bit");
	}

	SECTION("configuration errors") {
		CHECK_THROWS_AS(BitField("flags", 0), InvalidConfigError);
		CHECK_THROWS_AS(BitField("flags", BitField::MAX_BITS+1), InvalidConfigError);
	}

	SECTION("wrong kind of value") {
		BitField f("flags", 3);
		CHECK_THROWS_AS(f.normalize(std::string("3")), InvalidConfigError);
		CHECK_THROWS_AS(f.normalize(Tensor(3)), InvalidConfigError);
	}
}

TEST_CASE("Field interface", "[Field]")
{
	std::vector<std::shared_ptr<Field>> schema = {
		std::make_shared<ContinuousField>("price", 0, 100, Normalization::MinusOneOne),
		std::make_shared<DiscreteField>("color", std::vector<std::string>{"red", "green", "blue"}),
		std::make_shared<BitField>("flags", 5)
	};

	std::vector<Value> row = {Tensor(25.0), std::string("blue"), intmax_t(19)};

	SECTION("encode and decode a row") {
		for(size_t i=0;i<schema.size();i++) {
			Tensor y = schema[i]->normalize(row[i]);
			CHECK(y.shape().trailing() == (intmax_t)schema[i]->width());
			Value back = schema[i]->denormalize(y);
			CHECK(back.index() == row[i].index());
		}
		CHECK(std::get<Tensor>(schema[0]->denormalize(schema[0]->normalize(row[0]))).item<double>() == 25.0);
		CHECK(std::get<std::string>(schema[1]->denormalize(schema[1]->normalize(row[1]))) == "blue");
		CHECK(std::get<intmax_t>(schema[2]->denormalize(schema[2]->normalize(row[2]))) == 19);
	}

	SECTION("descriptors add up to the row width") {
		size_t total = 0;
		for(const auto& field : schema) {
			for(const auto& out : field->describe())
				total += out.dim;
		}
		CHECK(total == 1 + 3 + 10);
	}

	SECTION("value kinds") {
		CHECK(valueKind(row[1]) == "a label");
		CHECK(valueKind(row[2]) == "an integer");
		CHECK(valueKind(std::vector<std::string>{"x", "y"}) == "a list of 2 labels");
		CHECK(valueKind(row[0]) == "a tensor of shape {1}");
	}

	SECTION("rebuild from states") {
		for(const auto& field : schema) {
			std::shared_ptr<Field> rebuilt = fieldFromStates(field->states());
			CHECK(rebuilt->name() == field->name());
			CHECK(rebuilt->type() == field->type());
			CHECK(rebuilt->describe() == field->describe());
		}

		auto discrete = std::dynamic_pointer_cast<DiscreteField>(fieldFromStates(schema[1]->states()));
		REQUIRE(discrete != nullptr);
		CHECK(discrete->vocabulary() == std::vector<std::string>{"red", "green", "blue"});

		auto continuous = std::dynamic_pointer_cast<ContinuousField>(fieldFromStates(schema[0]->states()));
		REQUIRE(continuous != nullptr);
		CHECK(continuous->min() == 0);
		CHECK(continuous->max() == 100);
		CHECK(continuous->normalization() == Normalization::MinusOneOne);
	}

	SECTION("save and load a schema") {
		StateDict states;
		for(const auto& field : schema)
			states[field->name()] = field->states();

		std::string path = "fieldkit_schema_test.json";
		save(states, path);
		StateDict loaded = load(path);
		std::remove(path.c_str());

		REQUIRE(loaded.size() == schema.size());
		for(const auto& field : schema) {
			auto rebuilt = fieldFromStates(stateAt<StateDict>(loaded, field->name()));
			CHECK(rebuilt->describe() == field->describe());
		}
		auto bits = fieldFromStates(stateAt<StateDict>(loaded, "flags"));
		CHECK(std::get<intmax_t>(bits->denormalize(bits->normalize(intmax_t(19)))) == 19);
	}

	SECTION("shared across threads") {
		//Every thread starts from an unset default backend
		setDefaultBackend((Backend*)nullptr);

		const size_t num_threads = 8;
		const size_t rounds = 50;
		std::vector<int> succeeded(num_threads, 0);
		std::vector<std::thread> threads;
		for(size_t t=0;t<num_threads;t++) {
			threads.emplace_back([&, t]() {
				try {
					for(size_t r=0;r<rounds;r++) {
						double price = std::get<Tensor>(schema[0]->denormalize(schema[0]->normalize(row[0]))).item<double>();
						std::string color = std::get<std::string>(schema[1]->denormalize(schema[1]->normalize(row[1])));
						intmax_t flags = std::get<intmax_t>(schema[2]->denormalize(schema[2]->normalize(intmax_t(t))));
						if(std::abs(price-25.0) > 1e-9 || color != "blue" || flags != (intmax_t)t)
							return;
					}
					succeeded[t] = 1;
				}
				catch(const std::exception& e) {
					std::cerr << e.what() << std::endl;
				}
			});
		}
		for(auto& th : threads)
			th.join();

		for(size_t t=0;t<num_threads;t++)
			CHECK(succeeded[t] == 1);
		CHECK(defaultBackend() != nullptr);
		CHECK(defaultBackend()->name() == "CPU");
	}

	SECTION("malformed states") {
		CHECK_THROWS_AS(fieldFromStates(StateDict{}), InvalidConfigError);
		CHECK_THROWS_AS(fieldFromStates(StateDict{{"type", std::string("ordinal")}}), InvalidConfigError);

		StateDict states = schema[0]->states();
		states["normalization"] = std::string("zero_to_one");
		CHECK_THROWS_AS(fieldFromStates(states), InvalidConfigError);

		states = schema[2]->states();
		states["num_bits"] = 5.0;
		CHECK_THROWS_AS(fieldFromStates(states), InvalidConfigError);

		states = schema[1]->states();
		states.erase("vocabulary");
		CHECK_THROWS_AS(fieldFromStates(states), InvalidConfigError);
	}
}
