#include <algorithm>
#include <cctype>
#include <fstream>

#include "Serialize.hpp"

#include "Fieldkit/Core/Tensor.hpp"

using namespace fk;

#include <cereal/cereal.hpp>
#include <cereal/types/vector.hpp>
#include <cereal/types/string.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/archives/portable_binary.hpp>

namespace fk
{

//Name written next to each StateDict entry so load() knows what to read back
template <typename T>
static const char* stateTypeName()
{
	if constexpr(std::is_same_v<T, std::string>)
		return "string";
	else if constexpr(std::is_same_v<T, std::vector<std::string>>)
		return "strings";
	else if constexpr(std::is_same_v<T, Shape>)
		return "Shape";
	else if constexpr(std::is_same_v<T, int32_t>)
		return "int32_t";
	else if constexpr(std::is_same_v<T, float>)
		return "float";
	else if constexpr(std::is_same_v<T, double>)
		return "double";
	else if constexpr(std::is_same_v<T, bool>)
		return "bool";
	else if constexpr(std::is_same_v<T, Tensor>)
		return "Tensor";
	else
		return "StateDict";
}

//Calls f with a default constructed value of each storable type until f returns true
template <typename Func>
static bool visitStateTypes(Func f)
{
	return f(std::string()) || f(std::vector<std::string>()) || f(Shape()) || f(int32_t()) || f(float())
		|| f(double()) || f(bool()) || f(Tensor()) || f(StateDict());
}

}

namespace cereal
{

template <class Archive>
void save(Archive & archive, Shape const & s)
{
	archive(std::vector<int64_t>(s.begin(), s.end()));
}

template <class Archive>
void load(Archive & archive, Shape & s)
{
	std::vector<int64_t> dims;
	archive(dims);
	s = Shape(dims.begin(), dims.end());
}

template <class Archive>
void save(Archive & archive, Tensor const & t)
{
	archive(make_nvp("shape", t.shape()), make_nvp("dtype", to_string(t.dtype())));
	switch(t.dtype()) {
		case DType::Bool: archive(make_nvp("data", t.toHost<bool>())); break;
		case DType::Int32: archive(make_nvp("data", t.toHost<int32_t>())); break;
		case DType::Float: archive(make_nvp("data", t.toHost<float>())); break;
		case DType::Double: archive(make_nvp("data", t.toHost<double>())); break;
		default: throw FkError("Cannot save a tensor of type " + to_string(t.dtype()));
	}
}

template <typename T, class Archive>
static Tensor loadTensorData(Archive & archive, const Shape& s)
{
	std::vector<T> data;
	archive(make_nvp("data", data));
	if(data.size() != (size_t)s.volume()) {
		throw InvalidConfigError("Saved tensor of shape " + to_string(s) + " holds " + std::to_string(data.size())
			+ " values");
	}

	if constexpr(std::is_same_v<T, bool>) {
		std::vector<uint8_t> bytes(data.begin(), data.end());
		return Tensor(s, bytes.data());
	}
	else
		return Tensor(s, data.data());
}

template <class Archive>
void load(Archive & archive, Tensor & t)
{
	Shape s;
	std::string dtype;
	archive(make_nvp("shape", s), make_nvp("dtype", dtype));

	if(dtype == to_string(DType::Bool))
		t = loadTensorData<bool>(archive, s);
	else if(dtype == to_string(DType::Int32))
		t = loadTensorData<int32_t>(archive, s);
	else if(dtype == to_string(DType::Float))
		t = loadTensorData<float>(archive, s);
	else if(dtype == to_string(DType::Double))
		t = loadTensorData<double>(archive, s);
	else
		throw InvalidConfigError("Unknown tensor dtype \"" + dtype + "\" in saved state");
}

template <class Archive>
void save(Archive & archive, StateDict const & dict)
{
	std::vector<std::string> keys;
	std::vector<std::string> types;
	for(const auto& [key, value] : dict) {
		bool storable = visitStateTypes([&, &value=value](auto v) {
			using T = decltype(v);
			if(value.type() != typeid(T))
				return false;
			types.push_back(stateTypeName<T>());
			return true;
		});
		if(storable == false)
			throw FkError("Cannot save value of type " + demangle(value.type().name()) + " under key " + key);
		keys.push_back(key);
	}
	archive(make_nvp("keys", keys), make_nvp("types", types));

	for(const auto& [key, value] : dict) {
		visitStateTypes([&, &key=key, &value=value](auto v) {
			using T = decltype(v);
			if(value.type() != typeid(T))
				return false;
			archive(make_nvp(key, std::any_cast<const T&>(value)));
			return true;
		});
	}
}

template <class Archive>
void load(Archive & archive, StateDict & dict)
{
	std::vector<std::string> keys;
	std::vector<std::string> types;
	archive(make_nvp("keys", keys), make_nvp("types", types));

	if(keys.size() != types.size())
		throw InvalidConfigError("Corrupted state. " + std::to_string(keys.size()) + " keys but "
			+ std::to_string(types.size()) + " types");

	for(size_t i=0;i<keys.size();i++) {
		bool known = visitStateTypes([&](auto v) {
			using T = decltype(v);
			if(types[i] != stateTypeName<T>())
				return false;
			archive(make_nvp(keys[i], v));
			dict[keys[i]] = std::move(v);
			return true;
		});
		if(known == false)
			throw InvalidConfigError("Cannot deserialize type " + types[i]);
	}
}

}

//Lower case extension of the file name, empty when there is none
static std::string fileExtension(const std::string& path)
{
	size_t name_pos = path.find_last_of("/\\");
	std::string name = path.substr(name_pos == std::string::npos ? 0 : name_pos+1);
	size_t dot_pos = name.find_last_of('.');
	if(dot_pos == std::string::npos)
		return "";
	std::string ext = name.substr(dot_pos+1);
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
	return ext;
}

void fk::save(const StateDict& dict, const std::string& path)
{
	std::ofstream out(path, std::ios::binary);
	if(out.good() == false)
		throw FkError("Cannot open " + path + " for writing");

	if(fileExtension(path) == "json") {
		cereal::JSONOutputArchive ar(out);
		ar(cereal::make_nvp("state", dict));
	}
	else {
		cereal::PortableBinaryOutputArchive ar(out);
		ar(dict);
	}
}

StateDict fk::load(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	if(in.good() == false)
		throw FkError("Cannot open " + path + " for reading");

	StateDict dict;
	try {
		if(fileExtension(path) == "json") {
			cereal::JSONInputArchive ar(in);
			ar(cereal::make_nvp("state", dict));
		}
		else {
			cereal::PortableBinaryInputArchive ar(in);
			ar(dict);
		}
	}
	catch(const cereal::Exception& e) {
		throw InvalidConfigError("Cannot parse " + path + ": " + e.what());
	}
	return dict;
}
