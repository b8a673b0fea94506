#pragma once

#include "Shape.hpp"
#include "DType.hpp"
#include "Backend.hpp"
#include "TypeHelpers.hpp"

#include <algorithm>
#include <array>
#include <memory>

namespace fk
{

// Raw storage owned by a backend
struct FIELDKIT_EXPORT BufferImpl
{
	BufferImpl(size_t size, DType dtype, std::shared_ptr<Backend> backend)
		: size_(size), dtype_(dtype), backend_(std::move(backend)) {}
	virtual ~BufferImpl() = default;

	virtual void* data() const = 0;
	size_t size() const {return size_;}
	DType dtype() const {return dtype_;}
	Backend* backend() const {return backend_.get();}

protected:
	size_t size_;
	DType dtype_;
	std::shared_ptr<Backend> backend_;
};

// Tensors in Fieldkit are always dense and row-major. A TensorImpl is a shape on top of a buffer;
// reshaping shares the buffer
struct FIELDKIT_EXPORT TensorImpl
{
	TensorImpl(std::shared_ptr<BufferImpl> buffer, Shape shape)
		: buffer_(std::move(buffer)), shape_(std::move(shape)) {}

	void* data() {return buffer_->data();}
	const void* data() const {return buffer_->data();}

	DType dtype() const {return buffer_->dtype();}
	const Shape& shape() const {return shape_;}
	std::shared_ptr<BufferImpl> buffer() const {return buffer_;}
	size_t dimensions() const {return shape_.size();}
	size_t size() const {return shape_.volume();}
	Backend* backend() const {return buffer_->backend();}

protected:
	std::shared_ptr<BufferImpl> buffer_;
	Shape shape_;
};

//Requires the dtype of a tensor to be one of the listed types. ex: IsDType{DType::Float, DType::Double}
template <typename Storage>
struct IsDType
{
	Storage types;
};

template<typename T, typename... Ts>
IsDType(T, Ts...) -> IsDType<std::array<std::enable_if_t<(std::is_same_v<T, Ts> && ...), T>, 1 + sizeof...(Ts)>>;

inline bool checkProperty(const TensorImpl* x, const Backend* backend) {return x->backend() == backend;}
inline bool checkProperty(const TensorImpl* x, DType dtype) {return x->dtype() == dtype;}
inline bool checkProperty(const TensorImpl* x, const Shape& shape) {return x->shape() == shape;}
template <typename Storage>
bool checkProperty(const TensorImpl* x, const IsDType<Storage>& accepted)
{
	return std::find(accepted.types.begin(), accepted.types.end(), x->dtype()) != accepted.types.end();
}

inline std::string describeProperty(const Backend* backend) {return ".backend() == " + backend->name();}
inline std::string describeProperty(DType dtype) {return ".dtype() == " + to_string(dtype);}
inline std::string describeProperty(const Shape& shape) {return ".shape() == " + to_string(shape);}
template <typename Storage>
std::string describeProperty(const IsDType<Storage>& accepted)
{
	std::string res;
	for(auto dtype : accepted.types)
		res += (res.empty() ? "" : ", ") + to_string(dtype);
	return ".dtype() in {" + res + "}";
}

template <typename ... Args>
void requirePropertiesInternal(const TensorImpl* x, const std::string& where, const std::string& name, const Args& ... args)
{
	auto require = [&](const auto& property) {
		if(checkProperty(x, property) == false)
			throw FkError(where + " Tensor property requirement not met. Expecting " + name + describeProperty(property));
	};
	(require(args), ...);
}

}

//Throws FkError unless the tensor has all the listed properties (backend, DType, Shape or IsDType)
#define requireProperties(x, ...) (fk::requirePropertiesInternal(x, std::string(__FILE__)+":"+std::to_string(__LINE__)\
	+":"+std::string(__func__)+"():", #x, __VA_ARGS__))
