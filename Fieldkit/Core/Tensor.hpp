#pragma once

#include <memory>
#include <vector>
#include <typeinfo>

#include "TensorImpl.hpp"
#include "Error.hpp"
#include "DefaultBackend.hpp"
#include "TypeHelpers.hpp"

#include "Fieldkit_export.h"

namespace fk
{

struct Tensor;

FIELDKIT_EXPORT std::ostream& operator<< (std::ostream& os, const Tensor& t);
FIELDKIT_EXPORT std::string to_string(const Tensor& t);

// A shared handle to a dense tensor living on a backend. Copying a Tensor does not copy the data
struct FIELDKIT_EXPORT Tensor
{
	Tensor() = default;
	Tensor(std::shared_ptr<TensorImpl> pimpl) : pimpl_(std::move(pimpl)) {}
	explicit Tensor(const Shape& s, DType dtype, Backend* backend=defaultBackend())
		: pimpl_(backend->createTensor(s, dtype)) {}

	template <typename T>
	Tensor(const Shape& s, const T* data, Backend* backend=defaultBackend())
	{
		static_assert(typeToDType<T>() != DType::Unknown, "Tensors can't hold this type");
		pimpl_ = backend->createTensor(s, typeToDType<T>(), data);
	}

	template<typename T, typename = std::enable_if_t<typeToDType<T>() != DType::Unknown && !std::is_same_v<T, bool>>>
	Tensor(const std::vector<T>& vec, Backend* backend=defaultBackend())
		: Tensor(Shape{intmax_t(vec.size())}, vec.data(), backend) {}

	//Scalars become tensors of shape {1}
	Tensor(int v) : Tensor(Shape{1}, &v) {}
	Tensor(float v) : Tensor(Shape{1}, &v) {}
	Tensor(double v) : Tensor(Shape{1}, &v) {}

	void* data() {return pimpl_->data();}
	const void* data() const {return pimpl_->data();}
	DType dtype() const {return pimpl_->dtype();}
	Shape shape() const {return pimpl_ ? pimpl_->shape() : Shape();}
	size_t size() const {return pimpl_->size();}
	size_t dimensions() const {return pimpl_->dimensions();}
	Backend* backend() const {return pimpl_->backend();}

	const TensorImpl* pimpl() const {return pimpl_.get();}
	TensorImpl* pimpl() {return pimpl_.get();}

	//True when the tensor has storage with at least one element
	bool has_value() const {return pimpl_ != nullptr && size() > 0;}

	template<typename T>
	std::vector<T> toHost() const
	{
		if(dtype() != typeToDType<T>()) {
			throw FkError("toHost() failed. " + demangle(typeid(T).name()) + " requested but "
				+ to_string(dtype()) + " is stored.");
		}

		// std::vector<bool> is packed, go through a plain array
		if constexpr(std::is_same_v<T, bool>) {
			std::unique_ptr<bool[]> buffer(new bool[size()]);
			backend()->copyToHost(pimpl(), buffer.get());
			return std::vector<bool>(buffer.get(), buffer.get()+size());
		}
		else {
			std::vector<T> res(size());
			backend()->copyToHost(pimpl(), res.data());
			return res;
		}
	}

	template <typename T>
	T item() const
	{
		if(size() != 1)
			throw FkError("item() needs a tensor with exactly 1 element, got shape " + fk::to_string(shape()));
		return toHost<T>()[0];
	}

	Tensor cast(DType dtype) const {return dtype == this->dtype() ? *this : Tensor(backend()->cast(pimpl(), dtype));}

	//Shares the storage. One dimension can be -1 and is solved from the element count
	Tensor reshape(Shape shape) const;
	Tensor flatten() const {return reshape({intmax_t(size())});}

	Tensor equal(const Tensor& other) const {return backend()->equal(pimpl(), other.pimpl());}

	Tensor operator== (const Tensor& other) const {return equal(other);}

	Tensor sum(DType dtype=DType::Unknown) const {return backend()->sum(pimpl(), size(), dtype);}
	//Same dtype, shape and values
	bool isSame(const Tensor& other) const;

protected:
	std::shared_ptr<TensorImpl> pimpl_;
};

template <typename T>
Tensor constant(const Shape& shape, T value, Backend* backend=defaultBackend())
{
	std::vector<T> v(shape.volume(), value);
	return Tensor(shape, v.data(), backend);
}

FIELDKIT_EXPORT Tensor zeros(const Shape& shape, DType dtype=DType::Int32, Backend* backend=defaultBackend());
FIELDKIT_EXPORT Tensor ones(const Shape& shape, DType dtype=DType::Int32, Backend* backend=defaultBackend());

//Codec kernels, see Backend
inline Tensor rescale(const Tensor& x, double from_offset, double from_scale, double to_scale, double to_offset)
{
	return x.backend()->rescale(x.pimpl(), from_offset, from_scale, to_scale, to_offset);
}

inline Tensor oneHot(const Tensor& indices, size_t depth) {return indices.backend()->oneHot(indices.pimpl(), depth);}
inline Tensor argmax(const Tensor& x) {return x.backend()->argmax(x.pimpl());}

//Element-wise |x-y| <= atol + rtol*|y|, as numpy.isclose. Returns a Bool tensor
FIELDKIT_EXPORT Tensor isclose(const Tensor& x, const Tensor& y, double rtol=1e-9, double atol=1e-12);
inline bool allclose(const Tensor& x, const Tensor& y, double rtol=1e-9, double atol=1e-12)
{
	if(x.shape() != y.shape())
		return false;
	return x.size() == 0 || isclose(x, y, rtol, atol).sum().item<int32_t>() == (int32_t)x.size();
}

}
