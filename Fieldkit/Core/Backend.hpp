#pragma once

#include <memory>
#include <string>

#include "Shape.hpp"
#include "DType.hpp"
#include "Error.hpp"

namespace fk
{

struct TensorImpl;

// A device tensors are stored on. Every kernel takes TensorImpl pointers created by the same backend.
// Kernels a backend does not provide throw FkError
struct FIELDKIT_EXPORT Backend : public std::enable_shared_from_this<Backend>
{
	using TensorPtr = std::shared_ptr<TensorImpl>;

	virtual ~Backend() = default;
	virtual std::string name() const {return "Backend";}

	//Allocates a tensor. Copies size*sizeof(dtype) bytes from data when it is not null
	virtual TensorPtr createTensor(const Shape& shape, DType dtype, const void* data=nullptr) {throw unsupported("createTensor");}
	virtual void copyToHost(const TensorImpl* x, void* dest) {throw unsupported("copyToHost");}
	virtual TensorPtr cast(const TensorImpl* x, DType dtype) {throw unsupported("cast");}
	//Sums every chunk_size consecutive elements. DType::Unknown picks Int32 for integers
	virtual TensorPtr sum(const TensorImpl* x, size_t chunk_size, DType dtype=DType::Unknown) {throw unsupported("sum");}

	//y = (x - from_offset) / from_scale * to_scale + to_offset, computed in double precision.
	//Returns a Double tensor of the same shape
	virtual TensorPtr rescale(const TensorImpl* x, double from_offset, double from_scale, double to_scale
		, double to_offset) {throw unsupported("rescale");}
	//Int32 indices of shape S -> Double one-hot rows of shape S+{depth}. Index -1 makes an all-zero row
	virtual TensorPtr oneHot(const TensorImpl* indices, size_t depth) {throw unsupported("oneHot");}
	//Index of the largest value along the last dimension. Ties resolve to the lowest index
	virtual TensorPtr argmax(const TensorImpl* x) {throw unsupported("argmax");}

	//Element-wise comparison into a Bool tensor. A single element tensor is broadcast
	virtual TensorPtr equal(const TensorImpl* x1, const TensorImpl* x2) {throw unsupported("equal");}

protected:
	FkError unsupported(const std::string& kernel) const {return FkError(kernel + "() is not supported by backend " + name());}
};

}
