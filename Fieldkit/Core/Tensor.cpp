#include "Tensor.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace fk;

//Tensors with more elements than this are printed with the middle of each row elided
static const size_t g_print_threshold = 1000;

template <typename T>
static std::string formatValue(T v)
{
	std::stringstream ss;
	if constexpr(std::is_same_v<T, bool>)
		ss << (int)v;
	else
		ss << v;
	return ss.str();
}

template <typename T>
static void printRows(std::ostream& os, const T* ptr, const Shape& shape, size_t dim, bool elide)
{
	const intmax_t n = shape[dim];
	os << "{";
	if(dim+1 == shape.size()) {
		for(intmax_t i=0;i<n;i++) {
			if(elide && n > 8 && i == 3) {
				os << "..., ";
				i = n-4;
				continue;
			}
			os << formatValue(ptr[i]) << (i+1 == n ? "" : ", ");
		}
	}
	else {
		intmax_t stride = 1;
		for(size_t i=dim+1;i<shape.size();i++)
			stride *= shape[i];
		for(intmax_t i=0;i<n;i++) {
			printRows(os, ptr+i*stride, shape, dim+1, elide);
			if(i+1 != n)
				os << ",\n" << std::string(dim+1, ' ');
		}
	}
	os << "}";
}

std::ostream& fk::operator<< (std::ostream& os, const Tensor& t)
{
	if(t.has_value() == false) {
		os << "{}";
		return os;
	}

	bool elide = t.size() > g_print_threshold;
	switch(t.dtype()) {
		case DType::Bool: printRows(os, (const bool*)t.data(), t.shape(), 0, elide); break;
		case DType::Int32: printRows(os, (const int32_t*)t.data(), t.shape(), 0, elide); break;
		case DType::Float: printRows(os, (const float*)t.data(), t.shape(), 0, elide); break;
		case DType::Double: printRows(os, (const double*)t.data(), t.shape(), 0, elide); break;
		default: throw FkError("Printing tensor of this type is not supported.");
	}
	return os;
}

std::string fk::to_string(const Tensor& t)
{
	std::stringstream ss;
	ss << t;
	return ss.str();
}

Tensor Tensor::reshape(Shape shape) const
{
	// At most one dimension can be -1, it is solved from the number of elements
	auto unknown = std::find(shape.begin(), shape.end(), -1);
	if(unknown != shape.end()) {
		fk_check(std::count(shape.begin(), shape.end(), -1) == 1, "Only one dimension can be inferred. Got " + to_string(shape));
		*unknown = 1;
		intmax_t known = shape.volume();
		fk_check(known > 0 && size() % known == 0, "Cannot infer the missing dimension of " + to_string(shape)
			+ " from " + std::to_string(size()) + " elements");
		*unknown = size() / known;
	}

	fk_check(std::all_of(shape.begin(), shape.end(), [](auto v){ return v >= 0; }), "Negative dimension in " + to_string(shape));
	fk_check(size() == (size_t)shape.volume(), "Cannot reshape from " + to_string(this->shape()) + " to " + to_string(shape));
	return std::make_shared<TensorImpl>(pimpl_->buffer(), shape);
}

bool Tensor::isSame(const Tensor& other) const
{
	if(dtype() != other.dtype() || shape() != other.shape())
		return false;
	if(size() == 0)
		return true;
	return equal(other).sum().item<int32_t>() == (int32_t)size();
}

static Tensor filled(const Shape& shape, DType dtype, int value, Backend* backend)
{
	switch(dtype) {
		case DType::Bool: return constant<uint8_t>(shape, value != 0, backend);
		case DType::Int32: return constant<int32_t>(shape, value, backend);
		case DType::Float: return constant<float>(shape, value, backend);
		case DType::Double: return constant<double>(shape, value, backend);
		default: throw FkError("Cannot create a tensor of type " + to_string(dtype));
	}
}

Tensor fk::zeros(const Shape& shape, DType dtype, Backend* backend)
{
	return filled(shape, dtype, 0, backend);
}

Tensor fk::ones(const Shape& shape, DType dtype, Backend* backend)
{
	return filled(shape, dtype, 1, backend);
}

Tensor fk::isclose(const Tensor& x, const Tensor& y, double rtol, double atol)
{
	fk_check(x.shape() == y.shape(), "isclose() requires tensors of the same shape. Got "
		+ to_string(x.shape()) + " and " + to_string(y.shape()));
	auto a = x.cast(DType::Double).toHost<double>();
	auto b = y.cast(DType::Double).toHost<double>();

	std::vector<uint8_t> res(a.size());
	for(size_t i=0;i<a.size();i++)
		res[i] = std::abs(a[i]-b[i]) <= (atol + rtol*std::abs(b[i]));
	return Tensor(x.shape(), res.data(), x.backend());
}
