#include "CPUBackend.hpp"

#include <algorithm>
#include <numeric>
#include <cmath>

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

using namespace fk;

//Calls f with a default constructed value of the C++ type matching dtype
template <typename ... Ts, typename Func>
inline void dispatch(DType dtype, Func f)
{
	bool dispatched = ((typeToDType<Ts>() == dtype ? (f(Ts()), true) : false) || ...);
	if(dispatched == false)
		throw FkError("Cannot dispatch such dtype: " + to_string(dtype));
}

template <typename Func>
inline void dispatchAll(DType dtype, Func f)
{
	dispatch<bool, int32_t, float, double>(dtype, f);
}

//Parallelize only if the problem is big enought
template <typename Func>
inline void forEachIndex(size_t n, Func f)
{
	if(n > 2000) {
		tbb::parallel_for(tbb::blocked_range<size_t>(size_t(0), n), [&](const auto& r) {
			for(size_t i=r.begin();i!=r.end();i++)
				f(i);
		});
	}
	else {
		for(size_t i=0;i<n;i++)
			f(i);
	}
}

CPUBuffer::CPUBuffer(const Shape& shape, DType dtype, std::shared_ptr<Backend> backend, const void* src)
	: BufferImpl(shape.volume(), dtype, std::move(backend))
{
	dispatchAll(dtype, [&](auto v) {
		using T = decltype(v);
		T* ptr = new T[size_];
		if(src != nullptr)
			std::copy_n((const T*)src, size_, ptr);
		storage_ = ptr;
	});
}

CPUBuffer::~CPUBuffer()
{
	std::visit([](auto ptr){ delete [] ptr; }, storage_);
}

void* CPUBuffer::data() const
{
	return std::visit([](auto ptr){ return (void*)ptr; }, storage_);
}

std::shared_ptr<TensorImpl> CPUBackend::cast(const TensorImpl* x, DType dtype)
{
	requireProperties(x, this);
	auto y = createTensor(x->shape(), dtype);
	dispatchAll(x->dtype(), [&](auto from) {
		dispatchAll(dtype, [&](auto to) {
			using From = decltype(from);
			using To = decltype(to);
			const From* in = (const From*)x->data();
			To* out = (To*)y->data();
			forEachIndex(x->size(), [&](size_t i) { out[i] = static_cast<To>(in[i]); });
		});
	});
	return y;
}

void CPUBackend::copyToHost(const TensorImpl* x, void* dest)
{
	requireProperties(x, this);
	memcpy(dest, x->data(), x->size()*dtypeToSize(x->dtype()));
}

std::shared_ptr<TensorImpl> CPUBackend::sum(const TensorImpl* x, size_t chunk_size, DType dtype)
{
	requireProperties(x, this);
	fk_check(chunk_size != 0 && x->size() % chunk_size == 0, "Cannot sum " + std::to_string(x->size())
		+ " elements in chunks of " + std::to_string(chunk_size));

	// Integers accumulate into Int32, floating point types keep their precision
	if(dtype == DType::Unknown)
		dtype = (x->dtype() == DType::Float || x->dtype() == DType::Double) ? x->dtype() : DType::Int32;

	size_t num_chunks = x->size()/chunk_size;
	auto y = createTensor({intmax_t(num_chunks)}, dtype);
	dispatchAll(x->dtype(), [&](auto v) {
		dispatch<int32_t, float, double>(dtype, [&](auto acc) {
			using T = decltype(v);
			using Acc = decltype(acc);
			const T* in = (const T*)x->data();
			Acc* out = (Acc*)y->data();
			forEachIndex(num_chunks, [&](size_t i) {
				out[i] = std::accumulate(in+i*chunk_size, in+(i+1)*chunk_size, Acc(0));
			});
		});
	});
	return y;
}

std::shared_ptr<TensorImpl> CPUBackend::rescale(const TensorImpl* x, double from_offset, double from_scale
	, double to_scale, double to_offset)
{
	requireProperties(x, this);

	auto y = createTensor(x->shape(), DType::Double);
	double* out = (double*)y->data();

	dispatchAll(x->dtype(), [&](auto v) {
		using T = decltype(v);
		const T* in = (const T*)x->data();
		forEachIndex(x->size(), [&](size_t i) {
			out[i] = (double(in[i]) - from_offset) / from_scale * to_scale + to_offset;
		});
	});
	return y;
}

std::shared_ptr<TensorImpl> CPUBackend::oneHot(const TensorImpl* indices, size_t depth)
{
	requireProperties(indices, this, DType::Int32);
	fk_check(depth > 0, "oneHot() requires a depth of at least 1");

	auto y = createTensor(indices->shape() + intmax_t(depth), DType::Double);
	const int32_t* in = (const int32_t*)indices->data();
	double* out = (double*)y->data();

	//Validate all indices first
	for(size_t i=0;i<indices->size();i++) {
		if(in[i] < -1 || in[i] >= (int32_t)depth)
			throw FkError("One-hot index " + std::to_string(in[i]) + " is out of range for depth " + std::to_string(depth));
	}

	forEachIndex(indices->size(), [&](size_t i) {
		double* row = out+i*depth;
		std::fill(row, row+depth, 0.0);
		if(in[i] != -1)
			row[in[i]] = 1.0;
	});
	return y;
}

std::shared_ptr<TensorImpl> CPUBackend::argmax(const TensorImpl* x)
{
	requireProperties(x, this, IsDType{DType::Bool, DType::Int32, DType::Float, DType::Double});
	fk_check(x->dimensions() != 0 && x->shape().back() > 0, "argmax() on a tensor without elements in the last dimension");

	size_t row_size = x->shape().back();
	size_t num_rows = x->size()/row_size;
	Shape s = x->shape();
	s.pop_back();
	if(s.empty() == true)
		s.push_back(1);

	auto y = createTensor(s, DType::Int32);
	int32_t* out = (int32_t*)y->data();

	dispatchAll(x->dtype(), [&](auto v) {
		using T = decltype(v);
		const T* in = (const T*)x->data();
		forEachIndex(num_rows, [&](size_t i) {
			const T* row = in+i*row_size;
			size_t best = 0;
			for(size_t j=1;j<row_size;j++) {
				if(row[j] > row[best])
					best = j;
			}
			out[i] = (int32_t)best;
		});
	});
	return y;
}

// A tensor with a single element is broadcast against the other one
std::shared_ptr<TensorImpl> CPUBackend::equal(const TensorImpl* x1, const TensorImpl* x2)
{
	requireProperties(x1, this);
	requireProperties(x2, this);
	const bool x1_scalar = x1->size() == 1;
	const bool x2_scalar = x2->size() == 1;
	if(x1->shape() != x2->shape() && x1_scalar == false && x2_scalar == false)
		throw FkError("Cannot broadcast " + to_string(x1->shape()) + " and " + to_string(x2->shape()) + " together.");
	const Shape& shape = (x2_scalar || x1->shape() == x2->shape()) ? x1->shape() : x2->shape();

	auto res = createTensor(shape, DType::Bool);
	bool* out = (bool*)res->data();
	dispatchAll(x1->dtype(), [&](auto v1) {
		dispatchAll(x2->dtype(), [&](auto v2) {
			const auto* p1 = (const decltype(v1)*)x1->data();
			const auto* p2 = (const decltype(v2)*)x2->data();
			forEachIndex(shape.volume(), [&](size_t i) {
				out[i] = p1[x1_scalar ? 0 : i] == p2[x2_scalar ? 0 : i];
			});
		});
	});
	return res;
}
