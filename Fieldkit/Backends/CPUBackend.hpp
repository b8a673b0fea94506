#pragma once

#include <Fieldkit/Core/TensorImpl.hpp>
#include <Fieldkit/Core/TypeHelpers.hpp>

#include <cstring>
#include <memory>
#include <variant>
#include <vector>
#include <cstdint>


namespace fk
{

// Host memory buffer. Owns one new[]-allocated array of the buffer's dtype
struct FIELDKIT_EXPORT CPUBuffer : public BufferImpl
{
	CPUBuffer(const Shape& shape, DType dtype, std::shared_ptr<Backend> backend, const void* src=nullptr);
	CPUBuffer(const CPUBuffer&) = delete;
	CPUBuffer& operator= (const CPUBuffer&) = delete;
	~CPUBuffer() override;

	void* data() const override;

protected:
	std::variant<bool*, int32_t*, float*, double*> storage_;
};

struct FIELDKIT_EXPORT CPUBackend : public Backend
{
	virtual std::shared_ptr<TensorImpl> createTensor(const Shape& shape, DType dtype, const void* data=nullptr) override
	{
		auto buf = std::make_shared<CPUBuffer>(shape, dtype, shared_from_this(), data);
		return std::make_shared<TensorImpl>(buf, shape);
	}

	virtual std::shared_ptr<TensorImpl> cast(const TensorImpl* x, DType dtype) override;
	virtual void copyToHost(const TensorImpl* x, void* dest) override;
	virtual std::shared_ptr<TensorImpl> sum(const TensorImpl* x, size_t chunk_size, DType dtype=DType::Unknown) override;

	virtual std::shared_ptr<TensorImpl> rescale(const TensorImpl* x, double from_offset, double from_scale
		, double to_scale, double to_offset) override;
	virtual std::shared_ptr<TensorImpl> oneHot(const TensorImpl* indices, size_t depth) override;
	virtual std::shared_ptr<TensorImpl> argmax(const TensorImpl* x) override;

	virtual std::shared_ptr<TensorImpl> equal(const TensorImpl* x1, const TensorImpl* x2) override;

	virtual std::string name() const override {return "CPU";}
};

} // fk
