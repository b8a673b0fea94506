#include <memory>

#include <Fieldkit/Backends/CPUBackend.hpp>
#include "DefaultBackend.hpp"

namespace fk
{
std::shared_ptr<Backend> g_default_backend_hold;
std::atomic<Backend*> g_default_backend{nullptr};
}

using namespace fk;

Backend* fk::defaultBackend()
{
	Backend* backend = g_default_backend.load();
	if(backend != nullptr)
		return backend;

	//Created once and never destroyed before exit, so pointers handed out stay valid
	static std::shared_ptr<Backend> cpu_backend = std::make_shared<CPUBackend>();
	Backend* expected = nullptr;
	if(g_default_backend.compare_exchange_strong(expected, cpu_backend.get()))
		return cpu_backend.get();
	return expected;
}
