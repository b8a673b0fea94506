#pragma once

#include "Fieldkit/Core/Backend.hpp"

#include <atomic>
#include <memory>

namespace fk
{

extern FIELDKIT_EXPORT std::atomic<Backend*> g_default_backend;
extern FIELDKIT_EXPORT std::shared_ptr<Backend> g_default_backend_hold;

//Installing a backend is a set-up step. Call it before tensors are created from several threads
inline void setDefaultBackend(Backend* backend) {g_default_backend = backend;}
inline void setDefaultBackend(std::shared_ptr<Backend> backend) {g_default_backend_hold = backend; g_default_backend = backend.get();}
//Safe to call concurrently. A null default falls back to a process wide CPUBackend
FIELDKIT_EXPORT Backend* defaultBackend();

}
