#include "Error.hpp"
using namespace fk;

#include <backward.hpp>

#include <iostream>
#include <sstream>

static bool g_trace_on_exception = true;
static const size_t g_trace_depth = 32;

FIELDKIT_EXPORT void fk::enableTraceOnException(bool enable)
{
	g_trace_on_exception = enable;
}

FIELDKIT_EXPORT bool fk::getEnableTraceOnException()
{
	return g_trace_on_exception;
}

std::string fk::genStackTrace()
{
#ifdef BACKWARD_SYSTEM_UNKNOWN
	static bool warned = false;
	if(warned == false) {
		std::cerr << "Warning: stack traces are not available on this system." << std::endl;
		warned = true;
	}
	return "";
#else
	backward::StackTrace trace;
	trace.load_here(g_trace_depth);

	backward::Printer printer;
	printer.color_mode = backward::ColorMode::never;

	std::stringstream out;
	printer.print(trace, out);
	return out.str();
#endif
}

FkError::FkError(const std::string &msg)
	: msg_(msg)
{
	if(getEnableTraceOnException() == false)
		return;
	msg_ += "\n" + genStackTrace();
}
