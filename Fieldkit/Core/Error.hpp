#pragma once

#include <exception>
#include <string>
#include <iostream>

#include "Fieldkit_export.h"

//Use FkError (or one of its subclasses) for errors caused by user input or configuration.
//fk_assert is reserved for internal invariants
namespace fk
{

FIELDKIT_EXPORT void enableTraceOnException(bool enable);
FIELDKIT_EXPORT bool getEnableTraceOnException();
FIELDKIT_EXPORT std::string genStackTrace();

class FIELDKIT_EXPORT FkError : public std::exception
{
public:
	explicit FkError(const std::string &msg);
	const char *what() const noexcept override { return msg_.c_str(); }

protected:
	std::string msg_;
};

//The trailing dimension of an input does not match the width of a field
class FIELDKIT_EXPORT DimensionError : public FkError
{
public:
	explicit DimensionError(const std::string& msg) : FkError("Dimension error: " + msg) {}
};

//Bad construction parameters or saved state
class FIELDKIT_EXPORT InvalidConfigError : public FkError
{
public:
	explicit InvalidConfigError(const std::string& msg) : FkError("Invalid config: " + msg) {}
};

//A value can't be represented by the encoding
class FIELDKIT_EXPORT RangeError : public FkError
{
public:
	explicit RangeError(const std::string& msg) : FkError("Range error: " + msg) {}
};

class FIELDKIT_EXPORT LengthError : public FkError
{
public:
	explicit LengthError(const std::string& msg) : FkError("Length error: " + msg) {}
};

class FIELDKIT_EXPORT ArithmeticError : public FkError
{
public:
	explicit ArithmeticError(const std::string& msg) : FkError("Arithmetic error: " + msg) {}
};

}

// Asserts
#define fk_assert_with_message(expression, msg) do{if((expression) == false) {std::cerr << msg; std::abort();}}while(0)
#define fk_assert_no_message(expression) do{if((expression) == false){std::cerr << "Assertion " << #expression << " failed"; std::abort();}}while(0)
#define __GetFkAssrtyMacro(_1,_2,NAME,...) NAME
//fk_assert is basically C assert but not effected by the NDEBUG flag. Use it for bugs in Fieldkit itself, never for user input.
#define fk_assert(...) __GetFkAssrtyMacro(__VA_ARGS__ ,fk_assert_with_message, fk_assert_no_message, nullptr)(__VA_ARGS__)

// Checks. When the condition fails, they unwind the stack and throws an exception
#define fk_check_with_message(expression, msg) do{if((expression) == false) {throw fk::FkError(msg);}}while(0)
#define fk_check_no_message(expression) do{if((expression) == false){throw fk::FkError(std::string("Check ")+#expression+" failed");}}while(0)
#define __GetFkCheckyMacro(_1,_2,NAME,...) NAME
#define fk_check(...) __GetFkCheckyMacro(__VA_ARGS__ ,fk_check_with_message, fk_check_no_message, nullptr)(__VA_ARGS__)

// Same as fk_check but throws a specific subclass of FkError
#define fk_require(expression, ErrorType, msg) do{if((expression) == false) {throw ErrorType(msg);}}while(0)
