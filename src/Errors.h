#ifndef Errors_h
#define Errors_h

#include <exception>
#include <string>
#include <cstddef>

namespace Dyadic {

typedef char Char;
typedef std::basic_string<Char> String;

struct Exception : public std::exception { virtual ~Exception() throw() { } };

/**
	A FormatError is thrown for malformed textual input: a bit string that is not exactly 64 (or 32) characters of
	'0' and '1', a hex string with bad digits, or decimal text that cannot be scanned. `getOffset()` is the offset of
	the first offending character (or the input length when the input is too short).
**/
class FormatError : public Exception {
	public:
		FormatError(const String& input, size_t offset, const char* reason)
				: input(input), offset(offset), reason(reason) { }
		virtual const char* what() const throw();
		String getInput() const { return input; }
		size_t getOffset() const { return offset; }
		virtual ~FormatError() throw() { }

	protected:
		const String input;
		const size_t offset;
		const char* const reason;
		mutable String errorString;
};

/**
	A SpecialValueError is thrown when the bit pattern under examination encodes Infinity or NaN. It is raised before
	any arithmetic is attempted on a pattern and again after a step or rounding that produced a special pattern.
**/
class SpecialValueError : public Exception {
	public:
		enum Kind {
			INFINITE_VALUE		// exponent all ones, fraction all zeros
			, NOT_A_NUMBER		// exponent all ones, fraction non-zero
		};
		SpecialValueError(Kind kind) : kind(kind) { }
		virtual const char* what() const throw() { return (kind == INFINITE_VALUE ? "Infinity" : "NaN"); }
		Kind getKind() const { return kind; }
		virtual ~SpecialValueError() throw() { }

	protected:
		const Kind kind;
};

/**
	An OverflowError is thrown when an increment cannot produce a same-width result: the rounder carried out of its
	retained bits, or the stepper carried out of an exponent field that was already all ones. Stepping into the
	Infinity pattern is not an OverflowError, it is reported as a SpecialValueError.
**/
class OverflowError : public Exception {
	public:
		OverflowError(const String& operation) : operation(operation) { }
		virtual const char* what() const throw();
		String getOperation() const { return operation; }
		virtual ~OverflowError() throw() { }

	protected:
		const String operation;
		mutable String errorString;
};

class PreconditionError : public Exception {
	public:
		PreconditionError(const String& message) : message(message) { }
		virtual const char* what() const throw() { return message.c_str(); }
		virtual ~PreconditionError() throw() { }

	protected:
		const String message;
};

} // namespace Dyadic

#endif /* Errors_h */
