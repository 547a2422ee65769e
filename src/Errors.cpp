#include <sstream>
#include "Errors.h"

namespace Dyadic {

const char* FormatError::what() const throw() {
	try {
		if (errorString.empty()) {
			std::ostringstream ss;
			ss << reason << " at offset " << offset << " in \"" << input << '\"';
			errorString = ss.str();
		}
		return errorString.c_str();
	}
	catch (const std::exception&) {
		return "exception in Dyadic::FormatError::what()";
	}
}

const char* OverflowError::what() const throw() {
	try {
		if (errorString.empty()) {
			errorString = "Overflow in " + operation;
		}
		return errorString.c_str();
	}
	catch (const std::exception&) {
		return "exception in Dyadic::OverflowError::what()";
	}
}

} // namespace Dyadic
