#include <cstddef>
#include <cstdint>
#include <string>
#include "../src/Dyadic.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
	const std::string input(reinterpret_cast<const char*>(data), size);
	try {
		Dyadic::parseDouble(input);
		Dyadic::shortestRoundTrip(input.substr(0, 64));
	} catch (const Dyadic::Exception&) {
	}
	try {
		Dyadic::toExact(Dyadic::fromBits(input));
	} catch (const Dyadic::Exception&) {
	}
	return 0;
}
