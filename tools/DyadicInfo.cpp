#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include "../src/Dyadic.h"

static bool isBitString(const std::string& s) {
	return s.size() == static_cast<size_t>(Dyadic::DoublePattern::TOTAL_BITS) && s.find_first_not_of("01") == std::string::npos;
}

int main(int argc, char** argv) {
	if (argc != 2) {
		std::fprintf(stderr, "Usage: %s <decimal number | 0x hex pattern | 64 bit string>\n", argv[0]);
		return 1;
	}
	const std::string input(argv[1]);
	try {
		Dyadic::DoublePattern pattern;
		if (input.size() > 1 && input[0] == '0' && (input[1] == 'x' || input[1] == 'X')) {
			pattern = Dyadic::DoublePattern::fromHexString(input);
		} else if (isBitString(input)) {
			pattern = Dyadic::fromBits(input);
		} else {
			pattern = Dyadic::DoublePattern::fromValue(Dyadic::parseDouble(input));
		}
		std::cout << "bits: " << pattern.toBinaryString() << std::endl;
		std::cout << "hex: " << pattern.toHexString() << std::endl;
		if (pattern.isSpecial()) {
			std::cout << "value: " << (pattern.isNaN() ? "NaN" : (pattern.isNegative() ? "-Infinity" : "Infinity")) << std::endl;
			return 0;
		}

		const Dyadic::ExactValue exact = Dyadic::toExact(pattern);
		const std::pair<Dyadic::String, Dyadic::String> single = Dyadic::toSingleBits(exact.nativeApproximation);
		const Dyadic::RoundTripResult shortest = Dyadic::shortestRoundTrip(
				exact.exactDecimal.isZero() && exact.sign < 0 ? "-0" : exact.exactDecimal.toString());
		const Dyadic::Segment segment = Dyadic::segmentFromValue(exact.nativeApproximation);
		std::cout << "exact: " << exact.exactDecimal << std::endl;
		std::cout << "exponent: " << exact.unbiasedExponent << (pattern.isSubnormal() ? " (subnormal)" : "") << std::endl;
		std::cout << "shortest: " << shortest.shortestDecimal << " (" << shortest.digitCount << " digits)" << std::endl;
		std::cout << "segment min: " << segment.minValue << std::endl;
		std::cout << "segment max: " << segment.maxValue << std::endl;
		std::cout << "segment step: " << segment.stepDistance << std::endl;
		std::cout << "single: " << single.first << " " << single.second << std::endl;
	} catch (const Dyadic::Exception& x) {
		std::fprintf(stderr, "Error: %s\n", x.what());
		return 1;
	}
	return 0;
}
