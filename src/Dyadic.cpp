#ifdef __GNUC__
#ifndef __clang__
	#pragma GCC push_options
	#pragma GCC optimize ("no-finite-math-only")
	#pragma GCC optimize ("float-store")
#endif
#endif

#ifdef __FAST_MATH__
	#error This code relies on IEEE compliant NaN comparisons. Avoid -Ofast / -ffast-math (at least for this source file).
#endif

#include "assert.h"
#include <cstring>
#include <algorithm>
#include <limits>
#include "Dyadic.h"

namespace Dyadic {

typedef Decimal::Integer Integer;

template<typename T> bool isNaN(const T v) { return v != v; }

static int fromHex(Char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	} else if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	} else {
		return -1;
	}
}

static void checkContext(const Context& context) {
	if (context.precision < Context::MIN_PRECISION) {
		throw PreconditionError("Context precision must be at least " + std::to_string(Context::MIN_PRECISION)
				+ " significant digits");
	}
	if (context.mappingLimit == 0) {
		throw PreconditionError("Context mapping limit must be positive");
	}
}

/* --- BitPattern --- */

template<typename T> BitPattern<T>::BitPattern(const Bits& bits) : b(bits) {
	for (typename Bits::const_iterator it = b.begin(); it != b.end(); ++it) {
		assert(*it == 0 || *it == 1);
	}
}

template<typename T> BitPattern<T> BitPattern<T>::fromWord(Word word) {
	Bits bits;
	for (int i = 0; i < TOTAL_BITS; ++i) {
		bits[i] = static_cast<Bit>((word >> (TOTAL_BITS - 1 - i)) & 1);
	}
	return BitPattern(bits);
}

template<typename T> BitPattern<T> BitPattern<T>::fromFields(bool negative, Word biasedExponent, Word fraction) {
	assert(biasedExponent < (Word(1) << EXPONENT_BITS));
	assert(fraction < (Word(1) << FRACTION_BITS));
	return fromWord((Word(negative ? 1 : 0) << (TOTAL_BITS - 1)) | (biasedExponent << FRACTION_BITS) | fraction);
}

template<typename T> BitPattern<T> BitPattern<T>::fromValue(T value) {
	static_assert(sizeof (Word) == sizeof (T), "Word must match the floating point width");
	Word word;
	std::memcpy(&word, &value, sizeof (word));
	return fromWord(word);
}

template<typename T> BitPattern<T> BitPattern<T>::fromBinaryString(const String& s) {
	const size_t width = static_cast<size_t>(TOTAL_BITS);
	for (size_t i = 0; i < s.size() && i < width; ++i) {
		if (s[i] != '0' && s[i] != '1') {
			throw FormatError(s, i, "Invalid bit character");
		}
	}
	if (s.size() != width) {
		throw FormatError(s, std::min(s.size(), width), "Wrong bit string length");
	}
	Bits bits;
	for (size_t i = 0; i < width; ++i) {
		bits[i] = (s[i] == '1' ? 1 : 0);
	}
	return BitPattern(bits);
}

template<typename T> BitPattern<T> BitPattern<T>::fromHexString(const String& s) {
	size_t offset = 0;
	if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
		offset = 2;
	}
	if (offset == s.size()) {
		throw FormatError(s, offset, "Missing hex digits");
	}
	if (s.size() - offset > static_cast<size_t>(TOTAL_BITS / 4)) {
		throw FormatError(s, offset + TOTAL_BITS / 4, "Too many hex digits");
	}
	Word word = 0;
	for (size_t i = offset; i < s.size(); ++i) {
		const int v = fromHex(s[i]);
		if (v < 0) {
			throw FormatError(s, i, "Invalid hex digit");
		}
		word = (word << 4) | static_cast<Word>(v);
	}
	return fromWord(word);
}

template<typename T> typename BitPattern<T>::Word BitPattern<T>::toWord() const {
	Word word = 0;
	for (int i = 0; i < TOTAL_BITS; ++i) {
		word = (word << 1) | b[i];
	}
	return word;
}

template<typename T> T BitPattern<T>::toValue() const {
	const Word word = toWord();
	T value;
	std::memcpy(&value, &word, sizeof (value));
	return value;
}

template<typename T> String BitPattern<T>::toBinaryString() const {
	String s(TOTAL_BITS, '0');
	for (int i = 0; i < TOTAL_BITS; ++i) {
		s[i] = (b[i] != 0 ? '1' : '0');
	}
	return s;
}

template<typename T> String BitPattern<T>::toHexString() const {
	const Word word = toWord();
	String s("0x");
	for (int shift = TOTAL_BITS - 4; shift >= 0; shift -= 4) {
		const int nibble = static_cast<int>((word >> shift) & 0xF);
		if (nibble != 0 || s.size() > 2 || shift == 0) {
			s += "0123456789abcdef"[nibble];
		}
	}
	return s;
}

template<typename T> typename BitPattern<T>::Word BitPattern<T>::biasedExponent() const {
	return (toWord() >> FRACTION_BITS) & ((Word(1) << EXPONENT_BITS) - 1);
}

template<typename T> typename BitPattern<T>::Word BitPattern<T>::fraction() const {
	return toWord() & ((Word(1) << FRACTION_BITS) - 1);
}

template<typename T> bool BitPattern<T>::isInfinity() const { return isSpecial() && fraction() == 0; }
template<typename T> bool BitPattern<T>::isNaN() const { return isSpecial() && fraction() != 0; }

std::pair<String, String> toBits(double value) {
	const DoublePattern pattern = DoublePattern::fromValue(value);
	return std::make_pair(pattern.toBinaryString(), pattern.toHexString());
}

DoublePattern fromBits(const String& bitString) {
	return DoublePattern::fromBinaryString(bitString);
}

/* --- Exact value --- */

template<typename T> ExactValue toExact(const BitPattern<T>& pattern, const Context& context) {
	checkContext(context);
	checkSpecial(pattern);

	const bool subnormal = (pattern.biasedExponent() == 0);
	ExactValue v;
	v.sign = (pattern.isNegative() ? -1 : 1);
	v.unbiasedExponent = (subnormal ? static_cast<int>(Traits<T>::MIN_EXPONENT)
			: static_cast<int>(pattern.biasedExponent()) - Traits<T>::BIAS);

	// mantissa = implicit bit + sum(fraction[i] * 2^-i), accumulated as an integer scaled by 2^FRACTION_BITS.
	Integer mantissa(subnormal ? 0 : 1);
	for (typename BitPattern<T>::const_iterator it = pattern.fractionBegin(); it != pattern.fractionEnd(); ++it) {
		mantissa <<= 1;
		if (*it != 0) {
			++mantissa;
		}
	}
	const Decimal magnitude = Decimal(mantissa, 0).scaledByPowerOfTwo(v.unbiasedExponent - Traits<T>::FRACTION_BITS);
	v.exactDecimal = (v.sign < 0 ? -magnitude : magnitude).rounded(context.precision, context.rounding);

	if (v.exactDecimal.isZero()) {
		v.nativeApproximation = static_cast<double>(pattern.toValue());	// keeps the sign of zero
	} else {
		v.nativeApproximation = static_cast<double>(encode<T>(v.exactDecimal).toValue());
	}
	return v;
}

/* --- Stepper --- */

// Adds one unit in the last place to the magnitude, carrying fraction overflow into the exponent.
template<typename T> static void incrementMagnitude(typename BitPattern<T>::Bits& bits) {
	const typename BitPattern<T>::Bits::iterator fraction = bits.begin() + BitPattern<T>::FRACTION_OFFSET;
	if (incrementBits(fraction, bits.end())) {
		if (incrementBits(bits.begin() + 1, fraction)) {
			throw OverflowError("exponent increment");
		}
	}
}

// Subtracts one unit in the last place from a non-zero magnitude.
template<typename T> static void decrementMagnitude(typename BitPattern<T>::Bits& bits) {
	const typename BitPattern<T>::Bits::iterator fraction = bits.begin() + BitPattern<T>::FRACTION_OFFSET;
	if (decrementBits(fraction, bits.end())) {
		const bool borrow = decrementBits(bits.begin() + 1, fraction);
		assert(!borrow);
		(void) borrow;
	}
}

template<typename T> BitPattern<T> next(const BitPattern<T>& pattern) {
	checkSpecial(pattern);
	typename BitPattern<T>::Bits bits = pattern.getBits();
	if (!pattern.isNegative()) {
		incrementMagnitude<T>(bits);
	} else if (pattern.isZero()) {
		bits[0] = 0;	// -0 steps to the smallest positive subnormal
		bits[BitPattern<T>::TOTAL_BITS - 1] = 1;
	} else {
		decrementMagnitude<T>(bits);
	}
	const BitPattern<T> result(bits);
	checkSpecial(result);
	return result;
}

template<typename T> BitPattern<T> previous(const BitPattern<T>& pattern) {
	checkSpecial(pattern);
	typename BitPattern<T>::Bits bits = pattern.getBits();
	if (pattern.isNegative()) {
		incrementMagnitude<T>(bits);
	} else if (pattern.isZero()) {
		bits[0] = 1;	// +0 steps to the smallest negative subnormal
		bits[BitPattern<T>::TOTAL_BITS - 1] = 1;
	} else {
		decrementMagnitude<T>(bits);
	}
	const BitPattern<T> result(bits);
	checkSpecial(result);
	return result;
}

/* --- Rounder --- */

bool tryToRoundToNearestEven(const BitSequence& bits, size_t k, BitSequence& rounded) {
	if (k == 0) {
		throw PreconditionError("Rounding position must be at least 1");
	}
	for (BitSequence::const_iterator it = bits.begin(); it != bits.end(); ++it) {
		if (*it > 1) {
			throw PreconditionError("Bit sequences may only hold 0 and 1");
		}
	}
	if (bits.size() <= k) {
		rounded = bits;
		return true;
	}

	bool up = false;
	if (bits[k] != 0) {
		const bool anyFollowingOne = (std::find(bits.begin() + k + 1, bits.end(), Bit(1)) != bits.end());
		up = (anyFollowingOne || bits[k - 1] != 0);
	}
	BitSequence retained(bits.begin(), bits.begin() + k);
	const bool carry = (up && incrementBits(retained.begin(), retained.end()));
	rounded.swap(retained);
	return !carry;
}

BitSequence roundToNearestEven(const BitSequence& bits, size_t k) {
	BitSequence rounded;
	if (!tryToRoundToNearestEven(bits, k, rounded)) {
		throw OverflowError("round to nearest even");
	}
	return rounded;
}

/* --- Encoder --- */

// True if numerator / denominator < 2^exponent.
static bool isBelowPowerOfTwo(const Integer& numerator, const Integer& denominator, int exponent) {
	if (exponent >= 0) {
		const Integer scaled = denominator << static_cast<unsigned int>(exponent);
		return numerator < scaled;
	}
	const Integer scaled = numerator << static_cast<unsigned int>(-exponent);
	return scaled < denominator;
}

template<typename T> BitPattern<T> encode(const Decimal& value) {
	typedef Traits<T> FormatTraits;
	typedef typename BitPattern<T>::Word Word;
	const Word ALL_ONES_EXPONENT = (Word(1) << FormatTraits::EXPONENT_BITS) - 1;
	const int PRECISION = FormatTraits::FRACTION_BITS + 1;
	const bool negative = (value.sign() < 0);

	if (value.isZero()) {
		return BitPattern<T>();
	}
	const int adjusted = value.adjustedExponent();
	if (adjusted > FormatTraits::MAX_DECIMAL_EXPONENT) {
		return BitPattern<T>::fromFields(negative, ALL_ONES_EXPONENT, 0);
	}
	if (adjusted < FormatTraits::MIN_DECIMAL_EXPONENT - 1) {
		return BitPattern<T>::fromFields(negative, 0, 0);
	}

	// |value| == numerator / denominator
	Integer numerator = boost::multiprecision::abs(value.coefficient());
	Integer denominator(1);
	if (value.exponent() >= 0) {
		numerator *= boost::multiprecision::pow(Integer(10), static_cast<unsigned int>(value.exponent()));
	} else {
		denominator = boost::multiprecision::pow(Integer(10), static_cast<unsigned int>(-value.exponent()));
	}

	// 2^exponent <= |value| < 2^(exponent + 1)
	int exponent = static_cast<int>(boost::multiprecision::msb(numerator))
			- static_cast<int>(boost::multiprecision::msb(denominator));
	if (isBelowPowerOfTwo(numerator, denominator, exponent)) {
		--exponent;
	}

	// Subnormals keep the lowest normal exponent and lose leading significand bits instead.
	if (exponent < FormatTraits::MIN_EXPONENT) {
		exponent = FormatTraits::MIN_EXPONENT;
	}

	// PRECISION retained bits and one rounding bit, followed by a sticky bit if anything non-zero remains.
	const int shift = PRECISION - exponent;
	if (shift >= 0) {
		numerator <<= static_cast<unsigned int>(shift);
	} else {
		denominator <<= static_cast<unsigned int>(-shift);
	}
	Integer quotient;
	Integer remainder;
	boost::multiprecision::divide_qr(numerator, denominator, quotient, remainder);
	assert(quotient.is_zero() || boost::multiprecision::msb(quotient) <= static_cast<unsigned int>(PRECISION));
	BitSequence bits(PRECISION + 1);
	for (int i = 0; i <= PRECISION; ++i) {
		bits[i] = (boost::multiprecision::bit_test(quotient, static_cast<unsigned int>(PRECISION - i)) ? 1 : 0);
	}
	if (!remainder.is_zero()) {
		bits.push_back(1);
	}

	BitSequence significand;
	if (!tryToRoundToNearestEven(bits, PRECISION, significand)) {
		// All ones rounded up: the significand is 1.000... one binade higher.
		significand.assign(PRECISION, 0);
		significand[0] = 1;
		++exponent;
	}

	Word biasedExponent = 0;
	if (significand[0] != 0) {
		if (exponent > FormatTraits::MAX_EXPONENT) {
			return BitPattern<T>::fromFields(negative, ALL_ONES_EXPONENT, 0);
		}
		biasedExponent = static_cast<Word>(exponent + FormatTraits::BIAS);
	}
	Word fraction = 0;
	for (int i = 1; i < PRECISION; ++i) {
		fraction = (fraction << 1) | significand[i];
	}
	return BitPattern<T>::fromFields(negative, biasedExponent, fraction);
}

FloatPattern encodeSingle(double value) {
	const FloatPattern::Word ALL_ONES_EXPONENT = 0xFF;
	if (isNaN(value)) {
		return FloatPattern::fromFields(false, ALL_ONES_EXPONENT, 1);
	}
	const DoublePattern pattern = DoublePattern::fromValue(value);
	if (pattern.isZero()) {
		return FloatPattern::fromFields(pattern.isNegative(), 0, 0);
	}
	if (pattern.isInfinity()) {
		return FloatPattern::fromFields(pattern.isNegative(), ALL_ONES_EXPONENT, 0);
	}
	return encode<float>(toExact(pattern).exactDecimal);
}

std::pair<String, String> toSingleBits(double value) {
	const FloatPattern pattern = encodeSingle(value);
	return std::make_pair(pattern.toBinaryString(), pattern.toHexString());
}

double parseDouble(const String& s) {
	const Decimal d = Decimal::fromString(s);
	const double value = encode<double>(d).toValue();
	return (d.isZero() && !s.empty() && s[0] == '-' ? -value : value);
}

/* --- Round-trip precision finder --- */

/*
	Significant digits of a positional decimal: digits[0] is worth 10^leadingExponent and every following digit a tenth
	of the one before. Digits dropped left of the radix point come back as zeros when rendered.
*/
struct DigitString {
	DigitString() : negative(false), explicitPlus(false), leadingExponent(0) { }
	Decimal toDecimal() const {
		const Decimal magnitude(Integer(digits.c_str()), leadingExponent - static_cast<int>(digits.size()) + 1);
		return (negative ? -magnitude : magnitude);
	}
	String toString() const;
	bool operator==(const DigitString& other) const {
		return leadingExponent == other.leadingExponent && digits == other.digits;
	}
	bool negative;
	bool explicitPlus;
	String digits;
	int leadingExponent;
};

String DigitString::toString() const {
	String s(negative ? "-" : (explicitPlus ? "+" : ""));
	const int count = static_cast<int>(digits.size());
	if (leadingExponent < 0) {
		s += "0.";
		s.append(-leadingExponent - 1, '0');
		s += digits;
	} else {
		const int integerDigits = leadingExponent + 1;
		if (count <= integerDigits) {
			s += digits;
			s.append(integerDigits - count, '0');
		} else {
			s += digits.substr(0, integerDigits);
			s += '.';
			s += digits.substr(integerDigits);
		}
	}
	return s;
}

static DigitString scanDigitString(const String& s) {
	if (s.empty()) {
		throw PreconditionError("Empty decimal string");
	}
	if (s.find_first_of("eE") != String::npos) {
		throw PreconditionError("Exponential notation is not supported: " + s);
	}

	DigitString ds;
	const Char* const b = s.c_str();
	const Char* const e = b + s.size();
	const Char* p = b;
	if (p != e && (*p == '-' || *p == '+')) {
		ds.negative = (*p == '-');
		ds.explicitPlus = (*p == '+');
		++p;
	}
	String all;
	int integerDigits = 0;
	while (p != e && *p >= '0' && *p <= '9') {
		all += *p++;
		++integerDigits;
	}
	if (p != e && *p == '.') {
		++p;
		while (p != e && *p >= '0' && *p <= '9') {
			all += *p++;
		}
	}
	if (all.empty()) {
		throw FormatError(s, p - b, "Missing digits");
	}
	if (p != e) {
		throw FormatError(s, p - b, "Unexpected character");
	}

	const size_t first = all.find_first_not_of('0');
	if (first == String::npos) {
		ds.digits = "0";
		return ds;
	}
	ds.digits = all.substr(first);
	ds.leadingExponent = integerDigits - 1 - static_cast<int>(first);
	return ds;
}

// `exact` rounded to `count` significant digits, zero padded to exactly `count` digits.
static DigitString renderDigits(const Decimal& exact, int count, RoundingMode mode) {
	const Decimal rounded = exact.rounded(count, mode);
	DigitString ds;
	ds.negative = (rounded.sign() < 0);
	ds.digits = rounded.digits();
	ds.digits.append(count - ds.digits.size(), '0');
	ds.leadingExponent = rounded.adjustedExponent();
	return ds;
}

static bool parsesTo(const Decimal& candidate, double target) {
	return encode<double>(candidate).toValue() == target;
}

static bool parsesTo(const DigitString& candidate, double target) {
	return parsesTo(candidate.toDecimal(), target);
}

// `ds` written with the sign notation of `input`.
static RoundTripResult makeResult(const DigitString& ds, const DigitString& input) {
	DigitString signedDigits = ds;
	signedDigits.explicitPlus = input.explicitPlus;
	RoundTripResult result;
	result.digitCount = static_cast<int>(ds.digits.size());
	result.shortestDecimal = signedDigits.toString();
	return result;
}

RoundTripResult shortestRoundTrip(const String& decimal, const Context& context) {
	checkContext(context);
	const DigitString input = scanDigitString(decimal);
	const DoublePattern target = encode<double>(input.toDecimal());
	checkSpecial(target);
	if (target.isZero()) {
		RoundTripResult result;
		result.digitCount = 1;
		result.shortestDecimal = (input.negative ? "-0" : (input.explicitPlus ? "+0" : "0"));
		return result;
	}
	const double targetValue = target.toValue();
	const Decimal exact = toExact(target, context).exactDecimal;

	// Shrink: drop the last digit while the value still parses to the target, otherwise continue from the first
	// same-length neighbour (last digit 0 to 9) that does, or from the target rendered to that length when rounding
	// carries into the kept digits (...0899 to ...0900).
	std::vector<DigitString> candidates(1, input);
	DigitString current = input;
	while (current.digits.size() > 1) {
		DigitString shorter = current;
		shorter.digits.erase(shorter.digits.size() - 1);
		if (!parsesTo(shorter, targetValue)) {
			Char& last = shorter.digits[shorter.digits.size() - 1];
			Char d = '0';
			for (; d <= '9'; ++d) {
				last = d;
				if (parsesTo(shorter, targetValue)) {
					break;
				}
			}
			if (d > '9') {
				const DigitString carried = renderDigits(exact, static_cast<int>(shorter.digits.size()), context.rounding);
				if (!parsesTo(carried, targetValue)) {
					break;
				}
				shorter = carried;
			}
		}
		candidates.push_back(shorter);
		current = shorter;
	}

	// Verify, shortest first: the candidate (or its same-length neighbour) must equal the target re-rendered to the
	// candidate's own digit count.
	DigitString verified;
	bool isVerified = false;
	for (std::vector<DigitString>::const_reverse_iterator it = candidates.rbegin(); !isVerified && it != candidates.rend()
			; ++it) {
		const int count = static_cast<int>(it->digits.size());
		const DigitString rendered = renderDigits(exact, count, context.rounding);
		if (rendered == *it) {
			verified = *it;
			isVerified = true;
		} else if (rendered.leadingExponent == it->leadingExponent
				&& rendered.digits.compare(0, count - 1, it->digits, 0, count - 1) == 0
				&& parsesTo(rendered, targetValue)) {
			verified = rendered;
			isVerified = true;
		}
	}

	// A shorter rendering that parses to the target renders back to itself and takes precedence. With no verified
	// candidate the search ends at the latest when `count` reaches the digit count of the exact value.
	const int limit = (isVerified ? static_cast<int>(verified.digits.size()) : std::numeric_limits<int>::max());
	for (int count = 1; count < limit; ++count) {
		const DigitString rendered = renderDigits(exact, count, context.rounding);
		if (parsesTo(rendered, targetValue)) {
			return makeResult(rendered, input);
		}
	}
	return makeResult(verified, input);
}

/* --- Segment analyzer --- */

Decimal Segment::valueAt(uint64_t k) const {
	if (k >= (uint64_t(1) << Traits<double>::FRACTION_BITS)) {
		throw PreconditionError("Segment index must be below 2^52");
	}
	return minValue + Decimal(static_cast<long long>(k)) * stepDistance;
}

Segment segmentFromExponent(int exponent, const Context& context) {
	typedef Traits<double> FormatTraits;
	checkContext(context);
	if (exponent < FormatTraits::MIN_EXPONENT || exponent > FormatTraits::MAX_EXPONENT) {
		throw PreconditionError("Segment exponent " + std::to_string(exponent) + " is outside [-1022, 1023]");
	}
	const Decimal step = Decimal::powerOfTwo(exponent - FormatTraits::FRACTION_BITS);
	Segment segment;
	segment.unbiasedExponent = exponent;
	segment.minValue = Decimal::powerOfTwo(exponent).rounded(context.precision, context.rounding);
	segment.maxValue = (Decimal::powerOfTwo(exponent + 1) - step).rounded(context.precision, context.rounding);
	segment.stepDistance = step.rounded(context.precision, context.rounding);
	return segment;
}

Segment segmentFromValue(double value, const Context& context) {
	typedef Traits<double> FormatTraits;
	const DoublePattern pattern = DoublePattern::fromValue(value);
	checkSpecial(pattern);
	if (pattern.biasedExponent() != 0) {
		return segmentFromExponent(static_cast<int>(pattern.biasedExponent()) - FormatTraits::BIAS, context);
	}

	checkContext(context);
	const Decimal step = Decimal::powerOfTwo(FormatTraits::MIN_EXPONENT - FormatTraits::FRACTION_BITS);
	const long long LARGEST_FRACTION = (1LL << FormatTraits::FRACTION_BITS) - 1;
	Segment segment;
	segment.unbiasedExponent = FormatTraits::MIN_EXPONENT;
	segment.subnormal = true;
	segment.maxValue = (Decimal(LARGEST_FRACTION) * step).rounded(context.precision, context.rounding);
	segment.stepDistance = step.rounded(context.precision, context.rounding);
	return segment;
}

/* --- Decimal to float mapper --- */

static void checkMappingLimit(size_t count, const Context& context) {
	if (count > context.mappingLimit) {
		throw PreconditionError("Decimal mapping exceeds the limit of " + std::to_string(context.mappingLimit)
				+ " numbers");
	}
}

DecimalMapping mapNDigitDecimals(double value, int digits, const Context& context) {
	checkContext(context);
	if (digits < 1) {
		throw PreconditionError("Digit count must be at least 1");
	}
	const ExactValue exact = toExact(DoublePattern::fromValue(value), context);
	const int incrementExponent = exact.exactDecimal.adjustedExponent() + 1 - digits;

	DecimalMapping mapping;
	mapping.increment = Decimal::powerOfTen(incrementExponent);
	const Decimal start = exact.exactDecimal.quantized(incrementExponent, ROUND_FLOOR);

	std::vector<Decimal> below;
	for (Decimal candidate = start; parsesTo(candidate, value); candidate -= mapping.increment) {
		checkMappingLimit(below.size() + 1, context);
		below.push_back(candidate);
	}
	std::vector<Decimal> above;
	for (Decimal candidate = start + mapping.increment; parsesTo(candidate, value); candidate += mapping.increment) {
		checkMappingLimit(below.size() + above.size() + 1, context);
		above.push_back(candidate);
	}

	mapping.numbers.assign(below.rbegin(), below.rend());
	mapping.numbers.insert(mapping.numbers.end(), above.begin(), above.end());
	mapping.count = mapping.numbers.size();
	return mapping;
}

/* --- Ascending generator --- */

AscendingGenerator::AscendingGenerator(double seed, const Context& context)
		: context(context), exhausted(false) {
	if (isNaN(seed) || seed < 0.0) {
		throw PreconditionError("Generator seed must be zero or positive");
	}
	p = DoublePattern::fromValue(seed == 0.0 ? 0.0 : seed);	// -0.0 starts at +0
	value = toExact(p, context);
}

const ExactValue& AscendingGenerator::advance() {
	if (exhausted) {
		throw PreconditionError("Generator advanced past the end of its sequence");
	}
	try {
		const DoublePattern stepped = next(p);
		value = toExact(stepped, context);
		p = stepped;
	} catch (const Exception&) {
		exhausted = true;
		throw;
	}
	return value;
}

bool AscendingGenerator::tryToAdvance() {
	if (exhausted) {
		return false;
	}
	try {
		advance();
	} catch (const SpecialValueError&) {
		return false;
	}
	return true;
}

template class BitPattern<double>;
template class BitPattern<float>;
template ExactValue toExact<double>(const BitPattern<double>& pattern, const Context& context);
template ExactValue toExact<float>(const BitPattern<float>& pattern, const Context& context);
template BitPattern<double> next<double>(const BitPattern<double>& pattern);
template BitPattern<float> next<float>(const BitPattern<float>& pattern);
template BitPattern<double> previous<double>(const BitPattern<double>& pattern);
template BitPattern<float> previous<float>(const BitPattern<float>& pattern);
template BitPattern<double> encode<double>(const Decimal& value);
template BitPattern<float> encode<float>(const Decimal& value);

bool unitTest() {
#if !defined(NDEBUG)
	{
		Bit bits[3] = { 1, 0, 1 };
		assert(!incrementBits(bits, bits + 3));
		assert(bits[0] == 1 && bits[1] == 1 && bits[2] == 0);
		assert(!decrementBits(bits, bits + 3));
		assert(bits[0] == 1 && bits[1] == 0 && bits[2] == 1);

		Bit ones[3] = { 1, 1, 1 };
		assert(incrementBits(ones, ones + 3));
		assert(ones[0] == 0 && ones[1] == 0 && ones[2] == 0);
		assert(decrementBits(ones, ones + 3));
		assert(ones[0] == 1 && ones[1] == 1 && ones[2] == 1);
	}

	assert(fromHex('0') == 0);
	assert(fromHex('a') == 10);
	assert(fromHex('F') == 15);
	assert(fromHex('g') == -1);

	assert(isBelowPowerOfTwo(Integer(3), Integer(1), 2));
	assert(!isBelowPowerOfTwo(Integer(3), Integer(1), 1));
	assert(!isBelowPowerOfTwo(Integer(1), Integer(4), -2));
	assert(isBelowPowerOfTwo(Integer(1), Integer(5), -2));

	{
		const DigitString small = scanDigitString("0.000123");
		assert(small.digits == "123" && small.leadingExponent == -4);
		assert(small.toString() == "0.000123");
		const DigitString large = scanDigitString("72057594037927956");
		assert(large.digits == "72057594037927956" && large.leadingExponent == 16);
		DigitString trimmed = large;
		trimmed.digits.erase(trimmed.digits.size() - 1);
		assert(trimmed.toString() == "72057594037927950");
		const DigitString negative = scanDigitString("-007.250");
		assert(negative.negative && negative.digits == "7250" && negative.leadingExponent == 0);
		assert(negative.toString() == "-7.250");
		const DigitString plus = scanDigitString("+2.50");
		assert(!plus.negative && plus.explicitPlus && plus.toString() == "+2.50");
		assert(renderDigits(Decimal::fromString("0.5"), 3, ROUND_HALF_EVEN).toString() == "0.500");
		assert(renderDigits(Decimal::fromString("9.96"), 2, ROUND_HALF_EVEN).toString() == "10");
	}

	assert(DoublePattern().toHexString() == "0x0");
	assert(DoublePattern::fromValue(1.0).toHexString() == "0x3ff0000000000000");
	assert(DoublePattern::fromHexString("0X3FF0000000000000").toValue() == 1.0);
	assert(FloatPattern::fromValue(1.0f).toHexString() == "0x3f800000");
	assert(FloatPattern::fromValue(-2.5f).toBinaryString() == "11000000001000000000000000000000");

	assert(encode<double>(Decimal::fromString("0.1")).toValue() == 0.1);
	assert(encode<float>(Decimal::fromString("0.1")).toValue() == 0.1f);
	assert(encode<double>(Decimal::fromString("-1.5")).toValue() == -1.5);
	assert(encode<double>(Decimal::fromString("4.9406564584124654e-324")).toWord() == 1);
	assert(encode<double>(Decimal::fromString("2.4703282292062327e-324")).toWord() == 0);
	assert(encode<double>(Decimal::fromString("2.4703282292062328e-324")).toWord() == 1);
	assert(encode<double>(Decimal::fromString("2.2250738585072011e-308")).toWord() == 0x000fffffffffffffULL);
	assert(encode<double>(Decimal::fromString("1.7976931348623158e308")).toWord() == 0x7fefffffffffffffULL);
	assert(encode<double>(Decimal::fromString("1.7976931348623159e308")).isInfinity());
	assert(encode<double>(Decimal::fromString("1e400")).isInfinity());
	assert(encode<double>(Decimal::fromString("1e-400")).isZero());
	assert(encode<double>(Decimal::fromString("9007199254740993")).toValue() == 9007199254740992.0);
	assert(encode<double>(Decimal::fromString("9007199254740995")).toValue() == 9007199254740996.0);
	assert(encode<float>(Decimal::fromString("3.4028236e38")).isInfinity());
	assert(encode<float>(Decimal::fromString("1.4e-45")).toWord() == 1);
#endif

	return true;
}

} // namespace Dyadic

#ifdef REGISTER_UNIT_TEST
REGISTER_UNIT_TEST(Dyadic::unitTest)
#endif

#ifdef __GNUC__
#ifndef __clang__
	#pragma GCC pop_options
#endif
#endif
