#ifndef Dyadic_h
#define Dyadic_h

#include "assert.h"
#include <array>
#include <vector>
#include <string>
#include <utility>
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include "Errors.h"
#include "Decimal.h"

namespace Dyadic {

typedef unsigned char Bit;
typedef std::vector<Bit> BitSequence;	// most significant bit first

template<typename T> struct Traits { };

template<> struct Traits<double> {
	enum {
		TOTAL_BITS = 64, EXPONENT_BITS = 11, FRACTION_BITS = 52, BIAS = 1023
		, MIN_EXPONENT = -1022, MAX_EXPONENT = 1023					// unbiased exponents of normal values
		, MIN_DECIMAL_EXPONENT = -324, MAX_DECIMAL_EXPONENT = 308	// decimal exponents of the finite range
	};
	typedef uint64_t Word;
};

template<> struct Traits<float> {
	enum {
		TOTAL_BITS = 32, EXPONENT_BITS = 8, FRACTION_BITS = 23, BIAS = 127
		, MIN_EXPONENT = -126, MAX_EXPONENT = 127
		, MIN_DECIMAL_EXPONENT = -45, MAX_DECIMAL_EXPONENT = 38
	};
	typedef uint32_t Word;
};

/**
	Conversion settings threaded through every conversion call. `precision` is the number of significant decimal
	digits exact results are kept to (the default covers the 767 digits of the longest exact double expansion, so
	conversions are exact), `rounding` is applied when a result must be shortened, and `mappingLimit` bounds how many
	decimals mapNDigitDecimals() may enumerate.
**/
struct Context {
	enum { MIN_PRECISION = 400, DEFAULT_PRECISION = 800, DEFAULT_MAPPING_LIMIT = 1000000 };
	Context() : precision(DEFAULT_PRECISION), rounding(ROUND_HALF_EVEN), mappingLimit(DEFAULT_MAPPING_LIMIT) { }
	explicit Context(int precision, RoundingMode rounding = ROUND_HALF_EVEN)
			: precision(precision), rounding(rounding), mappingLimit(DEFAULT_MAPPING_LIMIT) { }
	int precision;
	RoundingMode rounding;
	size_t mappingLimit;
};

/**
	Adds one to the unsigned binary integer held in [begin, end), most significant bit first: trailing ones become
	zeros and the first zero from the end becomes one. Returns true if the addition carried out of the range, in which
	case the range has wrapped around to all zeros.
**/
template<typename I> bool incrementBits(I begin, I end) {
	I p = end;
	while (p != begin) {
		--p;
		if (*p == 0) {
			*p = 1;
			return false;
		}
		*p = 0;
	}
	return true;
}

// Mirror of incrementBits(). Returns true on borrow out of the range (which then holds all ones).
template<typename I> bool decrementBits(I begin, I end) {
	I p = end;
	while (p != begin) {
		--p;
		if (*p != 0) {
			*p = 0;
			return false;
		}
		*p = 1;
	}
	return true;
}

/**
	Throws SpecialValueError if the exponent bits are all ones: INFINITE_VALUE when the fraction bits are all zeros,
	NOT_A_NUMBER otherwise. Does nothing for finite patterns.
**/
template<typename I> void checkSpecial(I fractionBegin, I fractionEnd, I exponentBegin, I exponentEnd) {
	if (std::find(exponentBegin, exponentEnd, Bit(0)) == exponentEnd) {
		if (std::find(fractionBegin, fractionEnd, Bit(1)) == fractionEnd) {
			throw SpecialValueError(SpecialValueError::INFINITE_VALUE);
		}
		throw SpecialValueError(SpecialValueError::NOT_A_NUMBER);
	}
}

/**
	A BitPattern is the immutable IEEE-754 bit layout of a double (T = double) or single (T = float) precision value:
	bit 0 is the sign, followed by the exponent bits and the fraction bits, each most significant bit first.
**/
template<typename T> class BitPattern {
	public:
		typedef typename Traits<T>::Word Word;
		enum {
			TOTAL_BITS = Traits<T>::TOTAL_BITS
			, EXPONENT_BITS = Traits<T>::EXPONENT_BITS
			, FRACTION_BITS = Traits<T>::FRACTION_BITS
			, FRACTION_OFFSET = 1 + EXPONENT_BITS
		};
		typedef std::array<Bit, TOTAL_BITS> Bits;
		typedef typename Bits::const_iterator const_iterator;

		BitPattern() { b.fill(0); }
		explicit BitPattern(const Bits& bits);
		static BitPattern fromWord(Word word);
		static BitPattern fromFields(bool negative, Word biasedExponent, Word fraction);
		static BitPattern fromValue(T value);
		static BitPattern fromBinaryString(const String& s);	// exactly TOTAL_BITS '0' / '1' characters
		static BitPattern fromHexString(const String& s);		// optional "0x", 1 to TOTAL_BITS / 4 hex digits

		Word toWord() const;
		T toValue() const;
		String toBinaryString() const;
		String toHexString() const;		// lowercase "0x" form without leading zero nibbles

		const Bits& getBits() const { return b; }
		Bit operator[](int i) const { return b[i]; }
		bool isNegative() const { return b[0] != 0; }
		const_iterator exponentBegin() const { return b.begin() + 1; }
		const_iterator exponentEnd() const { return b.begin() + FRACTION_OFFSET; }
		const_iterator fractionBegin() const { return b.begin() + FRACTION_OFFSET; }
		const_iterator fractionEnd() const { return b.end(); }
		Word biasedExponent() const;
		Word fraction() const;

		bool isInfinity() const;
		bool isNaN() const;
		bool isSpecial() const { return biasedExponent() == (Word(1) << EXPONENT_BITS) - 1; }
		bool isZero() const { return biasedExponent() == 0 && fraction() == 0; }
		bool isSubnormal() const { return biasedExponent() == 0 && fraction() != 0; }

		bool operator==(const BitPattern& other) const { return b == other.b; }
		bool operator!=(const BitPattern& other) const { return b != other.b; }

	protected:
		Bits b;
};

typedef BitPattern<double> DoublePattern;
typedef BitPattern<float> FloatPattern;

template<typename T> void checkSpecial(const BitPattern<T>& pattern) {
	checkSpecial(pattern.fractionBegin(), pattern.fractionEnd(), pattern.exponentBegin(), pattern.exponentEnd());
}

// The 64-character bit string and the hex form of `value`, e.g. 7.2 -> ("0100000000011100...1101", "0x401ccccccccccccd").
std::pair<String, String> toBits(double value);
DoublePattern fromBits(const String& bitString);

/**
	ExactValue is the exact decimal value of a finite bit pattern together with its unbiased exponent and the native
	double it denotes. For a normal pattern `exactDecimal == sign * (1 + sum(fraction[i] * 2^-i)) * 2^unbiasedExponent`.
	Zero and subnormal patterns have an implicit leading 0 instead of 1 and an unbiased exponent fixed at
	Traits<T>::MIN_EXPONENT. Zero keeps its sign in `sign`.
**/
struct ExactValue {
	ExactValue() : sign(1), unbiasedExponent(0), nativeApproximation(0.0) { }
	int sign;
	Decimal exactDecimal;
	int unbiasedExponent;
	double nativeApproximation;
};

// Throws SpecialValueError for Infinity and NaN before any arithmetic is attempted.
template<typename T> ExactValue toExact(const BitPattern<T>& pattern, const Context& context = Context());

/**
	next() returns the adjacent representable value toward positive infinity and previous() the one toward negative
	infinity. Both throw SpecialValueError if the input is Infinity or NaN, or if the step lands on Infinity. Carrying
	out of an all-ones exponent field throws OverflowError.
**/
template<typename T> BitPattern<T> next(const BitPattern<T>& pattern);
template<typename T> BitPattern<T> previous(const BitPattern<T>& pattern);

/**
	Rounds `bits` to its first `k` bits, round-to-nearest ties-to-even: bits[k] == 0 truncates, bits[k] == 1 followed
	by any 1 rounds up, and an exact tie rounds up only if the retained bits[k - 1] is 1. Sequences no longer than `k`
	are returned as is. tryToRoundToNearestEven() returns false if rounding up carried out of the k retained bits
	(`rounded` then holds the wrapped, all zero, bits); roundToNearestEven() throws OverflowError instead.
**/
bool tryToRoundToNearestEven(const BitSequence& bits, size_t k, BitSequence& rounded);
BitSequence roundToNearestEven(const BitSequence& bits, size_t k);

/**
	Encodes an exact decimal as the nearest representable value, ties to even. Magnitudes beyond the finite range
	encode as Infinity, magnitudes below half the smallest subnormal as zero. Zero encodes as +0.
**/
template<typename T> BitPattern<T> encode(const Decimal& value);

/**
	Single precision encoder for native doubles. ±0 keep their sign, ±Infinity map to an all ones exponent with a zero
	fraction and NaN maps to the canonical pattern with only the least significant fraction bit set.
**/
FloatPattern encodeSingle(double value);
std::pair<String, String> toSingleBits(double value);

// Correctly rounded text to double conversion through Decimal::fromString() and encode<double>().
double parseDouble(const String& s);

struct RoundTripResult {
	RoundTripResult() : digitCount(0) { }
	int digitCount;
	String shortestDecimal;
};

/**
	Finds the shortest decimal string that parses back to the same double as `decimal` and that also survives
	re-rendering to its own digit count. `decimal` is positional notation ([-+]digits[.digits]). Empty input and
	exponential notation throw PreconditionError, other malformed input FormatError.
**/
RoundTripResult shortestRoundTrip(const String& decimal, const Context& context = Context());

/**
	A Segment is the binade [2^e, 2^(e+1)) of doubles sharing one exponent: every value in it is
	`minValue + k * stepDistance` for k in [0, 2^52 - 1]. The subnormal segment (subnormal == true) runs from 0 with
	the step of the lowest normal binade.
**/
struct Segment {
	Segment() : unbiasedExponent(0), subnormal(false) { }
	Decimal valueAt(uint64_t k) const;
	bool contains(const Decimal& value) const { return minValue <= value && value <= maxValue; }
	int unbiasedExponent;
	bool subnormal;
	Decimal minValue;
	Decimal maxValue;
	Decimal stepDistance;
};

Segment segmentFromExponent(int exponent, const Context& context = Context());
Segment segmentFromValue(double value, const Context& context = Context());

struct DecimalMapping {
	DecimalMapping() : count(0) { }
	size_t count;
	Decimal increment;
	std::vector<Decimal> numbers;	// ascending
};

/**
	Enumerates every decimal on the `digits` significant digit grid of `value` that parses to `value`. The grid is
	10^(adjusted + 1 - digits) where adjusted is the exponent of the leading digit of the exact value.
**/
DecimalMapping mapNDigitDecimals(double value, int digits, const Context& context = Context());

/**
	AscendingGenerator walks the representable doubles upward from a non-negative seed. current() starts at the seed
	itself; every advance() steps to the next representable value. Reaching Infinity ends the sequence for good:
	advance() throws the SpecialValueError once and the generator is exhausted from then on.
**/
class AscendingGenerator {
	public:
		AscendingGenerator(double seed, const Context& context = Context());
		const ExactValue& current() const { return value; }
		const DoublePattern& pattern() const { return p; }
		bool isExhausted() const { return exhausted; }
		const ExactValue& advance();	// throws PreconditionError once exhausted
		bool tryToAdvance();			// false at the end of the sequence

	protected:
		const Context context;
		DoublePattern p;
		ExactValue value;
		bool exhausted;
};

bool unitTest();

} // namespace Dyadic

#endif /* Dyadic_h */
