#ifndef Decimal_h
#define Decimal_h

#include "assert.h"
#include <ostream>
#include <boost/multiprecision/cpp_int.hpp>
#include "Errors.h"

namespace Dyadic {

enum RoundingMode {
	ROUND_HALF_EVEN			// ties go to the even neighbour
	, ROUND_HALF_UP			// ties go away from zero
	, ROUND_DOWN			// toward zero (truncation)
	, ROUND_FLOOR			// toward negative infinity
	, ROUND_CEILING			// toward positive infinity
};

/**
	Decimal is an exact decimal number `coefficient * 10^exponent` with an unbounded integer coefficient. Every
	operation except rounded() and quantized() is exact, so powers of two (positive and negative) and the exact
	expansion of any binary floating point value are represented without loss.

	Values are kept normalized (no trailing zeros in the coefficient, zero has exponent 0), so two Decimals are equal
	exactly when their coefficients and exponents are.
**/
class Decimal {
	public:
		typedef boost::multiprecision::cpp_int Integer;

		Decimal() : c(0), e(0) { }
		Decimal(long long value) : c(value), e(0) { normalize(); }
		Decimal(const Integer& coefficient, int exponent) : c(coefficient), e(exponent) { normalize(); }

		// Accepts [-+]digits[.digits][(e|E)[-+]digits] with at least one significand digit. Throws FormatError.
		static Decimal fromString(const String& s);
		static Decimal powerOfTwo(int exponent);
		static Decimal powerOfTen(int exponent);

		const Integer& coefficient() const { return c; }
		int exponent() const { return e; }
		int sign() const { return c.sign(); }
		bool isZero() const { return c.is_zero(); }
		int digitCount() const;				// significant digits in the coefficient, 1 for zero
		int adjustedExponent() const;		// exponent of the leading digit, 0 for zero
		String digits() const;				// significant digits of the magnitude

		Decimal abs() const { return (c.sign() < 0 ? -*this : *this); }
		Decimal scaledByPowerOfTwo(int exponent) const;
		Decimal scaledByPowerOfTen(int exponent) const { return Decimal(c, e + exponent); }
		Decimal rounded(int significantDigits, RoundingMode mode) const;	// at most `significantDigits` digits
		Decimal quantized(int exponent, RoundingMode mode) const;			// a multiple of 10^exponent

		Decimal operator-() const { return Decimal(-c, e); }
		Decimal operator+(const Decimal& other) const;
		Decimal operator-(const Decimal& other) const { return *this + (-other); }
		Decimal operator*(const Decimal& other) const { return Decimal(c * other.c, e + other.e); }
		Decimal& operator+=(const Decimal& other) { return (*this = *this + other); }
		Decimal& operator-=(const Decimal& other) { return (*this = *this - other); }

		int compare(const Decimal& other) const;
		bool operator==(const Decimal& other) const { return e == other.e && c == other.c; }
		bool operator!=(const Decimal& other) const { return !(*this == other); }
		bool operator<(const Decimal& other) const { return compare(other) < 0; }
		bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
		bool operator>(const Decimal& other) const { return compare(other) > 0; }
		bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

		// Positional notation with the complete expansion, never exponential (e.g. "0.000125", "4503599627370496").
		String toString() const;

	protected:
		void normalize();
		Integer c;
		int e;
};

inline std::ostream& operator<<(std::ostream& o, const Decimal& d) {
	o << d.toString();
	return o;
}

} // namespace Dyadic

#endif /* Decimal_h */
