#include "Decimal.h"

namespace Dyadic {

typedef Decimal::Integer Integer;

// Keeps exponents far enough from INT_MAX that sums of two exponents and digit counts cannot overflow.
const long long MAX_PARSED_EXPONENT = 100000000;

static Integer powerOfTenInteger(int exponent) {
	assert(exponent >= 0);
	return boost::multiprecision::pow(Integer(10), static_cast<unsigned int>(exponent));
}

void Decimal::normalize() {
	static const Integer TEN(10);
	if (c.is_zero()) {
		e = 0;
		return;
	}
	Integer quotient;
	Integer remainder;
	for (;;) {
		boost::multiprecision::divide_qr(c, TEN, quotient, remainder);
		if (!remainder.is_zero()) {
			break;
		}
		c.swap(quotient);
		++e;
	}
}

Decimal Decimal::fromString(const String& s) {
	const Char* const b = s.c_str();
	const Char* const end = b + s.size();
	const Char* p = b;

	bool negative = false;
	if (p != end && (*p == '-' || *p == '+')) {
		negative = (*p == '-');
		++p;
	}

	// Collect integer and fraction digits, skipping leading zeros (boost would read a leading '0' as octal).
	String digits;
	bool anyDigit = false;
	long long exponent = 0;
	while (p != end && *p >= '0' && *p <= '9') {
		anyDigit = true;
		if (!digits.empty() || *p != '0') {
			digits += *p;
		}
		++p;
	}
	if (p != end && *p == '.') {
		++p;
		while (p != end && *p >= '0' && *p <= '9') {
			anyDigit = true;
			if (!digits.empty() || *p != '0') {
				digits += *p;
			}
			--exponent;
			++p;
		}
	}
	if (!anyDigit) {
		throw FormatError(s, p - b, "Missing digits");
	}

	if (p != end && (*p == 'e' || *p == 'E')) {
		++p;
		int sign = 1;
		if (p != end && (*p == '-' || *p == '+')) {
			sign = (*p == '-' ? -1 : 1);
			++p;
		}
		const Char* const exponentBegin = p;
		long long x = 0;
		while (p != end && *p >= '0' && *p <= '9') {
			x = x * 10 + (*p - '0');
			if (x > MAX_PARSED_EXPONENT) {
				throw FormatError(s, p - b, "Exponent out of range");
			}
			++p;
		}
		if (p == exponentBegin) {
			throw FormatError(s, p - b, "Missing exponent digits");
		}
		exponent += sign * x;
	}
	if (p != end) {
		throw FormatError(s, p - b, "Unexpected character");
	}
	if (exponent < -MAX_PARSED_EXPONENT) {
		throw FormatError(s, p - b, "Exponent out of range");
	}

	if (digits.empty()) {
		return Decimal();
	}
	const Integer coefficient(digits.c_str());
	return Decimal(negative ? Integer(-coefficient) : coefficient, static_cast<int>(exponent));
}

Decimal Decimal::powerOfTwo(int exponent) {
	if (exponent >= 0) {
		return Decimal(Integer(1) << static_cast<unsigned int>(exponent), 0);
	}
	// 2^-n == 5^n * 10^-n
	return Decimal(boost::multiprecision::pow(Integer(5), static_cast<unsigned int>(-exponent)), exponent);
}

Decimal Decimal::powerOfTen(int exponent) {
	return Decimal(Integer(1), exponent);
}

int Decimal::digitCount() const {
	return static_cast<int>(digits().size());
}

int Decimal::adjustedExponent() const {
	return (c.is_zero() ? 0 : e + digitCount() - 1);
}

String Decimal::digits() const {
	const Integer magnitude = boost::multiprecision::abs(c);
	return magnitude.str();
}

Decimal Decimal::scaledByPowerOfTwo(int exponent) const {
	return *this * powerOfTwo(exponent);
}

Decimal Decimal::rounded(int significantDigits, RoundingMode mode) const {
	if (significantDigits < 1) {
		throw PreconditionError("Rounding requires at least one significant digit");
	}
	const int count = digitCount();
	if (c.is_zero() || count <= significantDigits) {
		return *this;
	}
	return quantized(e + (count - significantDigits), mode);
}

Decimal Decimal::quantized(int exponent, RoundingMode mode) const {
	if (c.is_zero() || e >= exponent) {
		return *this;
	}

	const bool negative = (c.sign() < 0);
	const Integer magnitude = boost::multiprecision::abs(c);
	const Integer divisor = powerOfTenInteger(exponent - e);
	Integer quotient;
	Integer remainder;
	boost::multiprecision::divide_qr(magnitude, divisor, quotient, remainder);

	bool up = false;
	if (!remainder.is_zero()) {
		switch (mode) {
			case ROUND_DOWN: break;
			case ROUND_FLOOR: up = negative; break;
			case ROUND_CEILING: up = !negative; break;
			case ROUND_HALF_UP: up = (remainder * 2 >= divisor); break;
			case ROUND_HALF_EVEN: {
				const Integer twice = remainder * 2;
				const int half = twice.compare(divisor);
				up = (half > 0 || (half == 0 && boost::multiprecision::bit_test(quotient, 0)));
				break;
			}
		}
	}
	if (up) {
		++quotient;
	}
	return Decimal(negative ? Integer(-quotient) : quotient, exponent);
}

Decimal Decimal::operator+(const Decimal& other) const {
	if (e == other.e) {
		return Decimal(c + other.c, e);
	} else if (e > other.e) {
		return Decimal(c * powerOfTenInteger(e - other.e) + other.c, other.e);
	} else {
		return Decimal(c + other.c * powerOfTenInteger(other.e - e), e);
	}
}

int Decimal::compare(const Decimal& other) const {
	const int signA = c.sign();
	const int signB = other.c.sign();
	if (signA != signB) {
		return (signA < signB ? -1 : 1);
	}
	if (signA == 0) {
		return 0;
	}
	// Same sign: compare leading digit positions first, full difference only when they agree.
	const int adjustedA = adjustedExponent();
	const int adjustedB = other.adjustedExponent();
	if (adjustedA != adjustedB) {
		return (adjustedA < adjustedB ? -signA : signA);
	}
	return (*this - other).sign();
}

String Decimal::toString() const {
	if (c.is_zero()) {
		return "0";
	}
	const String d = digits();
	String s;
	if (e >= 0) {
		s = d;
		s.append(e, '0');
	} else {
		const int point = static_cast<int>(d.size()) + e;
		if (point > 0) {
			s = d.substr(0, point) + '.' + d.substr(point);
		} else {
			s = "0.";
			s.append(-point, '0');
			s += d;
		}
	}
	if (c.sign() < 0) {
		s.insert(0, "-");
	}
	return s;
}

} // namespace Dyadic
