#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>
#include "../src/Dyadic.h"

using namespace Dyadic;

template<class E, class F> static bool throws(F f) {
	try {
		f();
	} catch (const E&) {
		return true;
	}
	return false;
}

static SpecialValueError::Kind specialKind(const DoublePattern& p) {
	try {
		toExact(p);
	} catch (const SpecialValueError& x) {
		return x.getKind();
	}
	assert(0);
	return SpecialValueError::NOT_A_NUMBER;
}

static const char* ONE_POINT_TWO = "0011111111110011001100110011001100110011001100110011001100110011";
static const char* MAX_FINITE = "0111111111101111111111111111111111111111111111111111111111111111";

static void testCodec() {
	const std::pair<String, String> bits = toBits(1.2);
	assert(bits.first == ONE_POINT_TWO);
	assert(bits.second == "0x3ff3333333333333");
	assert(toBits(7.2).second == "0x401ccccccccccccd");
	assert(toBits(0.0).second == "0x0");
	assert(toBits(-0.0).second == "0x8000000000000000");
	assert(toBits(-0.0).first == "1000000000000000000000000000000000000000000000000000000000000000");

	const DoublePattern p = fromBits(ONE_POINT_TWO);
	assert(p.toValue() == 1.2);
	assert(!p.isNegative());
	assert(p.biasedExponent() == 1023);
	assert(p.fraction() == 0x3333333333333ULL);
	assert(p.toWord() == 0x3ff3333333333333ULL);
	assert(p == DoublePattern::fromValue(1.2));
	assert(p == DoublePattern::fromWord(0x3ff3333333333333ULL));
	assert(p == DoublePattern::fromFields(false, 1023, 0x3333333333333ULL));
	assert(p == DoublePattern::fromHexString("0x3ff3333333333333"));
	assert(DoublePattern::fromHexString("401CCCCCCCCCCCCD").toValue() == 7.2);
	assert(DoublePattern::fromHexString("0x1").isSubnormal());

	try {
		fromBits("0101");
		assert(0);
	} catch (const FormatError& x) {
		assert(x.getOffset() == 4);
		assert(x.getInput() == "0101");
		assert(String(x.what()) == "Wrong bit string length at offset 4 in \"0101\"");
	}
	try {
		String s(ONE_POINT_TWO);
		s[5] = '2';
		fromBits(s);
		assert(0);
	} catch (const FormatError& x) {
		assert(x.getOffset() == 5);
	}
	assert(throws<FormatError>([]() { fromBits(String(ONE_POINT_TWO) + "0"); }));
	assert(throws<FormatError>([]() { DoublePattern::fromHexString("0x"); }));
	assert(throws<FormatError>([]() { DoublePattern::fromHexString("0x3g"); }));
	assert(throws<FormatError>([]() { DoublePattern::fromHexString("0x12345678123456781"); }));
	assert(throws<FormatError>([]() { FloatPattern::fromHexString("0x123456789"); }));

	assert(FloatPattern::fromValue(52.0f).toBinaryString() == "01000010010100000000000000000000");
	assert(FloatPattern::fromValue(52.0f).toHexString() == "0x42500000");
	assert(FloatPattern::fromBinaryString("01000010010100000000000000000000").toValue() == 52.0f);
}

static void testSpecialValues() {
	assert(specialKind(fromBits("1111111111110011001100110011001100110011001100110011001100110011"))
			== SpecialValueError::NOT_A_NUMBER);
	assert(specialKind(fromBits("1111111111110000000000000000000000000000000000000000000000000000"))
			== SpecialValueError::INFINITE_VALUE);
	assert(specialKind(DoublePattern::fromValue(std::numeric_limits<double>::infinity()))
			== SpecialValueError::INFINITE_VALUE);
	assert(specialKind(DoublePattern::fromValue(std::numeric_limits<double>::quiet_NaN()))
			== SpecialValueError::NOT_A_NUMBER);
	assert(DoublePattern::fromValue(-std::numeric_limits<double>::infinity()).isInfinity());
	assert(DoublePattern::fromValue(std::numeric_limits<double>::quiet_NaN()).isNaN());
	assert(!DoublePattern::fromValue(1.0).isSpecial());
}

static void testExactValue() {
	const ExactValue v = toExact(fromBits(ONE_POINT_TWO));
	assert(v.exactDecimal.toString() == "1.1999999999999999555910790149937383830547332763671875");
	assert(v.unbiasedExponent == 0);
	assert(v.sign == 1);
	assert(v.nativeApproximation == 1.2);

	const ExactValue negative = toExact(DoublePattern::fromValue(-0.375));
	assert(negative.exactDecimal.toString() == "-0.375");
	assert(negative.sign == -1);
	assert(negative.unbiasedExponent == -2);

	const ExactValue large = toExact(DoublePattern::fromValue(4503599627370496.0));
	assert(large.exactDecimal.toString() == "4503599627370496");
	assert(large.unbiasedExponent == 52);

	const ExactValue negativeZero = toExact(DoublePattern::fromValue(-0.0));
	assert(negativeZero.exactDecimal.isZero());
	assert(negativeZero.sign == -1);
	assert(negativeZero.unbiasedExponent == -1022);
	assert(negativeZero.nativeApproximation == 0.0 && std::signbit(negativeZero.nativeApproximation));

	const ExactValue smallest = toExact(DoublePattern::fromWord(1));
	assert(smallest.exactDecimal == Decimal::powerOfTwo(-1074));
	assert(smallest.exactDecimal.digitCount() == 751);
	assert(smallest.unbiasedExponent == -1022);
	assert(smallest.nativeApproximation == std::numeric_limits<double>::denorm_min());

	const ExactValue largest = toExact(fromBits(MAX_FINITE));
	assert(largest.exactDecimal.digitCount() == 309);
	assert(largest.exactDecimal.adjustedExponent() == 308);
	assert(largest.unbiasedExponent == 1023);
	assert(largest.nativeApproximation == std::numeric_limits<double>::max());

	const ExactValue single = toExact(FloatPattern::fromValue(0.1f));
	assert(single.exactDecimal.toString() == "0.100000001490116119384765625");
	assert(single.unbiasedExponent == -4);
	assert(single.nativeApproximation == static_cast<double>(0.1f));

	assert(throws<PreconditionError>([]() { toExact(DoublePattern::fromValue(1.0), Context(100)); }));
	const ExactValue coarse = toExact(DoublePattern::fromWord(1), Context(400, ROUND_DOWN));
	assert(coarse.exactDecimal.digitCount() <= 400);
	assert(coarse.exactDecimal < smallest.exactDecimal);
}

static void testStepper() {
	const DoublePattern start = fromBits(ONE_POINT_TWO);
	const DoublePattern successor = next(start);
	assert(successor.toBinaryString() == "0011111111110011001100110011001100110011001100110011001100110100");
	assert(successor.biasedExponent() == start.biasedExponent());
	assert(toExact(successor).exactDecimal > toExact(start).exactDecimal);
	assert(previous(successor) == start);

	const DoublePattern belowTwo = fromBits("0011111111111111111111111111111111111111111111111111111111111111");
	assert(next(belowTwo).toBinaryString() == "0100000000000000000000000000000000000000000000000000000000000000");
	assert(next(belowTwo).toValue() == 2.0);
	assert(previous(DoublePattern::fromValue(2.0)) == belowTwo);
	assert(previous(DoublePattern::fromValue(1.0)).toWord() == 0x3fefffffffffffffULL);

	try {
		next(fromBits(MAX_FINITE));
		assert(0);
	} catch (const SpecialValueError& x) {
		assert(x.getKind() == SpecialValueError::INFINITE_VALUE);
	}
	try {
		previous(DoublePattern::fromValue(-std::numeric_limits<double>::max()));
		assert(0);
	} catch (const SpecialValueError& x) {
		assert(x.getKind() == SpecialValueError::INFINITE_VALUE);
	}
	const DoublePattern nan = fromBits("1111111111110011001100110011001100110011001100110011001100110011");
	const DoublePattern nanCopy = nan;
	try {
		next(nan);
		assert(0);
	} catch (const SpecialValueError& x) {
		assert(x.getKind() == SpecialValueError::NOT_A_NUMBER);
	}
	assert(nan == nanCopy);
	assert(throws<SpecialValueError>([]() { next(DoublePattern::fromValue(std::numeric_limits<double>::infinity())); }));

	assert(next(DoublePattern::fromValue(0.0)).toWord() == 1);
	assert(next(DoublePattern::fromValue(-0.0)).toWord() == 1);
	assert(previous(DoublePattern::fromValue(0.0)).toWord() == 0x8000000000000001ULL);
	assert(previous(DoublePattern::fromValue(-0.0)).toWord() == 0x8000000000000001ULL);
	assert(next(DoublePattern::fromWord(0x8000000000000001ULL)).toWord() == 0x8000000000000000ULL);
	assert(next(DoublePattern::fromValue(-1.0)).toValue() == -1.0 + std::numeric_limits<double>::epsilon() / 2);
	assert(next(DoublePattern::fromWord(0x000fffffffffffffULL)).toValue() == std::numeric_limits<double>::min());

	assert(next(FloatPattern::fromValue(1.0f)).toValue() == 1.0f + std::numeric_limits<float>::epsilon());
	assert(throws<SpecialValueError>([]() { next(FloatPattern::fromValue(std::numeric_limits<float>::max())); }));

	std::mt19937_64 rng(1234567);
	std::uniform_int_distribution<uint64_t> distribution;
	for (int i = 0; i < 2000; ++i) {
		const DoublePattern p = DoublePattern::fromWord(distribution(rng));
		if (p.isSpecial() || p.toWord() == 0x7fefffffffffffffULL || p.toWord() == 0xffefffffffffffffULL) {
			continue;
		}
		const DoublePattern n = next(p);
		assert(n.toValue() == std::nextafter(p.toValue(), std::numeric_limits<double>::infinity()));
		assert(previous(n) == p || (p.isZero() && p.isNegative()));
		if (i % 20 == 0) {
			assert(toExact(n).exactDecimal > toExact(p).exactDecimal);
		}
		if (!p.isSubnormal() && !p.isZero()) {
			assert(DoublePattern::fromValue(toExact(p).nativeApproximation) == p);
		}
	}
}

static void testGenerator() {
	AscendingGenerator fromZero(0.0);
	assert(fromZero.current().exactDecimal.isZero());
	assert(fromZero.advance().exactDecimal == Decimal::powerOfTwo(-1074));
	assert(fromZero.pattern().toWord() == 1);
	assert(fromZero.advance().exactDecimal == Decimal::powerOfTwo(-1073));
	assert(!fromZero.isExhausted());

	AscendingGenerator fromNegativeZero(-0.0);
	assert(fromNegativeZero.pattern().toWord() == 0);

	AscendingGenerator fromOne(1.0);
	double previousValue = 1.0;
	for (int i = 0; i < 100; ++i) {
		assert(fromOne.tryToAdvance());
		assert(fromOne.current().nativeApproximation > previousValue);
		previousValue = fromOne.current().nativeApproximation;
	}
	assert(fromOne.current().nativeApproximation == 1.0 + 100 * std::numeric_limits<double>::epsilon());

	AscendingGenerator nearTop(std::nextafter(std::numeric_limits<double>::max(), 0.0));
	assert(nearTop.advance().nativeApproximation == std::numeric_limits<double>::max());
	try {
		nearTop.advance();
		assert(0);
	} catch (const SpecialValueError& x) {
		assert(x.getKind() == SpecialValueError::INFINITE_VALUE);
	}
	assert(nearTop.isExhausted());
	assert(nearTop.current().nativeApproximation == std::numeric_limits<double>::max());
	assert(throws<PreconditionError>([&nearTop]() { nearTop.advance(); }));
	assert(!nearTop.tryToAdvance());

	AscendingGenerator atTop(std::numeric_limits<double>::max());
	assert(!atTop.tryToAdvance());
	assert(atTop.isExhausted());

	assert(throws<PreconditionError>([]() { AscendingGenerator g(-1.0); }));
	assert(throws<PreconditionError>([]() { AscendingGenerator g(-std::numeric_limits<double>::denorm_min()); }));
	assert(throws<PreconditionError>([]() { AscendingGenerator g(std::numeric_limits<double>::quiet_NaN()); }));
	assert(throws<SpecialValueError>([]() { AscendingGenerator g(std::numeric_limits<double>::infinity()); }));
	assert(throws<PreconditionError>([]() { AscendingGenerator g(1.0, Context(10)); }));
}

int main() {
	testCodec();
	testSpecialValues();
	testExactValue();
	testStepper();
	testGenerator();
	std::printf("All tests passed\n");
	return 0;
}
