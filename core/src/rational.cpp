#include "dense_core/rational.hpp"

#include <limits>

namespace dense_core {
namespace {
using Limits = std::numeric_limits<std::int64_t>;

constexpr std::uint64_t uabs(std::int64_t x) noexcept {
		// works for INT64_MIN
		return x < 0 ? (static_cast<std::uint64_t>(-(x + 1)) + 1u) : static_cast<std::uint64_t>(x);
}

constexpr std::uint64_t gcd_u64(std::uint64_t a, std::uint64_t b) noexcept {
		while (b != 0u) {
				std::uint64_t t = a % b;
				a = b;
				b = t;
		}
		return a;
}

ErrorCode normalize(std::int64_t* num, std::int64_t* den) noexcept {
		if (*den == 0)
				return ErrorCode::DivisionByZero;

		if (*num == 0) {
				*den = 1;
				return ErrorCode::Ok;
		}

		if (*den < 0) {
				if (*den == Limits::min() || *num == Limits::min())
						return ErrorCode::Overflow;
				*num = -*num;
				*den = -*den;
		}

		const std::uint64_t g = gcd_u64(uabs(*num), static_cast<std::uint64_t>(*den));
		if (g > 1u) {
				*num /= static_cast<std::int64_t>(g);
				*den /= static_cast<std::int64_t>(g);
		}
		return ErrorCode::Ok;
}

// x / g for a nonzero x and a divisor g of |x|. g is 2^63 only when
// x == INT64_MIN, and 2^63 has no int64 representation
constexpr std::int64_t reduce_by(std::int64_t x, std::uint64_t g) noexcept {
		if (g == (std::uint64_t{1} << 63))
				return x < 0 ? -1 : 1;
		return x / static_cast<std::int64_t>(g);
}

// checked signed 64 bit arithmetic without __int128 or compiler builtins, so
// the same code runs on every toolchain we build with
bool add_overflow(std::int64_t a, std::int64_t b, std::int64_t* out) noexcept {
		if (b > 0 && a > Limits::max() - b)
				return true;
		if (b < 0 && a < Limits::min() - b)
				return true;
		*out = a + b;
		return false;
}

bool sub_overflow(std::int64_t a, std::int64_t b, std::int64_t* out) noexcept {
		if (b > 0 && a < Limits::min() + b)
				return true;
		if (b < 0 && a > Limits::max() + b)
				return true;
		*out = a - b;
		return false;
}

bool mul_overflow(std::int64_t a, std::int64_t b, std::int64_t* out) noexcept {
		if (a == 0 || b == 0) {
				*out = 0;
				return false;
		}
		if (a == 1) {
				*out = b;
				return false;
		}
		if (b == 1) {
				*out = a;
				return false;
		}
		// min * -1 is the one product that overflows with a unit factor
		if (a == -1) {
				if (b == Limits::min())
						return true;
				*out = -b;
				return false;
		}
		if (b == -1) {
				if (a == Limits::min())
						return true;
				*out = -a;
				return false;
		}

		if (a > 0) {
				if (b > 0) {
						if (a > Limits::max() / b)
								return true;
				} else if (b < Limits::min() / a) {
						return true;
				}
		} else {
				if (b > 0) {
						if (a < Limits::min() / b)
								return true;
				} else if (b < Limits::max() / a) {
						return true;
				}
		}

		*out = a * b;
		return false;
}

// a/b (+|-) c/d = (a*(d/g) (+|-) c*(b/g)) / (b/g*d), where g = gcd(b, d)
ErrorCode add_or_sub(const Rational& a, const Rational& b, bool subtract, Rational* out) noexcept {
		const std::uint64_t g = gcd_u64(static_cast<std::uint64_t>(a.den()), static_cast<std::uint64_t>(b.den()));
		const std::int64_t a_den_div_g = a.den() / static_cast<std::int64_t>(g);
		const std::int64_t b_den_div_g = b.den() / static_cast<std::int64_t>(g);

		std::int64_t term1 = 0;
		if (mul_overflow(a.num(), b_den_div_g, &term1))
				return ErrorCode::Overflow;

		std::int64_t term2 = 0;
		if (mul_overflow(b.num(), a_den_div_g, &term2))
				return ErrorCode::Overflow;

		// computing the difference directly (rather than adding -c/d) keeps the
		// INT64_MIN negation edge case out of subtraction
		std::int64_t num = 0;
		const bool overflow = subtract ? sub_overflow(term1, term2, &num) : add_overflow(term1, term2, &num);
		if (overflow)
				return ErrorCode::Overflow;

		std::int64_t den = 0;
		if (mul_overflow(a_den_div_g, b.den(), &den))
				return ErrorCode::Overflow;

		return Rational::make(num, den, out);
}

} // namespace

ErrorCode Rational::make(std::int64_t num, std::int64_t den, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		ErrorCode ec = normalize(&num, &den);
		if (!is_ok(ec))
				return ec;

		*out = Rational(num, den);
		return ErrorCode::Ok;
}

ErrorCode rational_neg(const Rational& a, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (a.num() == Limits::min())
				return ErrorCode::Overflow;
		return Rational::make(-a.num(), a.den(), out);
}

ErrorCode rational_abs(const Rational& a, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (!a.is_negative()) {
				*out = a;
				return ErrorCode::Ok;
		}
		return rational_neg(a, out);
}

ErrorCode rational_add(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		return add_or_sub(a, b, false, out);
}

ErrorCode rational_sub(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		return add_or_sub(a, b, true, out);
}

ErrorCode rational_mul(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		// reduce cross terms first: (a/b)*(c/d) with gcd(a, d) and gcd(c, b)
		// divided out keeps intermediate products small
		const std::uint64_t g1 = gcd_u64(uabs(a.num()), static_cast<std::uint64_t>(b.den()));
		const std::uint64_t g2 = gcd_u64(uabs(b.num()), static_cast<std::uint64_t>(a.den()));

		const std::int64_t a_num_red = a.num() / static_cast<std::int64_t>(g1);
		const std::int64_t b_den_red = b.den() / static_cast<std::int64_t>(g1);
		const std::int64_t b_num_red = b.num() / static_cast<std::int64_t>(g2);
		const std::int64_t a_den_red = a.den() / static_cast<std::int64_t>(g2);

		std::int64_t num = 0;
		if (mul_overflow(a_num_red, b_num_red, &num))
				return ErrorCode::Overflow;

		std::int64_t den = 0;
		if (mul_overflow(a_den_red, b_den_red, &den))
				return ErrorCode::Overflow;

		return Rational::make(num, den, out);
}

ErrorCode rational_div(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (b.is_zero())
				return ErrorCode::DivisionByZero;
		if (a.is_zero()) {
				*out = Rational();
				return ErrorCode::Ok;
		}

		// (a/b) / (c/d) = (a*d) / (b*c) with gcd(a, c) and gcd(b, d) divided out
		// first. the reciprocal c/d is never formed, so c == INT64_MIN only fails
		// when the quotient itself does not fit
		const std::uint64_t g1 = gcd_u64(uabs(a.num()), uabs(b.num()));
		const std::uint64_t g2 = gcd_u64(static_cast<std::uint64_t>(a.den()), static_cast<std::uint64_t>(b.den()));

		const std::int64_t a_num_red = reduce_by(a.num(), g1);
		const std::int64_t b_num_red = reduce_by(b.num(), g1);
		const std::int64_t a_den_red = a.den() / static_cast<std::int64_t>(g2);
		const std::int64_t b_den_red = b.den() / static_cast<std::int64_t>(g2);

		std::int64_t num = 0;
		if (mul_overflow(a_num_red, b_den_red, &num))
				return ErrorCode::Overflow;

		std::int64_t den = 0;
		if (mul_overflow(a_den_red, b_num_red, &den))
				return ErrorCode::Overflow;

		return Rational::make(num, den, out);
}

} // namespace dense_core
