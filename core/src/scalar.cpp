#include "dense_core/scalar.hpp"

namespace dense_core {

ErrorCode ScalarTraits<Rational>::abs_diff(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		Rational diff;
		ErrorCode ec = rational_sub(a, b, &diff);
		if (!is_ok(ec))
				return ec;
		return rational_abs(diff, out);
}

} // namespace dense_core
