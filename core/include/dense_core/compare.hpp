#pragma once

#include "dense_core/error.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {

// *out = shapes match and |a(i,j) - b(i,j)| <= delta for every cell
//
// a zero delta compares cells with ScalarTraits::eq directly, which is the same
// relation without the subtraction (and cannot overflow for exact scalars)
template <typename T> ErrorCode matrix_equals(In MatrixView<T> a, In MatrixView<T> b, In const T& delta, Out bool* out) noexcept {
		using Traits = ScalarTraits<T>;
		if (!out)
				return ErrorCode::Internal;

		*out = false;
		if (!same_dim(a, b))
				return ErrorCode::Ok;

		const bool exact = Traits::is_zero(delta);
		for (std::size_t row = 0; row < a.rows; row++) {
				for (std::size_t col = 0; col < a.cols; col++) {
						if (exact) {
								if (!Traits::eq(a.at(row, col), b.at(row, col)))
										return ErrorCode::Ok;
								continue;
						}

						T diff;
						ErrorCode ec = Traits::abs_diff(a.at(row, col), b.at(row, col), &diff);
						if (!is_ok(ec))
								return ec;
						T excess;
						ec = Traits::sub(diff, delta, &excess);
						if (!is_ok(ec))
								return ec;
						if (Traits::is_positive(excess))
								return ErrorCode::Ok;
				}
		}

		*out = true;
		return ErrorCode::Ok;
}

} // namespace dense_core
