#pragma once

#include <cstddef>

#include "dense_core/error.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/row_ops.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {

struct EchelonStats {
		std::size_t pivots = 0;
		std::size_t swaps = 0;
};

// Gauss-Jordan reduction of m to RREF, in place.
//
// pivots are chosen first-nonzero: columns are scanned left to right from the
// current pivot column, and within a column rows top to bottom from the current
// pivot row. no magnitude based selection is done, so on floating point scalars
// this is plain (unstabilized) elimination.
//
// *det_out receives the signed product of the pivot values divided out, i.e.
// the determinant when m is square and of full rank. the caller decides what a
// rank deficient or non-square result means
template <typename T> ErrorCode echelon_apply(InOut MatrixMutView<T> m, Out T* det_out, Out EchelonStats* stats) noexcept {
		using Traits = ScalarTraits<T>;
		if (!m.data)
				return ErrorCode::Internal;

		T det = Traits::one();
		EchelonStats st;
		std::size_t pivot_row = 0;
		std::size_t pivot_col = 0;

		while (pivot_row < m.rows && pivot_col < m.cols) {
				bool found = false;
				for (std::size_t col = pivot_col; col < m.cols && !found; col++) {
						for (std::size_t row = pivot_row; row < m.rows; row++) {
								if (Traits::is_zero(m.at(row, col)))
										continue;
								if (row != pivot_row) {
										apply_swap(m, row, pivot_row);
										ErrorCode ec = Traits::neg(det, &det);
										if (!is_ok(ec))
												return ec;
										st.swaps++;
								}
								pivot_col = col;
								found = true;
								break;
						}
				}

				// remaining rows are all zero
				if (!found)
						break;

				const T factor = m.at(pivot_row, pivot_col);
				ErrorCode ec = apply_divide(m, pivot_row, pivot_col, factor);
				if (!is_ok(ec))
						return ec;
				ec = Traits::mul(det, factor, &det);
				if (!is_ok(ec))
						return ec;

				for (std::size_t row = 0; row < m.rows; row++) {
						if (row == pivot_row)
								continue;
						const T entry = m.at(row, pivot_col);
						if (Traits::is_zero(entry))
								continue;
						ec = apply_submul(m, row, pivot_row, entry, pivot_col);
						if (!is_ok(ec))
								return ec;
				}

				st.pivots++;
				pivot_row++;
				pivot_col++;
		}

		if (det_out)
				*det_out = det;
		if (stats)
				*stats = st;
		return ErrorCode::Ok;
}

// true when every diagonal entry of a square RREF is one, i.e. the reduced
// matrix is the identity
template <typename T> bool rref_has_unit_diagonal(In MatrixView<T> rref) noexcept {
		const std::size_t n = rref.rows < rref.cols ? rref.rows : rref.cols;
		for (std::size_t i = 0; i < n; i++) {
				if (!ScalarTraits<T>::is_one(rref.at(i, i)))
						return false;
		}
		return true;
}

} // namespace dense_core
