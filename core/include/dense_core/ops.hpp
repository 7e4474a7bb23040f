#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "dense_core/compare.hpp"
#include "dense_core/config.hpp"
#include "dense_core/error.hpp"
#include "dense_core/matrix.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/row_reduction.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {

// inputs are never modified: every op reduces a private copy and writes its
// result to *out only on success
//
// Error::code is Ok or a domain failure (NotSquare, Singular, Inconsistent) or
// an arithmetic failure of the scalar (Overflow, DivisionByZero). shape
// violations, such as a b vector of the wrong length, abort through die(),
// except in op_add/op_sub/op_mul which report them as DimensionMismatch

namespace detail {
template <typename T> Error binary_error(ErrorCode ec, const Matrix<T>& a, const Matrix<T>& b) noexcept {
		if (ec == ErrorCode::DimensionMismatch)
				return err_dim_mismatch(a.dim(), b.dim());
		return {ec, a.dim(), b.dim()};
}
} // namespace detail

// checked counterparts of Matrix::add/subtract/multiply for operands whose
// shapes come from outside the program
template <typename T> Error op_add(In const Matrix<T>& a, In const Matrix<T>& b, Out Matrix<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_add");
		if (a.empty() || a.rows() != b.rows() || a.cols() != b.cols())
				return err_dim_mismatch(a.dim(), b.dim());

		Matrix<T> result(a.rows(), a.cols());
		ErrorCode ec = matrix_add(a.view(), b.view(), result.mut_view());
		if (!is_ok(ec))
				return detail::binary_error(ec, a, b);
		*out = std::move(result);
		return {};
}

template <typename T> Error op_sub(In const Matrix<T>& a, In const Matrix<T>& b, Out Matrix<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_sub");
		if (a.empty() || a.rows() != b.rows() || a.cols() != b.cols())
				return err_dim_mismatch(a.dim(), b.dim());

		Matrix<T> result(a.rows(), a.cols());
		ErrorCode ec = matrix_sub(a.view(), b.view(), result.mut_view());
		if (!is_ok(ec))
				return detail::binary_error(ec, a, b);
		*out = std::move(result);
		return {};
}

template <typename T> Error op_mul(In const Matrix<T>& a, In const Matrix<T>& b, Out Matrix<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_mul");
		if (a.empty() || b.empty() || a.cols() != b.rows())
				return err_dim_mismatch(a.dim(), b.dim());

		Matrix<T> result(a.rows(), b.cols());
		ErrorCode ec = matrix_mul(a.view(), b.view(), result.mut_view());
		if (!is_ok(ec))
				return detail::binary_error(ec, a, b);
		*out = std::move(result);
		return {};
}

template <typename T> struct EchelonAndDet {
		Matrix<T> rref;
		// NotSquare when the input has no determinant; det is then meaningless
		ErrorCode det_status = ErrorCode::NotSquare;
		T det = ScalarTraits<T>::zero();
		std::size_t rank = 0;
		// row exchanges performed; each one flipped the sign of det
		std::size_t swaps = 0;
};

template <typename T> Error op_reduced_echelon_and_det(In const Matrix<T>& a, Out EchelonAndDet<T>* out) {
		using Traits = ScalarTraits<T>;
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_reduced_echelon_and_det");
		check(a.empty() ? ErrorCode::InvalidDimension : ErrorCode::Ok, "op_reduced_echelon_and_det");

		EchelonAndDet<T> result;
		result.rref = a;

		T det = Traits::one();
		EchelonStats stats;
		ErrorCode ec = echelon_apply(result.rref.mut_view(), &det, &stats);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		result.rank = stats.pivots;
		result.swaps = stats.swaps;
		if (a.is_square()) {
				result.det_status = ErrorCode::Ok;
				result.det = rref_has_unit_diagonal(result.rref.view()) ? det : Traits::zero();
		}

		*out = std::move(result);
		return {};
}

template <typename T> Error op_reduced_echelon(In const Matrix<T>& a, Out Matrix<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_reduced_echelon");
		EchelonAndDet<T> result;
		Error err = op_reduced_echelon_and_det(a, &result);
		if (!is_ok(err))
				return err;
		*out = std::move(result.rref);
		return err;
}

template <typename T> Error op_det(In const Matrix<T>& a, Out T* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_det");
		if (!a.is_square())
				return err_not_square(a.dim());

		EchelonAndDet<T> result;
		Error err = op_reduced_echelon_and_det(a, &result);
		if (!is_ok(err))
				return err;
		*out = result.det;
		return err;
}

// number of pivots in RREF(a)
template <typename T> Error op_rank(In const Matrix<T>& a, Out std::size_t* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_rank");
		EchelonAndDet<T> result;
		Error err = op_reduced_echelon_and_det(a, &result);
		if (!is_ok(err))
				return err;
		*out = result.rank;
		return err;
}

// inverse via gauss jordan elimination on the augmented matrix [A | I]
//
// A is invertible iff the left block reduces to exactly I, in which case the
// right block holds A^{-1}. otherwise reports Singular
template <typename T> Error op_inverse(In const Matrix<T>& a, Out Matrix<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_inverse");
		check(a.empty() ? ErrorCode::InvalidDimension : ErrorCode::Ok, "op_inverse");
		if (!a.is_square())
				return err_not_square(a.dim());

		const std::size_t n = a.rows();
		const Matrix<T> identity = Matrix<T>::identity(n);
		Matrix<T> aug = a.combine(identity);

		ErrorCode ec = echelon_apply(aug.mut_view(), static_cast<T*>(nullptr), nullptr);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		MatrixView<T> left;
		MatrixView<T> right;
		check(matrix_subview(aug.view(), 0, n, 0, n, &left), "op_inverse");
		check(matrix_subview(aug.view(), 0, n, n, 2 * n, &right), "op_inverse");

		bool reduced_to_identity = false;
		ec = matrix_equals(left, identity.view(), ScalarTraits<T>::zero(), &reduced_to_identity);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		if (!reduced_to_identity)
				return err_singular(a.dim());

		Matrix<T> inv(n, n);
		check(matrix_copy(right, inv.mut_view()), "op_inverse");
		*out = std::move(inv);
		return {};
}

namespace detail {
// a reduced augmented system [C | d] is inconsistent when some row reads 0 = c
// with c != 0
template <typename T> bool augmented_consistent(MatrixView<T> rref) noexcept {
		using Traits = ScalarTraits<T>;
		const std::size_t last = rref.cols - 1;
		for (std::size_t row = 0; row < rref.rows; row++) {
				if (Traits::is_zero(rref.at(row, last)))
						continue;

				bool has_coefficient = false;
				for (std::size_t col = 0; col < last; col++) {
						if (!Traits::is_zero(rref.at(row, col))) {
								has_coefficient = true;
								break;
						}
				}
				if (!has_coefficient)
						return false;
		}
		return true;
}

// reads x off a consistent reduced [C | d]. a column whose entry at the row
// cursor is one is a pivot column and takes that row's d; any other column is
// free and its component is zero
template <typename T> std::vector<T> extract_solution(MatrixView<T> rref) {
		using Traits = ScalarTraits<T>;
		const std::size_t last = rref.cols - 1;
		std::vector<T> x;
		x.reserve(last);

		std::size_t row = 0;
		for (std::size_t col = 0; col < last; col++) {
				if (row < rref.rows && Traits::is_one(rref.at(row, col))) {
						x.push_back(rref.at(row, last));
						row++;
				} else {
						x.push_back(Traits::zero());
				}
		}
		return x;
}

// shared tail of solve and least squares: reduce [coeff | rhs] and read x
template <typename T> Error solve_augmented(const Matrix<T>& coeff, const Matrix<T>& rhs, std::vector<T>* out) {
		Matrix<T> aug = coeff.combine(rhs);
		ErrorCode ec = echelon_apply(aug.mut_view(), static_cast<T*>(nullptr), nullptr);
		if (!is_ok(ec))
				return err_from(ec, coeff.dim());
		if (!augmented_consistent(aug.view()))
				return err_inconsistent(coeff.dim());
		*out = extract_solution(aug.view());
		return {};
}

template <typename T> Matrix<T> column_of(const std::vector<T>& b) {
		return Matrix<T>::from_flat(b, b.size(), 1);
}
} // namespace detail

// solves A x = b. free variables are set to zero rather than parameterized
template <typename T> Error op_solve(In const Matrix<T>& a, In const std::vector<T>& b, Out std::vector<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_solve");
		check(a.empty() ? ErrorCode::InvalidDimension : ErrorCode::Ok, "op_solve");
		check(b.size() == a.rows() ? ErrorCode::Ok : ErrorCode::DimensionMismatch, "op_solve");

		return detail::solve_augmented(a, detail::column_of(b), out);
}

// least squares solution of A x ~ b from the normal equations A^T A x = A^T b
//
// Inconsistent is not expected for these systems; when reported it points at
// an arithmetic anomaly (floating point round off) in forming A^T A
template <typename T> Error op_least_squares(In const Matrix<T>& a, In const std::vector<T>& b, Out std::vector<T>* out) {
		check(out ? ErrorCode::Ok : ErrorCode::Internal, "op_least_squares");
		check(a.empty() ? ErrorCode::InvalidDimension : ErrorCode::Ok, "op_least_squares");
		check(b.size() == a.rows() ? ErrorCode::Ok : ErrorCode::DimensionMismatch, "op_least_squares");

#if DENSE_CORE_ENABLE_LEAST_SQUARES
		const Matrix<T> at = a.transpose();
		const Matrix<T> b_col = detail::column_of(b);

		Matrix<T> ata(a.cols(), a.cols());
		ErrorCode ec = matrix_mul(at.view(), a.view(), ata.mut_view());
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		Matrix<T> atb(a.cols(), 1);
		ec = matrix_mul(at.view(), b_col.view(), atb.mut_view());
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		return detail::solve_augmented(ata, atb, out);
#else
		return err_feature_disabled();
#endif
}

} // namespace dense_core
