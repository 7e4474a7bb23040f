#pragma once

#include <cstddef>
#include <utility>

#include "dense_core/error.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {

// swap rows r1 and r2 of matrix m
template <typename T> void apply_swap(MatrixMutView<T> m, std::size_t r1, std::size_t r2) noexcept {
		if (r1 == r2)
				return;
		for (std::size_t col = 0; col < m.cols; col++)
				std::swap(m.at_mut(r1, col), m.at_mut(r2, col));
}

// R_row <- R_row / k, over columns [from_col, cols)
//
// k is taken by value: callers usually pass an entry of the row being divided
template <typename T> ErrorCode apply_divide(MatrixMutView<T> m, std::size_t row, std::size_t from_col, const T k) noexcept {
		for (std::size_t col = from_col; col < m.cols; col++) {
				T result;
				ErrorCode ec = ScalarTraits<T>::div(m.at(row, col), k, &result);
				if (!is_ok(ec))
						return ec;
				m.at_mut(row, col) = result;
		}
		return ErrorCode::Ok;
}

// R_dst <- R_dst - k * R_src, over columns [from_col, cols)
template <typename T>
ErrorCode apply_submul(MatrixMutView<T> m, std::size_t dst, std::size_t src, const T k, std::size_t from_col) noexcept {
		for (std::size_t col = from_col; col < m.cols; col++) {
				T scaled;
				ErrorCode ec = ScalarTraits<T>::mul(m.at(src, col), k, &scaled);
				if (!is_ok(ec))
						return ec;
				T result;
				ec = ScalarTraits<T>::sub(m.at(dst, col), scaled, &result);
				if (!is_ok(ec))
						return ec;
				m.at_mut(dst, col) = result;
		}
		return ErrorCode::Ok;
}

} // namespace dense_core
