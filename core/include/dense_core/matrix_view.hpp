#pragma once

#include <cassert>
#include <cstddef>

#include "dense_core/error.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {
// non owning row-major windows over matrix storage. stride is the distance
// between rows, so a view can address a block of a larger matrix
template <typename T> struct MatrixView {
		std::size_t rows = 0;
		std::size_t cols = 0;
		std::size_t stride = 0;
		const T* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const T& at(std::size_t r, std::size_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}
};

template <typename T> struct MatrixMutView {
		std::size_t rows = 0;
		std::size_t cols = 0;
		std::size_t stride = 0;
		T* data = nullptr;

		MatrixView<T> view() const noexcept { return {rows, cols, stride, data}; }

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const T& at(std::size_t r, std::size_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}

		T& at_mut(std::size_t r, std::size_t c) noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}
};

template <typename T> constexpr bool same_dim(const MatrixView<T>& a, const MatrixView<T>& b) noexcept {
		return a.rows == b.rows && a.cols == b.cols;
}

template <typename T> ErrorCode matrix_copy(In MatrixView<T> src, Out MatrixMutView<T> dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < src.rows; row++) {
				for (std::size_t col = 0; col < src.cols; col++)
						dst.at_mut(row, col) = src.at(row, col);
		}
		return ErrorCode::Ok;
}

namespace detail {
template <typename T, typename Fn>
ErrorCode elementwise(MatrixView<T> a, MatrixView<T> b, MatrixMutView<T> out, Fn fn) noexcept {
		if (!same_dim(a, b) || !same_dim(a, out.view()))
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < a.rows; row++) {
				for (std::size_t col = 0; col < a.cols; col++) {
						T result;
						ErrorCode ec = fn(a.at(row, col), b.at(row, col), &result);
						if (!is_ok(ec))
								return ec;
						out.at_mut(row, col) = result;
				}
		}
		return ErrorCode::Ok;
}
} // namespace detail

// out may alias a or b: each cell is read before it is written
template <typename T> ErrorCode matrix_add(In MatrixView<T> a, In MatrixView<T> b, Out MatrixMutView<T> out) noexcept {
		return detail::elementwise(a, b, out, &ScalarTraits<T>::add);
}

template <typename T> ErrorCode matrix_sub(In MatrixView<T> a, In MatrixView<T> b, Out MatrixMutView<T> out) noexcept {
		return detail::elementwise(a, b, out, &ScalarTraits<T>::sub);
}

template <typename T> ErrorCode matrix_scale(In MatrixView<T> a, In const T& k, Out MatrixMutView<T> out) noexcept {
		if (!same_dim(a, out.view()))
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < a.rows; row++) {
				for (std::size_t col = 0; col < a.cols; col++) {
						T result;
						ErrorCode ec = ScalarTraits<T>::mul(a.at(row, col), k, &result);
						if (!is_ok(ec))
								return ec;
						out.at_mut(row, col) = result;
				}
		}
		return ErrorCode::Ok;
}

// out must not alias a or b
template <typename T> ErrorCode matrix_mul(In MatrixView<T> a, In MatrixView<T> b, Out MatrixMutView<T> out) noexcept {
		using Traits = ScalarTraits<T>;
		if (a.cols != b.rows)
				return ErrorCode::DimensionMismatch;
		if (out.rows != a.rows || out.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		for (std::size_t i = 0; i < out.rows; i++) {
				for (std::size_t j = 0; j < out.cols; j++) {
						T sum = Traits::zero();
						for (std::size_t k = 0; k < a.cols; k++) {
								T prod;
								ErrorCode ec = Traits::mul(a.at(i, k), b.at(k, j), &prod);
								if (!is_ok(ec))
										return ec;
								ec = Traits::add(sum, prod, &sum);
								if (!is_ok(ec))
										return ec;
						}
						out.at_mut(i, j) = sum;
				}
		}
		return ErrorCode::Ok;
}

template <typename T> ErrorCode matrix_transpose(In MatrixView<T> a, Out MatrixMutView<T> out) noexcept {
		if (out.rows != a.cols || out.cols != a.rows)
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < a.rows; row++) {
				for (std::size_t col = 0; col < a.cols; col++)
						out.at_mut(col, row) = a.at(row, col);
		}
		return ErrorCode::Ok;
}

// window [row_begin, row_end) x [col_begin, col_end) of src, sharing its storage
template <typename T>
ErrorCode matrix_subview(In MatrixView<T> src,
        In std::size_t row_begin,
        In std::size_t row_end,
        In std::size_t col_begin,
        In std::size_t col_end,
        Out MatrixView<T>* out) noexcept {
		if (!out || !src.data)
				return ErrorCode::Internal;
		if (row_begin >= row_end || col_begin >= col_end)
				return ErrorCode::InvalidDimension;
		if (row_end > src.rows || col_end > src.cols)
				return ErrorCode::IndexOutOfRange;

		out->rows = row_end - row_begin;
		out->cols = col_end - col_begin;
		out->stride = src.stride;
		out->data = src.data + row_begin * src.stride + col_begin;
		return ErrorCode::Ok;
}

// out = [left | right]
template <typename T> ErrorCode matrix_combine(In MatrixView<T> left, In MatrixView<T> right, Out MatrixMutView<T> out) noexcept {
		if (left.rows != right.rows)
				return ErrorCode::DimensionMismatch;
		if (out.rows != left.rows || out.cols != left.cols + right.cols)
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < left.rows; row++) {
				for (std::size_t col = 0; col < left.cols; col++)
						out.at_mut(row, col) = left.at(row, col);
				for (std::size_t col = 0; col < right.cols; col++)
						out.at_mut(row, left.cols + col) = right.at(row, col);
		}
		return ErrorCode::Ok;
}

} // namespace dense_core
