#pragma once

#include <cassert>
#include <cstddef>
#include <limits>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "dense_core/compare.hpp"
#include "dense_core/error.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/scalar.hpp"

namespace dense_core {
namespace detail {
constexpr bool valid_dim(std::size_t rows, std::size_t cols) noexcept {
		return rows >= 1 && cols >= 1 && cols <= std::numeric_limits<std::size_t>::max() / rows;
}

// exact integer square root, or false when n is not a perfect square
constexpr bool perfect_square_root(std::size_t n, std::size_t* root) noexcept {
		std::size_t r = 0;
		while ((r + 1) <= n / (r + 1))
				r++;
		if (r * r != n)
				return false;
		*root = r;
		return true;
}
} // namespace detail

// dense row-major matrix with value semantics: copies are deep, and every
// transforming member returns a new matrix
//
// a default constructed Matrix is empty (0x0) and only serves as an output slot
// for the op_* functions and make_* factories. every other constructor
// produces rows >= 1 and cols >= 1
//
// shape and index violations on the fail fast API (constructors, get/set,
// operator[], add/subtract/multiply/combine/partition) abort through die().
// the make_* twins and the kernels in matrix_view.hpp report them as ErrorCode
template <typename T> class Matrix {
	  public:
		using value_type = T;
		using Traits = ScalarTraits<T>;

		Matrix() = default;

		Matrix(std::size_t rows, std::size_t cols) {
				check(detail::valid_dim(rows, cols) ? ErrorCode::Ok : ErrorCode::InvalidDimension, "Matrix(rows, cols)");
				reset(rows, cols);
		}

		static ErrorCode make(In std::size_t rows, In std::size_t cols, Out Matrix* out) {
				if (!out)
						return ErrorCode::Internal;
				if (!detail::valid_dim(rows, cols))
						return ErrorCode::InvalidDimension;
				out->reset(rows, cols);
				return ErrorCode::Ok;
		}

		static Matrix square(std::size_t size) { return Matrix(size, size); }

		static Matrix identity(std::size_t size) {
				Matrix m(size, size);
				for (std::size_t i = 0; i < size; i++)
						m.at_mut(i, i) = Traits::one();
				return m;
		}

		// every row must have the first row's length
		static ErrorCode make_from_rows(In const std::vector<std::vector<T>>& rows, Out Matrix* out) {
				if (!out)
						return ErrorCode::Internal;
				if (rows.empty())
						return ErrorCode::InvalidDimension;

				const std::size_t cols = rows.front().size();
				for (const auto& row : rows) {
						if (row.size() != cols)
								return ErrorCode::InvalidDimension;
				}

				Matrix m;
				ErrorCode ec = make(rows.size(), cols, &m);
				if (!is_ok(ec))
						return ec;
				for (std::size_t r = 0; r < m.rows_; r++) {
						for (std::size_t c = 0; c < cols; c++)
								m.at_mut(r, c) = rows[r][c];
				}
				*out = std::move(m);
				return ErrorCode::Ok;
		}

		// values listed row by row
		static ErrorCode make_from_flat(In const std::vector<T>& values, In std::size_t rows, In std::size_t cols, Out Matrix* out) {
				if (!out)
						return ErrorCode::Internal;
				if (!detail::valid_dim(rows, cols) || values.size() != rows * cols)
						return ErrorCode::InvalidDimension;

				Matrix m;
				m.rows_ = rows;
				m.cols_ = cols;
				m.data_ = values;
				*out = std::move(m);
				return ErrorCode::Ok;
		}

		static ErrorCode make_square_from_flat(In const std::vector<T>& values, Out Matrix* out) {
				std::size_t size = 0;
				if (!detail::perfect_square_root(values.size(), &size))
						return ErrorCode::InvalidDimension;
				return make_from_flat(values, size, size, out);
		}

		static Matrix from_rows(const std::vector<std::vector<T>>& rows) {
				Matrix m;
				check(make_from_rows(rows, &m), "Matrix::from_rows");
				return m;
		}

		static Matrix from_flat(const std::vector<T>& values, std::size_t rows, std::size_t cols) {
				Matrix m;
				check(make_from_flat(values, rows, cols, &m), "Matrix::from_flat");
				return m;
		}

		static Matrix square_from_flat(const std::vector<T>& values) {
				Matrix m;
				check(make_square_from_flat(values, &m), "Matrix::square_from_flat");
				return m;
		}

		std::size_t rows() const noexcept { return rows_; }
		std::size_t cols() const noexcept { return cols_; }
		Dim dim() const noexcept { return {rows_, cols_}; }
		bool empty() const noexcept { return data_.empty(); }
		bool is_square() const noexcept { return rows_ == cols_; }

		T get(std::size_t row, std::size_t col) const {
				check(in_range(row, col) ? ErrorCode::Ok : ErrorCode::IndexOutOfRange, "Matrix::get");
				return at(row, col);
		}

		void set(std::size_t row, std::size_t col, const T& value) {
				check(in_range(row, col) ? ErrorCode::Ok : ErrorCode::IndexOutOfRange, "Matrix::set");
				at_mut(row, col) = value;
		}

		// unchecked access, asserted in debug builds
		const T& at(std::size_t row, std::size_t col) const noexcept {
				assert(row < rows_ && col < cols_);
				return data_[row * cols_ + col];
		}

		T& at_mut(std::size_t row, std::size_t col) noexcept {
				assert(row < rows_ && col < cols_);
				return data_[row * cols_ + col];
		}

		// read only row, e.g. m[1][0]
		std::span<const T> operator[](std::size_t row) const noexcept {
				check(row < rows_ ? ErrorCode::Ok : ErrorCode::IndexOutOfRange, "Matrix::operator[]");
				return std::span<const T>(data_.data() + row * cols_, cols_);
		}

		MatrixView<T> view() const noexcept { return {rows_, cols_, cols_, data_.data()}; }
		MatrixMutView<T> mut_view() noexcept { return {rows_, cols_, cols_, data_.data()}; }

		Matrix add(const Matrix& rhs) const {
				Matrix out(rows_, cols_);
				check(matrix_add(view(), rhs.view(), out.mut_view()), "Matrix::add");
				return out;
		}

		Matrix subtract(const Matrix& rhs) const {
				Matrix out(rows_, cols_);
				check(matrix_sub(view(), rhs.view(), out.mut_view()), "Matrix::subtract");
				return out;
		}

		Matrix multiply(const Matrix& rhs) const {
				check(cols_ == rhs.rows_ ? ErrorCode::Ok : ErrorCode::DimensionMismatch, "Matrix::multiply");
				Matrix out(rows_, rhs.cols_);
				check(matrix_mul(view(), rhs.view(), out.mut_view()), "Matrix::multiply");
				return out;
		}

		Matrix scale(const T& k) const {
				Matrix out(rows_, cols_);
				check(matrix_scale(view(), k, out.mut_view()), "Matrix::scale");
				return out;
		}

		Matrix transpose() const {
				Matrix out(cols_, rows_);
				check(matrix_transpose(view(), out.mut_view()), "Matrix::transpose");
				return out;
		}

		// rows [row_begin, row_end) and columns [col_begin, col_end), re-indexed from 0
		Matrix partition(std::size_t row_begin, std::size_t row_end, std::size_t col_begin, std::size_t col_end) const {
				MatrixView<T> block;
				check(matrix_subview(view(), row_begin, row_end, col_begin, col_end, &block), "Matrix::partition");
				Matrix out(block.rows, block.cols);
				check(matrix_copy(block, out.mut_view()), "Matrix::partition");
				return out;
		}

		// [*this | right]
		Matrix combine(const Matrix& right) const {
				check(rows_ == right.rows_ ? ErrorCode::Ok : ErrorCode::DimensionMismatch, "Matrix::combine");
				Matrix out(rows_, cols_ + right.cols_);
				check(matrix_combine(view(), right.view(), out.mut_view()), "Matrix::combine");
				return out;
		}

		bool equals(const Matrix& other, const T& delta) const {
				bool eq = false;
				check(matrix_equals(view(), other.view(), delta, &eq), "Matrix::equals");
				return eq;
		}

		Matrix& operator+=(const Matrix& rhs) {
				check(matrix_add(view(), rhs.view(), mut_view()), "Matrix::operator+=");
				return *this;
		}

		Matrix& operator-=(const Matrix& rhs) {
				check(matrix_sub(view(), rhs.view(), mut_view()), "Matrix::operator-=");
				return *this;
		}

		Matrix& operator*=(const Matrix& rhs) {
				*this = multiply(rhs);
				return *this;
		}

		Matrix& operator*=(const T& k) {
				check(matrix_scale(view(), k, mut_view()), "Matrix::operator*=");
				return *this;
		}

	  private:
		std::size_t rows_ = 0;
		std::size_t cols_ = 0;
		std::vector<T> data_;

		void reset(std::size_t rows, std::size_t cols) {
				rows_ = rows;
				cols_ = cols;
				data_.assign(rows * cols, Traits::zero());
		}

		constexpr bool in_range(std::size_t row, std::size_t col) const noexcept { return row < rows_ && col < cols_; }
};

template <typename T> Matrix<T> operator+(const Matrix<T>& a, const Matrix<T>& b) {
		return a.add(b);
}

template <typename T> Matrix<T> operator-(const Matrix<T>& a, const Matrix<T>& b) {
		return a.subtract(b);
}

template <typename T> Matrix<T> operator*(const Matrix<T>& a, const Matrix<T>& b) {
		return a.multiply(b);
}

// the scalar side is not deduced, so m * 2 converts 2 to T
template <typename T> Matrix<T> operator*(const Matrix<T>& a, const std::type_identity_t<T>& k) {
		return a.scale(k);
}

template <typename T> Matrix<T> operator*(const std::type_identity_t<T>& k, const Matrix<T>& a) {
		return a.scale(k);
}

template <typename T> bool operator==(const Matrix<T>& a, const Matrix<T>& b) {
		return a.equals(b, ScalarTraits<T>::zero());
}

template <typename T> bool operator!=(const Matrix<T>& a, const Matrix<T>& b) {
		return !(a == b);
}

} // namespace dense_core
