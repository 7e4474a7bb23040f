#pragma once

#include <type_traits>

#include "dense_core/error.hpp"
#include "dense_core/rational.hpp"

namespace dense_core {

// capability contract for matrix scalars. a specialization must provide:
//
//   static T zero();  static T one();
//   static bool is_zero(const T&);  static bool is_one(const T&);
//   static bool eq(const T&, const T&);
//   static bool is_positive(const T&);           // strictly greater than zero
//   static ErrorCode add/sub/mul/div(const T&, const T&, T* out);
//   static ErrorCode neg(const T&, T* out);
//   static ErrorCode abs_diff(const T&, const T&, T* out);   // |a - b|
//
// arithmetic reports through ErrorCode so exact scalars can surface Overflow and
// DivisionByZero instead of wrapping. the primary template is left undefined so
// an unsupported scalar fails at compile time
template <typename T, typename Enable = void> struct ScalarTraits;

template <typename T> struct ScalarTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
		static constexpr T zero() noexcept { return T(0); }
		static constexpr T one() noexcept { return T(1); }

		static constexpr bool is_zero(const T& v) noexcept { return v == T(0); }
		static constexpr bool is_one(const T& v) noexcept { return v == T(1); }
		static constexpr bool eq(const T& a, const T& b) noexcept { return a == b; }
		static constexpr bool is_positive(const T& v) noexcept { return v > T(0); }

		static ErrorCode add(const T& a, const T& b, T* out) noexcept {
				*out = a + b;
				return ErrorCode::Ok;
		}
		static ErrorCode sub(const T& a, const T& b, T* out) noexcept {
				*out = a - b;
				return ErrorCode::Ok;
		}
		static ErrorCode mul(const T& a, const T& b, T* out) noexcept {
				*out = a * b;
				return ErrorCode::Ok;
		}
		static ErrorCode div(const T& a, const T& b, T* out) noexcept {
				if (b == T(0))
						return ErrorCode::DivisionByZero;
				*out = a / b;
				return ErrorCode::Ok;
		}
		static ErrorCode neg(const T& a, T* out) noexcept {
				*out = -a;
				return ErrorCode::Ok;
		}
		static ErrorCode abs_diff(const T& a, const T& b, T* out) noexcept {
				*out = a > b ? a - b : b - a;
				return ErrorCode::Ok;
		}
};

template <> struct ScalarTraits<Rational> {
		static constexpr Rational zero() noexcept { return Rational::from_int(0); }
		static constexpr Rational one() noexcept { return Rational::from_int(1); }

		static constexpr bool is_zero(const Rational& v) noexcept { return v.is_zero(); }
		static constexpr bool is_one(const Rational& v) noexcept { return v.is_one(); }
		static constexpr bool eq(const Rational& a, const Rational& b) noexcept { return rational_eq(a, b); }
		static constexpr bool is_positive(const Rational& v) noexcept { return v.num() > 0; }

		static ErrorCode add(const Rational& a, const Rational& b, Rational* out) noexcept { return rational_add(a, b, out); }
		static ErrorCode sub(const Rational& a, const Rational& b, Rational* out) noexcept { return rational_sub(a, b, out); }
		static ErrorCode mul(const Rational& a, const Rational& b, Rational* out) noexcept { return rational_mul(a, b, out); }
		static ErrorCode div(const Rational& a, const Rational& b, Rational* out) noexcept { return rational_div(a, b, out); }
		static ErrorCode neg(const Rational& a, Rational* out) noexcept { return rational_neg(a, out); }
		static ErrorCode abs_diff(const Rational& a, const Rational& b, Rational* out) noexcept;
};

} // namespace dense_core
