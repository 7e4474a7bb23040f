#pragma once

#include <cstddef>
#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace dense_core {
struct Dim {
		std::size_t rows = 0;
		std::size_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled,
		InvalidDimension,
		DimensionMismatch,
		NotSquare,
		Singular,
		Inconsistent,
		DivisionByZero,
		Overflow,
		IndexOutOfRange,
		Internal,
};

struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

constexpr Error err_dim_mismatch(Dim a, Dim b) noexcept {
		return {ErrorCode::DimensionMismatch, a, b};
}
constexpr Error err_not_square(Dim a) noexcept {
		return {ErrorCode::NotSquare, a};
}
constexpr Error err_singular(Dim a) noexcept {
		return {ErrorCode::Singular, a};
}
constexpr Error err_inconsistent(Dim a) noexcept {
		return {ErrorCode::Inconsistent, a};
}
constexpr Error err_invalid_dim(Dim a) noexcept {
		return {ErrorCode::InvalidDimension, a};
}
constexpr Error err_feature_disabled() noexcept {
		return {ErrorCode::FeatureDisabled};
}
constexpr Error err_from(ErrorCode code, Dim a) noexcept {
		return {code, a};
}

// stable printable name, e.g. "NotSquare"
const char* error_code_name(ErrorCode code) noexcept;

// invariant violations (bad shapes, bad indices) are programmer errors and are
// not reported through Error. die() prints one line to stderr and aborts
[[noreturn]] void die(In ErrorCode code, In const char* what) noexcept;

inline void check(ErrorCode code, const char* what) noexcept {
		if (!is_ok(code))
				die(code, what);
}
} // namespace dense_core
