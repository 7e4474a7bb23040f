#include "dense_core/error.hpp"

#include <cstdio>
#include <cstdlib>

namespace dense_core {

const char* error_code_name(ErrorCode code) noexcept {
		switch (code) {
		case ErrorCode::Ok:
				return "Ok";
		case ErrorCode::FeatureDisabled:
				return "FeatureDisabled";
		case ErrorCode::InvalidDimension:
				return "InvalidDimension";
		case ErrorCode::DimensionMismatch:
				return "DimensionMismatch";
		case ErrorCode::NotSquare:
				return "NotSquare";
		case ErrorCode::Singular:
				return "Singular";
		case ErrorCode::Inconsistent:
				return "Inconsistent";
		case ErrorCode::DivisionByZero:
				return "DivisionByZero";
		case ErrorCode::Overflow:
				return "Overflow";
		case ErrorCode::IndexOutOfRange:
				return "IndexOutOfRange";
		case ErrorCode::Internal:
				return "Internal";
		}
		return "Unknown";
}

void die(ErrorCode code, const char* what) noexcept {
		std::fprintf(stderr, "[dense_core] %s: %s\n", what ? what : "(unknown)", error_code_name(code));
		std::fflush(stderr);
		std::abort();
}

} // namespace dense_core
