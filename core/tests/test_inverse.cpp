#include "dense_core/dense_core.hpp"

#include "test_helpers.hpp"

#include <cassert>

using dense_core::Error;
using dense_core::ErrorCode;
using dense_core::Matrix;
using dense_core::Rational;
using dense_test::expect_matrix;
using dense_test::ints;
using dense_test::rat;

using MatrixD = Matrix<double>;
using MatrixQ = Matrix<Rational>;

int main() {
		// A^{-1} = [[-2, 1], [3/2, -1/2]]
		{
				const MatrixQ a = ints({{1, 2}, {3, 4}});
				MatrixQ inv;
				Error err = dense_core::op_inverse(a, &inv);
				assert(dense_core::is_ok(err));
				expect_matrix(inv, MatrixQ::from_rows({{rat(-2), rat(1)}, {rat(3, 2), rat(-1, 2)}}));
				expect_matrix(a * inv, MatrixQ::identity(2));
				expect_matrix(inv * a, MatrixQ::identity(2));
				// input untouched
				expect_matrix(a, ints({{1, 2}, {3, 4}}));
		}

		// [[2,0],[0,2]] -> [[0.5,0],[0,0.5]]
		{
				MatrixD inv;
				assert(dense_core::is_ok(dense_core::op_inverse(MatrixD::from_rows({{2.0, 0.0}, {0.0, 2.0}}), &inv)));
				assert(inv == MatrixD::from_rows({{0.5, 0.0}, {0.0, 0.5}}));
		}

		// needs a row swap for the first pivot
		{
				const MatrixQ a = ints({{0, 1, 2}, {1, 0, 3}, {4, -3, 8}});
				MatrixQ inv;
				assert(dense_core::is_ok(dense_core::op_inverse(a, &inv)));
				expect_matrix(a * inv, MatrixQ::identity(3));
				expect_matrix(inv * a, MatrixQ::identity(3));
		}

		// A * A^{-1} ~ I on floating point
		{
				const MatrixD a = MatrixD::from_rows({{4.0, 7.0, 2.0}, {3.0, 6.0, 1.0}, {2.0, 5.0, 3.0}});
				MatrixD inv;
				assert(dense_core::is_ok(dense_core::op_inverse(a, &inv)));
				expect_matrix(a * inv, MatrixD::identity(3), 1e-9);
				expect_matrix(inv * a, MatrixD::identity(3), 1e-9);
		}

		// identity is its own inverse
		{
				MatrixQ inv;
				assert(dense_core::is_ok(dense_core::op_inverse(MatrixQ::identity(4), &inv)));
				expect_matrix(inv, MatrixQ::identity(4));
		}

		// singular: [[1,2],[2,4]] has determinant 0
		{
				MatrixQ inv;
				Error err = dense_core::op_inverse(ints({{1, 2}, {2, 4}}), &inv);
				assert(err.code == ErrorCode::Singular);
				assert(err.a.rows == 2 && err.a.cols == 2);
				assert(inv.empty());

				assert(dense_core::op_inverse(MatrixQ(3, 3), &inv).code == ErrorCode::Singular);
				assert(dense_core::op_inverse(ints({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}}), &inv).code == ErrorCode::Singular);

				MatrixD invd;
				assert(dense_core::op_inverse(MatrixD::from_rows({{1.0, 2.0}, {2.0, 4.0}}), &invd).code == ErrorCode::Singular);
		}

		// non square is reported before anything else
		{
				MatrixQ inv;
				Error err = dense_core::op_inverse(ints({{1, 2, 3}, {4, 5, 6}}), &inv);
				assert(err.code == ErrorCode::NotSquare);
				assert(err.a.rows == 2 && err.a.cols == 3);
				assert(inv.empty());
		}

		return 0;
}
