#include "dense_core/dense_core.hpp"

#include "test_helpers.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

using dense_core::Error;
using dense_core::ErrorCode;
using dense_core::Matrix;
using dense_core::MatrixView;
using dense_core::Rational;
using dense_test::expect_matrix;
using dense_test::ints;
using dense_test::rat;
using dense_test::same;

using MatrixD = Matrix<double>;
using MatrixQ = Matrix<Rational>;

int main() {
		// constructors
		{
				MatrixD z(2, 3);
				assert(z.rows() == 2 && z.cols() == 3);
				for (std::size_t r = 0; r < 2; r++) {
						for (std::size_t c = 0; c < 3; c++)
								assert(z.get(r, c) == 0.0);
				}

				MatrixD sq = MatrixD::square(4);
				assert(sq.rows() == 4 && sq.cols() == 4 && sq.is_square());

				MatrixQ id = MatrixQ::identity(3);
				for (std::size_t r = 0; r < 3; r++) {
						for (std::size_t c = 0; c < 3; c++)
								assert(same(id.get(r, c), r == c ? 1 : 0));
				}

				MatrixD flat = MatrixD::from_flat({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, 2, 3);
				assert(flat.get(0, 2) == 3.0);
				assert(flat.get(1, 0) == 4.0);

				MatrixD sq_flat = MatrixD::square_from_flat({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0});
				assert(sq_flat.rows() == 3 && sq_flat.cols() == 3);
				assert(sq_flat.get(2, 1) == 8.0);

				MatrixD nested = MatrixD::from_rows({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
				assert(nested == flat);
		}

		// checked factories report shape errors instead of aborting
		{
				MatrixD m;
				assert(m.empty());
				assert(MatrixD::make_from_flat({1.0, 2.0, 3.0, 4.0, 5.0}, 2, 3, &m) == ErrorCode::InvalidDimension);
				assert(m.empty());
				assert(MatrixD::make_square_from_flat({1.0, 2.0, 3.0}, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make_square_from_flat({}, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make_from_rows({{1.0, 2.0}, {3.0}}, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make_from_rows({}, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make_from_rows({{}, {}}, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make(0, 3, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make(3, 0, &m) == ErrorCode::InvalidDimension);
				assert(MatrixD::make(2, 2, nullptr) == ErrorCode::Internal);

				assert(MatrixD::make_square_from_flat({7.0}, &m) == ErrorCode::Ok);
				assert(m.rows() == 1 && m.get(0, 0) == 7.0);
				assert(MatrixD::make(2, 5, &m) == ErrorCode::Ok);
				assert(m.rows() == 2 && m.cols() == 5);
		}

		// accessors
		{
				MatrixQ m = ints({{1, 2}, {3, 4}});
				m.set(1, 0, rat(-7, 2));
				assert(same(m.get(1, 0), -7, 2));
				assert(same(m[1][0], -7, 2));
				assert(same(m[0][1], 2));
				assert(m[1].size() == 2);
		}

		// value semantics: copies share nothing
		{
				MatrixD a = MatrixD::from_rows({{1.0, 2.0}, {3.0, 4.0}});
				MatrixD b = a;
				b.set(0, 0, 100.0);
				assert(a.get(0, 0) == 1.0);
				assert(b.get(0, 0) == 100.0);

				MatrixD t = a.transpose();
				t.set(1, 0, -1.0);
				assert(a.get(0, 1) == 2.0);
		}

		// named arithmetic and operator sugar
		{
				MatrixQ a = ints({{1, 2}, {3, 4}});
				MatrixQ b = ints({{5, 6}, {7, 8}});

				expect_matrix(a.add(b), ints({{6, 8}, {10, 12}}));
				expect_matrix(a + b, ints({{6, 8}, {10, 12}}));
				expect_matrix(b.subtract(a), ints({{4, 4}, {4, 4}}));
				expect_matrix(b - a, ints({{4, 4}, {4, 4}}));
				expect_matrix(a.multiply(b), ints({{19, 22}, {43, 50}}));
				expect_matrix(a * b, ints({{19, 22}, {43, 50}}));
				expect_matrix(a.scale(rat(1, 2)), MatrixQ::from_rows({{rat(1, 2), rat(1)}, {rat(3, 2), rat(2)}}));
				expect_matrix(a * rat(3), ints({{3, 6}, {9, 12}}));
				expect_matrix(rat(3) * a, ints({{3, 6}, {9, 12}}));

				MatrixQ c = a;
				c += b;
				expect_matrix(c, ints({{6, 8}, {10, 12}}));
				c -= b;
				expect_matrix(c, a);
				c *= b;
				expect_matrix(c, ints({{19, 22}, {43, 50}}));
				c *= rat(0);
				expect_matrix(c, MatrixQ(2, 2));
				assert(c != a);

				// non square product
				MatrixQ row = ints({{1, 2, 3}});
				MatrixQ col = ints({{4}, {5}, {6}});
				expect_matrix(row * col, ints({{32}}));
				expect_matrix(col * row, ints({{4, 8, 12}, {5, 10, 15}, {6, 12, 18}}));

				// the scalar converts to the element type
				const MatrixD d = MatrixD::from_rows({{1.0, -2.0}, {0.5, 4.0}});
				assert(d * 2 == MatrixD::from_rows({{2.0, -4.0}, {1.0, 8.0}}));
				assert(3 * d == MatrixD::from_rows({{3.0, -6.0}, {1.5, 12.0}}));
				assert(d * 0.5f == MatrixD::from_rows({{0.5, -1.0}, {0.25, 2.0}}));
		}

		// checked arithmetic reports shape problems with both operand shapes
		{
				const MatrixQ a = ints({{1, 2}, {3, 4}});
				const MatrixQ wide = ints({{1, 2, 3}, {4, 5, 6}});
				MatrixQ out;

				assert(dense_core::is_ok(dense_core::op_add(a, a, &out)));
				expect_matrix(out, ints({{2, 4}, {6, 8}}));
				assert(dense_core::is_ok(dense_core::op_sub(a, a, &out)));
				expect_matrix(out, MatrixQ(2, 2));
				assert(dense_core::is_ok(dense_core::op_mul(a, wide, &out)));
				expect_matrix(out, ints({{9, 12, 15}, {19, 26, 33}}));

				MatrixQ untouched = ints({{7}});
				Error err = dense_core::op_add(a, wide, &untouched);
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(err.a.rows == 2 && err.a.cols == 2);
				assert(err.b.rows == 2 && err.b.cols == 3);
				expect_matrix(untouched, ints({{7}}));

				err = dense_core::op_sub(wide, a, &untouched);
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(err.a.cols == 3 && err.b.cols == 2);

				err = dense_core::op_mul(wide, a, &untouched);
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(err.a.rows == 2 && err.a.cols == 3 && err.b.rows == 2 && err.b.cols == 2);
				assert(dense_core::op_mul(a, MatrixQ(), &untouched).code == ErrorCode::DimensionMismatch);

				// arithmetic failures carry both shapes too
				const MatrixQ big = MatrixQ::from_rows({{Rational::from_int(std::numeric_limits<std::int64_t>::max())}});
				err = dense_core::op_add(big, big, &untouched);
				assert(err.code == ErrorCode::Overflow);
				assert(err.a.rows == 1 && err.b.rows == 1);
				assert(dense_core::op_mul(big, big, &untouched).code == ErrorCode::Overflow);
				expect_matrix(untouched, ints({{7}}));
		}

		// identity(3) * identity(3) == identity(3)
		{
				MatrixD id = MatrixD::identity(3);
				assert(id * id == id);
				MatrixQ idq = MatrixQ::identity(3);
				assert(idq * idq == idq);
		}

		// transpose
		{
				MatrixQ a = ints({{1, 2, 3}, {4, 5, 6}});
				MatrixQ t = a.transpose();
				expect_matrix(t, ints({{1, 4}, {2, 5}, {3, 6}}));
				assert(t.transpose() == a);
		}

		// partition / combine
		{
				MatrixQ a = ints({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}});
				expect_matrix(a.partition(0, 3, 0, 3), a);
				expect_matrix(a.partition(1, 3, 1, 3), ints({{5, 6}, {8, 9}}));
				expect_matrix(a.partition(0, 1, 2, 3), ints({{3}}));

				MatrixQ left = ints({{1, 2}, {3, 4}});
				MatrixQ right = ints({{9}, {8}});
				MatrixQ both = left.combine(right);
				expect_matrix(both, ints({{1, 2, 9}, {3, 4, 8}}));
				expect_matrix(both.partition(0, 2, 0, 2), left);
				expect_matrix(both.partition(0, 2, 2, 3), right);
		}

		// view kernels report what the fail fast API aborts on
		{
				MatrixQ a = ints({{1, 2}, {3, 4}});
				MatrixQ wide = ints({{1, 2, 3}});
				MatrixQ out(2, 2);

				assert(dense_core::matrix_add(a.view(), wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_sub(a.view(), wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_mul(a.view(), wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_transpose(wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_combine(a.view(), wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_copy(wide.view(), out.mut_view()) == ErrorCode::DimensionMismatch);
				assert(dense_core::matrix_copy(MatrixView<Rational>{2, 2, 2, nullptr}, out.mut_view()) == ErrorCode::Internal);

				MatrixView<Rational> block;
				assert(dense_core::matrix_subview(a.view(), 0, 3, 0, 1, &block) == ErrorCode::IndexOutOfRange);
				assert(dense_core::matrix_subview(a.view(), 1, 1, 0, 1, &block) == ErrorCode::InvalidDimension);
				assert(dense_core::matrix_subview(a.view(), 0, 1, 0, 1, static_cast<MatrixView<Rational>*>(nullptr)) == ErrorCode::Internal);
				assert(dense_core::matrix_subview(a.view(), 1, 2, 0, 2, &block) == ErrorCode::Ok);
				assert(block.rows == 1 && block.cols == 2 && block.stride == 2);
				assert(same(block.at(0, 1), 4));

		}

		// exact scalars report overflow through the kernels
		{
				MatrixQ big = MatrixQ::from_rows({{Rational::from_int(std::numeric_limits<std::int64_t>::max())}});
				MatrixQ out(1, 1);
				assert(dense_core::matrix_add(big.view(), big.view(), out.mut_view()) == ErrorCode::Overflow);
				assert(dense_core::matrix_mul(big.view(), big.view(), out.mut_view()) == ErrorCode::Overflow);
				assert(dense_core::matrix_scale(big.view(), rat(2), out.mut_view()) == ErrorCode::Overflow);
		}

		// error helpers
		{
				const Error e0 = dense_core::err_not_square({2, 3});
				assert(e0.code == ErrorCode::NotSquare && e0.a.rows == 2 && e0.a.cols == 3);
				const Error e1 = dense_core::err_dim_mismatch({1, 2}, {2, 1});
				assert(e1.code == ErrorCode::DimensionMismatch && e1.b.rows == 2);
				assert(dense_core::err_singular({2, 2}).code == ErrorCode::Singular);
				assert(dense_core::err_inconsistent({2, 2}).code == ErrorCode::Inconsistent);
				assert(dense_core::err_invalid_dim({0, 1}).code == ErrorCode::InvalidDimension);
				assert(dense_core::err_feature_disabled().code == ErrorCode::FeatureDisabled);
				assert(dense_core::is_ok(Error{}));

				assert(std::strcmp(dense_core::error_code_name(ErrorCode::Ok), "Ok") == 0);
				assert(std::strcmp(dense_core::error_code_name(ErrorCode::Singular), "Singular") == 0);
				assert(std::strcmp(dense_core::error_code_name(ErrorCode::Inconsistent), "Inconsistent") == 0);
				assert(std::strcmp(dense_core::error_code_name(ErrorCode::IndexOutOfRange), "IndexOutOfRange") == 0);
		}

		return 0;
}
