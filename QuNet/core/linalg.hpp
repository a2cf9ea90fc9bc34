#ifndef QUNET_CORE_LINALG_HPP
#define QUNET_CORE_LINALG_HPP

#include <QuNet/core/array.hpp>
#include <QuNet/core/options.hpp>

#include <Eigen/Core>

#include <cstddef>

/// dense kernels consumed by the engine as black boxes
namespace qunet::linalg {

using Matrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Vector = Eigen::VectorXd;

/// @return view of the elements of @p arr as a @p rows x @p cols row-major
/// matrix
Eigen::Map<const Matrix> as_matrix(const Array &arr, std::size_t rows,
                                   std::size_t cols);

/// @return @p m as an Array of shape (rows, cols)
Array to_array(const Matrix &m);

/// singular value decomposition A = U diag(s) Vh, s descending
struct SVD {
  Matrix U;
  Vector s;
  Matrix Vh;
};

/// thin SVD
SVD svd(const Matrix &a);

/// thin QR decomposition A = Q R
struct QR {
  Matrix Q;
  Matrix R;
};

QR qr(const Matrix &a);

/// thin LQ decomposition A = L Q
struct LQ {
  Matrix L;
  Matrix Q;
};

LQ lq(const Matrix &a);

/// eigendecomposition A = V diag(w) V^T of a symmetric matrix, eigenvalues
/// sorted by descending magnitude
struct Eigh {
  Vector w;
  Matrix V;
};

Eigh eigh(const Matrix &a);

/// the number of components kept by a truncation and the weight discarded
struct Truncation {
  std::size_t rank;
  /// square root of the sum of squares of the discarded values
  double discarded;
};

/// @param s singular values (or eigenvalue magnitudes), descending
/// @param opts truncation options; only cutoff, cutoff_mode and max_bond are
/// used
/// @return the kept rank (at least 1) and the discarded weight
Truncation truncation_rank(const Vector &s, const TruncationOptions &opts);

}  // namespace qunet::linalg

#endif  // QUNET_CORE_LINALG_HPP
