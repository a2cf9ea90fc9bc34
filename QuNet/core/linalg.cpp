#include <QuNet/core/linalg.hpp>
#include <QuNet/core/utility/exception.hpp>

#include <Eigen/Eigenvalues>
#include <Eigen/QR>
#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace qunet::linalg {

Eigen::Map<const Matrix> as_matrix(const Array &arr, std::size_t rows,
                                   std::size_t cols) {
  if (rows * cols != arr.size())
    throw ShapeError("as_matrix: " + std::to_string(arr.size()) +
                     " elements do not form a " + std::to_string(rows) + "x" +
                     std::to_string(cols) + " matrix");
  return Eigen::Map<const Matrix>(arr.data(), static_cast<Eigen::Index>(rows),
                                  static_cast<Eigen::Index>(cols));
}

Array to_array(const Matrix &m) {
  std::vector<double> data(m.data(), m.data() + m.size());
  return Array(Array::shape_type{static_cast<std::size_t>(m.rows()),
                                 static_cast<std::size_t>(m.cols())},
               std::move(data));
}

SVD svd(const Matrix &a) {
  const Eigen::MatrixXd cm = a;
  Eigen::BDCSVD<Eigen::MatrixXd> solver(
      cm, Eigen::ComputeThinU | Eigen::ComputeThinV);
  SVD result;
  result.U = solver.matrixU();
  result.s = solver.singularValues();
  result.Vh = solver.matrixV().transpose();
  return result;
}

QR qr(const Matrix &a) {
  const auto m = a.rows();
  const auto n = a.cols();
  const auto k = std::min(m, n);
  const Eigen::MatrixXd cm = a;
  Eigen::HouseholderQR<Eigen::MatrixXd> solver(cm);
  QR result;
  result.Q = solver.householderQ() * Eigen::MatrixXd::Identity(m, k);
  result.R = solver.matrixQR().topRows(k).triangularView<Eigen::Upper>();
  return result;
}

LQ lq(const Matrix &a) {
  // A^T = Q R  =>  A = R^T Q^T
  auto [q, r] = qr(a.transpose());
  LQ result;
  result.L = r.transpose();
  result.Q = q.transpose();
  return result;
}

Eigh eigh(const Matrix &a) {
  if (a.rows() != a.cols())
    throw ShapeError("eigh: matrix is not square");
  const Eigen::MatrixXd cm = a;
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cm);
  const auto &w = solver.eigenvalues();
  const auto &v = solver.eigenvectors();
  std::vector<Eigen::Index> order(w.size());
  std::iota(order.begin(), order.end(), Eigen::Index{0});
  std::stable_sort(order.begin(), order.end(), [&w](auto i, auto j) {
    return std::abs(w[i]) > std::abs(w[j]);
  });
  Eigh result;
  result.w.resize(w.size());
  result.V.resize(v.rows(), v.cols());
  for (Eigen::Index k = 0; k != static_cast<Eigen::Index>(order.size()); ++k) {
    result.w[k] = w[order[k]];
    result.V.col(k) = v.col(order[k]);
  }
  return result;
}

Truncation truncation_rank(const Vector &s, const TruncationOptions &opts) {
  const auto n = static_cast<std::size_t>(s.size());
  std::size_t keep = n;
  if (opts.cutoff > 0 && n > 0) {
    switch (opts.cutoff_mode) {
      case CutoffMode::Abs:
      case CutoffMode::Rel: {
        const double threshold = opts.cutoff_mode == CutoffMode::Abs
                                     ? opts.cutoff
                                     : opts.cutoff * std::abs(s[0]);
        keep = 0;
        while (keep < n && std::abs(s[keep]) > threshold) ++keep;
        break;
      }
      case CutoffMode::SumSquares:
      case CutoffMode::RelSumSquares: {
        const double threshold = opts.cutoff_mode == CutoffMode::SumSquares
                                     ? opts.cutoff
                                     : opts.cutoff * s.squaredNorm();
        double tail = 0;
        while (keep > 0 && tail + s[keep - 1] * s[keep - 1] <= threshold) {
          tail += s[keep - 1] * s[keep - 1];
          --keep;
        }
        break;
      }
    }
  }
  if (opts.max_bond) keep = std::min(keep, *opts.max_bond);
  keep = std::max<std::size_t>(keep, std::min<std::size_t>(n, 1));

  double discarded = 0;
  for (std::size_t i = keep; i < n; ++i) discarded += s[i] * s[i];
  return {keep, std::sqrt(discarded)};
}

}  // namespace qunet::linalg
