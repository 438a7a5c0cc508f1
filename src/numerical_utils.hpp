#pragma once

#include <cmath>
#include <Eigen/Dense>

using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Eigen::MatrixXf;
using Eigen::VectorXf;
using Eigen::MatrixXi;

// L1 or L2 norm of each row
inline VectorXf rowNorms(const RowMajorMatrixXf& mtx, int normOrder) {
    if (normOrder == 1) {
        return mtx.cwiseAbs().rowwise().sum();
    }
    return mtx.rowwise().norm();
}

// Scale every row to unit norm; all-zero rows stay zero
inline RowMajorMatrixXf rowNormalize(const RowMajorMatrixXf& mtx, int normOrder = 2) {
    RowMajorMatrixXf out = mtx;
    VectorXf norms = rowNorms(mtx, normOrder);
    for (Eigen::Index i = 0; i < out.rows(); ++i) {
        if (norms(i) > 0) {
            out.row(i) /= norms(i);
        }
    }
    return out;
}
