#pragma once

#include <cstdint>
#include <nanoflann.hpp>
#include "numerical_utils.hpp"

// Rows of a row-major matrix as points for nanoflann
struct MatrixRowCloud {
    const RowMajorMatrixXf* mtx = nullptr;

    explicit MatrixRowCloud(const RowMajorMatrixXf& m) : mtx(&m) {}

    inline size_t kdtree_get_point_count() const { return static_cast<size_t>(mtx->rows()); }
    inline float kdtree_get_pt(const size_t idx, const size_t dim) const {
        return (*mtx)(static_cast<Eigen::Index>(idx), static_cast<Eigen::Index>(dim));
    }
    template <class BBOX>
    bool kdtree_get_bbox(BBOX& /* bb */) const { return false; }
};

typedef nanoflann::KDTreeSingleIndexAdaptor<
    nanoflann::L2_Simple_Adaptor<float, MatrixRowCloud>,
    MatrixRowCloud, -1, uint32_t> kd_tree_l2_t;

typedef nanoflann::KDTreeSingleIndexAdaptor<
    nanoflann::L1_Adaptor<float, MatrixRowCloud>,
    MatrixRowCloud, -1, uint32_t> kd_tree_l1_t;
