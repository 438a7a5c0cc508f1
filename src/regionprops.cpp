#include "regionprops.hpp"
#include "error.hpp"
#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <numeric>

std::vector<size_t> RegionProperties::bboxExtent() const {
    std::vector<size_t> ext(bboxMin.size());
    for (size_t d = 0; d < ext.size(); ++d) ext[d] = bboxMax[d] - bboxMin[d];
    return ext;
}

namespace {

struct PixBox3 {
    size_t lo[3] = {SIZE_MAX, SIZE_MAX, SIZE_MAX};
    size_t hi[3] = {0, 0, 0};
    void include(size_t z, size_t y, size_t x) {
        lo[0] = std::min(lo[0], z); hi[0] = std::max(hi[0], z + 1);
        lo[1] = std::min(lo[1], y); hi[1] = std::max(hi[1], y + 1);
        lo[2] = std::min(lo[2], x); hi[2] = std::max(hi[2], x + 1);
    }
};

struct RegionAccum {
    size_t area = 0;
    double sum[3] = {0, 0, 0};
    PixBox3 box;
};

template<typename T>
std::vector<RegionProperties> regionPropsTyped(const T* lab, const std::vector<size_t>& shape) {
    const bool is3d = shape.size() == 3;
    const size_t Z = is3d ? shape[0] : 1;
    const size_t H = shape[shape.size() - 2];
    const size_t W = shape.back();

    // 1st pass: per label size, coordinate sums and bounding box
    std::map<int64_t, RegionAccum> accum;
    int64_t lastLabel = 0;
    RegionAccum* last = nullptr;
    size_t idx = 0;
    for (size_t z = 0; z < Z; ++z) {
        for (size_t y = 0; y < H; ++y) {
            for (size_t x = 0; x < W; ++x, ++idx) {
                const int64_t lbl = static_cast<int64_t>(lab[idx]);
                if (lbl <= 0) continue;
                if (last == nullptr || lbl != lastLabel) {
                    last = &accum[lbl];
                    lastLabel = lbl;
                }
                last->area += 1;
                last->sum[0] += static_cast<double>(z);
                last->sum[1] += static_cast<double>(y);
                last->sum[2] += static_cast<double>(x);
                last->box.include(z, y, x);
            }
        }
    }

    std::vector<RegionProperties> props;
    props.reserve(accum.size());
    std::map<int64_t, size_t> label2idx;
    const size_t d0 = is3d ? 0 : 1;
    for (const auto& kv : accum) {
        const RegionAccum& a = kv.second;
        RegionProperties p;
        p.label = kv.first;
        p.area = a.area;
        std::vector<size_t> extent;
        for (size_t d = d0; d < 3; ++d) {
            p.centroid.push_back(a.sum[d] / static_cast<double>(a.area));
            p.bboxMin.push_back(a.box.lo[d]);
            p.bboxMax.push_back(a.box.hi[d]);
            extent.push_back(a.box.hi[d] - a.box.lo[d]);
        }
        p.image = NdArray(DType::Bool, extent);
        label2idx[kv.first] = props.size();
        props.push_back(std::move(p));
    }

    // 2nd pass: paint each region's cropped image
    idx = 0;
    for (size_t z = 0; z < Z; ++z) {
        for (size_t y = 0; y < H; ++y) {
            for (size_t x = 0; x < W; ++x, ++idx) {
                const int64_t lbl = static_cast<int64_t>(lab[idx]);
                if (lbl <= 0) continue;
                RegionProperties& p = props[label2idx[lbl]];
                const PixBox3& box = accum[lbl].box;
                const size_t cy = y - box.lo[1];
                const size_t cx = x - box.lo[2];
                if (is3d) {
                    p.image.at<bool>(z - box.lo[0], cy, cx) = true;
                } else {
                    p.image.at<bool>(cy, cx) = true;
                }
            }
        }
    }
    return props;
}

} // namespace

std::vector<RegionProperties> regionProps(const NdArray& labels) {
    if (labels.ndim() != 2 && labels.ndim() != 3) {
        fail<TypeMismatchError>("%s: expected 2 or 3 dimensions; got %zu", __func__, labels.ndim());
    }
    if (!isIntegral(labels.dtype()) && labels.dtype() != DType::Bool) {
        fail<TypeMismatchError>("%s: label raster must be integral, got %s", __func__, dtypeName(labels.dtype()));
    }
    return dispatchDType(labels.dtype(), [&](auto tag) -> std::vector<RegionProperties> {
        using T = typename decltype(tag)::type;
        if constexpr (std::is_floating_point<T>::value) {
            return {};
        } else {
            return regionPropsTyped<T>(labels.data<T>(), labels.shape());
        }
    });
}

ComponentLabeling labelComponents(const std::vector<uint32_t>& classes,
    const std::vector<size_t>& shape, uint32_t bg, Connectivity conn) {
    if (shape.size() != 2 && shape.size() != 3) {
        fail<ShapeError>("%s: expected 2 or 3 dimensions; got %zu", __func__, shape.size());
    }
    const size_t Z = shape.size() == 3 ? shape[0] : 1;
    const size_t H = shape[shape.size() - 2];
    const size_t W = shape.back();
    const size_t nPix = Z * H * W;
    if (classes.size() != nPix) {
        fail<ShapeError>("%s: %zu classes for %zu pixels", __func__, classes.size(), nPix);
    }
    const uint32_t INVALID = ComponentLabeling::NONE;
    ComponentLabeling out;
    out.component.assign(nPix, INVALID);
    if (nPix == 0) return out;

    // neighbours preceding a pixel in raster order
    std::vector<std::array<int, 3>> nbrs;
    for (int dz = -1; dz <= 0; ++dz) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                const bool before = dz < 0 || (dz == 0 && (dy < 0 || (dy == 0 && dx < 0)));
                if (!before) continue;
                const int nz = (dz != 0) + (dy != 0) + (dx != 0);
                if (conn == Connectivity::Face && nz != 1) continue;
                nbrs.push_back({dz, dy, dx});
            }
        }
    }

    std::vector<uint32_t> parent(nPix, INVALID);
    std::vector<uint8_t> rankv(nPix, 0);
    auto findRoot = [&](uint32_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };
    auto unite = [&](uint32_t a, uint32_t b) {
        uint32_t ra = findRoot(a);
        uint32_t rb = findRoot(b);
        if (ra == rb) return;
        if (rankv[ra] < rankv[rb]) std::swap(ra, rb);
        parent[rb] = ra;
        if (rankv[ra] == rankv[rb]) rankv[ra]++;
    };

    // 1st pass: union with preceding neighbours of the same class
    for (size_t z = 0; z < Z; ++z) {
        for (size_t y = 0; y < H; ++y) {
            for (size_t x = 0; x < W; ++x) {
                const size_t idx = (z * H + y) * W + x;
                const uint32_t c = classes[idx];
                if (c == bg) continue;
                parent[idx] = static_cast<uint32_t>(idx);
                for (const auto& o : nbrs) {
                    const long nz = static_cast<long>(z) + o[0];
                    const long ny = static_cast<long>(y) + o[1];
                    const long nx = static_cast<long>(x) + o[2];
                    if (nz < 0 || ny < 0 || nx < 0 || ny >= static_cast<long>(H) || nx >= static_cast<long>(W)) continue;
                    const size_t nidx = (static_cast<size_t>(nz) * H + static_cast<size_t>(ny)) * W + static_cast<size_t>(nx);
                    if (classes[nidx] == c) {
                        unite(static_cast<uint32_t>(idx), static_cast<uint32_t>(nidx));
                    }
                }
            }
        }
    }
    // 2nd pass: pixel -> compact component ID
    std::vector<uint32_t> root2cid(nPix, INVALID);
    for (size_t idx = 0; idx < nPix; ++idx) {
        if (parent[idx] == INVALID) continue;
        uint32_t r = findRoot(static_cast<uint32_t>(idx));
        uint32_t cid = root2cid[r];
        if (cid == INVALID) {
            cid = static_cast<uint32_t>(out.compSize.size());
            root2cid[r] = cid;
            out.compSize.push_back(0);
            out.compClass.push_back(classes[idx]);
        }
        out.component[idx] = cid;
        out.compSize[cid] += 1;
    }
    out.ncomp = static_cast<uint32_t>(out.compSize.size());
    return out;
}
