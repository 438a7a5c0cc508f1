#include "ndarray.hpp"
#include <algorithm>
#include <numeric>

size_t dtypeSize(DType t) {
    switch (t) {
        case DType::Bool:
        case DType::Int8:
        case DType::UInt8:   return 1;
        case DType::Int16:
        case DType::UInt16:  return 2;
        case DType::Int32:
        case DType::UInt32:
        case DType::Float32: return 4;
        case DType::Int64:
        case DType::UInt64:
        case DType::Float64: return 8;
    }
    return 1;
}

const char* dtypeName(DType t) {
    switch (t) {
        case DType::Bool:    return "bool";
        case DType::Int8:    return "int8";
        case DType::UInt8:   return "uint8";
        case DType::Int16:   return "int16";
        case DType::UInt16:  return "uint16";
        case DType::Int32:   return "int32";
        case DType::UInt32:  return "uint32";
        case DType::Int64:   return "int64";
        case DType::UInt64:  return "uint64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
    }
    return "unknown";
}

DType dtypeFromName(const std::string& name) {
    static const DType all[] = {
        DType::Bool, DType::Int8, DType::UInt8, DType::Int16, DType::UInt16,
        DType::Int32, DType::UInt32, DType::Int64, DType::UInt64,
        DType::Float32, DType::Float64};
    for (DType t : all) {
        if (name == dtypeName(t)) return t;
    }
    fail<TypeMismatchError>("Unknown dtype '%s'", name.c_str());
}

std::string shapeToString(const std::vector<size_t>& shape) {
    std::string s = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    s += ")";
    return s;
}

NdArray::NdArray(DType dtype, std::vector<size_t> shape)
    : dtype_(dtype), shape_(std::move(shape)) {
    size_ = std::accumulate(shape_.begin(), shape_.end(), size_t(1), std::multiplies<size_t>());
    bytes_.assign(size_ * dtypeSize(dtype_), 0);
}

NdArray NdArray::fromBools(std::vector<size_t> shape, const std::vector<bool>& values) {
    NdArray out(DType::Bool, std::move(shape));
    if (values.size() != out.size()) {
        fail<ShapeError>("%s: %zu values given for an array of %zu elements",
            __func__, values.size(), out.size());
    }
    for (size_t i = 0; i < values.size(); ++i) {
        out.bytes_[i] = values[i] ? 1 : 0;
    }
    return out;
}

NdArray NdArray::fromBytes(DType dtype, std::vector<size_t> shape, std::vector<uint8_t> bytes) {
    NdArray out(dtype, std::move(shape));
    if (bytes.size() != out.bytes_.size()) {
        fail<ShapeError>("%s: %zu bytes given for a %s array of shape %s",
            __func__, bytes.size(), dtypeName(dtype), shapeToString(out.shape_).c_str());
    }
    if (dtype == DType::Bool) {
        for (uint8_t b : bytes) {
            if (b > 1) {
                fail<TypeMismatchError>("%s: boolean array contains byte value %u", __func__, b);
            }
        }
    }
    out.bytes_ = std::move(bytes);
    return out;
}

int64_t NdArray::intAt(size_t i) const {
    if (dtype_ == DType::Float32 || dtype_ == DType::Float64) {
        fail<TypeMismatchError>("%s: array has floating point dtype %s", __func__, dtypeName(dtype_));
    }
    const uint8_t* p = bytes_.data() + i * itemSize();
    return dispatchDType(dtype_, [p](auto tag) -> int64_t {
        using T = typename decltype(tag)::type;
        T v;
        std::memcpy(&v, p, sizeof(T));
        return static_cast<int64_t>(v);
    });
}

NdArray NdArray::crop(const std::vector<size_t>& start, const std::vector<size_t>& extent) const {
    if (start.size() != ndim() || extent.size() != ndim()) {
        fail<ShapeError>("%s: crop of rank %zu requested on an array of rank %zu",
            __func__, start.size(), ndim());
    }
    for (size_t d = 0; d < ndim(); ++d) {
        if (start[d] + extent[d] > shape_[d]) {
            fail<std::out_of_range>("%s: crop [%zu, %zu) exceeds extent %zu on axis %zu",
                __func__, start[d], start[d] + extent[d], shape_[d], d);
        }
    }
    NdArray out(dtype_, extent);
    if (out.size() == 0) return out;
    const size_t isz = itemSize();
    const size_t rowBytes = extent.back() * isz;
    // copy contiguous rows along the last axis
    const size_t nRows = out.size() / extent.back();
    std::vector<size_t> idx(ndim(), 0);
    for (size_t r = 0; r < nRows; ++r) {
        size_t src = 0;
        for (size_t d = 0; d < ndim(); ++d) {
            src = src * shape_[d] + start[d] + (d + 1 < ndim() ? idx[d] : 0);
        }
        std::memcpy(out.bytes_.data() + r * rowBytes, bytes_.data() + src * isz, rowBytes);
        for (size_t d = ndim() - 1; d-- > 0;) {
            if (++idx[d] < extent[d]) break;
            idx[d] = 0;
        }
    }
    return out;
}

void NdArray::paste(const NdArray& block, const std::vector<size_t>& start, bool nonzeroOnly) {
    if (block.dtype_ != dtype_) {
        fail<TypeMismatchError>("%s: cannot paste %s into %s", __func__,
            dtypeName(block.dtype_), dtypeName(dtype_));
    }
    if (block.ndim() != ndim() || start.size() != ndim()) {
        fail<ShapeError>("%s: block of rank %zu pasted into rank %zu", __func__, block.ndim(), ndim());
    }
    for (size_t d = 0; d < ndim(); ++d) {
        if (start[d] + block.shape_[d] > shape_[d]) {
            fail<std::out_of_range>("%s: block [%zu, %zu) exceeds extent %zu on axis %zu",
                __func__, start[d], start[d] + block.shape_[d], shape_[d], d);
        }
    }
    if (block.size() == 0) return;
    const size_t isz = itemSize();
    const size_t rowLen = block.shape_.back();
    const size_t nRows = block.size() / rowLen;
    std::vector<size_t> idx(ndim(), 0);
    for (size_t r = 0; r < nRows; ++r) {
        size_t dst = 0;
        for (size_t d = 0; d < ndim(); ++d) {
            dst = dst * shape_[d] + start[d] + (d + 1 < ndim() ? idx[d] : 0);
        }
        const uint8_t* src = block.bytes_.data() + r * rowLen * isz;
        uint8_t* out = bytes_.data() + dst * isz;
        if (!nonzeroOnly) {
            std::memcpy(out, src, rowLen * isz);
        } else {
            for (size_t i = 0; i < rowLen; ++i) {
                const uint8_t* e = src + i * isz;
                if (std::any_of(e, e + isz, [](uint8_t b) { return b != 0; })) {
                    std::memcpy(out + i * isz, e, isz);
                }
            }
        }
        for (size_t d = ndim() - 1; d-- > 0;) {
            if (++idx[d] < block.shape_[d]) break;
            idx[d] = 0;
        }
    }
}
