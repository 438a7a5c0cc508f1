#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <type_traits>
#include "error.hpp"

enum class DType : uint8_t {
    Bool, Int8, UInt8, Int16, UInt16, Int32, UInt32, Int64, UInt64, Float32, Float64
};

template<typename T> struct DTypeOf;
template<> struct DTypeOf<bool>     { static constexpr DType value = DType::Bool; };
template<> struct DTypeOf<int8_t>   { static constexpr DType value = DType::Int8; };
template<> struct DTypeOf<uint8_t>  { static constexpr DType value = DType::UInt8; };
template<> struct DTypeOf<int16_t>  { static constexpr DType value = DType::Int16; };
template<> struct DTypeOf<uint16_t> { static constexpr DType value = DType::UInt16; };
template<> struct DTypeOf<int32_t>  { static constexpr DType value = DType::Int32; };
template<> struct DTypeOf<uint32_t> { static constexpr DType value = DType::UInt32; };
template<> struct DTypeOf<int64_t>  { static constexpr DType value = DType::Int64; };
template<> struct DTypeOf<uint64_t> { static constexpr DType value = DType::UInt64; };
template<> struct DTypeOf<float>    { static constexpr DType value = DType::Float32; };
template<> struct DTypeOf<double>   { static constexpr DType value = DType::Float64; };

static_assert(sizeof(bool) == 1, "boolean rasters are stored one byte per element");

size_t dtypeSize(DType t);
const char* dtypeName(DType t);
DType dtypeFromName(const std::string& name);
inline bool isIntegral(DType t) {
    return t != DType::Bool && t != DType::Float32 && t != DType::Float64;
}

template<typename T> struct TypeTag { using type = T; };

// Invoke f(TypeTag<T>{}) with the C++ type matching t
template<typename F>
decltype(auto) dispatchDType(DType t, F&& f) {
    switch (t) {
        case DType::Bool:    return f(TypeTag<bool>{});
        case DType::Int8:    return f(TypeTag<int8_t>{});
        case DType::UInt8:   return f(TypeTag<uint8_t>{});
        case DType::Int16:   return f(TypeTag<int16_t>{});
        case DType::UInt16:  return f(TypeTag<uint16_t>{});
        case DType::Int32:   return f(TypeTag<int32_t>{});
        case DType::UInt32:  return f(TypeTag<uint32_t>{});
        case DType::Int64:   return f(TypeTag<int64_t>{});
        case DType::UInt64:  return f(TypeTag<uint64_t>{});
        case DType::Float32: return f(TypeTag<float>{});
        case DType::Float64: break;
    }
    return f(TypeTag<double>{});
}

/// Dense row-major raster with a runtime element type. Axis order is
/// (y, x) for 2D and (z, y, x) for 3D data.
class NdArray {
public:
    NdArray() = default;
    NdArray(DType dtype, std::vector<size_t> shape);

    template<typename T>
    static NdArray fromValues(std::vector<size_t> shape, const std::vector<T>& values) {
        NdArray out(DTypeOf<T>::value, std::move(shape));
        if (values.size() != out.size()) {
            fail<ShapeError>("%s: %zu values given for an array of %zu elements",
                __func__, values.size(), out.size());
        }
        if (!values.empty()) {
            std::memcpy(out.bytes_.data(), values.data(), values.size() * sizeof(T));
        }
        return out;
    }
    static NdArray fromBools(std::vector<size_t> shape, const std::vector<bool>& values);
    static NdArray fromBytes(DType dtype, std::vector<size_t> shape, std::vector<uint8_t> bytes);

    DType dtype() const { return dtype_; }
    size_t ndim() const { return shape_.size(); }
    const std::vector<size_t>& shape() const { return shape_; }
    size_t shape(size_t axis) const { return shape_.at(axis); }
    size_t size() const { return size_; }
    size_t itemSize() const { return dtypeSize(dtype_); }
    size_t nbytes() const { return bytes_.size(); }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

    template<typename T>
    const T* data() const {
        checkType(DTypeOf<T>::value);
        return reinterpret_cast<const T*>(bytes_.data());
    }
    template<typename T>
    T* data() {
        checkType(DTypeOf<T>::value);
        return reinterpret_cast<T*>(bytes_.data());
    }

    size_t offset(size_t y, size_t x) const { return y * shape_[ndim() - 1] + x; }
    size_t offset(size_t z, size_t y, size_t x) const {
        return (z * shape_[1] + y) * shape_[2] + x;
    }
    template<typename T> T& at(size_t y, size_t x) { return data<T>()[offset(y, x)]; }
    template<typename T> T at(size_t y, size_t x) const { return data<T>()[offset(y, x)]; }
    template<typename T> T& at(size_t z, size_t y, size_t x) { return data<T>()[offset(z, y, x)]; }
    template<typename T> T at(size_t z, size_t y, size_t x) const { return data<T>()[offset(z, y, x)]; }

    // Element i converted to int64; only for integral and boolean arrays
    int64_t intAt(size_t i) const;

    // Copy of the block [start, start+extent) along every axis
    NdArray crop(const std::vector<size_t>& start, const std::vector<size_t>& extent) const;
    // Write `block` into this array with its origin at `start`, elements of
    // `block` that are zero/false are skipped when `nonzeroOnly` is set
    void paste(const NdArray& block, const std::vector<size_t>& start, bool nonzeroOnly = false);

    bool operator==(const NdArray& other) const {
        return dtype_ == other.dtype_ && shape_ == other.shape_ && bytes_ == other.bytes_;
    }
    bool operator!=(const NdArray& other) const { return !(*this == other); }

private:
    DType dtype_ = DType::UInt8;
    std::vector<size_t> shape_;
    size_t size_ = 0;
    std::vector<uint8_t> bytes_;

    void checkType(DType requested) const {
        if (requested != dtype_) {
            fail<TypeMismatchError>("array has dtype %s, accessed as %s",
                dtypeName(dtype_), dtypeName(requested));
        }
    }
};

std::string shapeToString(const std::vector<size_t>& shape);
