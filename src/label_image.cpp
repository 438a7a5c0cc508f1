#include "label_image.hpp"
#include "archive.hpp"
#include "error.hpp"

void LabelImage::validateArray(const NdArray& array) {
    if (array.ndim() != 2 && array.ndim() != 3) {
        fail<TypeMismatchError>("label image must be 2D or 3D, got rank %zu", array.ndim());
    }
    if (!isIntegral(array.dtype())) {
        fail<TypeMismatchError>("label image must have an integer dtype, got %s", dtypeName(array.dtype()));
    }
    dispatchDType(array.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        if constexpr (std::is_signed<T>::value) {
            const T* p = array.data<T>();
            for (size_t i = 0; i < array.size(); ++i) {
                if (p[i] < 0) {
                    fail<std::invalid_argument>("label image contains negative label %lld at element %zu",
                        static_cast<long long>(p[i]), i);
                }
            }
        }
    });
}

LabelImage LabelImage::fromArrayAndTicks(NdArray array, const TickInput& ticks, Log log) {
    Ticks resolved = resolveTicks(array.shape(), ticks);
    validateArray(array);
    return LabelImage(std::move(array), std::move(resolved), std::move(log));
}

LabelImage LabelImage::fromArrayAndTicks(NdArray array, Ticks ticks, Log log) {
    validateArray(array);
    if (ticks.shape() != array.shape()) {
        fail<ShapeError>("ticks describe a frame of shape %s but the array has shape %s",
            shapeToString(ticks.shape()).c_str(), shapeToString(array.shape()).c_str());
    }
    return LabelImage(std::move(array), std::move(ticks), std::move(log));
}

Archive LabelImage::toArchive() const {
    Archive ar;
    ar.doctype = SPOTCALL_LABEL_IMAGE_DOCTYPE;
    ar.meta["ticks"] = ticks_;
    ar.meta["log"] = log_.toJson();
    ar.blobs.push_back(array_);
    return ar;
}

LabelImage LabelImage::fromArchive(Archive ar) {
    if (ar.blobs.size() != 1) {
        error("%s: Expected one array in a label image, found %zu", __func__, ar.blobs.size());
    }
    Ticks ticks;
    Log log;
    try {
        ticks = ar.meta.at("ticks").get<Ticks>();
        log = Log::fromJson(ar.meta.value("log", nlohmann::json::array()));
    } catch (const nlohmann::json::exception& e) {
        error("%s: Malformed label image metadata: %s", __func__, e.what());
    }
    return fromArrayAndTicks(std::move(ar.blobs[0]), std::move(ticks), std::move(log));
}

std::vector<uint8_t> LabelImage::toBytes() const {
    return toArchive().pack();
}

LabelImage LabelImage::fromBytes(const std::vector<uint8_t>& bytes) {
    return fromArchive(Archive::unpack(bytes, SPOTCALL_LABEL_IMAGE_DOCTYPE));
}

void LabelImage::save(const std::string& path) const {
    toArchive().save(path);
}

LabelImage LabelImage::open(const std::string& path) {
    return fromArchive(Archive::open(path, SPOTCALL_LABEL_IMAGE_DOCTYPE));
}
