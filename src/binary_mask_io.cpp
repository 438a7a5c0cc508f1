#include "binary_mask.hpp"
#include "archive.hpp"
#include "error.hpp"

Archive BinaryMaskCollection::toArchive() const {
    Archive ar;
    ar.doctype = SPOTCALL_MASK_COLLECTION_DOCTYPE;
    ar.meta["ticks"] = ticks_;
    ar.meta["log"] = log_.toJson();
    nlohmann::json offsets = nlohmann::json::array();
    for (const auto& m : masks_) {
        offsets.push_back(m.offsets);
        ar.blobs.push_back(m.binaryMask);
    }
    ar.meta["offsets"] = offsets;
    return ar;
}

BinaryMaskCollection BinaryMaskCollection::fromArchive(Archive ar) {
    Ticks ticks;
    Log log;
    std::vector<MaskData> masks;
    try {
        ticks = ar.meta.at("ticks").get<Ticks>();
        log = Log::fromJson(ar.meta.value("log", nlohmann::json::array()));
        const nlohmann::json& offsets = ar.meta.at("offsets");
        if (!offsets.is_array() || offsets.size() != ar.blobs.size()) {
            error("%s: %zu mask offsets stored for %zu mask arrays", __func__, offsets.size(), ar.blobs.size());
        }
        masks.reserve(ar.blobs.size());
        for (size_t i = 0; i < ar.blobs.size(); ++i) {
            masks.push_back(MaskData{std::move(ar.blobs[i]), offsets[i].get<std::vector<size_t>>()});
        }
    } catch (const nlohmann::json::exception& e) {
        error("%s: Malformed mask collection metadata: %s", __func__, e.what());
    }
    std::vector<PropsPtr> none(masks.size());
    return BinaryMaskCollection(std::move(ticks), std::move(masks), std::move(none), std::move(log));
}

std::vector<uint8_t> BinaryMaskCollection::toBytes() const {
    return toArchive().pack();
}

BinaryMaskCollection BinaryMaskCollection::fromBytes(const std::vector<uint8_t>& bytes) {
    return fromArchive(Archive::unpack(bytes, SPOTCALL_MASK_COLLECTION_DOCTYPE));
}

void BinaryMaskCollection::save(const std::string& path) const {
    toArchive().save(path);
    notice("Saved %zu masks to %s", masks_.size(), path.c_str());
}

BinaryMaskCollection BinaryMaskCollection::fromDisk(const std::string& path) {
    BinaryMaskCollection masks = fromArchive(Archive::open(path, SPOTCALL_MASK_COLLECTION_DOCTYPE));
    debug("%s: Loaded %zu masks from %s", __func__, masks.size(), path.c_str());
    return masks;
}
