#include "archive.hpp"
#include "error.hpp"
#include "utils_sys.hpp"
#include <algorithm>
#include <cstring>

namespace {

bool hostIsLittleEndian() {
    const uint16_t probe = 1;
    uint8_t first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

const char* hostByteOrder() {
    return hostIsLittleEndian() ? "little" : "big";
}

void putLittleEndian64(uint8_t* p, uint64_t v) {
    for (size_t i = 0; i < 8; ++i) p[i] = static_cast<uint8_t>(v >> (8 * i));
}

uint64_t getLittleEndian64(const uint8_t* p) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) v |= static_cast<uint64_t>(p[i]) << (8 * i);
    return v;
}

// Reverse the bytes of every element in place
void swapElements(std::vector<uint8_t>& raw, size_t itemSize) {
    if (itemSize <= 1) return;
    for (size_t i = 0; i + itemSize <= raw.size(); i += itemSize) {
        std::reverse(raw.begin() + i, raw.begin() + i + itemSize);
    }
}

} // namespace

std::vector<uint8_t> Archive::pack() const {
    nlohmann::json header;
    header["doctype"] = doctype;
    header["version"] = version;
    header["byteorder"] = hostByteOrder();
    header["meta"] = meta;
    nlohmann::json blobInfo = nlohmann::json::array();
    size_t payload = 0;
    for (const auto& b : blobs) {
        blobInfo.push_back({{"dtype", dtypeName(b.dtype())}, {"shape", b.shape()}, {"nbytes", b.nbytes()}});
        payload += b.nbytes();
    }
    header["blobs"] = blobInfo;
    const std::string hdr = header.dump();
    const uint64_t hdrLen = hdr.size();

    std::vector<uint8_t> out(SPOTCALL_ARCHIVE_MAGIC_LEN + sizeof(uint64_t) + hdr.size() + payload);
    uint8_t* p = out.data();
    std::memcpy(p, SPOTCALL_ARCHIVE_MAGIC, SPOTCALL_ARCHIVE_MAGIC_LEN);
    p += SPOTCALL_ARCHIVE_MAGIC_LEN;
    putLittleEndian64(p, hdrLen);
    p += sizeof(uint64_t);
    std::memcpy(p, hdr.data(), hdr.size());
    p += hdr.size();
    for (const auto& b : blobs) {
        if (b.nbytes() > 0) {
            std::memcpy(p, b.bytes().data(), b.nbytes());
        }
        p += b.nbytes();
    }
    return out;
}

Archive Archive::unpack(const std::vector<uint8_t>& bytes, const std::string& expectedDoctype) {
    const size_t prefix = SPOTCALL_ARCHIVE_MAGIC_LEN + sizeof(uint64_t);
    if (bytes.size() < prefix || std::memcmp(bytes.data(), SPOTCALL_ARCHIVE_MAGIC, SPOTCALL_ARCHIVE_MAGIC_LEN) != 0) {
        error("%s: Not a spotcall archive", __func__);
    }
    const uint64_t hdrLen = getLittleEndian64(bytes.data() + SPOTCALL_ARCHIVE_MAGIC_LEN);
    if (hdrLen > bytes.size() - prefix) {
        error("%s: Truncated archive header (%llu bytes declared, %zu available)",
            __func__, (unsigned long long) hdrLen, bytes.size() - prefix);
    }
    nlohmann::json header;
    try {
        header = nlohmann::json::parse(bytes.begin() + prefix, bytes.begin() + prefix + hdrLen);
    } catch (const nlohmann::json::parse_error& e) {
        error("%s: Malformed archive header: %s", __func__, e.what());
    }

    if (!header.is_object()) {
        error("%s: Archive header is not a JSON object", __func__);
    }

    Archive ar;
    size_t off = prefix + hdrLen;
    try {
        ar.doctype = header.value("doctype", std::string());
        if (ar.doctype != expectedDoctype) {
            error("%s: Expected document type '%s', found '%s'",
                __func__, expectedDoctype.c_str(), ar.doctype.c_str());
        }
        ar.version = header.value("version", 0);
        if (ar.version < 1 || ar.version > SPOTCALL_FORMAT_VERSION) {
            error("%s: Unsupported %s version %d (this build reads up to %d)",
                __func__, ar.doctype.c_str(), ar.version, SPOTCALL_FORMAT_VERSION);
        }
        if (header.contains("meta")) ar.meta = header["meta"];
        // archives without a byte order tag were written little endian
        const std::string order = header.value("byteorder", std::string("little"));
        if (order != "little" && order != "big") {
            error("%s: Unknown byte order '%s'", __func__, order.c_str());
        }
        const bool swap = order != hostByteOrder();

        for (const auto& info : header.at("blobs")) {
            DType dt = dtypeFromName(info.at("dtype").get<std::string>());
            auto shape = info.at("shape").get<std::vector<size_t>>();
            size_t n = info.at("nbytes").get<size_t>();
            if (n > bytes.size() - off) {
                error("%s: Truncated archive: blob %zu needs %zu bytes, %zu left",
                    __func__, ar.blobs.size(), n, bytes.size() - off);
            }
            std::vector<uint8_t> raw(bytes.begin() + off, bytes.begin() + off + n);
            if (swap) swapElements(raw, dtypeSize(dt));
            ar.blobs.push_back(NdArray::fromBytes(dt, std::move(shape), std::move(raw)));
            off += n;
        }
    } catch (const nlohmann::json::exception& e) {
        error("%s: Malformed archive header: %s", __func__, e.what());
    }
    if (off != bytes.size()) {
        warning("%s: %zu trailing bytes ignored", __func__, bytes.size() - off);
    }
    return ar;
}

void Archive::save(const std::string& path) const {
    std::vector<uint8_t> buf = pack();
    AtomicFile out(path);
    out.write(buf.data(), buf.size());
    out.commit();
    debug("%s: Wrote %s (%zu bytes, %zu arrays) to %s", __func__, doctype.c_str(), buf.size(), blobs.size(), path.c_str());
}

Archive Archive::open(const std::string& path, const std::string& expectedDoctype) {
    return unpack(readFileBytes(path), expectedDoctype);
}
