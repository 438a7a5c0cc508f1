#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ndarray.hpp"

#define SPOTCALL_ARCHIVE_MAGIC "SPOTCALL"
#define SPOTCALL_ARCHIVE_MAGIC_LEN 8
#define SPOTCALL_FORMAT_VERSION 1

/*
 * Container layout:
 *   8 bytes  magic "SPOTCALL"
 *   8 bytes  header length L (uint64, little endian)
 *   L bytes  JSON header {"doctype", "version", "byteorder", "blobs": [{"dtype", "shape", "nbytes"}], ...}
 *   blobs    raw array bytes in the writer's "byteorder", concatenated in header order.
 *            Readers on the other byte order swap each element.
 */
struct Archive {
    std::string doctype;
    int32_t version = SPOTCALL_FORMAT_VERSION;
    nlohmann::json meta = nlohmann::json::object();  // document specific fields
    std::vector<NdArray> blobs;

    std::vector<uint8_t> pack() const;
    // Rejects a foreign doctype or a version newer than SPOTCALL_FORMAT_VERSION
    static Archive unpack(const std::vector<uint8_t>& bytes, const std::string& expectedDoctype);

    void save(const std::string& path) const;
    static Archive open(const std::string& path, const std::string& expectedDoctype);
};
