#include <gtest/gtest.h>
#include <cstdio>
#include <thread>
#include <unistd.h>
#include "archive.hpp"
#include "binary_mask.hpp"

namespace {

std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + "spotcall_" + std::to_string(::getpid()) + "_" + name;
}

// 5x5 with label 1 on row 0 and label 2 on rows/cols 3-4, [4, 4] cleared
NdArray twoRegionLabels() {
    NdArray arr(DType::Int32, {5, 5});
    for (size_t x = 0; x < 5; ++x) arr.at<int32_t>(0, x) = 1;
    for (size_t y = 3; y < 5; ++y) {
        for (size_t x = 3; x < 5; ++x) arr.at<int32_t>(y, x) = 2;
    }
    arr.at<int32_t>(4, 4) = 0;
    return arr;
}

TickInput twoRegionTicks() {
    TickInput in;
    in.yc = std::vector<double>{1.2, 2.4, 3.6, 4.8, 6.0};
    in.xc = std::vector<double>{7.2, 8.4, 9.6, 10.8, 12};
    return in;
}

BinaryMaskCollection twoRegionMasks() {
    return BinaryMaskCollection::fromLabelArrayAndTicks(twoRegionLabels(), twoRegionTicks());
}

NdArray boolArray(std::vector<size_t> shape, const std::vector<bool>& values) {
    return NdArray::fromBools(std::move(shape), values);
}

} // namespace

TEST(BinaryMaskCollection, FromLabelImage) {
    BinaryMaskCollection masks = twoRegionMasks();
    ASSERT_EQ(masks.size(), 2u);
    EXPECT_EQ(masks.maxShape(), (std::vector<size_t>{5, 5}));

    Mask m0 = masks.mask(0);
    Mask m1 = masks.mask(1);
    EXPECT_EQ(m0.name, "0");
    EXPECT_EQ(m1.name, "1");

    EXPECT_EQ(m0.data, boolArray({1, 5}, {true, true, true, true, true}));
    EXPECT_EQ(m1.data, boolArray({2, 2}, {true, true, true, false}));

    EXPECT_EQ(m0.ticks.y.pixel, (std::vector<int32_t>{0}));
    EXPECT_EQ(m0.ticks.x.pixel, (std::vector<int32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(m1.ticks.y.pixel, (std::vector<int32_t>{3, 4}));
    EXPECT_EQ(m1.ticks.x.pixel, (std::vector<int32_t>{3, 4}));

    EXPECT_EQ(m0.ticks.y.physical, (std::vector<double>{1.2}));
    EXPECT_EQ(m0.ticks.x.physical, (std::vector<double>{7.2, 8.4, 9.6, 10.8, 12}));
    EXPECT_EQ(m1.ticks.y.physical, (std::vector<double>{4.8, 6.0}));
    EXPECT_EQ(m1.ticks.x.physical, (std::vector<double>{10.8, 12}));
    EXPECT_EQ(m1.offsets, (std::vector<size_t>{3, 3}));
}

TEST(BinaryMaskCollection, OneMaskPerDistinctLabel) {
    // sparse label values still give dense indices in ascending label order
    NdArray arr = NdArray::fromValues<uint8_t>({2, 4}, {9, 0, 3, 3, 0, 0, 0, 200});
    TickInput in;
    in.yc = std::vector<double>{0, 1};
    in.xc = std::vector<double>{0, 1, 2, 3};
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(arr, in);
    ASSERT_EQ(masks.size(), 3u);
    EXPECT_EQ(masks.maskData(0).offsets, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(masks.maskData(1).offsets, (std::vector<size_t>{0, 0}));
    EXPECT_EQ(masks.maskData(2).offsets, (std::vector<size_t>{1, 3}));
}

TEST(BinaryMaskCollection, NamesArePadded) {
    NdArray arr(DType::UInt16, {1, 12});
    for (size_t x = 0; x < 12; ++x) arr.at<uint16_t>(0, x) = static_cast<uint16_t>(x + 1);
    TickInput in;
    in.yc = std::vector<double>{0};
    in.xc = std::vector<double>(12, 0.0);
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(arr, in);
    EXPECT_EQ(masks.mask(0).name, "00");
    EXPECT_EQ(masks.mask(11).name, "11");
}

TEST(BinaryMaskCollection, ToLabelImage) {
    NdArray arr(DType::Int32, {5, 6});
    for (size_t x = 0; x < 6; ++x) arr.at<int32_t>(0, x) = 1;
    for (size_t y = 3; y < 5; ++y) {
        for (size_t x = 3; x < 6; ++x) arr.at<int32_t>(y, x) = 2;
    }
    arr.at<int32_t>(4, 5) = 0;
    TickInput in;
    in.yc = std::vector<double>{1.2, 2.4, 3.6, 4.8, 6.0};
    in.xc = std::vector<double>{7.2, 8.4, 9.6, 10.8, 12, 15.5};
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(arr, in);

    LabelImage back = masks.toLabelImage();
    ASSERT_EQ(back.shape(), arr.shape());
    EXPECT_EQ(back.array().dtype(), DType::UInt16);
    for (size_t i = 0; i < arr.size(); ++i) {
        EXPECT_EQ(back.array().intAt(i), arr.intAt(i)) << "element " << i;
    }
    EXPECT_EQ(back.ticks(), masks.ticks());
}

TEST(BinaryMaskCollection, SaveAndLoad) {
    BinaryMaskCollection masks = twoRegionMasks();
    const std::string path = tempPath("masks.bin");
    masks.save(path);
    BinaryMaskCollection loaded = BinaryMaskCollection::fromDisk(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), masks.size());
    EXPECT_EQ(loaded.ticks(), masks.ticks());
    for (size_t i = 0; i < masks.size(); ++i) {
        Mask a = masks.mask(i);
        Mask b = loaded.mask(i);
        EXPECT_EQ(a.data, b.data);
        EXPECT_EQ(a.offsets, b.offsets);
        EXPECT_EQ(a.ticks, b.ticks);
    }
    // cached props from extraction agree with the lazily computed ones
    for (size_t i = 0; i < masks.size(); ++i) {
        EXPECT_EQ(masks.maskRegionProps(i), loaded.maskRegionProps(i));
    }
}

TEST(BinaryMaskCollection, RegionProps) {
    BinaryMaskCollection masks = twoRegionMasks();
    const RegionProperties& p = masks.maskRegionProps(1);
    EXPECT_EQ(p.label, 2);
    EXPECT_EQ(p.area, 3u);
    EXPECT_EQ(p.bboxMin, (std::vector<size_t>{3, 3}));
    EXPECT_EQ(p.bboxMax, (std::vector<size_t>{5, 5}));
    ASSERT_EQ(p.centroid.size(), 2u);
    EXPECT_DOUBLE_EQ(p.centroid[0], 10.0 / 3.0);
    EXPECT_DOUBLE_EQ(p.centroid[1], 10.0 / 3.0);
    EXPECT_EQ(p.image, masks.mask(1).data);
    // same object on repeated access
    EXPECT_EQ(&p, &masks.maskRegionProps(1));
}

TEST(BinaryMaskCollection, ConcurrentRegionProps) {
    std::vector<NdArray> arrays;
    for (size_t k = 0; k < 4; ++k) {
        NdArray a(DType::Bool, {8, 8});
        for (size_t y = k; y < k + 3; ++y) a.at<bool>(y, k + 1) = true;
        arrays.push_back(std::move(a));
    }
    TickInput in;
    in.yc = std::vector<double>(8, 0.0);
    in.xc = std::vector<double>(8, 0.0);
    BinaryMaskCollection masks = BinaryMaskCollection::fromBinaryArraysAndTicks(arrays, in);

    std::vector<const RegionProperties*> seen(8, nullptr);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < seen.size(); ++t) {
        workers.emplace_back([&masks, &seen, t]() { seen[t] = &masks.maskRegionProps(t % 4); });
    }
    for (auto& w : workers) w.join();
    for (size_t t = 0; t < seen.size(); ++t) {
        EXPECT_EQ(seen[t], &masks.maskRegionProps(t % 4));
        EXPECT_EQ(seen[t]->area, 3u);
        EXPECT_EQ(seen[t]->label, static_cast<int64_t>(t % 4 + 1));
    }
}

TEST(BinaryMaskCollection, CropUncropInverse) {
    BinaryMaskCollection masks = twoRegionMasks();
    for (size_t i = 0; i < masks.size(); ++i) {
        Mask cropped = masks.mask(i);
        Mask full = masks.uncroppedMask(i);
        EXPECT_EQ(full.data.shape(), masks.maxShape());
        EXPECT_EQ(full.ticks, masks.ticks());
        EXPECT_EQ(full.data.crop(cropped.offsets, cropped.data.shape()), cropped.data);

        BinaryMaskCollection again = BinaryMaskCollection::fromBinaryArraysAndTicks(
            {full.data}, twoRegionTicks());
        EXPECT_EQ(again.mask(0).data, cropped.data);
        EXPECT_EQ(again.mask(0).offsets, cropped.offsets);
    }
}

TEST(BinaryMaskCollection, FromBinaryArrays) {
    TickInput in;
    in.yc = std::vector<double>{0.5, 1.5};
    in.xc = std::vector<double>{0.5, 1.5, 2.5};
    std::vector<NdArray> arrays = {
        boolArray({2, 3}, {true, false, false, false, true, true}),
        boolArray({2, 3}, {false, false, false, false, false, true}),
    };
    BinaryMaskCollection masks = BinaryMaskCollection::fromBinaryArraysAndTicks(arrays, in);
    ASSERT_EQ(masks.size(), 2u);
    EXPECT_EQ(masks.mask(0).data, arrays[0]);
    EXPECT_EQ(masks.mask(1).data, boolArray({1, 1}, {true}));
    EXPECT_EQ(masks.mask(1).offsets, (std::vector<size_t>{1, 2}));
    EXPECT_EQ(masks.mask(1).ticks.x.physical, (std::vector<double>{2.5}));
    EXPECT_TRUE(masks.contains(0, {1, 1}));
    EXPECT_FALSE(masks.contains(0, {0, 1}));
    EXPECT_FALSE(masks.contains(1, {0, 0}));
}

TEST(BinaryMaskCollection, FromBinaryArrays3D) {
    TickInput in;
    in.zc = std::vector<double>{0.5, 1.5};
    in.yc = std::vector<double>{1.5, 2.5, 3.5};
    in.xc = std::vector<double>{42.5};
    in.z = std::vector<int32_t>{0, 1};
    in.y = std::vector<int32_t>{1, 2, 3};
    in.x = std::vector<int32_t>{42};
    std::vector<NdArray> arrays = {boolArray({2, 3, 1}, {true, false, false, false, true, true})};
    BinaryMaskCollection masks = BinaryMaskCollection::fromBinaryArraysAndTicks(arrays, in);
    EXPECT_EQ(masks.ndim(), 3u);
    EXPECT_EQ(masks.mask(0).ticks.y.pixel, (std::vector<int32_t>{1, 2, 3}));
    EXPECT_EQ(masks.maskRegionProps(0).area, 3u);
}

TEST(BinaryMaskCollection, RejectsInvalidBinaryArrays) {
    TickInput in;
    in.yc = std::vector<double>{0.5, 1.5};
    in.xc = std::vector<double>{0.5, 1.5, 2.5};
    std::vector<NdArray> ints = {NdArray::fromValues<int32_t>({2, 3}, {1, 2, 3, 4, 5, 6})};
    EXPECT_THROW(BinaryMaskCollection::fromBinaryArraysAndTicks(ints, in), TypeMismatchError);

    std::vector<NdArray> rank1 = {boolArray({3}, {true, false, true})};
    EXPECT_THROW(BinaryMaskCollection::fromBinaryArraysAndTicks(rank1, in), TypeMismatchError);

    std::vector<NdArray> mixed = {boolArray({2, 3}, std::vector<bool>(6, true)),
                                  boolArray({3, 2}, std::vector<bool>(6, true))};
    EXPECT_THROW(BinaryMaskCollection::fromBinaryArraysAndTicks(mixed, in), ShapeError);

    TickInput noX;
    noX.yc = in.yc;
    std::vector<NdArray> ok = {boolArray({2, 3}, std::vector<bool>(6, true))};
    EXPECT_THROW(BinaryMaskCollection::fromBinaryArraysAndTicks(ok, noX), MissingCoordinateError);
}

TEST(BinaryMaskCollection, AllFalseArrayCropsToNothing) {
    TickInput in;
    in.yc = std::vector<double>{0, 1};
    in.xc = std::vector<double>{0, 1};
    std::vector<NdArray> arrays = {NdArray(DType::Bool, {2, 2})};
    BinaryMaskCollection masks = BinaryMaskCollection::fromBinaryArraysAndTicks(arrays, in);
    ASSERT_EQ(masks.size(), 1u);
    EXPECT_EQ(masks.mask(0).data.shape(), (std::vector<size_t>{0, 0}));
    EXPECT_EQ(masks.uncroppedMask(0).data, NdArray(DType::Bool, {2, 2}));
    const RegionProperties& p = masks.maskRegionProps(0);
    EXPECT_EQ(p.area, 0u);
    EXPECT_TRUE(p.centroid.empty());
    EXPECT_EQ(masks.toLabelImage().array(), NdArray(DType::UInt16, {2, 2}));
}

TEST(BinaryMaskCollection, IndexOutOfRange) {
    BinaryMaskCollection masks = twoRegionMasks();
    EXPECT_THROW(masks.mask(2), std::out_of_range);
    EXPECT_THROW(masks.uncroppedMask(5), std::out_of_range);
    EXPECT_THROW(masks.maskRegionProps(2), std::out_of_range);
}

TEST(BinaryMaskCollection, KeepsLog) {
    Log log;
    log.append("Segment", {{"method", "watershed"}});
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(
        twoRegionLabels(), twoRegionTicks(), log);
    EXPECT_EQ(masks.log(), log);
    BinaryMaskCollection back = BinaryMaskCollection::fromBytes(masks.toBytes());
    EXPECT_EQ(back.log(), log);
    EXPECT_EQ(back.toLabelImage().log(), log);
}

TEST(BinaryMaskCollection, MalformedMetadataIsRuntimeError) {
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(twoRegionLabels(), twoRegionTicks());
    Archive ar = Archive::unpack(masks.toBytes(), SPOTCALL_MASK_COLLECTION_DOCTYPE);
    ASSERT_EQ(ar.blobs.size(), 2u);

    Archive noOffsets = ar;
    noOffsets.meta.erase("offsets");
    EXPECT_THROW(BinaryMaskCollection::fromBytes(noOffsets.pack()), std::runtime_error);

    Archive badOffsets = ar;
    badOffsets.meta["offsets"][1] = "3,3";
    EXPECT_THROW(BinaryMaskCollection::fromBytes(badOffsets.pack()), std::runtime_error);

    Archive noTicks = ar;
    noTicks.meta.erase("ticks");
    EXPECT_THROW(BinaryMaskCollection::fromBytes(noTicks.pack()), std::runtime_error);
}
