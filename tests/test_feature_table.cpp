#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include "binary_mask.hpp"
#include "feature_table.hpp"

namespace {

std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + "spotcall_" + std::to_string(::getpid()) + "_" + name;
}

// n rows spread evenly along the diagonal of `area`
FeatureTable diagonalTable(const Area& area, size_t n) {
    FeatureTable t;
    for (size_t i = 0; i < n; ++i) {
        const double f = n > 1 ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
        Feature row;
        row.xc = area.xmin + f * (area.xmax - area.xmin);
        row.yc = area.ymin + f * (area.ymax - area.ymin);
        row.target = "ACTB";
        row.passesThresholds = true;
        t.append(row);
    }
    return t;
}

Feature spot(int32_t y, int32_t x, const std::string& target, bool passes = true) {
    Feature f;
    f.y = y;
    f.x = x;
    f.target = target;
    f.passesThresholds = passes;
    return f;
}

} // namespace

TEST(FeatureTable, AppendAndPassing) {
    FeatureTable t;
    t.append(spot(0, 0, "A"));
    t.append(spot(0, 1, SPOTCALL_NO_CALL, false));
    EXPECT_EQ(t.size(), 2u);
    EXPECT_EQ(t.countPassing(), 1u);
    EXPECT_EQ(t.passing().size(), 1u);
    EXPECT_EQ(t.at(1).cellId, -1);
    EXPECT_THROW(t.at(2), std::out_of_range);
}

TEST(FeatureTable, BoundingAreaAndSelection) {
    FeatureTable t = diagonalTable(Area(0, 2, 0, 2), 10);
    EXPECT_EQ(t.boundingArea(), Area(0, 2, 0, 2));

    Area overlap(1, 2, 1, 3);
    FeatureTable inside = t.selectArea(overlap);
    FeatureTable outside = t.removeArea(overlap);
    EXPECT_EQ(inside.size() + outside.size(), t.size());
    for (const auto& f : inside) {
        EXPECT_GT(f.xc, 1.0);
        EXPECT_LT(f.xc, 2.0);
    }
    for (const auto& f : outside) {
        EXPECT_FALSE(overlap.containsStrictly(f.xc, f.yc));
    }
    EXPECT_THROW(FeatureTable().boundingArea(), std::runtime_error);
}

TEST(FeatureTable, FindOverlapsSkipsEmptyTables) {
    std::vector<FeatureTable> tables = {
        diagonalTable(Area(0, 1, 0, 1), 10),
        FeatureTable(),
        diagonalTable(Area(0.5, 2, 0.5, 1.5), 10),
    };
    OverlapMap overlaps = findOverlaps(tables);
    ASSERT_EQ(overlaps.size(), 1u);
    EXPECT_EQ(overlaps.at({0, 2}), Area(0.5, 1, 0.5, 1));
}

TEST(FeatureTable, TakeMaxKeepsDenserTable) {
    FeatureTable a = diagonalTable(Area(0, 2, 0, 2), 10);
    FeatureTable b = diagonalTable(Area(1, 2, 1, 3), 20);
    FeatureTable merged = FeatureTable::concatenate({a, b}, OverlapStrategy::TakeMax);
    EXPECT_EQ(merged.size(), 26u);

    // every row of the denser table survives
    size_t fromB = 0;
    for (const auto& f : merged) {
        for (const auto& g : b) {
            if (f.xc == g.xc && f.yc == g.yc) {
                ++fromB;
                break;
            }
        }
    }
    EXPECT_EQ(fromB, 20u);
}

TEST(FeatureTable, ConcatenateWithoutStrategyKeepsEverything) {
    FeatureTable a = diagonalTable(Area(0, 2, 0, 2), 10);
    FeatureTable b = diagonalTable(Area(1, 2, 1, 3), 20);
    EXPECT_EQ(FeatureTable::concatenate({a, b}).size(), 30u);
}

TEST(FeatureTable, DisjointTablesAreConserved) {
    FeatureTable a = diagonalTable(Area(0, 1, 0, 1), 7);
    FeatureTable b = diagonalTable(Area(5, 6, 5, 6), 4);
    a.log().append("MetricDistance", {{"distance_threshold", 0.5}});
    FeatureTable merged = FeatureTable::concatenate({a, b}, OverlapStrategy::TakeMax);
    ASSERT_EQ(merged.size(), 11u);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(merged.at(i).xc, a.at(i).xc);
        EXPECT_EQ(merged.at(i).yc, a.at(i).yc);
    }
    for (size_t i = 0; i < b.size(); ++i) {
        EXPECT_EQ(merged.at(a.size() + i).xc, b.at(i).xc);
    }
    EXPECT_EQ(merged.log().size(), 1u);
}

TEST(FeatureTable, AssignTargets) {
    NdArray labels(DType::Int32, {4, 4});
    labels.at<int32_t>(0, 0) = 1;
    labels.at<int32_t>(0, 1) = 1;
    labels.at<int32_t>(3, 3) = 2;
    TickInput in;
    in.y = std::vector<int32_t>{10, 11, 12, 13};
    in.x = std::vector<int32_t>{20, 21, 22, 23};
    in.yc = std::vector<double>{0, 1, 2, 3};
    in.xc = std::vector<double>{0, 1, 2, 3};
    BinaryMaskCollection masks = BinaryMaskCollection::fromLabelArrayAndTicks(labels, in);

    FeatureTable t;
    t.append(spot(10, 21, "A"));
    t.append(spot(13, 23, "B"));
    t.append(spot(12, 22, "A"));
    t.append(spot(0, 0, "A"));  // outside the frame
    t.assignTargets(masks);

    EXPECT_EQ(t.at(0).cellId, 0);
    EXPECT_EQ(t.at(1).cellId, 1);
    EXPECT_EQ(t.at(2).cellId, -1);
    EXPECT_EQ(t.at(3).cellId, -1);
    EXPECT_EQ(t.log().entries().back().method, "FeatureTable.assignTargets");
}

TEST(FeatureTable, ExpressionMatrix) {
    std::vector<Feature> rows = {spot(0, 0, "A"), spot(0, 0, "A"), spot(0, 0, "B"), spot(0, 0, "B", false),
                                 spot(0, 0, "A"), spot(0, 0, "C")};
    rows[0].cellId = 3;
    rows[1].cellId = 3;
    rows[2].cellId = 1;
    rows[3].cellId = 1;
    rows[4].cellId = -1;
    rows[5].cellId = 1;
    FeatureTable t(rows);
    ExpressionMatrix em = t.toExpressionMatrix({"A", "B"});
    EXPECT_EQ(em.cellIds, (std::vector<int32_t>{1, 3}));
    ASSERT_EQ(em.counts.rows(), 2);
    ASSERT_EQ(em.counts.cols(), 2);
    EXPECT_EQ(em.counts(0, 0), 0);
    EXPECT_EQ(em.counts(0, 1), 1);
    EXPECT_EQ(em.counts(1, 0), 2);
    EXPECT_EQ(em.counts(1, 1), 0);
}

TEST(FeatureTable, WriteTsv) {
    FeatureTable t;
    Feature f = spot(2, 3, "ACTB");
    f.xc = 1.5;
    f.yc = 2.5;
    f.distance = 0.25f;
    t.append(f);
    t.append(spot(4, 5, SPOTCALL_NO_CALL, false));
    t.log().append("PerRoundMaxChannel", {{"method", "per_round_max"}});

    const std::string path = tempPath("features.tsv");
    t.writeTsv(path);

    std::ifstream in(path);
    std::string header, line1, line2;
    std::getline(in, header);
    std::getline(in, line1);
    std::getline(in, line2);
    EXPECT_EQ(header.rfind("#xc\tyc\tzc\tx\ty\tz\ttarget", 0), 0u);
    EXPECT_NE(line1.find("\tACTB\t"), std::string::npos);
    EXPECT_NE(line2.find("\tnan\t"), std::string::npos);

    std::ifstream js(path + ".json");
    nlohmann::json meta = nlohmann::json::parse(js);
    EXPECT_EQ(meta.at("n_rows").get<size_t>(), 2u);
    EXPECT_EQ(meta.at("n_passing").get<size_t>(), 1u);
    EXPECT_EQ(meta.at("columns").at("target").get<int>(), 6);
    EXPECT_EQ(meta.at("log").size(), 1u);

    std::remove(path.c_str());
    std::remove((path + ".json").c_str());
}
