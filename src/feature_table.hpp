#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "area.hpp"
#include "provenance.hpp"

class BinaryMaskCollection;

#define SPOTCALL_NO_CALL "nan"

// One decoded spot or pixel cluster
struct Feature {
    double xc = 0, yc = 0, zc = 0;   // physical
    int32_t x = 0, y = 0, z = 0;     // pixel
    std::string target = SPOTCALL_NO_CALL;
    float distance = std::numeric_limits<float>::quiet_NaN();
    bool passesThresholds = false;
    float radius = std::numeric_limits<float>::quiet_NaN();
    int32_t area = 0;                // pixels in the cluster, 0 for spots
    int32_t cellId = -1;
};

enum class OverlapStrategy : uint8_t {
    None,    // keep every row
    TakeMax  // inside an overlap keep the table with more rows there
};

// Cell x target counts of passing, assigned features
struct ExpressionMatrix {
    std::vector<int32_t> cellIds;
    std::vector<std::string> targets;
    Eigen::MatrixXi counts;
};

/// Table of decoded features, append-only while it is being built
class FeatureTable {
public:
    FeatureTable() = default;
    explicit FeatureTable(std::vector<Feature> rows, Log log = Log()) : rows_(std::move(rows)), log_(std::move(log)) {}

    void append(Feature f) { rows_.push_back(std::move(f)); }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    const Feature& at(size_t i) const { return rows_.at(i); }
    const std::vector<Feature>& rows() const { return rows_; }
    std::vector<Feature>::const_iterator begin() const { return rows_.begin(); }
    std::vector<Feature>::const_iterator end() const { return rows_.end(); }
    const Log& log() const { return log_; }
    Log& log() { return log_; }

    FeatureTable passing() const;
    size_t countPassing() const;

    // Min/max of the physical x and y coordinates; the table must not be empty
    Area boundingArea() const;
    // Rows strictly inside `area`
    FeatureTable selectArea(const Area& area) const;
    // Rows not strictly inside `area`
    FeatureTable removeArea(const Area& area) const;

    static FeatureTable concatenate(const std::vector<FeatureTable>& tables,
        OverlapStrategy strategy = OverlapStrategy::None);

    // Set cellId to the index of the first mask containing each feature's
    // pixel position, -1 if none does
    void assignTargets(const BinaryMaskCollection& masks);
    // Columns follow `targets`; rows are the distinct non-negative cell ids
    ExpressionMatrix toExpressionMatrix(const std::vector<std::string>& targets) const;

    // Tab separated rows with a '#' header, plus `path`.json describing them
    void writeTsv(const std::string& path) const;

private:
    std::vector<Feature> rows_;
    Log log_;
};

// Pairwise intersections of the tables' bounding areas; empty tables are skipped
OverlapMap findOverlaps(const std::vector<FeatureTable>& tables);
