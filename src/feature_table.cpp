#include "feature_table.hpp"
#include "binary_mask.hpp"
#include "error.hpp"
#include "utils_sys.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <nlohmann/json.hpp>

FeatureTable FeatureTable::passing() const {
    std::vector<Feature> out;
    for (const auto& f : rows_) {
        if (f.passesThresholds) out.push_back(f);
    }
    return FeatureTable(std::move(out), log_);
}

size_t FeatureTable::countPassing() const {
    return static_cast<size_t>(std::count_if(rows_.begin(), rows_.end(),
        [](const Feature& f) { return f.passesThresholds; }));
}

Area FeatureTable::boundingArea() const {
    if (rows_.empty()) {
        error("%s: Empty feature table has no bounding area", __func__);
    }
    double xmin = rows_[0].xc, xmax = rows_[0].xc;
    double ymin = rows_[0].yc, ymax = rows_[0].yc;
    for (const auto& f : rows_) {
        xmin = std::min(xmin, f.xc);
        xmax = std::max(xmax, f.xc);
        ymin = std::min(ymin, f.yc);
        ymax = std::max(ymax, f.yc);
    }
    return Area(xmin, xmax, ymin, ymax);
}

FeatureTable FeatureTable::selectArea(const Area& area) const {
    std::vector<Feature> out;
    for (const auto& f : rows_) {
        if (area.containsStrictly(f.xc, f.yc)) out.push_back(f);
    }
    return FeatureTable(std::move(out), log_);
}

FeatureTable FeatureTable::removeArea(const Area& area) const {
    std::vector<Feature> out;
    for (const auto& f : rows_) {
        if (!area.containsStrictly(f.xc, f.yc)) out.push_back(f);
    }
    return FeatureTable(std::move(out), log_);
}

OverlapMap findOverlaps(const std::vector<FeatureTable>& tables) {
    std::vector<size_t> nonEmpty;
    std::vector<Area> areas;
    for (size_t i = 0; i < tables.size(); ++i) {
        if (tables[i].empty()) continue;
        nonEmpty.push_back(i);
        areas.push_back(tables[i].boundingArea());
    }
    OverlapMap out;
    for (const auto& kv : findOverlaps(areas)) {
        out.emplace(std::make_pair(nonEmpty[kv.first.first], nonEmpty[kv.first.second]), kv.second);
    }
    return out;
}

FeatureTable FeatureTable::concatenate(const std::vector<FeatureTable>& tables, OverlapStrategy strategy) {
    std::vector<std::vector<uint8_t>> drop(tables.size());
    for (size_t i = 0; i < tables.size(); ++i) {
        drop[i].assign(tables[i].size(), 0);
    }
    if (strategy == OverlapStrategy::TakeMax) {
        auto countInside = [](const FeatureTable& t, const Area& a) {
            return std::count_if(t.rows_.begin(), t.rows_.end(),
                [&a](const Feature& f) { return a.containsStrictly(f.xc, f.yc); });
        };
        OverlapMap overlaps = findOverlaps(tables);
        for (const auto& kv : overlaps) {
            const size_t i = kv.first.first;
            const size_t j = kv.first.second;
            const Area& a = kv.second;
            const auto ni = countInside(tables[i], a);
            const auto nj = countInside(tables[j], a);
            // ties go to the later table
            const size_t loser = (nj < ni) ? j : i;
            const auto& rows = tables[loser].rows_;
            for (size_t r = 0; r < rows.size(); ++r) {
                if (a.containsStrictly(rows[r].xc, rows[r].yc)) drop[loser][r] = 1;
            }
            debug("%s: Tables %zu and %zu overlap with %ld and %ld rows, dropping rows of table %zu",
                __func__, i, j, (long) ni, (long) nj, loser);
        }
    }
    std::vector<Feature> out;
    Log log;
    for (size_t i = 0; i < tables.size(); ++i) {
        const auto& rows = tables[i].rows_;
        for (size_t r = 0; r < rows.size(); ++r) {
            if (!drop[i][r]) out.push_back(rows[r]);
        }
        for (const auto& e : tables[i].log_.entries()) log.append(e);
    }
    return FeatureTable(std::move(out), std::move(log));
}

void FeatureTable::assignTargets(const BinaryMaskCollection& masks) {
    const Ticks& ticks = masks.ticks();
    const size_t nd = ticks.ndim();
    // pixel tick value -> array index, per axis
    std::vector<std::unordered_map<int32_t, size_t>> tick2idx(nd);
    for (size_t d = 0; d < nd; ++d) {
        const auto& px = ticks.axis(d).pixel;
        for (size_t i = 0; i < px.size(); ++i) tick2idx[d].emplace(px[i], i);
    }
    size_t nAssigned = 0;
    std::vector<size_t> pos(nd);
    for (auto& f : rows_) {
        f.cellId = -1;
        const int32_t coord3[3] = {f.z, f.y, f.x};
        bool inFrame = true;
        for (size_t d = 0; d < nd; ++d) {
            auto it = tick2idx[d].find(coord3[d + 3 - nd]);
            if (it == tick2idx[d].end()) {
                inFrame = false;
                break;
            }
            pos[d] = it->second;
        }
        if (!inFrame) continue;
        for (size_t m = 0; m < masks.size(); ++m) {
            if (masks.contains(m, pos)) {
                f.cellId = static_cast<int32_t>(m);
                ++nAssigned;
                break;
            }
        }
    }
    log_.append("FeatureTable.assignTargets", {{"n_masks", masks.size()}, {"n_assigned", nAssigned}});
    notice("Assigned %zu of %zu features to %zu masks", nAssigned, rows_.size(), masks.size());
}

ExpressionMatrix FeatureTable::toExpressionMatrix(const std::vector<std::string>& targets) const {
    ExpressionMatrix em;
    em.targets = targets;
    std::unordered_map<std::string, int32_t> target2col;
    for (size_t j = 0; j < targets.size(); ++j) target2col.emplace(targets[j], static_cast<int32_t>(j));
    std::map<int32_t, int32_t> cell2row;
    for (const auto& f : rows_) {
        if (f.passesThresholds && f.cellId >= 0) cell2row.emplace(f.cellId, 0);
    }
    for (auto& kv : cell2row) {
        kv.second = static_cast<int32_t>(em.cellIds.size());
        em.cellIds.push_back(kv.first);
    }
    em.counts = Eigen::MatrixXi::Zero(em.cellIds.size(), targets.size());
    for (const auto& f : rows_) {
        if (!f.passesThresholds || f.cellId < 0) continue;
        auto it = target2col.find(f.target);
        if (it == target2col.end()) continue;
        em.counts(cell2row[f.cellId], it->second) += 1;
    }
    return em;
}

void FeatureTable::writeTsv(const std::string& path) const {
    static const char* columns[] = {"xc", "yc", "zc", "x", "y", "z", "target", "distance",
        "passes_thresholds", "radius", "area", "cell_id"};
    nlohmann::json header;
    std::string buf = "#";
    for (size_t i = 0; i < sizeof(columns) / sizeof(columns[0]); ++i) {
        if (i > 0) buf += "\t";
        buf += columns[i];
        header[columns[i]] = i;
    }
    buf += "\n";
    for (const auto& f : rows_) {
        buf += formatString("%.4f\t%.4f\t%.4f\t%d\t%d\t%d\t%s\t%.4e\t%d\t%.4f\t%d\t%d\n",
            f.xc, f.yc, f.zc, f.x, f.y, f.z, f.target.c_str(), static_cast<double>(f.distance),
            f.passesThresholds ? 1 : 0, static_cast<double>(f.radius), f.area, f.cellId);
    }
    AtomicFile out(path);
    out.write(buf);
    out.commit();

    nlohmann::json meta;
    meta["columns"] = header;
    meta["n_rows"] = rows_.size();
    meta["n_passing"] = countPassing();
    meta["log"] = log_.toJson();
    AtomicFile jsonOut(path + ".json");
    jsonOut.write(meta.dump(2));
    jsonOut.commit();
    notice("Wrote %zu features to %s", rows_.size(), path.c_str());
}
