#include "GroupedSample.h"
#include "../Errors.hpp"
#include "../metrics/reductions.h"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <numeric>
#include <random>
#include <unordered_set>

namespace Equity {

namespace {

std::vector<Eigen::ArrayXd> to_arrays(const std::vector<std::vector<double>>& values) {
    std::vector<Eigen::ArrayXd> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.emplace_back(Eigen::Map<const Eigen::ArrayXd>(v.data(), static_cast<Eigen::Index>(v.size())));
    }
    return out;
}

} // namespace

GroupedSample::GroupedSample(std::vector<std::string> groups,
                             std::vector<Eigen::ArrayXd> grouped_values,
                             Options opts)
    : groups_(std::move(groups)), grouped_values_(std::move(grouped_values)), opts_(opts)
{
    if (groups_.size() != grouped_values_.size()) {
        throw ConstructionError("GroupedSample: " + std::to_string(groups_.size()) + " group labels but " +
                                std::to_string(grouped_values_.size()) + " value arrays");
    }

    std::unordered_set<std::string> seen;
    for (const auto& g : groups_) {
        if (!seen.insert(g).second) {
            throw ConstructionError("GroupedSample: duplicate group label '" + g + "'");
        }
    }

    derive();
}

GroupedSample::GroupedSample(std::vector<std::string> groups,
                             const std::vector<std::vector<double>>& grouped_values,
                             Options opts)
    : GroupedSample(std::move(groups), to_arrays(grouped_values), opts) {}

void GroupedSample::report(const std::string& msg) {
    diagnostics_.push_back(msg);
    if (opts_.verbose) {
        std::cerr << "[WARN][Equity::Sample] " << msg << std::endl;
    }
}

void GroupedSample::derive() {
    // 1. Flatten (group order, then row order)
    flat_ = Reduce::concatenate(grouped_values_);
    nan_count_ = Reduce::count_nan(flat_);

    // 2. Missing values
    if (nan_count_ > 0) {
        report(std::to_string(nan_count_) + " of " + std::to_string(n()) +
               " observations are NaN and are excluded from every reduction. "
               "Results may be biased if values are not missing at random.");
    }

    // 3. Small groups
    std::vector<std::string> small;
    for (std::size_t i = 0; i < groups_.size(); ++i) {
        if (Reduce::count_valid(grouped_values_[i]) < opts_.min_group_size) {
            small.push_back(groups_[i]);
        }
    }
    if (!small.empty()) {
        std::string names;
        for (const auto& s : small) {
            if (!names.empty()) names += ", ";
            names += s;
        }
        report(std::to_string(small.size()) + " group(s) have fewer than " +
               std::to_string(opts_.min_group_size) + " valid observations: " + names);
    }
}

GroupedSample GroupedSample::from_table(const Table& table,
                                        const std::vector<std::string>& group_columns,
                                        const std::string& value_column,
                                        std::optional<long long> sample_size,
                                        std::optional<std::uint64_t> seed,
                                        Options opts) {
    Table::GroupedRows grouped;

    if (sample_size) {
        long long total = static_cast<long long>(table.rows());
        if (*sample_size <= 0 || *sample_size > total) {
            throw ConfigurationError("sample_size must be a positive integer no larger than the row count (" +
                                     std::to_string(total) + "), got " + std::to_string(*sample_size));
        }

        std::uint64_t s = seed ? *seed : static_cast<std::uint64_t>(std::random_device{}());
        std::mt19937_64 rng(s);

        std::vector<std::size_t> all(table.rows());
        std::iota(all.begin(), all.end(), std::size_t{0});
        std::vector<std::size_t> chosen;
        chosen.reserve(static_cast<std::size_t>(*sample_size));
        std::sample(all.begin(), all.end(), std::back_inserter(chosen),
                    static_cast<std::size_t>(*sample_size), rng);

        if (opts.verbose) {
            std::clog << "[Equity::Sample] Drew " << chosen.size() << " of " << total << " rows"
                      << (seed ? " (seed " + std::to_string(*seed) + ")" : " (unseeded)") << std::endl;
        }
        grouped = table.group_by(group_columns, value_column, &chosen);
    } else {
        grouped = table.group_by(group_columns, value_column);
    }

    std::vector<std::string> labels;
    std::vector<Eigen::ArrayXd> values;
    labels.reserve(grouped.size());
    values.reserve(grouped.size());
    for (auto& [label, vals] : grouped) {
        labels.push_back(std::move(label));
        values.emplace_back(Eigen::Map<const Eigen::ArrayXd>(vals.data(), static_cast<Eigen::Index>(vals.size())));
    }
    return GroupedSample(std::move(labels), std::move(values), opts);
}

} // namespace Equity
