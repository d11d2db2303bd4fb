#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../sample/GroupedSample.h"
#include "../sample/Table.h"
#include "../summary/GroupSummary.hpp"

namespace Equity {
namespace detail {

// Per-group descriptive statistics of one value column, optionally restricted to `rows`
inline std::vector<GroupSummary> summarize_column(const Table& table,
                                                  const std::vector<std::string>& group_columns,
                                                  const std::string& column,
                                                  const GroupedSample::Options& opts,
                                                  const std::vector<std::size_t>* rows = nullptr) {
    Table::GroupedRows grouped = table.group_by(group_columns, column, rows);
    std::vector<std::string> labels;
    std::vector<std::vector<double>> values;
    labels.reserve(grouped.size());
    values.reserve(grouped.size());
    for (auto& g : grouped) {
        labels.push_back(std::move(g.first));
        values.push_back(std::move(g.second));
    }
    GroupedSample sample(std::move(labels), values, opts);
    return summarize_groups(sample, opts.min_group_size);
}

// Copy of `table` with one more value column
inline Table with_column(const Table& table, const std::string& name, std::vector<double> values) {
    Table out = table;
    out.add_value_column(name, std::move(values));
    return out;
}

} // namespace detail
} // namespace Equity
