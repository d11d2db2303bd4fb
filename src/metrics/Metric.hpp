#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../Errors.hpp"
#include "../sample/GroupedSample.h"
#include "../sample/Table.h"
#include "GiniDecomposition.hpp"
#include "ThielL.hpp"
#include "ThielT.hpp"
#include "VarianceDecomposition.hpp"

namespace Equity {

enum class MetricKind { ThielT, ThielL, Variance, Gini };

// Four independent value types behind one contract
using Metric = std::variant<ThielT, ThielL, VarianceDecomposition, GiniDecomposition>;

inline MetricKind parse_metric_kind(const std::string& name) {
    if (name == "theil_t") return MetricKind::ThielT;
    if (name == "theil_l") return MetricKind::ThielL;
    if (name == "variance") return MetricKind::Variance;
    if (name == "gini") return MetricKind::Gini;
    throw ConfigurationError("Unknown metric '" + name + "' (expected theil_t, theil_l, variance or gini)");
}

inline const char* to_string(MetricKind kind) {
    switch (kind) {
        case MetricKind::ThielT:   return "theil_t";
        case MetricKind::ThielL:   return "theil_l";
        case MetricKind::Variance: return "variance";
        case MetricKind::Gini:     return "gini";
    }
    return "unknown";
}

inline Metric make_metric(MetricKind kind, GroupedSample sample,
                          MetricBase::Options opts = MetricBase::Options()) {
    switch (kind) {
        case MetricKind::ThielT:   return ThielT(std::move(sample), opts);
        case MetricKind::ThielL:   return ThielL(std::move(sample), opts);
        case MetricKind::Variance: return VarianceDecomposition(std::move(sample), opts);
        case MetricKind::Gini:     return GiniDecomposition(std::move(sample), opts);
    }
    throw ConfigurationError("Unhandled metric kind");
}

// Convenience constructor from a flat table. Every call builds its own sample,
// so the returned metric shares nothing with any other instance.
template <typename M>
M metric_from_table(const Table& table,
                    const std::vector<std::string>& group_columns,
                    const std::string& value_column,
                    std::optional<long long> sample_size = std::nullopt,
                    std::optional<std::uint64_t> seed = std::nullopt,
                    GroupedSample::Options sample_opts = GroupedSample::Options(),
                    MetricBase::Options metric_opts = MetricBase::Options()) {
    return M(GroupedSample::from_table(table, group_columns, value_column, sample_size, seed, sample_opts),
             metric_opts);
}

inline const DecompositionResult& calculate(Metric& metric) {
    return std::visit([](auto& m) -> const DecompositionResult& { return m.calculate(); }, metric);
}

inline const MetricBase& base_of(const Metric& metric) {
    return std::visit([](const auto& m) -> const MetricBase& { return m; }, metric);
}

} // namespace Equity
