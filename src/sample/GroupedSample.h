#ifndef EQUITY_SAMPLE_GROUPED_SAMPLE_H
#define EQUITY_SAMPLE_GROUPED_SAMPLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "Table.h"

namespace Equity {

struct GroupedSampleOptions {
    int min_group_size = 30;   // Groups below this many valid observations are reported
    bool verbose = true;       // Echo diagnostics to std::cerr
};

// Immutable population of observations partitioned into labeled groups.
// Derived quantities (flat, n, nan_count) are computed once at construction.
class GroupedSample {
public:
    using Options = GroupedSampleOptions;

    GroupedSample(std::vector<std::string> groups,
                  std::vector<Eigen::ArrayXd> grouped_values,
                  Options opts = Options());

    GroupedSample(std::vector<std::string> groups,
                  const std::vector<std::vector<double>>& grouped_values,
                  Options opts = Options());

    // Group a flat table by `group_columns`, optionally drawing one uniform random
    // subsample of `sample_size` rows (without replacement) before grouping.
    // Without `seed` the draw is not reproducible.
    static GroupedSample from_table(const Table& table,
                                    const std::vector<std::string>& group_columns,
                                    const std::string& value_column,
                                    std::optional<long long> sample_size = std::nullopt,
                                    std::optional<std::uint64_t> seed = std::nullopt,
                                    Options opts = Options());

    const std::vector<std::string>& groups() const { return groups_; }
    const std::vector<Eigen::ArrayXd>& grouped_values() const { return grouped_values_; }
    const Eigen::ArrayXd& flat() const { return flat_; }

    Eigen::Index n() const { return flat_.size(); }
    Eigen::Index nan_count() const { return nan_count_; }
    Eigen::Index valid_count() const { return n() - nan_count_; }
    std::size_t group_count() const { return groups_.size(); }

    const Options& options() const { return opts_; }
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

private:
    void derive();
    void report(const std::string& msg);

    std::vector<std::string> groups_;
    std::vector<Eigen::ArrayXd> grouped_values_;
    Options opts_;

    Eigen::ArrayXd flat_;
    Eigen::Index nan_count_ = 0;
    std::vector<std::string> diagnostics_;
};

} // namespace Equity

#endif // EQUITY_SAMPLE_GROUPED_SAMPLE_H
