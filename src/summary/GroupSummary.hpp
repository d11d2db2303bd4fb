#pragma once
#include <limits>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../metrics/reductions.h"
#include "../sample/GroupedSample.h"

namespace Equity {

// Descriptive statistics per group, NaNs excluded
struct GroupSummary {
    std::string group;
    Eigen::Index n = 0;     // Valid observations
    double mean = std::numeric_limits<double>::quiet_NaN();
    double median = std::numeric_limits<double>::quiet_NaN();
    double sd = std::numeric_limits<double>::quiet_NaN(); // Sample standard deviation (N-1)
    double min = std::numeric_limits<double>::quiet_NaN();
    double max = std::numeric_limits<double>::quiet_NaN();
    bool suppressed = false; // Fewer than min_group_size observations; not for publication
};

inline std::vector<GroupSummary> summarize_groups(const GroupedSample& sample, int min_group_size) {
    std::vector<GroupSummary> out;
    out.reserve(sample.group_count());

    for (std::size_t i = 0; i < sample.group_count(); ++i) {
        const Eigen::ArrayXd& x = sample.grouped_values()[i];
        GroupSummary s;
        s.group = sample.groups()[i];
        s.n = Reduce::count_valid(x);
        s.mean = Reduce::mean(x);
        s.median = Reduce::median(x);
        s.sd = Reduce::sample_sd(x);
        s.min = Reduce::min(x);
        s.max = Reduce::max(x);
        s.suppressed = s.n < min_group_size;
        out.push_back(s);
    }
    return out;
}

inline std::vector<GroupSummary> summarize_groups(const GroupedSample& sample) {
    return summarize_groups(sample, sample.options().min_group_size);
}

} // namespace Equity
