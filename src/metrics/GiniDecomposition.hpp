#pragma once
#include <algorithm>
#include <limits>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../Errors.hpp"
#include "MetricBase.hpp"
#include "reductions.h"

namespace Equity {

// Gini of a single array: sum_i sum_j |x_i - x_j| / (2 n^2 mean), NaNs excluded.
// The double sum is evaluated from the order statistics,
//   sum_i sum_j |x_i - x_j| = 2 * sum_k (2k - n - 1) x_(k),  k = 1..n
// Throws DomainError when the mean is zero. Empty input gives NaN.
inline double gini_index(const Eigen::ArrayXd& values) {
    Eigen::ArrayXd x = Reduce::valid(values);
    const Eigen::Index n = x.size();
    if (n == 0) return std::numeric_limits<double>::quiet_NaN();

    const double mu = x.mean();
    if (mu == 0.0) {
        throw DomainError("Gini index is undefined for values with zero mean");
    }

    std::vector<double> sorted(x.data(), x.data() + n);
    std::sort(sorted.begin(), sorted.end());

    double acc = 0.0;
    for (Eigen::Index k = 0; k < n; ++k) {
        acc += static_cast<double>(2 * (k + 1) - n - 1) * sorted[k];
    }
    const double nd = static_cast<double>(n);
    return (2.0 * acc) / (2.0 * nd * nd * mu);
}

// Gini decomposition for non-negative, income-like values.
//   within  = sum Gini(group_i) * value_share_i * population_share_i
//   between = Gini of the array where each observation is replaced by its group mean
//   overall = Gini(all observations)
// Gini is not exactly decomposable: residual = overall - within - between is the
// overlap between group distributions, zero only when group ranges do not overlap.
class GiniDecomposition : public MetricBase {
public:
    using MetricBase::MetricBase;

    const char* name() const override { return "gini"; }

protected:
    void check_domain() const override {
        const GroupedSample& s = sample();
        if (s.valid_count() == 0) {
            throw DomainError("Gini: sample has no valid (non-NaN) observations");
        }
        if (Reduce::mean(s.flat()) == 0.0) {
            throw DomainError("Gini index is undefined for values with zero mean");
        }
    }

    DecompositionResult compute() const override {
        const GroupedSample& s = sample();
        const double total = Reduce::sum(s.flat());
        const double n_all = static_cast<double>(s.valid_count());

        DecompositionResult r;
        Eigen::Index negatives = (s.flat() < 0.0).count();
        if (negatives > 0) {
            note(r, std::to_string(negatives) + " negative value(s) present; the Gini index is built "
                    "from value shares and is not interpretable for negative data");
        }

        std::vector<Eigen::ArrayXd> substituted;
        substituted.reserve(s.group_count());

        for (std::size_t i = 0; i < s.group_count(); ++i) {
            Eigen::ArrayXd x = Reduce::valid(s.grouped_values()[i]);
            if (x.size() == 0) {
                note(r, "group '" + s.groups()[i] + "' has no valid observations and is excluded");
                continue;
            }

            double group_sum = x.sum();
            substituted.push_back(Eigen::ArrayXd::Constant(x.size(), group_sum / static_cast<double>(x.size())));

            // A group holding no value has zero value share
            if (group_sum == 0.0) continue;

            double value_share = group_sum / total;
            double population_share = static_cast<double>(x.size()) / n_all;
            r.within += gini_index(x) * value_share * population_share;
        }

        r.between = gini_index(Reduce::concatenate(substituted));
        r.overall = gini_index(s.flat());
        r.residual = r.overall - (r.within + r.between);
        return r;
    }
};

} // namespace Equity
