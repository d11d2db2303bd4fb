#pragma once
#include <cmath>
#include <limits>
#include <Eigen/Dense>
#include "MetricBase.hpp"
#include "ThielCommon.hpp"
#include "reductions.h"

namespace Equity {

// Theil T of a single array: (1/N) * sum (x/mu) ln(x/mu), NaNs excluded.
// Ratios pushed below zero by rounding are clipped to 0, and 0 * ln(0) is taken
// at its limit 0. Expects positive values.
inline double theil_t_index(const Eigen::ArrayXd& values) {
    Eigen::ArrayXd x = Reduce::valid(values);
    if (x.size() == 0) return std::numeric_limits<double>::quiet_NaN();

    double mu = x.mean();
    Eigen::ArrayXd r = (x / mu).max(0.0);
    Eigen::ArrayXd terms = (r > 0.0).select(r * r.log(), 0.0);
    return terms.sum() / static_cast<double>(x.size());
}

// Theil T decomposition. Group weights are income shares:
//   s_i = (N_i / N) * (mean_i / mu)
//   within  = sum T_i * s_i
//   between = sum s_i * ln(mean_i / mu)
class ThielT : public MetricBase {
public:
    using MetricBase::MetricBase;

    const char* name() const override { return "theil_t"; }

protected:
    void check_domain() const override {
        detail::require_positive(sample(), "Theil T");
    }

    DecompositionResult compute() const override {
        const GroupedSample& s = sample();
        const double mu = Reduce::mean(s.flat());
        const double n_all = static_cast<double>(s.valid_count());

        DecompositionResult r;
        for (std::size_t i = 0; i < s.group_count(); ++i) {
            Eigen::ArrayXd x = Reduce::valid(s.grouped_values()[i]);
            if (x.size() == 0) {
                note(r, "group '" + s.groups()[i] + "' has no valid observations and is excluded");
                continue;
            }

            double mean_i = x.mean();
            if (((x / mean_i) < 0.0).any()) {
                note(r, "group '" + s.groups()[i] + "': negative ratios to the mean were clipped to 0; "
                        "the within term is approximate");
            }

            double share = (static_cast<double>(x.size()) / n_all) * (mean_i / mu);
            r.within += theil_t_index(x) * share;
            r.between += share * std::log(mean_i / mu);
        }
        r.overall = r.within + r.between;
        return r;
    }
};

} // namespace Equity
