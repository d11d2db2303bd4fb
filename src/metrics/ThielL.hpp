#pragma once
#include <cmath>
#include <limits>
#include <Eigen/Dense>
#include "MetricBase.hpp"
#include "ThielCommon.hpp"
#include "reductions.h"

namespace Equity {

// Theil L (mean log deviation) of a single array: (1/N) * sum ln(mu/x), NaNs excluded.
inline double theil_l_index(const Eigen::ArrayXd& values) {
    Eigen::ArrayXd x = Reduce::valid(values);
    if (x.size() == 0) return std::numeric_limits<double>::quiet_NaN();

    double mu = x.mean();
    return (mu / x).log().sum() / static_cast<double>(x.size());
}

// Theil L decomposition. Group weights are population shares only, s_i = N_i / N,
// which makes it more sensitive to the lower tail than Theil T.
class ThielL : public MetricBase {
public:
    using MetricBase::MetricBase;

    const char* name() const override { return "theil_l"; }

protected:
    void check_domain() const override {
        detail::require_positive(sample(), "Theil L");
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

            double share = static_cast<double>(x.size()) / n_all;
            r.within += theil_l_index(x) * share;
            r.between += share * std::log(mu / x.mean());
        }
        r.overall = r.within + r.between;
        return r;
    }
};

} // namespace Equity
