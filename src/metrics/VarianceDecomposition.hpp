#pragma once
#include <algorithm>
#include <cmath>
#include <vector>
#include <Eigen/Dense>
#include "../Errors.hpp"
#include "MetricBase.hpp"
#include "reductions.h"

namespace Equity {

// Population variance (divide by N) of a single array, NaNs excluded.
inline double population_variance(const Eigen::ArrayXd& values) {
    return Reduce::pop_variance(values);
}

// Variance decomposition; valid for any real values.
//   within  = sum (N_i / N) * popvar(group_i)
//   between = popvar(group means), unweighted: one entry per group regardless of size
//   overall = popvar(all observations)
// The unweighted between term makes within + between == overall only when the
// groups are equally sized; otherwise the gap shows up in `residual`.
class VarianceDecomposition : public MetricBase {
public:
    using MetricBase::MetricBase;

    const char* name() const override { return "variance"; }

protected:
    void check_domain() const override {
        if (sample().valid_count() == 0) {
            throw DomainError("Variance: sample has no valid (non-NaN) observations");
        }
    }

    DecompositionResult compute() const override {
        const GroupedSample& s = sample();
        const double n_all = static_cast<double>(s.valid_count());

        DecompositionResult r;
        std::vector<double> means;
        means.reserve(s.group_count());

        for (std::size_t i = 0; i < s.group_count(); ++i) {
            Eigen::ArrayXd x = Reduce::valid(s.grouped_values()[i]);
            if (x.size() == 0) {
                note(r, "group '" + s.groups()[i] + "' has no valid observations and is excluded");
                continue;
            }
            r.within += (static_cast<double>(x.size()) / n_all) * population_variance(x);
            means.push_back(x.mean());
        }

        r.between = population_variance(
            Eigen::Map<const Eigen::ArrayXd>(means.data(), static_cast<Eigen::Index>(means.size())));
        r.overall = population_variance(s.flat());
        r.residual = r.overall - (r.within + r.between);

        if (std::abs(*r.residual) > options().residual_tolerance * std::max(1.0, std::abs(r.overall))) {
            note(r, "within + between differs from overall by " + std::to_string(*r.residual) +
                    "; the between term is the unweighted variance of group means, "
                    "which is additive only for equally sized groups");
        }
        return r;
    }
};

} // namespace Equity
