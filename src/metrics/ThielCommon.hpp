#pragma once
#include <string>
#include "../Errors.hpp"
#include "../sample/GroupedSample.h"

namespace Equity {
namespace detail {

// Both Theil indices take logarithms of ratios to a mean, so every valid
// observation has to be strictly positive.
inline void require_positive(const GroupedSample& sample, const std::string& index_name) {
    if (sample.valid_count() == 0) {
        throw DomainError(index_name + ": sample has no valid (non-NaN) observations");
    }

    const Eigen::ArrayXd& x = sample.flat();
    Eigen::Index bad = (x <= 0.0).count();   // NaN compares false
    if (bad > 0) {
        throw DomainError(index_name + " index requires strictly positive values; found " +
                          std::to_string(bad) + " zero or negative value(s). "
                          "Use the Variance decomposition for real-valued data, "
                          "or the Gini decomposition for non-negative data.");
    }
}

} // namespace detail
} // namespace Equity
