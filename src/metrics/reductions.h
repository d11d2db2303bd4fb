#ifndef EQUITY_METRICS_REDUCTIONS_H
#define EQUITY_METRICS_REDUCTIONS_H

#include <vector>
#include <Eigen/Dense>

// NaN-tolerant reductions shared by all indices.
// Every function ignores NaN entries; an input with no valid entry yields NaN
// (or 0 for counts and sums).
namespace Equity {
namespace Reduce {

Eigen::ArrayXd valid(const Eigen::ArrayXd& x);
Eigen::Index count_valid(const Eigen::ArrayXd& x);
Eigen::Index count_nan(const Eigen::ArrayXd& x);

double sum(const Eigen::ArrayXd& x);
double mean(const Eigen::ArrayXd& x);

// Population variance (divides by N)
double pop_variance(const Eigen::ArrayXd& x);

// Sample standard deviation (divides by N-1), used only for descriptive summaries
double sample_sd(const Eigen::ArrayXd& x);

double median(const Eigen::ArrayXd& x);
double min(const Eigen::ArrayXd& x);
double max(const Eigen::ArrayXd& x);

// Order-preserving concatenation
Eigen::ArrayXd concatenate(const std::vector<Eigen::ArrayXd>& parts);

} // namespace Reduce
} // namespace Equity

#endif // EQUITY_METRICS_REDUCTIONS_H
