#include "reductions.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Equity {
namespace Reduce {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

Eigen::ArrayXd valid(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd out(count_valid(x));
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (!std::isnan(x[i])) out[k++] = x[i];
    }
    return out;
}

Eigen::Index count_valid(const Eigen::ArrayXd& x) {
    return x.size() - count_nan(x);
}

Eigen::Index count_nan(const Eigen::ArrayXd& x) {
    return x.isNaN().count();
}

double sum(const Eigen::ArrayXd& x) {
    return x.isNaN().select(0.0, x).sum();
}

double mean(const Eigen::ArrayXd& x) {
    Eigen::Index n = count_valid(x);
    if (n == 0) return kNaN;
    return sum(x) / static_cast<double>(n);
}

double pop_variance(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd v = valid(x);
    if (v.size() == 0) return kNaN;
    double mu = v.mean();
    return (v - mu).square().sum() / static_cast<double>(v.size());
}

double sample_sd(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd v = valid(x);
    if (v.size() < 2) return kNaN;
    double mu = v.mean();
    return std::sqrt((v - mu).square().sum() / static_cast<double>(v.size() - 1));
}

double median(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd v = valid(x);
    Eigen::Index n = v.size();
    if (n == 0) return kNaN;

    std::vector<double> sorted(v.data(), v.data() + n);
    std::sort(sorted.begin(), sorted.end());
    if (n % 2 == 1) return sorted[n / 2];
    return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

double min(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd v = valid(x);
    return v.size() == 0 ? kNaN : v.minCoeff();
}

double max(const Eigen::ArrayXd& x) {
    Eigen::ArrayXd v = valid(x);
    return v.size() == 0 ? kNaN : v.maxCoeff();
}

Eigen::ArrayXd concatenate(const std::vector<Eigen::ArrayXd>& parts) {
    Eigen::Index total = 0;
    for (const auto& p : parts) total += p.size();

    Eigen::ArrayXd out(total);
    Eigen::Index offset = 0;
    for (const auto& p : parts) {
        out.segment(offset, p.size()) = p;
        offset += p.size();
    }
    return out;
}

} // namespace Reduce
} // namespace Equity
