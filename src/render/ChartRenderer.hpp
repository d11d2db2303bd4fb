#pragma once
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../metrics/reductions.h"

namespace Equity {

// Optional rendering collaborator. Metrics never call it; a caller that wants a
// chart invokes it explicitly with the sample's groups and values.
class ChartRenderer {
public:
    virtual ~ChartRenderer() = default;
    virtual std::string render(const std::vector<std::string>& groups,
                               const std::vector<Eigen::ArrayXd>& grouped_values) const = 0;
};

// Horizontal bars of group means, scaled to the largest absolute mean
class TextBarRenderer : public ChartRenderer {
public:
    explicit TextBarRenderer(int width = 40) : width_(width) {}

    std::string render(const std::vector<std::string>& groups,
                       const std::vector<Eigen::ArrayXd>& grouped_values) const override {
        std::vector<double> means;
        std::size_t label_width = 0;
        for (std::size_t i = 0; i < groups.size(); ++i) {
            means.push_back(Reduce::mean(grouped_values[i]));
            label_width = std::max(label_width, groups[i].size());
        }

        double scale = 0.0;
        for (double m : means) {
            if (!std::isnan(m)) scale = std::max(scale, std::abs(m));
        }

        std::ostringstream os;
        for (std::size_t i = 0; i < groups.size(); ++i) {
            int len = (scale > 0.0 && !std::isnan(means[i]))
                          ? static_cast<int>(std::lround(width_ * std::abs(means[i]) / scale))
                          : 0;
            os << std::left << std::setw(static_cast<int>(label_width)) << groups[i] << " | "
               << std::string(static_cast<std::size_t>(len), means[i] < 0.0 ? '-' : '#')
               << " " << means[i] << "\n";
        }
        return os.str();
    }

private:
    int width_;
};

} // namespace Equity
