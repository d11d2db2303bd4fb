#pragma once
#include <cmath>
#include <cstddef>
#include <iostream>
#include <vector>
#include <Eigen/Dense>
#include "../Errors.hpp"
#include "../Params.hpp"
#include "../sample/Table.h"
#include "MincerWage.hpp"

namespace Equity {

// Append spec.output_column = ending wage - Mincer counterfactual wage to `table`.
// Rows with a missing, fractional or out-of-range EDUC code get a missing premium.
// Returns the number of such rows.
inline std::size_t add_premium_column(Table& table, const PremiumSpec& spec) {
    auto column = [&](const std::string& name) {
        const std::vector<double>& v = table.values(name);
        return Eigen::ArrayXd(Eigen::Map<const Eigen::ArrayXd>(v.data(), static_cast<Eigen::Index>(v.size())));
    };

    Eigen::ArrayXd educ = column(spec.education_column);
    Eigen::ArrayXd age = column(spec.age_column);
    Eigen::ArrayXd start = column(spec.starting_wage_column);
    Eigen::ArrayXd end = column(spec.ending_wage_column);
    Eigen::ArrayXd years = column(spec.years_in_program_column);

    MincerWagePredictor predictor(spec.coefficients);
    std::vector<double> premium(table.rows());
    std::size_t unusable = 0;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const Eigen::Index k = static_cast<Eigen::Index>(i);
        if (!is_valid_educ_code(educ[k])) {
            premium[i] = std::nan("");
            ++unusable;
            continue;
        }
        double cf = predictor.counterfactual_wage(static_cast<int>(educ[k]), age[k], start[k], years[k]);
        premium[i] = end[k] - cf;
    }
    table.add_value_column(spec.output_column, std::move(premium));
    if (unusable > 0) {
        std::cerr << "[WARN][Equity::Wage] " << unusable
                  << " row(s) without a usable EDUC code get a missing " << spec.output_column << std::endl;
    }
    return unusable;
}

} // namespace Equity
