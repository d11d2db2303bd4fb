#pragma once
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../Errors.hpp"

namespace Equity {

// Pre-fitted coefficients of the modified Mincer model
//   ln w = b_s * S + b_sx * S * E + b_e * E + b_e2 * E^2 + ...
// The schooling main effect cancels when differencing over experience.
struct MincerCoefficients {
    double schooling_x_experience = 0.0;
    double experience = 0.0;
    double experience_squared = 0.0;
};

// Years of schooling from a CPS EDUC code, right-closed bins
inline double years_of_schooling(int educ_code) {
    struct Bin { int upper; double years; };
    static const Bin bins[] = {
        {60, 10.0}, {73, 12.0}, {81, 14.0}, {92, 13.0},
        {111, 16.0}, {123, 18.0}, {124, 19.0}, {125, 20.0},
    };
    if (educ_code > -1) {
        for (const auto& b : bins) {
            if (educ_code <= b.upper) return b.years;
        }
    }
    throw DomainError("EDUC code " + std::to_string(educ_code) + " is outside the supported range (-1, 125]");
}

// True for a whole-number EDUC code inside the binned range (-1, 125]
inline bool is_valid_educ_code(double code) {
    return std::isfinite(code) && code > -1.0 && code <= 125.0 && std::floor(code) == code;
}

// Counterfactual wage of a program participant: the wage they would be expected to
// earn now had they spent the program years working instead.
class MincerWagePredictor {
public:
    explicit MincerWagePredictor(MincerCoefficients c) : coef(c) {}

    // Proportional wage change implied by moving from exp_start to exp_now years of experience
    double wage_change(double schooling, double exp_start, double exp_now) const {
        return f(schooling, exp_now) - f(schooling, exp_start);
    }

    double counterfactual_wage(int educ_code, double age, double starting_wage, double years_in_program) const {
        double s = years_of_schooling(educ_code);
        double exp_now = age - s - 6.0;
        double exp_start = exp_now - years_in_program;
        return starting_wage * (1.0 + wage_change(s, exp_start, exp_now));
    }

    // Element-wise over a cohort. Missing starting wages (NaN) stay missing.
    Eigen::ArrayXd counterfactual_wages(const std::vector<int>& educ_codes,
                                        const Eigen::ArrayXd& ages,
                                        const Eigen::ArrayXd& starting_wages,
                                        const Eigen::ArrayXd& years_in_program) const {
        const Eigen::Index n = ages.size();
        if (static_cast<Eigen::Index>(educ_codes.size()) != n || starting_wages.size() != n ||
            years_in_program.size() != n) {
            throw ConstructionError("Mincer inputs must all have the same length");
        }

        Eigen::ArrayXd out(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            out[i] = counterfactual_wage(educ_codes[i], ages[i], starting_wages[i], years_in_program[i]);
        }
        return out;
    }

    // Earnings premium: observed end wage minus counterfactual wage
    Eigen::ArrayXd premiums(const std::vector<int>& educ_codes,
                            const Eigen::ArrayXd& ages,
                            const Eigen::ArrayXd& starting_wages,
                            const Eigen::ArrayXd& years_in_program,
                            const Eigen::ArrayXd& ending_wages) const {
        Eigen::ArrayXd cf = counterfactual_wages(educ_codes, ages, starting_wages, years_in_program);
        if (ending_wages.size() != cf.size()) {
            throw ConstructionError("Mincer inputs must all have the same length");
        }
        return ending_wages - cf;
    }

private:
    double f(double s, double e) const {
        return coef.schooling_x_experience * e * s + coef.experience * e + coef.experience_squared * e * e;
    }

    MincerCoefficients coef;
};

} // namespace Equity
