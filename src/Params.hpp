#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Errors.hpp"
#include "outcomes/Completion.hpp"
#include "outcomes/EmploymentLikelihood.hpp"
#include "wage/MincerWage.hpp"

namespace Equity {

// Derive an earnings-premium column from wage records before grouping
struct PremiumSpec {
    MincerCoefficients coefficients;
    std::string education_column;
    std::string age_column;
    std::string starting_wage_column;
    std::string ending_wage_column;
    std::string years_in_program_column;
    std::string output_column = "earnings_premium";
};

// Parameter container for one decomposition job
struct DecompositionParams {
    std::map<std::string, double> scalars;   // Numeric tuning, e.g. residual_tolerance

    std::vector<std::string> group_columns;
    std::string value_column;
    std::optional<long long> sample_size;
    std::optional<std::uint64_t> seed;
    int min_group_size = 30;
    std::vector<std::string> metrics = {"theil_t", "theil_l", "variance", "gini"};
    bool verbose = true;
    bool chart = false;

    std::optional<PremiumSpec> premium;
    std::optional<EmploymentSpec> employment;   // Summarized by group_columns
    std::optional<CompletionSpec> completion;

    double get(const std::string& key, double default_val) const {
        auto it = scalars.find(key);
        if (it != scalars.end()) return it->second;
        return default_val;
    }

    double get_required(const std::string& key) const {
        auto it = scalars.find(key);
        if (it == scalars.end()) throw ConfigurationError("Missing required parameter: " + key);
        return it->second;
    }
};

} // namespace Equity
