#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>
#include "Errors.hpp"
#include "Params.hpp"
#include "sample/Table.h"
#include "wage/MincerWage.hpp"
#include "wage/PremiumColumn.hpp"

using namespace Equity;

namespace {

MincerCoefficients coefficients() {
    MincerCoefficients c;
    c.schooling_x_experience = 0.001;
    c.experience = 0.05;
    c.experience_squared = -0.001;
    return c;
}

} // namespace

TEST(MincerTest, YearsOfSchoolingBins) {
    EXPECT_DOUBLE_EQ(years_of_schooling(0), 10.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(60), 10.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(73), 12.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(74), 14.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(92), 13.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(111), 16.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(124), 19.0);
    EXPECT_DOUBLE_EQ(years_of_schooling(125), 20.0);
    EXPECT_THROW(years_of_schooling(-1), DomainError);
    EXPECT_THROW(years_of_schooling(126), DomainError);
}

TEST(MincerTest, CounterfactualWage) {
    MincerWagePredictor p(coefficients());
    // HS graduate (12 years), age 30, two years in program:
    // experience 12 now, 10 at start; f(12) - f(10) = 0.6 - 0.52
    EXPECT_NEAR(p.counterfactual_wage(73, 30.0, 30000.0, 2.0), 32400.0, 1e-8);
    EXPECT_NEAR(p.counterfactual_wage(73, 30.0, 30000.0, 0.0), 30000.0, 1e-8);
}

TEST(MincerTest, PremiumsAndMissingWages) {
    MincerWagePredictor p(coefficients());
    Eigen::ArrayXd ages(2), start(2), years(2), end(2);
    ages << 30.0, 30.0;
    start << 30000.0, std::numeric_limits<double>::quiet_NaN();
    years << 2.0, 2.0;
    end << 35000.0, 35000.0;

    Eigen::ArrayXd prem = p.premiums({73, 73}, ages, start, years, end);
    EXPECT_NEAR(prem[0], 2600.0, 1e-8);
    EXPECT_TRUE(std::isnan(prem[1]));

    EXPECT_THROW(p.counterfactual_wages({73}, ages, start, years), ConstructionError);
}

TEST(MincerTest, PremiumColumnIsAppendedToTable) {
    Table t;
    t.add_key_column("program", {"nursing", "welding"});
    t.add_value_column("educ", {73.0, std::numeric_limits<double>::quiet_NaN()});
    t.add_value_column("age", {30.0, 40.0});
    t.add_value_column("wage_start", {30000.0, 25000.0});
    t.add_value_column("wage_end", {35000.0, 30000.0});
    t.add_value_column("years", {2.0, 1.0});

    PremiumSpec spec;
    spec.coefficients = coefficients();
    spec.education_column = "educ";
    spec.age_column = "age";
    spec.starting_wage_column = "wage_start";
    spec.ending_wage_column = "wage_end";
    spec.years_in_program_column = "years";

    add_premium_column(t, spec);
    ASSERT_TRUE(t.is_value_column("earnings_premium"));
    EXPECT_NEAR(t.values("earnings_premium")[0], 2600.0, 1e-8);
    EXPECT_TRUE(std::isnan(t.values("earnings_premium")[1]));
}

namespace {

Table wage_records(std::vector<double> educ) {
    Table t;
    t.add_key_column("program", {"nursing", "welding"});
    t.add_value_column("educ", std::move(educ));
    t.add_value_column("age", {30.0, 30.0});
    t.add_value_column("wage_start", {30000.0, 30000.0});
    t.add_value_column("wage_end", {35000.0, 35000.0});
    t.add_value_column("years", {2.0, 2.0});
    return t;
}

PremiumSpec wage_spec() {
    PremiumSpec spec;
    spec.coefficients = coefficients();
    spec.education_column = "educ";
    spec.age_column = "age";
    spec.starting_wage_column = "wage_start";
    spec.ending_wage_column = "wage_end";
    spec.years_in_program_column = "years";
    return spec;
}

} // namespace

TEST(MincerTest, EducCodeValidity) {
    EXPECT_TRUE(is_valid_educ_code(0.0));
    EXPECT_TRUE(is_valid_educ_code(125.0));
    EXPECT_FALSE(is_valid_educ_code(-1.0));
    EXPECT_FALSE(is_valid_educ_code(126.0));
    EXPECT_FALSE(is_valid_educ_code(73.5));
    EXPECT_FALSE(is_valid_educ_code(1e300));
    EXPECT_FALSE(is_valid_educ_code(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(is_valid_educ_code(std::numeric_limits<double>::quiet_NaN()));
}

TEST(MincerTest, FractionalEducCodeGivesMissingPremium) {
    Table t = wage_records({73.0, 73.5});
    std::size_t unusable = 0;
    EXPECT_NO_THROW(unusable = add_premium_column(t, wage_spec()));
    EXPECT_EQ(unusable, 1u);
    EXPECT_NEAR(t.values("earnings_premium")[0], 2600.0, 1e-8);
    EXPECT_TRUE(std::isnan(t.values("earnings_premium")[1]));
}

TEST(MincerTest, OutOfRangeEducCodeOnlyAffectsItsRow) {
    Table t = wage_records({73.0, 130.0});
    std::size_t unusable = 0;
    EXPECT_NO_THROW(unusable = add_premium_column(t, wage_spec()));
    EXPECT_EQ(unusable, 1u);
    EXPECT_NEAR(t.values("earnings_premium")[0], 2600.0, 1e-8);
    EXPECT_TRUE(std::isnan(t.values("earnings_premium")[1]));
}
