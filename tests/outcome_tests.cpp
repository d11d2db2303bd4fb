#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "Errors.hpp"
#include "outcomes/Completion.hpp"
#include "outcomes/EmploymentLikelihood.hpp"
#include "sample/Table.h"

using namespace Equity;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

GroupedSample::Options quiet() {
    GroupedSample::Options o;
    o.min_group_size = 1;
    o.verbose = false;
    return o;
}

Table employment_records() {
    Table t;
    t.add_key_column("program", {"a", "a", "a", "b", "b"});
    t.add_value_column("emp0", {0, 1, 0, 1, NaN});
    t.add_value_column("emp1", {1, 1, 0, 1, 1});
    t.add_value_column("bls", {0.1, 0.1, 0.1, -0.2, 0.0});
    return t;
}

EmploymentSpec employment_spec() {
    EmploymentSpec spec;
    spec.employed_at_start_column = "emp0";
    spec.employed_at_end_column = "emp1";
    return spec;
}

Table completion_records() {
    Table t;
    t.add_key_column("program", {"a", "a", "a", "b", "b"});
    t.add_value_column("done", {1, 0, 1, 0, 0});
    t.add_value_column("entry", {2010, 2010, 2011, 2012, 2012});
    t.add_value_column("exit", {2012, 2015, 2012, 2013, 2014});
    return t;
}

CompletionSpec completion_spec() {
    CompletionSpec spec;
    spec.completed_column = "done";
    spec.entry_year_column = "entry";
    spec.exit_year_column = "exit";
    return spec;
}

} // namespace

TEST(EmploymentTest, RateAndChangeByProgram) {
    EmploymentOutcomes e = employment_likelihood(employment_records(), {"program"}, employment_spec(), quiet());

    ASSERT_EQ(e.rate_at_end.size(), 2u);
    EXPECT_EQ(e.rate_at_end[0].group, "a");
    EXPECT_NEAR(e.rate_at_end[0].mean, 2.0 / 3.0, 1e-15);
    EXPECT_DOUBLE_EQ(e.rate_at_end[1].mean, 1.0);

    ASSERT_EQ(e.change.size(), 2u);
    EXPECT_NEAR(e.change[0].mean, 1.0 / 3.0, 1e-15);
    EXPECT_EQ(e.change[1].n, 1);   // Unknown starting status is excluded
    EXPECT_DOUBLE_EQ(e.change[1].mean, 0.0);

    // No correction: the premium is the raw change
    ASSERT_EQ(e.premium.size(), 2u);
    EXPECT_NEAR(e.premium[0].mean, e.change[0].mean, 1e-15);
}

TEST(EmploymentTest, MacroCorrectionIsSubtracted) {
    EmploymentSpec spec = employment_spec();
    spec.macro_correction_column = "bls";
    EmploymentOutcomes e = employment_likelihood(employment_records(), {"program"}, spec, quiet());

    ASSERT_EQ(e.premium.size(), 2u);
    EXPECT_NEAR(e.premium[0].mean, 0.7 / 3.0, 1e-12);
    EXPECT_NEAR(e.premium[0].min, -0.1, 1e-12);
    EXPECT_NEAR(e.premium[0].max, 0.9, 1e-12);
    EXPECT_EQ(e.premium[1].n, 1);
    EXPECT_NEAR(e.premium[1].mean, 0.2, 1e-12);
}

TEST(EmploymentTest, IndividualPremium) {
    std::vector<double> correction = {0.5, 0.0};
    std::vector<double> p = employment_premium({0, 1}, {1, 1}, &correction);
    EXPECT_DOUBLE_EQ(p[0], 0.5);
    EXPECT_DOUBLE_EQ(p[1], 0.0);
    EXPECT_THROW(employment_premium({0, 1}, {1}), ConstructionError);
}

TEST(EmploymentTest, UnknownColumnIsConfigurationError) {
    EmploymentSpec spec = employment_spec();
    spec.macro_correction_column = "missing";
    EXPECT_THROW(employment_likelihood(employment_records(), {"program"}, spec, quiet()), ConfigurationError);
}

TEST(EmploymentTest, DerivedColumnMayNotShadowInput) {
    EmploymentSpec spec = employment_spec();
    spec.change_column = "emp1";
    EXPECT_THROW(employment_likelihood(employment_records(), {"program"}, spec, quiet()), ConstructionError);
}

TEST(CompletionTest, CompletionRateByProgram) {
    CompletionOutcomes c = completion(completion_records(), {"program"}, completion_spec(), quiet());
    ASSERT_EQ(c.completion_rate.size(), 2u);
    EXPECT_EQ(c.completion_rate[0].group, "a");
    EXPECT_NEAR(c.completion_rate[0].mean, 2.0 / 3.0, 1e-15);
    EXPECT_DOUBLE_EQ(c.completion_rate[1].mean, 0.0);
    EXPECT_EQ(c.completion_rate[1].n, 2);
}

TEST(CompletionTest, TimeToCompletionCountsCompletersOnly) {
    CompletionOutcomes c = completion(completion_records(), {"program"}, completion_spec(), quiet());
    // Program b has no completers
    ASSERT_EQ(c.time_to_completion.size(), 1u);
    EXPECT_EQ(c.time_to_completion[0].group, "a");
    EXPECT_EQ(c.time_to_completion[0].n, 2);
    EXPECT_DOUBLE_EQ(c.time_to_completion[0].mean, 1.5);
    EXPECT_DOUBLE_EQ(c.time_to_completion[0].min, 1.0);
    EXPECT_DOUBLE_EQ(c.time_to_completion[0].max, 2.0);
}

TEST(CompletionTest, SmallGroupsAreSuppressed) {
    GroupedSample::Options opts = quiet();
    opts.min_group_size = 3;
    CompletionOutcomes c = completion(completion_records(), {"program"}, completion_spec(), opts);
    EXPECT_FALSE(c.completion_rate[0].suppressed);
    EXPECT_TRUE(c.completion_rate[1].suppressed);
    EXPECT_TRUE(c.time_to_completion[0].suppressed);
}
