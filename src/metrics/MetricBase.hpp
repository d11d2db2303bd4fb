#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../sample/GroupedSample.h"

namespace Equity {

// Outcome of one decomposition. `overall` equals within + between exactly for the
// Theil indices, and up to `residual` for Variance and Gini.
struct DecompositionResult {
    std::string index;
    double within = 0.0;
    double between = 0.0;
    double overall = 0.0;
    double ratio = 0.0;                 // between / overall, 0 when overall == 0
    std::optional<double> residual;     // Variance and Gini only
    std::vector<std::string> notes;     // Non-fatal diagnostics raised while computing
};

struct MetricBaseOptions {
    double residual_tolerance = 1e-9;   // Beyond this an additive identity is reported as broken
    bool verbose = true;
};

// Shared two-phase lifecycle: construction stores the sample, calculate() computes.
// Each instance owns its sample; nothing is shared between instances.
class MetricBase {
public:
    using Options = MetricBaseOptions;

    explicit MetricBase(GroupedSample sample, Options opts = Options())
        : sample_(std::move(sample)), opts_(opts) {}
    virtual ~MetricBase() = default;

    virtual const char* name() const = 0;

    // Domain checks run first and throw before anything is computed or stored.
    // Re-running on the same instance reproduces the same result.
    const DecompositionResult& calculate() {
        check_domain();
        DecompositionResult r = compute();
        r.index = name();
        r.ratio = (r.overall == 0.0) ? 0.0 : r.between / r.overall;
        result_ = std::move(r);
        return *result_;
    }

    bool calculated() const { return result_.has_value(); }

    const DecompositionResult& result() const {
        if (!result_) {
            throw std::logic_error(std::string(name()) + ": calculate() has not been called");
        }
        return *result_;
    }

    double within() const { return result().within; }
    double between() const { return result().between; }
    double overall() const { return result().overall; }
    double ratio() const { return result().ratio; }
    std::optional<double> residual() const { return result().residual; }

    const GroupedSample& sample() const { return sample_; }
    const Options& options() const { return opts_; }

protected:
    virtual void check_domain() const = 0;
    virtual DecompositionResult compute() const = 0;

    void note(DecompositionResult& r, const std::string& msg) const;

private:
    GroupedSample sample_;
    Options opts_;
    std::optional<DecompositionResult> result_;
};

} // namespace Equity
