#pragma once
#include <stdexcept>
#include <string>

namespace Equity {

// Root of every error raised by the decomposition engine.
struct EquityError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed GroupedSample or Table (length mismatch, duplicate labels, ragged columns)
struct ConstructionError : EquityError {
    using EquityError::EquityError;
};

// Invalid options: sample_size out of range, unknown column or metric name
struct ConfigurationError : EquityError {
    using EquityError::EquityError;
};

// Values outside the domain of an index (non-positive for Theil, zero mean for Gini)
struct DomainError : EquityError {
    using EquityError::EquityError;
};

} // namespace Equity
