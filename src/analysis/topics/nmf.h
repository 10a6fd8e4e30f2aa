#pragma once

/// @file nmf.h
/// @brief Non-negative matrix factorization with multiplicative updates

#include <cstddef>
#include <cstdint>
#include <vector>

#include <absl/status/statusor.h>

#include "analysis/topics/tfidf.h"

namespace reviewscope::topics {

struct NmfConfig {
    size_t n_components = 6;
    size_t max_iter = 200;

    /// Stop once the error decrease over 10 iterations, relative to the
    /// initial error, falls below this
    double tol = 1e-4;

    uint32_t random_seed = 42;
};

/// @brief X (n x m) ~= W (n x k) * H (k x m), both row-major
struct NmfResult {
    size_t rows = 0;
    size_t cols = 0;
    size_t components = 0;
    std::vector<double> w;  ///< Document-topic weights
    std::vector<double> h;  ///< Topic-term weights

    size_t iterations = 0;
    bool converged = false;
    double reconstruction_error = 0.0;  ///< Frobenius norm of X - WH

    double W(size_t row, size_t k) const { return w[row * components + k]; }
    double H(size_t k, size_t col) const { return h[k * cols + col]; }
};

/// @brief Factorize a non-negative matrix
///
/// Initialization draws from std::mt19937 seeded with `random_seed`, so
/// identical input yields identical factors. A run that exhausts `max_iter`
/// is returned with `converged == false`.
///
/// @return InvalidArgument for an empty matrix, negative entries or zero
/// components; Internal if the updates produce non-finite values
absl::StatusOr<NmfResult> FactorizeNmf(const TfidfMatrix& x, const NmfConfig& config);

}  // namespace reviewscope::topics
