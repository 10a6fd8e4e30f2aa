#include "analysis/topics/nmf.h"

#include <algorithm>
#include <cmath>
#include <random>

#include <absl/strings/str_cat.h>
#include <spdlog/spdlog.h>

#include "common/error.h"

namespace reviewscope::topics {

namespace {

constexpr double kEpsilon = 1e-12;
constexpr size_t kErrorCheckInterval = 10;

double FrobeniusError(const TfidfMatrix& x, const NmfResult& f) {
    double sum = 0.0;
    for (size_t i = 0; i < f.rows; ++i) {
        for (size_t j = 0; j < f.cols; ++j) {
            double approx = 0.0;
            for (size_t k = 0; k < f.components; ++k) {
                approx += f.W(i, k) * f.H(k, j);
            }
            const double diff = x.At(i, j) - approx;
            sum += diff * diff;
        }
    }
    return std::sqrt(sum);
}

// W <- W * (X H^T) / (W H H^T)
void UpdateW(const TfidfMatrix& x, NmfResult& f) {
    const size_t n = f.rows;
    const size_t m = f.cols;
    const size_t r = f.components;

    std::vector<double> hht(r * r, 0.0);
    for (size_t a = 0; a < r; ++a) {
        for (size_t b = 0; b < r; ++b) {
            double s = 0.0;
            for (size_t j = 0; j < m; ++j) {
                s += f.H(a, j) * f.H(b, j);
            }
            hht[a * r + b] = s;
        }
    }

    std::vector<double> numer(r);
    std::vector<double> row(r);
    for (size_t i = 0; i < n; ++i) {
        std::copy(f.w.begin() + i * r, f.w.begin() + (i + 1) * r, row.begin());
        for (size_t k = 0; k < r; ++k) {
            double s = 0.0;
            for (size_t j = 0; j < m; ++j) {
                s += x.At(i, j) * f.H(k, j);
            }
            numer[k] = s;
        }
        for (size_t k = 0; k < r; ++k) {
            double denom = 0.0;
            for (size_t b = 0; b < r; ++b) {
                denom += row[b] * hht[b * r + k];
            }
            f.w[i * r + k] = row[k] * numer[k] / (denom + kEpsilon);
        }
    }
}

// H <- H * (W^T X) / (W^T W H)
void UpdateH(const TfidfMatrix& x, NmfResult& f) {
    const size_t n = f.rows;
    const size_t m = f.cols;
    const size_t r = f.components;

    std::vector<double> wtw(r * r, 0.0);
    for (size_t a = 0; a < r; ++a) {
        for (size_t b = 0; b < r; ++b) {
            double s = 0.0;
            for (size_t i = 0; i < n; ++i) {
                s += f.W(i, a) * f.W(i, b);
            }
            wtw[a * r + b] = s;
        }
    }

    std::vector<double> wtx(r * m, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < r; ++k) {
            const double wik = f.W(i, k);
            if (wik == 0.0) {
                continue;
            }
            for (size_t j = 0; j < m; ++j) {
                wtx[k * m + j] += wik * x.At(i, j);
            }
        }
    }

    std::vector<double> updated(f.h.size());
    for (size_t k = 0; k < r; ++k) {
        for (size_t j = 0; j < m; ++j) {
            double denom = 0.0;
            for (size_t b = 0; b < r; ++b) {
                denom += wtw[k * r + b] * f.H(b, j);
            }
            updated[k * m + j] = f.H(k, j) * wtx[k * m + j] / (denom + kEpsilon);
        }
    }
    f.h = std::move(updated);
}

bool AllFinite(const std::vector<double>& values) {
    for (double v : values) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return true;
}

}  // namespace

absl::StatusOr<NmfResult> FactorizeNmf(const TfidfMatrix& x, const NmfConfig& config) {
    if (x.rows == 0 || x.cols == 0) {
        return MakeError(ErrorCode::kInvalidArgument, "cannot factorize an empty matrix");
    }
    if (config.n_components == 0) {
        return MakeError(ErrorCode::kInvalidArgument, "n_components must be positive");
    }

    double mean = 0.0;
    for (double v : x.values) {
        if (v < 0.0) {
            return MakeError(ErrorCode::kInvalidArgument,
                             "NMF input must be non-negative");
        }
        mean += v;
    }
    mean /= static_cast<double>(x.values.size());

    NmfResult f;
    f.rows = x.rows;
    f.cols = x.cols;
    f.components = config.n_components;
    f.w.resize(f.rows * f.components);
    f.h.resize(f.components * f.cols);

    // Uniform [0, scale] draws keep the initial product near the data mean
    std::mt19937 gen(config.random_seed);
    const double scale = std::sqrt(mean / static_cast<double>(f.components));
    const double gen_max = static_cast<double>(std::mt19937::max());
    for (double& v : f.h) {
        v = scale * static_cast<double>(gen()) / gen_max;
    }
    for (double& v : f.w) {
        v = scale * static_cast<double>(gen()) / gen_max;
    }

    const double error_at_init = FrobeniusError(x, f);
    double previous_error = error_at_init;

    if (error_at_init < kEpsilon) {
        f.converged = true;
        f.reconstruction_error = error_at_init;
        return f;
    }

    for (size_t iter = 1; iter <= config.max_iter; ++iter) {
        UpdateW(x, f);
        UpdateH(x, f);
        f.iterations = iter;

        if (!AllFinite(f.w) || !AllFinite(f.h)) {
            return MakeError(ErrorCode::kInternal,
                             absl::StrCat("NMF diverged at iteration ", iter));
        }

        if (config.tol > 0.0 && iter % kErrorCheckInterval == 0) {
            const double error = FrobeniusError(x, f);
            if ((previous_error - error) / error_at_init < config.tol) {
                f.converged = true;
                break;
            }
            previous_error = error;
        }
    }

    f.reconstruction_error = FrobeniusError(x, f);
    if (!f.converged) {
        spdlog::warn("NMF did not converge within {} iterations (error {:.6f})",
                     config.max_iter, f.reconstruction_error);
    }
    return f;
}

}  // namespace reviewscope::topics
