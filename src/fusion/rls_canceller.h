// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_FUSION_RLS_CANCELLER_H
#define OPMCLEAN_FUSION_RLS_CANCELLER_H

// RecursiveNoiseCanceller: reference-sensor noise regression.
//
// Model per sample: t = beta^T x + e, x = [1; r] (bias + references).
// Exponentially weighted RLS, forgetting factor lambda:
//   k    = P x / (lambda + x^T P x)
//   e    = t - beta^T x           (a priori error)
//   beta = beta + k e^T
//   P    = (P - k x^T P) / lambda (symmetrized)
//   out  = t - beta^T x           (a posteriori, updated beta)
//
// Warm-up: the first min_samples samples pass through unchanged. At sample
// min_samples beta is seeded by least squares over the warm-up window
// (column-pivoted QR) and P = scale * I. A rank-deficient warm-up window
// is grown by another min_samples and retried.

#include "core/diagnostics.h"
#include "math/sample_matrix.h"
#include "opmclean/config.h"

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

namespace oc {

// One RLS filter: (refs+1) x targets coefficients and (refs+1)^2 inverse
// correlation. Owned by a single run; usable standalone.
struct RlsState {
    Eigen::MatrixXd beta;   // Row 0 = bias, rows 1..refs = reference weights
    Eigen::MatrixXd P;
    double lambda{opmclean::rls::kForgettingFactor};

    void init(int32_t refCount, int32_t targetCount, double forgettingFactor,
              double initialScale);

    // One adaptive step; residual = t - beta^T x after the update.
    // False (state untouched) unless reference has beta.rows()-1 entries and
    // target has beta.cols().
    bool advance(const Eigen::VectorXd& reference, const Eigen::VectorXd& target,
                 Eigen::VectorXd& residual);

    // P finite and symmetric-positive on the diagonal
    bool healthy() const;
};

struct RlsConfig {
    double forgetting_factor{opmclean::rls::kForgettingFactor};
    int32_t min_samples{opmclean::rls::kMinSamples};
    double initial_inverse_corr{opmclean::rls::kInitialInverseCorr};
};

struct RlsReport {
    double noise_reduction_pct{};
    std::vector<double> channel_reduction_pct;
    Eigen::MatrixXd coefficients;   // Final beta, (refs+1) x targets
    int32_t adaptation_start{-1};   // 0-based index of first adaptive sample, -1 if none
    int32_t warmup_extensions{};
};

struct RecursiveNoiseCanceller {
    RlsConfig config;

    Status validate(const SampleMatrix& targets, const SampleMatrix& references,
                    Diagnostics& diag) const;

    Status apply(const SampleMatrix& targets, const SampleMatrix& references,
                 SampleMatrix& out, Diagnostics& diag) const;

    Status apply(const SampleMatrix& targets, const SampleMatrix& references,
                 SampleMatrix& out, Diagnostics& diag, RlsReport& report) const;
};

} // namespace oc

#endif // OPMCLEAN_FUSION_RLS_CANCELLER_H
