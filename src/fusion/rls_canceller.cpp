// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "fusion/rls_canceller.h"

#include <cmath>
#include <cstdio>

namespace oc {

namespace {

// Regressors [1, r^T] for samples [0, count)
Eigen::MatrixXd design_rows(const SampleMatrix& references, Eigen::Index count) {
    Eigen::MatrixXd x(count, references.rows() + 1);
    x.col(0).setOnes();
    x.rightCols(references.rows()) = references.leftCols(count).transpose();
    return x;
}

// Least-squares seed over the first `count` samples. False if rank deficient.
bool seed_coefficients(const SampleMatrix& targets, const SampleMatrix& references,
                       Eigen::Index count, Eigen::MatrixXd& beta) {
    const Eigen::MatrixXd x = design_rows(references, count);
    const Eigen::MatrixXd y = targets.leftCols(count).transpose();
    const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(x);
    if (qr.rank() < x.cols()) {
        return false;
    }
    beta = qr.solve(y);
    return beta.allFinite();
}

} // anonymous namespace

// ============================================================================
// RlsState
// ============================================================================

void RlsState::init(int32_t refCount, int32_t targetCount, double forgettingFactor,
                    double initialScale) {
    beta = Eigen::MatrixXd::Zero(refCount + 1, targetCount);
    P = Eigen::MatrixXd::Identity(refCount + 1, refCount + 1) * initialScale;
    lambda = forgettingFactor;
}

bool RlsState::advance(const Eigen::VectorXd& reference, const Eigen::VectorXd& target,
                       Eigen::VectorXd& residual) {
    if (reference.size() + 1 != beta.rows() || target.size() != beta.cols()) {
        DBG_ERROR("[RLS] step size mismatch: %lld refs, %lld targets for %lld x %lld state",
                  static_cast<long long>(reference.size()),
                  static_cast<long long>(target.size()),
                  static_cast<long long>(beta.rows()), static_cast<long long>(beta.cols()));
        return false;
    }
    Eigen::VectorXd x(reference.size() + 1);
    x(0) = 1.0;
    x.tail(reference.size()) = reference;

    const Eigen::VectorXd px = P * x;
    const double denom = lambda + x.dot(px);
    const Eigen::VectorXd k = px / denom;

    const Eigen::VectorXd err = target - beta.transpose() * x;
    beta += k * err.transpose();

    // P x == (x^T P)^T for symmetric P
    P = (P - k * px.transpose()) / lambda;
    P = 0.5 * (P + P.transpose()).eval();

    residual = target - beta.transpose() * x;
    return true;
}

bool RlsState::healthy() const {
    if (!P.allFinite() || !beta.allFinite()) {
        return false;
    }
    for (Eigen::Index i = 0; i < P.rows(); ++i) {
        if (!(P(i, i) > 0.0)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// RecursiveNoiseCanceller
// ============================================================================

Status RecursiveNoiseCanceller::validate(const SampleMatrix& targets,
                                         const SampleMatrix& references,
                                         Diagnostics& diag) const {
    if (targets.rows() == 0) {
        return diag.fail(Stage::kRls, "targets", "must have at least one channel");
    }
    if (references.rows() == 0) {
        return diag.fail(Stage::kRls, "references", "must have at least one channel");
    }
    if (targets.cols() != references.cols()) {
        char msg[96];
        snprintf(msg, sizeof(msg), "sample count %lld != target sample count %lld",
                 static_cast<long long>(references.cols()),
                 static_cast<long long>(targets.cols()));
        return diag.fail_shape(Stage::kRls, "references", msg);
    }
    if (!(config.forgetting_factor > 0.0) || config.forgetting_factor > 1.0) {
        return diag.fail(Stage::kRls, "forgetting_factor",
                         violated("must be in (0, 1]", config.forgetting_factor));
    }
    if (config.min_samples < 1) {
        return diag.fail(Stage::kRls, "min_samples",
                         violated("must be >= 1", config.min_samples));
    }
    const Eigen::Index unknowns = references.rows() + 1;
    if (config.min_samples < unknowns) {
        char msg[96];
        snprintf(msg, sizeof(msg), "must be >= reference count + 1 (%lld), got %d",
                 static_cast<long long>(unknowns), static_cast<int>(config.min_samples));
        return diag.fail(Stage::kRls, "min_samples", msg);
    }
    if (!(config.initial_inverse_corr > 0.0)) {
        return diag.fail(Stage::kRls, "initial_inverse_corr",
                         violated("must be > 0", config.initial_inverse_corr));
    }
    return Status::kOk;
}

Status RecursiveNoiseCanceller::apply(const SampleMatrix& targets,
                                      const SampleMatrix& references,
                                      SampleMatrix& out, Diagnostics& diag) const {
    RlsReport report;
    return apply(targets, references, out, diag, report);
}

Status RecursiveNoiseCanceller::apply(const SampleMatrix& targets,
                                      const SampleMatrix& references,
                                      SampleMatrix& out, Diagnostics& diag,
                                      RlsReport& report) const {
    const Status status = validate(targets, references, diag);
    if (status != Status::kOk) {
        return status;
    }

    const Eigen::Index n = targets.cols();
    const int32_t refCount = static_cast<int32_t>(references.rows());
    const int32_t targetCount = static_cast<int32_t>(targets.rows());

    RlsState state;
    state.init(refCount, targetCount, config.forgetting_factor, config.initial_inverse_corr);

    RlsReport result;
    SampleMatrix denoised = targets;
    bool adapting = false;
    Eigen::Index nextSeed = config.min_samples;   // 1-based sample of next seed attempt
    char msg[128];

    for (Eigen::Index i = 0; i < n; ++i) {
        if (adapting) {
            const Eigen::VectorXd r = references.col(i);
            const Eigen::VectorXd t = targets.col(i);
            Eigen::VectorXd residual;
            // Sizes fixed by init() from the validated matrices
            if (state.advance(r, t, residual)) {
                denoised.col(i) = residual;
            }
            continue;
        }

        // Warm-up: output already equals input
        if (i + 1 == nextSeed) {
            if (seed_coefficients(targets, references, i + 1, state.beta)) {
                state.P = Eigen::MatrixXd::Identity(refCount + 1, refCount + 1)
                          * config.initial_inverse_corr;
                adapting = true;
                result.adaptation_start = static_cast<int32_t>(i + 1);
            } else {
                snprintf(msg, sizeof(msg),
                         "warm-up rank deficient over %lld samples, extending",
                         static_cast<long long>(i + 1));
                diag.warn(Stage::kRls, msg);
                ++result.warmup_extensions;
                nextSeed += config.min_samples;
            }
        }
    }

    const bool adapted = adapting && result.adaptation_start < n;
    if (!adapted) {
        snprintf(msg, sizeof(msg),
                 "no adaptive samples in %lld-sample recording, passed through",
                 static_cast<long long>(n));
        diag.warn(Stage::kRls, msg);
        result.adaptation_start = -1;
    } else if (!state.healthy()) {
        diag.warn(Stage::kRls, "inverse correlation matrix lost positive diagonal");
    }

    result.noise_reduction_pct = adapted ? noise_reduction_pct(targets, denoised) : 0.0;
    result.channel_reduction_pct = channel_power_reduction_pct(targets, denoised);
    result.coefficients = state.beta;

    DBG_PRINT("[RLS] %d targets, %d refs, lambda %.4f, start %d: %.1f%%",
              static_cast<int>(targetCount), static_cast<int>(refCount),
              config.forgetting_factor, static_cast<int>(result.adaptation_start),
              result.noise_reduction_pct);
    diag.report(Stage::kRls, result.noise_reduction_pct, !adapted);

    report = result;
    out = denoised;
    return Status::kOk;
}

} // namespace oc
