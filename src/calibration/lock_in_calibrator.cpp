// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "calibration/lock_in_calibrator.h"

#include "dsp/zero_phase.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace oc {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Band-pass edges clip to [kMinEdgeHz, Nyquist - kNyquistMarginHz]
constexpr double kMinEdgeHz = 1.0;
constexpr double kNyquistMarginHz = 1.0;

// Envelope low-pass cutoff clips to this fraction of Nyquist
constexpr double kMaxLowpassNorm = 0.99;

using opmclean::calibration::kMaxGain;
using opmclean::calibration::kMinGain;

} // anonymous namespace

Status LockInCalibrator::validate(Diagnostics& diag) const {
    const LockInConfig& c = config;
    if (!(c.sampling_rate_hz > 0.0)) {
        return diag.fail(Stage::kCalibration, "sampling_rate_hz",
                         violated("must be > 0", c.sampling_rate_hz));
    }
    const double nyquist = c.sampling_rate_hz * 0.5;
    if (!(c.reference_freq_hz > 0.0) || !(c.reference_freq_hz < nyquist)) {
        return diag.fail(Stage::kCalibration, "reference_freq_hz",
                         violated("must be in (0, Nyquist)", c.reference_freq_hz));
    }
    if (!(c.target_peak > 0.0)) {
        return diag.fail(Stage::kCalibration, "target_peak",
                         violated("must be > 0", c.target_peak));
    }
    if (c.fir_order < 1) {
        return diag.fail(Stage::kCalibration, "fir_order",
                         violated("must be >= 1", c.fir_order));
    }
    if (!(c.band_half_width_hz > 0.0)) {
        return diag.fail(Stage::kCalibration, "band_half_width_hz",
                         violated("must be > 0", c.band_half_width_hz));
    }
    if (!(c.lowpass_cutoff_hz > 0.0)) {
        return diag.fail(Stage::kCalibration, "lowpass_cutoff_hz",
                         violated("must be > 0", c.lowpass_cutoff_hz));
    }
    if (!(c.min_amplitude_frac > 0.0)) {
        return diag.fail(Stage::kCalibration, "min_amplitude_frac",
                         violated("must be > 0", c.min_amplitude_frac));
    }
    return Status::kOk;
}

FilterCoeffs LockInCalibrator::design_bandpass(Diagnostics& diag) const {
    const double nyquist = config.sampling_rate_hz * 0.5;
    const double maxEdge = nyquist - kNyquistMarginHz;
    const double lowHz = std::min(std::max(config.reference_freq_hz - config.band_half_width_hz,
                                           kMinEdgeHz), maxEdge);
    const double highHz = std::min(std::max(config.reference_freq_hz + config.band_half_width_hz,
                                            kMinEdgeHz), maxEdge);

    FilterCoeffs bp;
    if (design_fir_bandpass(config.fir_order, lowHz / nyquist, highHz / nyquist, bp)) {
        return bp;
    }
    char msg[160];
    snprintf(msg, sizeof(msg),
             "band-pass design failed for %.2f-%.2f Hz, using %d-tap moving average",
             lowHz, highHz, static_cast<int>(config.fir_order + 1));
    diag.warn(Stage::kCalibration, msg);
    return moving_average(config.fir_order + 1);
}

FilterCoeffs LockInCalibrator::design_envelope_lowpass() const {
    const double nyquist = config.sampling_rate_hz * 0.5;
    const double wc = std::min(config.lowpass_cutoff_hz / nyquist, kMaxLowpassNorm);
    FilterCoeffs lp;
    if (!design_butter2_lowpass(wc, lp)) {
        // wc is in (0, 0.99] after validation; a failure here is a bug
        DBG_ERROR("[LockIn] envelope low-pass design failed (wc=%g)", wc);
        lp = moving_average(1);
    }
    return lp;
}

Signal LockInCalibrator::channel_gain(const Signal& raw, const FilterCoeffs& bandpass,
                                      const FilterCoeffs& lowpass) const {
    const Eigen::Index n = raw.size();
    const Signal filtered = filter_causal(bandpass, raw);

    Signal inPhase(n);
    Signal quadrature(n);
    const double w = 2.0 * kPi * config.reference_freq_hz / config.sampling_rate_hz;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double phase = w * static_cast<double>(i);
        inPhase[i] = filtered[i] * std::sin(phase);
        quadrature[i] = filtered[i] * std::cos(phase);
    }

    const Signal iSmooth = filtfilt(lowpass, inPhase);
    const Signal qSmooth = filtfilt(lowpass, quadrature);

    const double floorAmp = config.target_peak * config.min_amplitude_frac;
    Signal gain(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double amp = 2.0 * std::sqrt(iSmooth[i] * iSmooth[i] + qSmooth[i] * qSmooth[i]);
        const double g = config.target_peak / std::max(amp, floorAmp);
        gain[i] = std::min(std::max(g, kMinGain), kMaxGain);
    }

    // Group delay compensation: advance by order/2, hold the last value
    const Eigen::Index delay = config.fir_order / 2;
    if (delay == 0 || delay >= n) {
        return gain;
    }
    Signal shifted(n);
    shifted.head(n - delay) = gain.tail(n - delay);
    shifted.tail(delay).setConstant(gain[n - 1]);
    return shifted;
}

Status LockInCalibrator::gain_envelope(const SampleMatrix& raw, SampleMatrix& gain,
                                       Diagnostics& diag) const {
    const Status status = validate(diag);
    if (status != Status::kOk) {
        return status;
    }
    const FilterCoeffs bandpass = design_bandpass(diag);
    const FilterCoeffs lowpass = design_envelope_lowpass();

    SampleMatrix result(raw.rows(), raw.cols());
    for (Eigen::Index ch = 0; ch < raw.rows(); ++ch) {
        result.row(ch) = channel_gain(raw.row(ch), bandpass, lowpass);
    }
    gain = result;
    return Status::kOk;
}

Status LockInCalibrator::calibrate(const SampleMatrix& raw, SampleMatrix& out,
                                   Diagnostics& diag) const {
    SampleMatrix gain;
    const Status status = gain_envelope(raw, gain, diag);
    if (status != Status::kOk) {
        return status;
    }

    SampleMatrix result = raw.cwiseProduct(gain);
    baseline_correct(result);

    DBG_PRINT("[LockIn] %lld ch x %lld samples, ref %.1f Hz -> target %.0f",
              static_cast<long long>(raw.rows()), static_cast<long long>(raw.cols()),
              config.reference_freq_hz, config.target_peak);
    diag.report(Stage::kCalibration, noise_reduction_pct(raw, result), false);
    out = result;
    return Status::kOk;
}

} // namespace oc
