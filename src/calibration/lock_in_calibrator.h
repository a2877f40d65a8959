// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_CALIBRATION_LOCK_IN_CALIBRATOR_H
#define OPMCLEAN_CALIBRATION_LOCK_IN_CALIBRATOR_H

// LockInCalibrator: per-sample gain correction from a known calibration tone.
//
// Each channel carries a coil-driven reference tone of known frequency. Its
// instantaneous amplitude is tracked by lock-in demodulation:
//   band-pass (causal FIR, ref +/- half width)
//   -> multiply by sin/cos at ref
//   -> zero-phase Butterworth low-pass of I and Q
//   -> A = 2 * sqrt(I^2 + Q^2)
// and the channel is rescaled by target / max(A, frac * target), clamped to
// [kMinGain, kMaxGain]. The gain is shifted left by the FIR group delay
// (order/2) before use; the tail holds the last gain value.
// Output is re-baselined (first sample of each channel subtracted).

#include "core/diagnostics.h"
#include "dsp/fir_design.h"
#include "math/sample_matrix.h"
#include "opmclean/config.h"

#include <cstdint>

namespace oc {

struct LockInConfig {
    double sampling_rate_hz{opmclean::layout::kSamplingRateHz};
    double reference_freq_hz{opmclean::calibration::kRefFreqYHz};
    double target_peak{opmclean::calibration::kTargetPeakY};
    int32_t fir_order{opmclean::calibration::kBandpassOrder};
    double band_half_width_hz{opmclean::calibration::kBandHalfWidthHz};
    double lowpass_cutoff_hz{opmclean::calibration::kEnvelopeCutoffHz};
    double min_amplitude_frac{opmclean::calibration::kMinAmplitudeFrac};
};

struct LockInCalibrator {
    LockInConfig config;

    // Checks every config constraint. On violation records the parameter in
    // diag and returns kInvalidConfig.
    Status validate(Diagnostics& diag) const;

    // Rescale raw by the compensated gain envelope, then re-baseline.
    // out is written only on kOk.
    Status calibrate(const SampleMatrix& raw, SampleMatrix& out,
                     Diagnostics& diag) const;

    // Compensated (delay-shifted) gain applied to each sample, same shape
    // as raw. Values lie in [kMinGain, kMaxGain].
    Status gain_envelope(const SampleMatrix& raw, SampleMatrix& gain,
                         Diagnostics& diag) const;

private:
    // Band-pass around the reference, or a moving average when the band
    // edges are degenerate (warning recorded).
    FilterCoeffs design_bandpass(Diagnostics& diag) const;
    FilterCoeffs design_envelope_lowpass() const;

    Signal channel_gain(const Signal& raw, const FilterCoeffs& bandpass,
                        const FilterCoeffs& lowpass) const;
};

} // namespace oc

#endif // OPMCLEAN_CALIBRATION_LOCK_IN_CALIBRATOR_H
