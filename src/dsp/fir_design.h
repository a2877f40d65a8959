// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_DSP_FIR_DESIGN_H
#define OPMCLEAN_DSP_FIR_DESIGN_H

// Filter design for the denoising stages.
//
// FIR: Hamming-windowed sinc (window method), order N -> N+1 taps, linear
// phase with group delay N/2. Scaled to unit gain at DC (low-pass,
// band-stop) or at the passband centre (band-pass).
// IIR: 2nd-order Butterworth low-pass (bilinear, pre-warped) and 2nd-order
// notch with -3 dB bandwidth.
//
// All frequencies are normalized to Nyquist: 1.0 == Fs/2.
// Design functions return false on degenerate edges; out is untouched.

#include <cstdint>
#include <vector>

namespace oc {

// Transfer function b(z)/a(z), a[0] == 1. FIR filters carry a == {1}.
// Immutable once designed; shared read-only across channels and passes.
struct FilterCoeffs {
    std::vector<double> b;
    std::vector<double> a{1.0};

    bool is_fir() const { return a.size() == 1; }
    int32_t order() const;
};

bool design_fir_lowpass(int32_t order, double wc, FilterCoeffs& out);
bool design_fir_bandpass(int32_t order, double w1, double w2, FilterCoeffs& out);

// Band-stop requires an even order (odd order puts a forced zero at Nyquist).
bool design_fir_bandstop(int32_t order, double w1, double w2, FilterCoeffs& out);

// Boxcar of `length` taps summing to 1. Fallback smoother.
FilterCoeffs moving_average(int32_t length);

bool design_butter2_lowpass(double wc, FilterCoeffs& out);

// w0: notch centre, bw: -3 dB bandwidth, both normalized to Nyquist.
bool design_iir_notch(double w0, double bw, FilterCoeffs& out);

// |H(e^{j*pi*w})| at normalized frequency w.
double magnitude_response(const FilterCoeffs& f, double w);

// Hamming window of `length` points (symmetric).
std::vector<double> hamming_window(int32_t length);

} // namespace oc

#endif // OPMCLEAN_DSP_FIR_DESIGN_H
