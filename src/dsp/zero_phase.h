// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_DSP_ZERO_PHASE_H
#define OPMCLEAN_DSP_ZERO_PHASE_H

// Causal and zero-phase (forward-backward) filtering of one channel.
//
// Causal path: direct form II transposed, optional initial state.
// Zero-phase path: odd reflection of 3*(nfilt-1) edge samples at both ends
// (clipped to n-1), steady-state initial conditions scaled by the first
// sample of each pass, filter forward, reverse, filter again, reverse.
// Net phase is exactly zero; magnitude response is |H|^2.
//
// Each call is a pure function of (channel, coefficients): channels can be
// processed independently.

#include "dsp/fir_design.h"
#include "math/sample_matrix.h"

#include <vector>

namespace oc {

// y = filter(b, a, x) with zero initial state.
Signal filter_causal(const FilterCoeffs& f, const Signal& x);

// Same with explicit initial DF2T state (size == order, or empty for zero).
Signal filter_causal(const FilterCoeffs& f, const Signal& x,
                     const std::vector<double>& zi);

// DF2T state that makes the step response start at steady state
// (state for a constant unit input). Scale by the input level before use.
std::vector<double> steady_state_state(const FilterCoeffs& f);

// Forward-backward filtering with edge reflection.
Signal filtfilt(const FilterCoeffs& f, const Signal& x);

// filtfilt applied to every row.
SampleMatrix filtfilt_rows(const FilterCoeffs& f, const SampleMatrix& m);

} // namespace oc

#endif // OPMCLEAN_DSP_ZERO_PHASE_H
