// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_DSP_SPECTRUM_H
#define OPMCLEAN_DSP_SPECTRUM_H

// Single-frequency probe (Goertzel-style DFT bin at an arbitrary frequency).
// Used for notch attenuation reporting and in tests; not a full spectrum.

#include "math/sample_matrix.h"

namespace oc {

// Peak amplitude of the component of x at freq_hz: 2/N * |sum x[n] e^{-jwn}|.
// Mean is removed first. Exact for a tone with an integer number of cycles.
double tone_amplitude(const Signal& x, double fs_hz, double freq_hz);

// 20*log10 of tone_amplitude. Floors at -300 dB for a zero component.
double tone_level_db(const Signal& x, double fs_hz, double freq_hz);

// Mean over channels of (level before - level after) at freq_hz, in dB.
// Channels with no component at freq_hz before filtering (below 1e-9 of
// the channel peak) are ignored. 0 for an empty recording.
double mean_attenuation_db(const SampleMatrix& before, const SampleMatrix& after,
                           double fs_hz, double freq_hz);

} // namespace oc

#endif // OPMCLEAN_DSP_SPECTRUM_H
