// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_FILTER_POWER_LINE_NOTCH_H
#define OPMCLEAN_FILTER_POWER_LINE_NOTCH_H

// PowerLineNotch: final mains-interference removal.
// 2nd-order IIR notch per frequency (-3 dB bandwidth as configured), applied
// zero-phase to every channel. Narrow compared with the calibration-tone
// notch; runs after field correction on the denoised channels.

#include "core/diagnostics.h"
#include "math/sample_matrix.h"
#include "opmclean/config.h"

#include <iterator>
#include <vector>

namespace oc {

struct PowerLineConfig {
    double sampling_rate_hz{opmclean::layout::kSamplingRateHz};
    std::vector<double> frequencies_hz{
        std::begin(opmclean::mains::kFrequenciesHz), std::end(opmclean::mains::kFrequenciesHz)};
    double bandwidth_hz{opmclean::mains::kBandwidthHz};
};

struct PowerLineNotch {
    PowerLineConfig config;

    Status validate(Diagnostics& diag) const;
    Status apply(const SampleMatrix& in, SampleMatrix& out, Diagnostics& diag) const;
};

} // namespace oc

#endif // OPMCLEAN_FILTER_POWER_LINE_NOTCH_H
