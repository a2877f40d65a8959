// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_FILTER_CASCADED_NOTCH_H
#define OPMCLEAN_FILTER_CASCADED_NOTCH_H

// CascadedNotchFilter: deep suppression of calibration tones.
//
// One windowed-sinc band-stop (Hamming, even order, edges f +/- bw/2) per
// centre frequency, applied zero-phase `cascade` times in a row. Each pass
// squares the stop-band rejection again, so attenuation at the centre grows
// with the cascade count while the passband keeps zero phase.
// Frequencies are processed in list order, each on the previous output.

#include "core/diagnostics.h"
#include "math/sample_matrix.h"
#include "opmclean/config.h"

#include <cstdint>
#include <vector>

namespace oc {

struct NotchConfig {
    double sampling_rate_hz{opmclean::layout::kSamplingRateHz};
    std::vector<double> frequencies_hz{opmclean::calibration::kRefFreqYHz};
    double bandwidth_hz{opmclean::notch::kBandwidthHz};
    int32_t fir_order{opmclean::notch::kFirOrder};
    int32_t cascade{opmclean::notch::kCascade};
};

// Measured effect at one centre frequency (mean over channels).
struct NotchAttenuation {
    double frequency_hz{};
    double attenuation_db{};
    bool skipped{};
};

struct CascadedNotchFilter {
    NotchConfig config;

    Status validate(Diagnostics& diag) const;

    Status apply(const SampleMatrix& in, SampleMatrix& out, Diagnostics& diag) const;

    // Same, also returning one NotchAttenuation per configured frequency.
    Status apply(const SampleMatrix& in, SampleMatrix& out, Diagnostics& diag,
                 std::vector<NotchAttenuation>& attenuation) const;
};

} // namespace oc

#endif // OPMCLEAN_FILTER_CASCADED_NOTCH_H
