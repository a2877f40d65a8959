// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "filter/power_line_notch.h"

#include "dsp/fir_design.h"
#include "dsp/zero_phase.h"

#include <cstdio>

namespace oc {

Status PowerLineNotch::validate(Diagnostics& diag) const {
    if (!(config.sampling_rate_hz > 0.0)) {
        return diag.fail(Stage::kPowerLine, "sampling_rate_hz",
                         violated("must be > 0", config.sampling_rate_hz));
    }
    if (!(config.bandwidth_hz > 0.0)) {
        return diag.fail(Stage::kPowerLine, "bandwidth_hz",
                         violated("must be > 0", config.bandwidth_hz));
    }
    return Status::kOk;
}

Status PowerLineNotch::apply(const SampleMatrix& in, SampleMatrix& out,
                             Diagnostics& diag) const {
    const Status status = validate(diag);
    if (status != Status::kOk) {
        return status;
    }

    const double nyquist = config.sampling_rate_hz * 0.5;
    const double bw = config.bandwidth_hz / nyquist;
    SampleMatrix data = in;
    int32_t applied = 0;
    char msg[128];

    for (const double freq : config.frequencies_hz) {
        if (freq >= nyquist) {
            snprintf(msg, sizeof(msg), "mains notch %.1f Hz at or above Nyquist, skipped", freq);
            diag.warn(Stage::kPowerLine, msg);
            continue;
        }
        FilterCoeffs notch;
        if (!design_iir_notch(freq / nyquist, bw, notch)) {
            snprintf(msg, sizeof(msg), "mains notch design failed at %.1f Hz, skipped", freq);
            diag.warn(Stage::kPowerLine, msg);
            continue;
        }
        data = filtfilt_rows(notch, data);
        ++applied;
    }

    DBG_PRINT("[PowerLine] %d of %d notches applied", static_cast<int>(applied),
              static_cast<int>(config.frequencies_hz.size()));
    diag.report(Stage::kPowerLine, noise_reduction_pct(in, data), applied == 0);
    out = data;
    return Status::kOk;
}

} // namespace oc
