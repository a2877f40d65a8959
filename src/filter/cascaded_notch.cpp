// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "filter/cascaded_notch.h"

#include "dsp/fir_design.h"
#include "dsp/spectrum.h"
#include "dsp/zero_phase.h"

#include <algorithm>
#include <cstdio>

namespace oc {

using opmclean::notch::kEdgeMax;
using opmclean::notch::kEdgeMin;

Status CascadedNotchFilter::validate(Diagnostics& diag) const {
    const NotchConfig& c = config;
    if (!(c.sampling_rate_hz > 0.0)) {
        return diag.fail(Stage::kNotch, "sampling_rate_hz",
                         violated("must be > 0", c.sampling_rate_hz));
    }
    if (c.fir_order < 2 || (c.fir_order % 2) != 0) {
        return diag.fail(Stage::kNotch, "fir_order",
                         violated("must be even and >= 2", c.fir_order));
    }
    if (c.cascade < 1) {
        return diag.fail(Stage::kNotch, "cascade", violated("must be >= 1", c.cascade));
    }
    if (!(c.bandwidth_hz > 0.0)) {
        return diag.fail(Stage::kNotch, "bandwidth_hz",
                         violated("must be > 0", c.bandwidth_hz));
    }
    if (c.frequencies_hz.empty()) {
        return diag.fail(Stage::kNotch, "frequencies_hz", "must not be empty");
    }
    for (const double f : c.frequencies_hz) {
        if (!(f > 0.0)) {
            return diag.fail(Stage::kNotch, "frequencies_hz",
                             violated("every frequency must be > 0", f));
        }
    }
    return Status::kOk;
}

Status CascadedNotchFilter::apply(const SampleMatrix& in, SampleMatrix& out,
                                  Diagnostics& diag) const {
    std::vector<NotchAttenuation> attenuation;
    return apply(in, out, diag, attenuation);
}

Status CascadedNotchFilter::apply(const SampleMatrix& in, SampleMatrix& out,
                                  Diagnostics& diag,
                                  std::vector<NotchAttenuation>& attenuation) const {
    const Status status = validate(diag);
    if (status != Status::kOk) {
        return status;
    }

    const double nyquist = config.sampling_rate_hz * 0.5;
    std::vector<NotchAttenuation> report;
    SampleMatrix data = in;
    bool anyApplied = false;
    char msg[160];

    for (const double freq : config.frequencies_hz) {
        NotchAttenuation entry;
        entry.frequency_hz = freq;
        entry.skipped = true;

        if (freq >= nyquist) {
            snprintf(msg, sizeof(msg), "notch %.1f Hz at or above Nyquist %.1f Hz, skipped",
                     freq, nyquist);
            diag.warn(Stage::kNotch, msg);
            report.push_back(entry);
            continue;
        }

        const double wLow = std::max((freq - config.bandwidth_hz * 0.5) / nyquist, kEdgeMin);
        const double wHigh = std::min((freq + config.bandwidth_hz * 0.5) / nyquist, kEdgeMax);
        if (wLow >= wHigh) {
            snprintf(msg, sizeof(msg), "notch %.1f Hz has empty band [%.4f, %.4f], skipped",
                     freq, wLow, wHigh);
            diag.warn(Stage::kNotch, msg);
            report.push_back(entry);
            continue;
        }

        FilterCoeffs stop;
        if (!design_fir_bandstop(config.fir_order, wLow, wHigh, stop)) {
            snprintf(msg, sizeof(msg), "band-stop design failed at %.1f Hz, skipped", freq);
            diag.warn(Stage::kNotch, msg);
            report.push_back(entry);
            continue;
        }

        const SampleMatrix before = data;
        for (int32_t pass = 0; pass < config.cascade; ++pass) {
            data = filtfilt_rows(stop, data);
        }

        entry.skipped = false;
        entry.attenuation_db = mean_attenuation_db(before, data, config.sampling_rate_hz, freq);
        DBG_PRINT("[Notch] %.1f Hz x%d: %.1f dB", freq, static_cast<int>(config.cascade),
                  entry.attenuation_db);
        report.push_back(entry);
        anyApplied = true;
    }

    diag.report(Stage::kNotch, noise_reduction_pct(in, data), !anyApplied);
    attenuation = report;
    out = data;
    return Status::kOk;
}

} // namespace oc
