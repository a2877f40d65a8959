// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "dsp/spectrum.h"

#include <cmath>

namespace oc {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kFloorDb = -300.0;

// A component below this fraction of the channel peak is rounding noise and
// carries no meaningful attenuation figure
constexpr double kRelativeProbeFloor = 1e-9;

} // anonymous namespace

double tone_amplitude(const Signal& x, double fsHz, double freqHz) {
    const Eigen::Index n = x.size();
    if (n == 0 || !(fsHz > 0.0)) {
        return 0.0;
    }
    const double mean = x.mean();
    const double w = 2.0 * kPi * freqHz / fsHz;
    double re = 0.0;
    double im = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double v = x[i] - mean;
        const double phase = w * static_cast<double>(i);
        re += v * std::cos(phase);
        im -= v * std::sin(phase);
    }
    return 2.0 * std::sqrt(re * re + im * im) / static_cast<double>(n);
}

double tone_level_db(const Signal& x, double fsHz, double freqHz) {
    const double amp = tone_amplitude(x, fsHz, freqHz);
    if (!(amp > 0.0)) {
        return kFloorDb;
    }
    const double db = 20.0 * std::log10(amp);
    return (db < kFloorDb) ? kFloorDb : db;
}

double mean_attenuation_db(const SampleMatrix& before, const SampleMatrix& after,
                           double fsHz, double freqHz) {
    if (before.cols() == 0) {
        return 0.0;
    }
    double sum = 0.0;
    int32_t counted = 0;
    for (Eigen::Index ch = 0; ch < before.rows(); ++ch) {
        const double floorAmp = kRelativeProbeFloor * before.row(ch).cwiseAbs().maxCoeff();
        if (!(tone_amplitude(before.row(ch), fsHz, freqHz) > floorAmp)) {
            continue;
        }
        sum += tone_level_db(before.row(ch), fsHz, freqHz)
             - tone_level_db(after.row(ch), fsHz, freqHz);
        ++counted;
    }
    return (counted == 0) ? 0.0 : sum / static_cast<double>(counted);
}

} // namespace oc
