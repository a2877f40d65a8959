// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "dsp/fir_design.h"

#include <cmath>
#include <complex>

namespace oc {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Hamming coefficients (0.54 - 0.46 cos)
constexpr double kHammingA0 = 0.54;
constexpr double kHammingA1 = 0.46;

// Normalization gain below this means the design collapsed
constexpr double kMinNormGain = 1e-12;

// -3 dB point used by the notch bandwidth definition
constexpr double kNotchGainDb = -3.0;

// Ideal low-pass impulse response with cutoff wc, centred at `centre`.
double ideal_lowpass(double wc, double n, double centre) {
    const double x = n - centre;
    if (x == 0.0) {
        return wc;
    }
    return std::sin(kPi * wc * x) / (kPi * x);
}

bool valid_edge(double w) {
    return std::isfinite(w) && w > 0.0 && w < 1.0;
}

// h[len-1-i] = h[i]. The two halves of a linear-phase design are computed
// from mirrored arguments and can differ in the last bits otherwise.
void mirror_halves(std::vector<double>& h) {
    const size_t len = h.size();
    for (size_t i = 0; i < len / 2; ++i) {
        h[len - 1 - i] = h[i];
    }
}

void apply_window(std::vector<double>& h) {
    const std::vector<double> win = hamming_window(static_cast<int32_t>(h.size()));
    for (size_t i = 0; i < h.size(); ++i) {
        h[i] *= win[i];
    }
}

// Scale so that |H| == 1 at normalized frequency w.
bool normalize_at(std::vector<double>& h, double w) {
    FilterCoeffs tmp;
    tmp.b = h;
    const double g = magnitude_response(tmp, w);
    if (!(g > kMinNormGain)) {
        return false;
    }
    for (auto& v : h) {
        v /= g;
    }
    return true;
}

} // anonymous namespace

int32_t FilterCoeffs::order() const {
    const size_t len = (b.size() > a.size()) ? b.size() : a.size();
    return (len == 0) ? 0 : static_cast<int32_t>(len - 1);
}

std::vector<double> hamming_window(int32_t length) {
    std::vector<double> w(static_cast<size_t>(length), 1.0);
    if (length < 2) {
        return w;
    }
    const double denom = static_cast<double>(length - 1);
    for (int32_t i = 0; i < length; ++i) {
        w[static_cast<size_t>(i)] =
            kHammingA0 - kHammingA1 * std::cos(2.0 * kPi * static_cast<double>(i) / denom);
    }
    mirror_halves(w);
    return w;
}

bool design_fir_lowpass(int32_t order, double wc, FilterCoeffs& out) {
    if (order < 1 || !valid_edge(wc)) {
        return false;
    }
    const double centre = static_cast<double>(order) * 0.5;
    std::vector<double> h(static_cast<size_t>(order + 1));
    for (int32_t n = 0; n <= order; ++n) {
        h[static_cast<size_t>(n)] = ideal_lowpass(wc, n, centre);
    }
    mirror_halves(h);
    apply_window(h);
    if (!normalize_at(h, 0.0)) {
        return false;
    }
    out.b = h;
    out.a = {1.0};
    return true;
}

bool design_fir_bandpass(int32_t order, double w1, double w2, FilterCoeffs& out) {
    if (order < 1 || !valid_edge(w1) || !valid_edge(w2) || w1 >= w2) {
        return false;
    }
    const double centre = static_cast<double>(order) * 0.5;
    std::vector<double> h(static_cast<size_t>(order + 1));
    for (int32_t n = 0; n <= order; ++n) {
        h[static_cast<size_t>(n)] =
            ideal_lowpass(w2, n, centre) - ideal_lowpass(w1, n, centre);
    }
    mirror_halves(h);
    apply_window(h);
    // Unit gain at the passband centre
    if (!normalize_at(h, 0.5 * (w1 + w2))) {
        return false;
    }
    out.b = h;
    out.a = {1.0};
    return true;
}

bool design_fir_bandstop(int32_t order, double w1, double w2, FilterCoeffs& out) {
    if (order < 2 || (order % 2) != 0 ||
        !valid_edge(w1) || !valid_edge(w2) || w1 >= w2) {
        return false;
    }
    const double centre = static_cast<double>(order) * 0.5;
    std::vector<double> h(static_cast<size_t>(order + 1));
    for (int32_t n = 0; n <= order; ++n) {
        const double impulse = (n == order / 2) ? 1.0 : 0.0;
        h[static_cast<size_t>(n)] = impulse
            - (ideal_lowpass(w2, n, centre) - ideal_lowpass(w1, n, centre));
    }
    mirror_halves(h);
    apply_window(h);
    if (!normalize_at(h, 0.0)) {
        return false;
    }
    out.b = h;
    out.a = {1.0};
    return true;
}

FilterCoeffs moving_average(int32_t length) {
    if (length < 1) {
        length = 1;
    }
    FilterCoeffs f;
    f.b.assign(static_cast<size_t>(length), 1.0 / static_cast<double>(length));
    f.a = {1.0};
    return f;
}

bool design_butter2_lowpass(double wc, FilterCoeffs& out) {
    if (!valid_edge(wc)) {
        return false;
    }
    // Bilinear transform with frequency pre-warping
    const double k = std::tan(kPi * wc * 0.5);
    const double k2 = k * k;
    const double sqrt2 = std::sqrt(2.0);
    const double norm = 1.0 / (1.0 + sqrt2 * k + k2);

    const double b0 = k2 * norm;
    out.b = {b0, 2.0 * b0, b0};
    out.a = {1.0, 2.0 * (k2 - 1.0) * norm, (1.0 - sqrt2 * k + k2) * norm};
    return true;
}

bool design_iir_notch(double w0, double bw, FilterCoeffs& out) {
    if (!valid_edge(w0) || !(bw > 0.0) || !std::isfinite(bw)) {
        return false;
    }
    const double gb = std::pow(10.0, kNotchGainDb / 20.0);
    const double beta = (std::sqrt(1.0 - gb * gb) / gb) * std::tan(kPi * bw * 0.5);
    const double gain = 1.0 / (1.0 + beta);
    const double c = std::cos(kPi * w0);

    out.b = {gain, -2.0 * gain * c, gain};
    out.a = {1.0, -2.0 * gain * c, 2.0 * gain - 1.0};
    return true;
}

double magnitude_response(const FilterCoeffs& f, double w) {
    const std::complex<double> z1 = std::polar(1.0, -kPi * w);
    std::complex<double> num(0.0, 0.0);
    std::complex<double> zk(1.0, 0.0);
    for (const double bk : f.b) {
        num += bk * zk;
        zk *= z1;
    }
    std::complex<double> den(0.0, 0.0);
    zk = std::complex<double>(1.0, 0.0);
    for (const double ak : f.a) {
        den += ak * zk;
        zk *= z1;
    }
    if (std::abs(den) == 0.0) {
        return 0.0;
    }
    return std::abs(num / den);
}

} // namespace oc
