// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "dsp/zero_phase.h"

#include <Eigen/LU>

namespace oc {

namespace {

// Edge reflection length = kEdgeFactor * (nfilt - 1)
constexpr int32_t kEdgeFactor = 3;

// Coefficients padded to equal length order+1 and normalized by a[0].
struct Normalized {
    std::vector<double> b;
    std::vector<double> a;
    int32_t order{};
};

Normalized normalize(const FilterCoeffs& f) {
    Normalized n;
    n.order = f.order();
    const size_t len = static_cast<size_t>(n.order) + 1;
    n.b.assign(len, 0.0);
    n.a.assign(len, 0.0);
    const double a0 = (f.a.empty() || f.a[0] == 0.0) ? 1.0 : f.a[0];
    for (size_t i = 0; i < f.b.size(); ++i) {
        n.b[i] = f.b[i] / a0;
    }
    if (f.a.empty()) {
        n.a[0] = 1.0;
    }
    for (size_t i = 0; i < f.a.size(); ++i) {
        n.a[i] = f.a[i] / a0;
    }
    return n;
}

Signal reversed(const Signal& x) {
    return x.reverse();
}

std::vector<double> scaled(const std::vector<double>& v, double s) {
    std::vector<double> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = v[i] * s;
    }
    return out;
}

} // anonymous namespace

Signal filter_causal(const FilterCoeffs& f, const Signal& x) {
    return filter_causal(f, x, {});
}

Signal filter_causal(const FilterCoeffs& f, const Signal& x,
                     const std::vector<double>& zi) {
    const Normalized c = normalize(f);
    const int32_t order = c.order;
    const Eigen::Index n = x.size();
    Signal y(n);

    if (order == 0) {
        y = x * c.b[0];
        return y;
    }

    std::vector<double> z(static_cast<size_t>(order), 0.0);
    if (zi.size() == z.size()) {
        z = zi;
    }

    const bool fir = f.is_fir();
    for (Eigen::Index i = 0; i < n; ++i) {
        const double xi = x[i];
        const double yi = c.b[0] * xi + z[0];
        if (fir) {
            for (int32_t k = 0; k < order - 1; ++k) {
                z[static_cast<size_t>(k)] = c.b[static_cast<size_t>(k + 1)] * xi
                                            + z[static_cast<size_t>(k + 1)];
            }
            z[static_cast<size_t>(order - 1)] = c.b[static_cast<size_t>(order)] * xi;
        } else {
            for (int32_t k = 0; k < order - 1; ++k) {
                z[static_cast<size_t>(k)] = c.b[static_cast<size_t>(k + 1)] * xi
                                            + z[static_cast<size_t>(k + 1)]
                                            - c.a[static_cast<size_t>(k + 1)] * yi;
            }
            z[static_cast<size_t>(order - 1)] = c.b[static_cast<size_t>(order)] * xi
                                                - c.a[static_cast<size_t>(order)] * yi;
        }
        y[i] = yi;
    }
    return y;
}

std::vector<double> steady_state_state(const FilterCoeffs& f) {
    const Normalized c = normalize(f);
    const int32_t order = c.order;
    std::vector<double> zi(static_cast<size_t>(order), 0.0);
    if (order == 0) {
        return zi;
    }

    if (f.is_fir()) {
        // z_k = sum_{j > k} b_j for a constant unit input
        double acc = 0.0;
        for (int32_t k = order - 1; k >= 0; --k) {
            acc += c.b[static_cast<size_t>(k + 1)];
            zi[static_cast<size_t>(k)] = acc;
        }
        return zi;
    }

    // (I - companion(a)^T) zi = b[1:] - a[1:] * b[0]
    Eigen::MatrixXd iMinusA = Eigen::MatrixXd::Identity(order, order);
    Eigen::VectorXd rhs(order);
    for (int32_t i = 0; i < order; ++i) {
        iMinusA(i, 0) += c.a[static_cast<size_t>(i + 1)];
        if (i + 1 < order) {
            iMinusA(i, i + 1) -= 1.0;
        }
        rhs(i) = c.b[static_cast<size_t>(i + 1)] - c.a[static_cast<size_t>(i + 1)] * c.b[0];
    }
    const Eigen::VectorXd sol = iMinusA.partialPivLu().solve(rhs);
    for (int32_t i = 0; i < order; ++i) {
        zi[static_cast<size_t>(i)] = sol(i);
    }
    return zi;
}

Signal filtfilt(const FilterCoeffs& f, const Signal& x) {
    const Eigen::Index n = x.size();
    if (n == 0) {
        return x;
    }

    Eigen::Index edge = static_cast<Eigen::Index>(kEdgeFactor) * f.order();
    if (edge > n - 1) {
        edge = n - 1;
    }

    // Odd reflection about the end samples
    Signal ext(n + 2 * edge);
    const double first = x[0];
    const double last = x[n - 1];
    for (Eigen::Index i = 0; i < edge; ++i) {
        ext[i] = 2.0 * first - x[edge - i];
        ext[n + edge + i] = 2.0 * last - x[n - 2 - i];
    }
    ext.segment(edge, n) = x;

    const std::vector<double> zi = steady_state_state(f);

    const Signal fwd = filter_causal(f, ext, scaled(zi, ext[0]));
    const Signal rev = reversed(fwd);
    const Signal back = filter_causal(f, rev, scaled(zi, rev[0]));

    return reversed(back).segment(edge, n);
}

SampleMatrix filtfilt_rows(const FilterCoeffs& f, const SampleMatrix& m) {
    SampleMatrix out(m.rows(), m.cols());
    for (Eigen::Index ch = 0; ch < m.rows(); ++ch) {
        out.row(ch) = filtfilt(f, m.row(ch));
    }
    return out;
}

} // namespace oc
