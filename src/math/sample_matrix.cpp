// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "math/sample_matrix.h"

#include <cmath>

namespace oc {

void baseline_correct(SampleMatrix& m) {
    if (m.cols() == 0) {
        return;
    }
    for (Eigen::Index ch = 0; ch < m.rows(); ++ch) {
        const double first = m(ch, 0);
        m.row(ch).array() -= first;
    }
}

double channel_variance(const Signal& x) {
    const Eigen::Index n = x.size();
    if (n < 2) {
        return 0.0;
    }
    const double mean = x.mean();
    return (x.array() - mean).square().sum() / static_cast<double>(n - 1);
}

double mean_channel_variance(const SampleMatrix& m) {
    if (m.rows() == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (Eigen::Index ch = 0; ch < m.rows(); ++ch) {
        sum += channel_variance(m.row(ch));
    }
    return sum / static_cast<double>(m.rows());
}

double noise_reduction_pct(const SampleMatrix& before, const SampleMatrix& after) {
    const double powerBefore = mean_channel_variance(before);
    if (!(powerBefore > 0.0)) {
        return 0.0;
    }
    const double powerAfter = mean_channel_variance(after);
    return 100.0 * (1.0 - powerAfter / powerBefore);
}

std::vector<double> channel_power_reduction_pct(const SampleMatrix& before,
                                                const SampleMatrix& after) {
    std::vector<double> pct(static_cast<size_t>(before.rows()), 0.0);
    for (Eigen::Index ch = 0; ch < before.rows(); ++ch) {
        const double pb = before.row(ch).squaredNorm();
        if (pb > 0.0) {
            const double pa = after.row(ch).squaredNorm();
            // Equal sample counts, so the mean-square ratio is the sum ratio
            pct[static_cast<size_t>(ch)] = 100.0 * (1.0 - pa / pb);
        }
    }
    return pct;
}

SampleMatrix select_rows(const SampleMatrix& m, const std::vector<int32_t>& rows) {
    SampleMatrix out(static_cast<Eigen::Index>(rows.size()), m.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = m.row(rows[i]);
    }
    return out;
}

SampleMatrix strided_rows(const SampleMatrix& m, int32_t start, int32_t step,
                          int32_t count) {
    SampleMatrix out(count, m.cols());
    for (int32_t i = 0; i < count; ++i) {
        out.row(i) = m.row(start + i * step);
    }
    return out;
}

SampleMatrix interleave_rows(const SampleMatrix& first, const SampleMatrix& second,
                             int32_t count) {
    SampleMatrix out(2 * static_cast<Eigen::Index>(count), first.cols());
    for (int32_t i = 0; i < count; ++i) {
        out.row(2 * i) = first.row(i);
        out.row(2 * i + 1) = second.row(i);
    }
    return out;
}

bool all_finite(const SampleMatrix& m) {
    return m.allFinite();
}

} // namespace oc
