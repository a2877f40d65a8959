// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_MATH_SAMPLE_MATRIX_H
#define OPMCLEAN_MATH_SAMPLE_MATRIX_H

// SampleMatrix: channels x samples, double precision.
// Row-major so each channel is contiguous; per-channel filters read and
// write whole rows. Channel order is meaningful (reference vs target rows).

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

namespace oc {

using SampleMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Signal = Eigen::RowVectorXd;

// Subtract each channel's first sample from the whole channel.
void baseline_correct(SampleMatrix& m);

// Unbiased (N-1) variance of one channel. 0 for fewer than 2 samples.
double channel_variance(const Signal& x);

// Mean over channels of the per-channel variance.
double mean_channel_variance(const SampleMatrix& m);

// 100 * (1 - mean var after / mean var before). 0 when before has no variance.
double noise_reduction_pct(const SampleMatrix& before, const SampleMatrix& after);

// Per-channel power reduction: 100 * (1 - mean(after^2) / mean(before^2)).
// Channels with zero power before report 0.
std::vector<double> channel_power_reduction_pct(const SampleMatrix& before,
                                                const SampleMatrix& after);

// Copy the listed rows, in order, into a new matrix.
SampleMatrix select_rows(const SampleMatrix& m, const std::vector<int32_t>& rows);

// Rows start, start+step, start+2*step, ... (count rows).
SampleMatrix strided_rows(const SampleMatrix& m, int32_t start, int32_t step,
                          int32_t count);

// Merge two single-axis channel sets: out[2i] = first[i], out[2i+1] = second[i]
// for i < count. Both inputs must have at least count rows and equal samples.
SampleMatrix interleave_rows(const SampleMatrix& first, const SampleMatrix& second,
                             int32_t count);

bool all_finite(const SampleMatrix& m);

} // namespace oc

#endif // OPMCLEAN_MATH_SAMPLE_MATRIX_H
