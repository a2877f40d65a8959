// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_FUSION_HFC_PROJECTOR_H
#define OPMCLEAN_FUSION_HFC_PROJECTOR_H

// HomogeneousFieldProjector: homogeneous field correction (HFC).
//
// A spatially uniform interference field B couples into channel i as
// o_i . B. Stacking two orientation sets per channel gives
// N = [O_a | O_b] (channels x 6). Projecting the data onto the orthogonal
// complement of span(N) removes every homogeneous field component:
//   N = U S V^T (thin SVD), r = #{sigma > max(rows, cols) * eps * sigma_max}
//   P = I - U_r U_r^T,  out = P * data
// P is symmetric and idempotent. r == 0 (all-zero orientations) leaves the
// data untouched.

#include "core/diagnostics.h"
#include "math/sample_matrix.h"
#include "math/vec3.h"
#include "opmclean/config.h"

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

namespace oc {

struct HfcConfig {
    double rank_epsilon{opmclean::hfc::kRankEpsilon};
};

struct HomogeneousFieldProjector {
    HfcConfig config;

    // Derived by build(); empty until then
    Eigen::MatrixXd projection;
    int32_t rank{-1};

    // Orientation lists are per channel (row), equal length.
    Status build(const std::vector<Vec3>& orientationsA,
                 const std::vector<Vec3>& orientationsB, Diagnostics& diag);

    // out = projection * in. in must have as many rows as build() was given.
    Status apply(const SampleMatrix& in, SampleMatrix& out, Diagnostics& diag) const;

    // build() then apply().
    Status project(const SampleMatrix& in, const std::vector<Vec3>& orientationsA,
                   const std::vector<Vec3>& orientationsB, SampleMatrix& out,
                   Diagnostics& diag);

    bool built() const { return rank >= 0; }
};

} // namespace oc

#endif // OPMCLEAN_FUSION_HFC_PROJECTOR_H
