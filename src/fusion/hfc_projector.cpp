// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "fusion/hfc_projector.h"

#include <Eigen/SVD>

#include <algorithm>
#include <cstdio>

namespace oc {

namespace {

constexpr int32_t kAxisCount = 3;
constexpr int32_t kDesignCols = 2 * kAxisCount;

void put_row(Eigen::MatrixXd& m, Eigen::Index row, Eigen::Index col, const Vec3& v) {
    m(row, col) = v.x;
    m(row, col + 1) = v.y;
    m(row, col + 2) = v.z;
}

} // anonymous namespace

Status HomogeneousFieldProjector::build(const std::vector<Vec3>& orientationsA,
                                        const std::vector<Vec3>& orientationsB,
                                        Diagnostics& diag) {
    if (!(config.rank_epsilon > 0.0)) {
        return diag.fail(Stage::kHfc, "rank_epsilon",
                         violated("must be > 0", config.rank_epsilon));
    }
    if (orientationsA.empty()) {
        return diag.fail(Stage::kHfc, "orientations", "must have at least one channel");
    }
    if (orientationsA.size() != orientationsB.size()) {
        return diag.fail(Stage::kHfc, "orientations",
                         violated("second axis list length must equal first",
                                  static_cast<double>(orientationsB.size())));
    }

    const Eigen::Index channels = static_cast<Eigen::Index>(orientationsA.size());
    Eigen::MatrixXd design(channels, kDesignCols);
    for (Eigen::Index i = 0; i < channels; ++i) {
        const Vec3& a = orientationsA[static_cast<size_t>(i)];
        const Vec3& b = orientationsB[static_cast<size_t>(i)];
        if (!a.is_finite() || !b.is_finite()) {
            return diag.fail(Stage::kHfc, "orientations",
                             violated("components must be finite, channel",
                                      static_cast<double>(i)));
        }
        put_row(design, i, 0, a);
        put_row(design, i, kAxisCount, b);
    }

    const Eigen::JacobiSVD<Eigen::MatrixXd> svd(design, Eigen::ComputeThinU);
    const Eigen::VectorXd& sv = svd.singularValues();
    const double sigmaMax = (sv.size() > 0) ? sv(0) : 0.0;
    const double tol = static_cast<double>(std::max<Eigen::Index>(channels, kDesignCols))
                     * config.rank_epsilon * sigmaMax;

    int32_t r = 0;
    for (Eigen::Index i = 0; i < sv.size(); ++i) {
        if (sv(i) > tol) {
            ++r;
        }
    }

    projection = Eigen::MatrixXd::Identity(channels, channels);
    if (r > 0) {
        const Eigen::MatrixXd ur = svd.matrixU().leftCols(r);
        projection.noalias() -= ur * ur.transpose();
    } else {
        diag.warn(Stage::kHfc, "orientation matrix has rank 0, projection is identity");
    }
    rank = r;
    DBG_PRINT("[HFC] %lld channels, rank %d", static_cast<long long>(channels),
              static_cast<int>(rank));
    return Status::kOk;
}

Status HomogeneousFieldProjector::apply(const SampleMatrix& in, SampleMatrix& out,
                                        Diagnostics& diag) const {
    if (!built()) {
        return diag.fail(Stage::kHfc, "projection", "build() must succeed before apply()");
    }
    if (in.rows() != projection.rows()) {
        char msg[96];
        snprintf(msg, sizeof(msg), "channel count %lld != orientation count %lld",
                 static_cast<long long>(in.rows()), static_cast<long long>(projection.rows()));
        return diag.fail_shape(Stage::kHfc, "data", msg);
    }

    if (rank == 0) {
        diag.report(Stage::kHfc, 0.0, true);
        out = in;
        return Status::kOk;
    }

    SampleMatrix result = projection * in;
    diag.report(Stage::kHfc, noise_reduction_pct(in, result), false);
    out = result;
    return Status::kOk;
}

Status HomogeneousFieldProjector::project(const SampleMatrix& in,
                                          const std::vector<Vec3>& orientationsA,
                                          const std::vector<Vec3>& orientationsB,
                                          SampleMatrix& out, Diagnostics& diag) {
    if (static_cast<size_t>(in.rows()) != orientationsA.size()) {
        return diag.fail(Stage::kHfc, "orientations",
                         violated("list length must equal channel count",
                                  static_cast<double>(orientationsA.size())));
    }
    const Status status = build(orientationsA, orientationsB, diag);
    if (status != Status::kOk) {
        return status;
    }
    return apply(in, out, diag);
}

} // namespace oc
