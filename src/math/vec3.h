// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_MATH_VEC3_H
#define OPMCLEAN_MATH_VEC3_H

// Vec3: sensitive-axis direction of one sensor, in head coordinates.
// Plain aggregate so orientation lists can sit in config structs; the HFC
// projector copies the components into its Eigen design matrix.
// Directions need not be unit length: the projector only uses their span.

namespace oc {

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // All three components finite (rejects NaN / Inf from config input)
    bool is_finite() const;
};

} // namespace oc

#endif // OPMCLEAN_MATH_VEC3_H
