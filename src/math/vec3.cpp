// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "math/vec3.h"

#include <cmath>

namespace oc {

bool Vec3::is_finite() const {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

} // namespace oc
