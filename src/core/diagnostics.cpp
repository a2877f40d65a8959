// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "core/diagnostics.h"

#include "opmclean/config.h"

#include <cstdio>

namespace oc {

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::kPipeline:    return "Pipeline";
        case Stage::kCalibration: return "Calibration";
        case Stage::kNotch:       return "Notch";
        case Stage::kRls:         return "RLS";
        case Stage::kHfc:         return "HFC";
        case Stage::kPowerLine:   return "PowerLine";
    }
    return "Unknown";
}

const char* status_name(Status status) {
    switch (status) {
        case Status::kOk:            return "OK";
        case Status::kInvalidConfig: return "INVALID_CONFIG";
        case Status::kShapeMismatch: return "SHAPE_MISMATCH";
    }
    return "UNKNOWN";
}

std::string violated(const char* rule, double value) {
    char buf[128];
    snprintf(buf, sizeof(buf), "%s, got %g", rule, value);
    return buf;
}

Status Diagnostics::fail(Stage stage, const std::string& parameter,
                         const std::string& constraint) {
    has_error = true;
    error.stage = stage;
    error.parameter = parameter;
    error.constraint = constraint;
    DBG_ERROR("[%s] %s %s", stage_name(stage), parameter.c_str(), constraint.c_str());
    return Status::kInvalidConfig;
}

Status Diagnostics::fail_shape(Stage stage, const std::string& parameter,
                               const std::string& constraint) {
    fail(stage, parameter, constraint);
    return Status::kShapeMismatch;
}

void Diagnostics::warn(Stage stage, const std::string& message) {
    DBG_PRINT("[%s] warning: %s", stage_name(stage), message.c_str());
    warnings.push_back({stage, message});
}

void Diagnostics::report(Stage stage, double noiseReductionPct, bool skipped) {
    DBG_PRINT("[%s] noise reduction %.1f%%%s", stage_name(stage),
              noiseReductionPct, skipped ? " (skipped)" : "");
    stages.push_back({stage, noiseReductionPct, skipped});
}

const StageReport* Diagnostics::find(Stage stage) const {
    for (const auto& s : stages) {
        if (s.stage == stage) {
            return &s;
        }
    }
    return nullptr;
}

size_t Diagnostics::warning_count(Stage stage) const {
    size_t count = 0;
    for (const auto& w : warnings) {
        if (w.stage == stage) {
            ++count;
        }
    }
    return count;
}

} // namespace oc
