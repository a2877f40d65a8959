// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_CORE_DIAGNOSTICS_H
#define OPMCLEAN_CORE_DIAGNOSTICS_H

// Status codes and the diagnostics record shared by every stage.
//
// Two error classes:
//   Configuration errors: invalid or inconsistent parameters. Fatal to the
//     call: the stage returns kInvalidConfig / kShapeMismatch, records the
//     parameter name and violated constraint, and leaves its output untouched.
//   Degenerate input: notch above Nyquist, failed filter design, zero-rank
//     orientation matrix. Local: the stage passes data through, appends a
//     Warning, and the pipeline continues.

#include <cstdint>
#include <string>
#include <vector>

namespace oc {

enum class Status : uint8_t {
    kOk = 0,
    kInvalidConfig,     // Parameter violates a documented constraint
    kShapeMismatch,     // Matrices disagree in channel or sample count
};

enum class Stage : uint8_t {
    kPipeline = 0,
    kCalibration,
    kNotch,
    kRls,
    kHfc,
    kPowerLine,
};

const char* stage_name(Stage stage);
const char* status_name(Status status);

// "<rule>, got <value>" for ConfigError::constraint.
std::string violated(const char* rule, double value);

struct ConfigError {
    Stage stage{Stage::kPipeline};
    std::string parameter;      // e.g. "forgetting_factor"
    std::string constraint;     // e.g. "must be in (0, 1], got 1.5"
};

struct Warning {
    Stage stage{Stage::kPipeline};
    std::string message;
};

// Per-stage summary. noise_reduction_pct = 100 * (1 - var_after / var_before)
// averaged over channels; 0 for a skipped stage.
struct StageReport {
    Stage stage{Stage::kPipeline};
    double noise_reduction_pct{};
    bool skipped{};
};

struct Diagnostics {
    std::vector<Warning> warnings;
    std::vector<StageReport> stages;
    bool has_error{};
    ConfigError error;

    // Records a fatal configuration error and returns kInvalidConfig.
    Status fail(Stage stage, const std::string& parameter,
                const std::string& constraint);

    // Records a sample/channel count mismatch and returns kShapeMismatch.
    Status fail_shape(Stage stage, const std::string& parameter,
                      const std::string& constraint);

    void warn(Stage stage, const std::string& message);
    void report(Stage stage, double noiseReductionPct, bool skipped);

    // First report for a stage, or nullptr.
    const StageReport* find(Stage stage) const;
    size_t warning_count(Stage stage) const;
};

} // namespace oc

#endif // OPMCLEAN_CORE_DIAGNOSTICS_H
