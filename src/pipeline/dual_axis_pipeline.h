// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#ifndef OPMCLEAN_PIPELINE_DUAL_AXIS_PIPELINE_H
#define OPMCLEAN_PIPELINE_DUAL_AXIS_PIPELINE_H

// DualAxisPipeline: full denoising chain for a dual-axis OPM recording.
//
// Raw layout: two rows per physical sensor, [Z0, Y0, Z1, Y1, ...].
// Sensors [0, meg_sensor_count) are head sensors (targets); the sensors
// listed in reference_sensor_indices drive the reference regression.
//
//   gain -> split Z/Y + baseline -> lock-in per axis -> tone notch per axis
//   -> interleave targets -> RLS (refs: Z refs, then Y refs) -> HFC
//   -> mains notch -> axis selection
//
// Every stage preserves shape; only the final selection narrows channels.

#include "calibration/lock_in_calibrator.h"
#include "core/diagnostics.h"
#include "filter/cascaded_notch.h"
#include "filter/power_line_notch.h"
#include "fusion/hfc_projector.h"
#include "fusion/rls_canceller.h"
#include "math/sample_matrix.h"
#include "math/vec3.h"
#include "opmclean/config.h"

#include <cstdint>
#include <iterator>
#include <vector>

namespace oc {

enum class OutputAxis : uint8_t {
    kZ = 0,     // Even interleaved rows
    kY,         // Odd interleaved rows
    kBoth,
};

const char* output_axis_name(OutputAxis axis);

// Accepts "Z", "Y", "BOTH" (case-insensitive). False on anything else.
bool parse_output_axis(const char* text, OutputAxis& axis);

struct PipelineConfig {
    double sampling_rate_hz{opmclean::layout::kSamplingRateHz};
    double input_gain{opmclean::layout::kInputGain};
    int32_t meg_sensor_count{opmclean::layout::kMegSensorCount};
    std::vector<int32_t> reference_sensor_indices{
        std::begin(opmclean::layout::kReferenceSensors),
        std::end(opmclean::layout::kReferenceSensors)};

    // Per-axis calibration tone. Sampling rate is taken from this struct.
    double ref_freq_y_hz{opmclean::calibration::kRefFreqYHz};
    double target_peak_y{opmclean::calibration::kTargetPeakY};
    double ref_freq_z_hz{opmclean::calibration::kRefFreqZHz};
    double target_peak_z{opmclean::calibration::kTargetPeakZ};
    LockInConfig lock_in;       // Filter options shared by both axes

    // Tone notch options; centre frequency is the axis' calibration tone
    double notch_bandwidth_hz{opmclean::notch::kBandwidthHz};
    int32_t notch_order{opmclean::notch::kFirOrder};
    int32_t notch_cascade{opmclean::notch::kCascade};

    RlsConfig rls;

    bool apply_hfc{true};
    HfcConfig hfc;
    // Per head sensor sensitive directions. Empty = (0,0,1) for Z, (0,1,0) for Y.
    std::vector<Vec3> orientation_z;
    std::vector<Vec3> orientation_y;

    bool apply_power_line{true};
    std::vector<double> mains_frequencies_hz{
        std::begin(opmclean::mains::kFrequenciesHz), std::end(opmclean::mains::kFrequenciesHz)};
    double mains_bandwidth_hz{opmclean::mains::kBandwidthHz};

    OutputAxis output_axis{OutputAxis::kZ};
};

struct PipelineResult {
    SampleMatrix output;        // Selected axis rows of the denoised targets
    SampleMatrix references;    // Reference rows for the selected axis
    Diagnostics diagnostics;
    RlsReport rls;
    std::vector<NotchAttenuation> notch_z;
    std::vector<NotchAttenuation> notch_y;
    int32_t hfc_rank{-1};       // -1 when HFC is disabled
};

struct DualAxisPipeline {
    PipelineConfig config;

    Status validate(const SampleMatrix& raw, Diagnostics& diag) const;

    // On error result.diagnostics holds the ConfigError; output is empty.
    Status run(const SampleMatrix& raw, PipelineResult& result) const;

private:
    Status process_axis(const SampleMatrix& axisRaw, double refFreqHz, double targetPeak,
                        SampleMatrix& out, std::vector<NotchAttenuation>& attenuation,
                        Diagnostics& diag) const;
    void row_orientations(std::vector<Vec3>& rowsZ, std::vector<Vec3>& rowsY) const;
};

} // namespace oc

#endif // OPMCLEAN_PIPELINE_DUAL_AXIS_PIPELINE_H
