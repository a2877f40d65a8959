// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
#include "pipeline/dual_axis_pipeline.h"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace oc {

namespace {

constexpr int32_t kRowsPerSensor = 2;

// Default sensitive axes of a head sensor
constexpr Vec3 kDefaultZ{0.0, 0.0, 1.0};
constexpr Vec3 kDefaultY{0.0, 1.0, 0.0};

bool equals_ignore_case(const char* a, const char* b) {
    while (*a != '\0' && *b != '\0') {
        if (std::toupper(static_cast<unsigned char>(*a)) !=
            std::toupper(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == *b;
}

} // anonymous namespace

const char* output_axis_name(OutputAxis axis) {
    switch (axis) {
        case OutputAxis::kZ:    return "Z";
        case OutputAxis::kY:    return "Y";
        case OutputAxis::kBoth: return "BOTH";
    }
    return "UNKNOWN";
}

bool parse_output_axis(const char* text, OutputAxis& axis) {
    if (text == nullptr) {
        return false;
    }
    if (equals_ignore_case(text, "Z")) {
        axis = OutputAxis::kZ;
    } else if (equals_ignore_case(text, "Y")) {
        axis = OutputAxis::kY;
    } else if (equals_ignore_case(text, "BOTH")) {
        axis = OutputAxis::kBoth;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Validation
// ============================================================================

Status DualAxisPipeline::validate(const SampleMatrix& raw, Diagnostics& diag) const {
    const PipelineConfig& c = config;
    if (raw.rows() == 0 || (raw.rows() % kRowsPerSensor) != 0) {
        return diag.fail(Stage::kPipeline, "raw_rows",
                         violated("must be a positive even count (Z/Y pairs)",
                                  static_cast<double>(raw.rows())));
    }
    if (raw.cols() == 0) {
        return diag.fail(Stage::kPipeline, "samples", "must be > 0");
    }
    if (!(c.sampling_rate_hz > 0.0)) {
        return diag.fail(Stage::kPipeline, "sampling_rate_hz",
                         violated("must be > 0", c.sampling_rate_hz));
    }
    if (!std::isfinite(c.input_gain)) {
        return diag.fail(Stage::kPipeline, "input_gain", "must be finite");
    }

    const int32_t sensors = static_cast<int32_t>(raw.rows() / kRowsPerSensor);
    if (c.meg_sensor_count < 1 || c.meg_sensor_count > sensors) {
        char msg[96];
        snprintf(msg, sizeof(msg), "must be in [1, %d], got %d",
                 static_cast<int>(sensors), static_cast<int>(c.meg_sensor_count));
        return diag.fail(Stage::kPipeline, "meg_sensor_count", msg);
    }
    if (c.reference_sensor_indices.empty()) {
        return diag.fail(Stage::kPipeline, "reference_sensor_indices", "must not be empty");
    }
    for (const int32_t idx : c.reference_sensor_indices) {
        if (idx < 0 || idx >= sensors) {
            char msg[96];
            snprintf(msg, sizeof(msg), "index %d outside [0, %d)",
                     static_cast<int>(idx), static_cast<int>(sensors));
            return diag.fail(Stage::kPipeline, "reference_sensor_indices", msg);
        }
    }

    const size_t megCount = static_cast<size_t>(c.meg_sensor_count);
    if (!c.orientation_z.empty() && c.orientation_z.size() != megCount) {
        return diag.fail(Stage::kPipeline, "orientation_z",
                         violated("length must equal meg_sensor_count",
                                  static_cast<double>(c.orientation_z.size())));
    }
    if (!c.orientation_y.empty() && c.orientation_y.size() != megCount) {
        return diag.fail(Stage::kPipeline, "orientation_y",
                         violated("length must equal meg_sensor_count",
                                  static_cast<double>(c.orientation_y.size())));
    }
    return Status::kOk;
}

// ============================================================================
// Stages
// ============================================================================

Status DualAxisPipeline::process_axis(const SampleMatrix& axisRaw, double refFreqHz,
                                      double targetPeak, SampleMatrix& out,
                                      std::vector<NotchAttenuation>& attenuation,
                                      Diagnostics& diag) const {
    LockInCalibrator calibrator;
    calibrator.config = config.lock_in;
    calibrator.config.sampling_rate_hz = config.sampling_rate_hz;
    calibrator.config.reference_freq_hz = refFreqHz;
    calibrator.config.target_peak = targetPeak;

    SampleMatrix calibrated;
    Status status = calibrator.calibrate(axisRaw, calibrated, diag);
    if (status != Status::kOk) {
        return status;
    }

    CascadedNotchFilter notch;
    notch.config.sampling_rate_hz = config.sampling_rate_hz;
    notch.config.frequencies_hz = {refFreqHz};
    notch.config.bandwidth_hz = config.notch_bandwidth_hz;
    notch.config.fir_order = config.notch_order;
    notch.config.cascade = config.notch_cascade;
    return notch.apply(calibrated, out, diag, attenuation);
}

void DualAxisPipeline::row_orientations(std::vector<Vec3>& rowsZ,
                                        std::vector<Vec3>& rowsY) const {
    const size_t megCount = static_cast<size_t>(config.meg_sensor_count);
    rowsZ.clear();
    rowsY.clear();
    // Both rows of a sensor share that sensor's direction pair
    for (size_t i = 0; i < megCount; ++i) {
        const Vec3 z = config.orientation_z.empty() ? kDefaultZ : config.orientation_z[i];
        const Vec3 y = config.orientation_y.empty() ? kDefaultY : config.orientation_y[i];
        for (int32_t r = 0; r < kRowsPerSensor; ++r) {
            rowsZ.push_back(z);
            rowsY.push_back(y);
        }
    }
}

Status DualAxisPipeline::run(const SampleMatrix& raw, PipelineResult& result) const {
    result = PipelineResult{};
    Diagnostics& diag = result.diagnostics;

    Status status = validate(raw, diag);
    if (status != Status::kOk) {
        return status;
    }

    const int32_t sensors = static_cast<int32_t>(raw.rows() / kRowsPerSensor);
    const int32_t megCount = config.meg_sensor_count;
    const SampleMatrix scaled = raw * config.input_gain;

    // Axis split + baseline
    SampleMatrix rawZ = strided_rows(scaled, 0, kRowsPerSensor, sensors);
    SampleMatrix rawY = strided_rows(scaled, 1, kRowsPerSensor, sensors);
    baseline_correct(rawZ);
    baseline_correct(rawY);

    SampleMatrix cleanZ;
    SampleMatrix cleanY;
    status = process_axis(rawZ, config.ref_freq_z_hz, config.target_peak_z, cleanZ,
                          result.notch_z, diag);
    if (status != Status::kOk) {
        return status;
    }
    status = process_axis(rawY, config.ref_freq_y_hz, config.target_peak_y, cleanY,
                          result.notch_y, diag);
    if (status != Status::kOk) {
        return status;
    }

    const SampleMatrix targets = interleave_rows(cleanZ, cleanY, megCount);

    const Eigen::Index refCount = static_cast<Eigen::Index>(config.reference_sensor_indices.size());
    SampleMatrix references(2 * refCount, raw.cols());
    references.topRows(refCount) = select_rows(cleanZ, config.reference_sensor_indices);
    references.bottomRows(refCount) = select_rows(cleanY, config.reference_sensor_indices);

    RecursiveNoiseCanceller canceller;
    canceller.config = config.rls;
    SampleMatrix denoised;
    status = canceller.apply(targets, references, denoised, diag, result.rls);
    if (status != Status::kOk) {
        return status;
    }

    if (config.apply_hfc) {
        std::vector<Vec3> rowsZ;
        std::vector<Vec3> rowsY;
        row_orientations(rowsZ, rowsY);
        HomogeneousFieldProjector projector;
        projector.config = config.hfc;
        SampleMatrix corrected;
        status = projector.project(denoised, rowsZ, rowsY, corrected, diag);
        if (status != Status::kOk) {
            return status;
        }
        result.hfc_rank = projector.rank;
        denoised = corrected;
    }

    if (config.apply_power_line) {
        PowerLineNotch mains;
        mains.config.sampling_rate_hz = config.sampling_rate_hz;
        mains.config.frequencies_hz = config.mains_frequencies_hz;
        mains.config.bandwidth_hz = config.mains_bandwidth_hz;
        SampleMatrix filtered;
        status = mains.apply(denoised, filtered, diag);
        if (status != Status::kOk) {
            return status;
        }
        denoised = filtered;
    }

    diag.report(Stage::kPipeline, noise_reduction_pct(targets, denoised), false);

    switch (config.output_axis) {
        case OutputAxis::kZ:
            result.output = strided_rows(denoised, 0, kRowsPerSensor, megCount);
            result.references = references.topRows(refCount);
            break;
        case OutputAxis::kY:
            result.output = strided_rows(denoised, 1, kRowsPerSensor, megCount);
            result.references = references.bottomRows(refCount);
            break;
        case OutputAxis::kBoth:
            result.output = denoised;
            result.references = references;
            break;
    }

    DBG_PRINT("[Pipeline] %d sensors (%d MEG), axis %s -> %lld x %lld",
              static_cast<int>(sensors), static_cast<int>(megCount),
              output_axis_name(config.output_axis),
              static_cast<long long>(result.output.rows()),
              static_cast<long long>(result.output.cols()));
    return Status::kOk;
}

} // namespace oc
