// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 OPM-Clean Project
// Standalone pipeline replay harness.
// Reads a recorded matrix CSV (csv_loader.h format), runs the dual-axis
// pipeline with default configuration, writes the denoised matrix.
// Output becomes a change-indication regression baseline.
//
// Usage: opm_replay <input.csv> <output.csv> [Z|Y|BOTH]

#include <clocale>
#include <cstdio>

#include "csv_loader.h"
#include "replay/output_log.h"
#include "opmclean/config.h"
#include "pipeline/dual_axis_pipeline.h"

static void print_pipeline_config(FILE* f, const oc::PipelineConfig& c) {
    fprintf(f, "Pipeline configuration (OPM-Clean %s):\n", kVersionString);
    fprintf(f, "  sampling_rate_hz   = %.9g\n", c.sampling_rate_hz);
    fprintf(f, "  meg_sensor_count   = %d\n", static_cast<int>(c.meg_sensor_count));
    fprintf(f, "  ref Y / target     = %.9g Hz / %.9g\n", c.ref_freq_y_hz, c.target_peak_y);
    fprintf(f, "  ref Z / target     = %.9g Hz / %.9g\n", c.ref_freq_z_hz, c.target_peak_z);
    fprintf(f, "  notch bw/order/cascade = %.9g / %d / %d\n", c.notch_bandwidth_hz,
            static_cast<int>(c.notch_order), static_cast<int>(c.notch_cascade));
    fprintf(f, "  rls lambda / min   = %.9g / %d\n", c.rls.forgetting_factor,
            static_cast<int>(c.rls.min_samples));
    fprintf(f, "  hfc / mains notch  = %s / %s\n", c.apply_hfc ? "on" : "off",
            c.apply_power_line ? "on" : "off");
    fprintf(f, "  output axis        = %s\n", oc::output_axis_name(c.output_axis));
}

int main(int argc, char* argv[]) {
    // Locale-independent decimal formatting
    setlocale(LC_NUMERIC, "C");

    if (argc != 3 && argc != 4) {
        fprintf(stderr, "Usage: %s <input.csv> <output.csv> [Z|Y|BOTH]\n", argv[0]);
        return 1;
    }

    const char* input_path = argv[1];
    const char* output_path = argv[2];

    oc::DualAxisPipeline pipeline;
    if (argc == 4 && !oc::parse_output_axis(argv[3], pipeline.config.output_axis)) {
        fprintf(stderr, "Error: unknown axis '%s' (expected Z, Y or BOTH)\n", argv[3]);
        return 1;
    }

    oc::test::MatrixCsv input;
    if (!oc::test::load_matrix_csv(input_path, input)) {
        fprintf(stderr, "Error: cannot read input matrix: %s\n", input_path);
        return 1;
    }
    if (input.sampling_rate_hz > 0.0) {
        pipeline.config.sampling_rate_hz = input.sampling_rate_hz;
    } else {
        fprintf(stderr, "Warning: no '# fs=' header, assuming %d Hz\n",
                static_cast<int>(opmclean::layout::kSamplingRateHz));
    }

    // Recordings narrower than the full array: last kReferenceSensorCount
    // sensors are the references, the rest are head sensors
    const int32_t sensors = static_cast<int32_t>(input.data.rows() / 2);
    const int32_t fullArray = opmclean::layout::kMegSensorCount
                            + opmclean::layout::kReferenceSensorCount;
    if (sensors > opmclean::layout::kReferenceSensorCount && sensors < fullArray) {
        pipeline.config.meg_sensor_count = sensors - opmclean::layout::kReferenceSensorCount;
        pipeline.config.reference_sensor_indices.clear();
        for (int32_t i = pipeline.config.meg_sensor_count; i < sensors; ++i) {
            pipeline.config.reference_sensor_indices.push_back(i);
        }
    }

    oc::PipelineResult result;
    const oc::Status status = pipeline.run(input.data, result);
    if (status != oc::Status::kOk) {
        const oc::ConfigError& e = result.diagnostics.error;
        fprintf(stderr, "Error: %s in %s: %s %s\n", oc::status_name(status),
                oc::stage_name(e.stage), e.parameter.c_str(), e.constraint.c_str());
        return 1;
    }

    FILE* out = fopen(output_path, "w");
    if (!out) {
        fprintf(stderr, "Error: cannot open output file: %s\n", output_path);
        return 1;
    }
    oc::test::write_matrix_csv(out, result.output, pipeline.config.sampling_rate_hz);
    fclose(out);

    // Summary to stderr
    fprintf(stderr, "Replay complete: %s\n", input_path);
    fprintf(stderr, "  Input:  %lld ch x %lld samples\n",
            static_cast<long long>(input.data.rows()),
            static_cast<long long>(input.data.cols()));
    fprintf(stderr, "  Output: %lld ch x %lld samples\n",
            static_cast<long long>(result.output.rows()),
            static_cast<long long>(result.output.cols()));
    oc::test::write_diagnostics(stderr, result);
    print_pipeline_config(stderr, pipeline.config);

    return 0;
}
