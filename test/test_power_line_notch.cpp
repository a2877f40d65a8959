// Mains notch: harmonic removal, passband preservation, Nyquist skips.

#include "filter/power_line_notch.h"
#include "dsp/spectrum.h"

#include <cmath>
#include <cstdint>

#include <gtest/gtest.h>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kFs = 4800.0;

oc::Signal sine(double freqHz, double amp, int32_t n) {
    oc::Signal x(n);
    for (int32_t i = 0; i < n; ++i) {
        x[i] = amp * std::sin(2.0 * kPi * freqHz * i / kFs);
    }
    return x;
}

} // anonymous namespace

TEST(PowerLineNotch, RemovesMainsKeepsDistantTone) {
    const int32_t n = 9600;
    oc::SampleMatrix in(2, n);
    in.row(0) = sine(50.0, 100.0, n) + sine(130.0, 10.0, n);
    in.row(1) = sine(150.0, 40.0, n) + sine(130.0, 10.0, n);

    oc::PowerLineNotch mains;
    mains.config.sampling_rate_hz = kFs;
    oc::Diagnostics diag;
    oc::SampleMatrix out;
    ASSERT_EQ(mains.apply(in, out, diag), oc::Status::kOk);
    ASSERT_EQ(out.rows(), 2);
    ASSERT_EQ(out.cols(), n);
    EXPECT_TRUE(diag.warnings.empty());

    // Middle second, away from the notch settling transient
    const oc::Signal mid0 = out.row(0).segment(2400, 4800);
    const oc::Signal mid1 = out.row(1).segment(2400, 4800);
    const double level50 = 20.0 * std::log10(100.0 / oc::tone_amplitude(mid0, kFs, 50.0));
    const double level150 = 20.0 * std::log10(40.0 / oc::tone_amplitude(mid1, kFs, 150.0));
    EXPECT_GT(level50, 20.0);
    EXPECT_GT(level150, 20.0);
    EXPECT_NEAR(oc::tone_amplitude(mid0, kFs, 130.0), 10.0, 0.1);
    EXPECT_NEAR(oc::tone_amplitude(mid1, kFs, 130.0), 10.0, 0.1);
}

TEST(PowerLineNotch, HarmonicsAboveNyquistSkipped) {
    oc::PowerLineNotch mains;
    mains.config.sampling_rate_hz = 400.0;  // Nyquist 200: skips 200 and 250

    const oc::SampleMatrix in = oc::SampleMatrix::Random(3, 800);
    oc::Diagnostics diag;
    oc::SampleMatrix out;
    ASSERT_EQ(mains.apply(in, out, diag), oc::Status::kOk);
    EXPECT_EQ(out.rows(), 3);
    EXPECT_EQ(out.cols(), 800);
    EXPECT_EQ(diag.warning_count(oc::Stage::kPowerLine), 2u);
}

TEST(PowerLineNotch, EmptyListIsSkippedStage) {
    oc::PowerLineNotch mains;
    mains.config.frequencies_hz.clear();

    const oc::SampleMatrix in = oc::SampleMatrix::Random(2, 100);
    oc::Diagnostics diag;
    oc::SampleMatrix out;
    ASSERT_EQ(mains.apply(in, out, diag), oc::Status::kOk);
    EXPECT_TRUE(out == in);
    ASSERT_NE(diag.find(oc::Stage::kPowerLine), nullptr);
    EXPECT_TRUE(diag.find(oc::Stage::kPowerLine)->skipped);
}

TEST(PowerLineNotch, InvalidParametersNamed) {
    const oc::SampleMatrix in = oc::SampleMatrix::Random(1, 100);
    oc::SampleMatrix out;
    {
        oc::PowerLineNotch mains;
        mains.config.bandwidth_hz = -2.0;
        oc::Diagnostics diag;
        EXPECT_EQ(mains.apply(in, out, diag), oc::Status::kInvalidConfig);
        EXPECT_EQ(diag.error.parameter, "bandwidth_hz");
        EXPECT_EQ(diag.error.stage, oc::Stage::kPowerLine);
    }
    {
        oc::PowerLineNotch mains;
        mains.config.sampling_rate_hz = 0.0;
        oc::Diagnostics diag;
        EXPECT_EQ(mains.apply(in, out, diag), oc::Status::kInvalidConfig);
        EXPECT_EQ(diag.error.parameter, "sampling_rate_hz");
    }
}
