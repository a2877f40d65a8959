// Causal DF2T filtering and forward-backward zero-phase filtering.

#include "dsp/zero_phase.h"

#include <cmath>
#include <cstdint>
#include <vector>

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

oc::FilterCoeffs lowpass_200hz() {
    oc::FilterCoeffs f;
    oc::design_fir_lowpass(100, 200.0 / (kFs * 0.5), f);
    return f;
}

} // anonymous namespace

// ============================================================================
// Causal Filtering
// ============================================================================

TEST(ZeroPhase, CausalUnitDelay) {
    oc::FilterCoeffs delay;
    delay.b = {0.0, 1.0};
    oc::Signal x(3);
    x << 1.0, 2.0, 3.0;
    const oc::Signal y = oc::filter_causal(delay, x);
    EXPECT_DOUBLE_EQ(y[0], 0.0);
    EXPECT_DOUBLE_EQ(y[1], 1.0);
    EXPECT_DOUBLE_EQ(y[2], 2.0);
}

TEST(ZeroPhase, CausalFirLagsByHalfOrder) {
    const oc::FilterCoeffs lp = lowpass_200hz();
    ASSERT_EQ(lp.order(), 100);
    const oc::Signal x = sine(50.0, 1.0, 4800);
    const oc::Signal y = oc::filter_causal(lp, x);
    for (int32_t i = 1000; i < 2000; ++i) {
        EXPECT_NEAR(y[i], x[i - 50], 0.01) << "i=" << i;
    }
}

TEST(ZeroPhase, IirMatchesDifferenceEquation) {
    oc::FilterCoeffs f;
    ASSERT_TRUE(oc::design_butter2_lowpass(0.1, f));
    const oc::Signal x = sine(300.0, 2.0, 64);
    const oc::Signal y = oc::filter_causal(f, x);

    // y[n] = b0 x[n] + b1 x[n-1] + b2 x[n-2] - a1 y[n-1] - a2 y[n-2]
    for (int32_t n = 0; n < 64; ++n) {
        double ref = f.b[0] * x[n];
        if (n >= 1) ref += f.b[1] * x[n - 1] - f.a[1] * y[n - 1];
        if (n >= 2) ref += f.b[2] * x[n - 2] - f.a[2] * y[n - 2];
        EXPECT_NEAR(y[n], ref, 1e-12);
    }
}

TEST(ZeroPhase, SteadyStateStateHoldsConstantInput) {
    oc::FilterCoeffs f;
    ASSERT_TRUE(oc::design_butter2_lowpass(0.05, f));
    const oc::Signal x = oc::Signal::Constant(200, 3.0);
    std::vector<double> zi = oc::steady_state_state(f);
    for (auto& v : zi) v *= 3.0;
    const oc::Signal y = oc::filter_causal(f, x, zi);
    for (int32_t i = 0; i < 200; ++i) {
        EXPECT_NEAR(y[i], 3.0, 1e-10);
    }
}

// ============================================================================
// Zero-phase Filtering
// ============================================================================

TEST(ZeroPhase, FiltfiltHasNoLag) {
    const oc::FilterCoeffs lp = lowpass_200hz();
    const oc::Signal x = sine(50.0, 1.0, 4800);
    const oc::Signal y = oc::filtfilt(lp, x);
    ASSERT_EQ(y.size(), x.size());
    for (int32_t i = 500; i < 4300; ++i) {
        EXPECT_NEAR(y[i], x[i], 0.01) << "i=" << i;
    }
}

TEST(ZeroPhase, FiltfiltPassesConstant) {
    const oc::Signal x = oc::Signal::Constant(500, 5.0);

    const oc::Signal yFir = oc::filtfilt(lowpass_200hz(), x);
    oc::FilterCoeffs butter;
    ASSERT_TRUE(oc::design_butter2_lowpass(0.01, butter));
    const oc::Signal yIir = oc::filtfilt(butter, x);

    for (int32_t i = 0; i < 500; ++i) {
        EXPECT_NEAR(yFir[i], 5.0, 1e-9);
        EXPECT_NEAR(yIir[i], 5.0, 1e-9);
    }
}

TEST(ZeroPhase, ShortSignalClampsEdge) {
    // 10 samples against a 300-sample edge reflection
    const oc::Signal x = sine(100.0, 1.0, 10);
    const oc::Signal y = oc::filtfilt(lowpass_200hz(), x);
    ASSERT_EQ(y.size(), 10);
    EXPECT_TRUE(y.allFinite());
}

TEST(ZeroPhase, RowsFilteredIndependently) {
    oc::SampleMatrix m(3, 400);
    m.row(0) = sine(50.0, 1.0, 400);
    m.row(1).setZero();
    m.row(2) = oc::Signal::Constant(400, -2.0);
    const oc::SampleMatrix out = oc::filtfilt_rows(lowpass_200hz(), m);
    ASSERT_EQ(out.rows(), 3);
    ASSERT_EQ(out.cols(), 400);
    EXPECT_DOUBLE_EQ(out.row(1).cwiseAbs().maxCoeff(), 0.0);
    EXPECT_NEAR(out(2, 200), -2.0, 1e-9);
}
