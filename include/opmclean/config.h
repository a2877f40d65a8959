/**
 * @file config.h
 * @brief OPM-Clean build configuration and processing defaults
 *
 * Per CODING_STANDARDS.md:
 * - Constants use k prefix: kSampleRate, kMaxRetries
 * - Stage config structs default-initialize from these constants
 */

#ifndef OPMCLEAN_CONFIG_H
#define OPMCLEAN_CONFIG_H

#include <chrono>
#include <cstdint>
#include <cstdio>

// ============================================================================
// Version Information
// ============================================================================

constexpr uint8_t     kVersionMajor  = 0;
constexpr uint8_t     kVersionMinor  = 3;
constexpr uint8_t     kVersionPatch  = 0;
constexpr const char* kVersionString = "0.3.0";

namespace opmclean {

// ============================================================================
// Acquisition Layout (OPM dual-axis array)
// ============================================================================

namespace layout {

constexpr int32_t kSamplingRateHz     = 4800;   // NI acquisition rate
constexpr double  kInputGain          = 1.0;    // Raw units pass through unscaled
constexpr int32_t kMegSensorCount     = 64;     // Head-mounted sensors
constexpr int32_t kReferenceSensors[] = {64, 65, 66};  // 0-based, tri-axial reference
constexpr int32_t kReferenceSensorCount = 3;

} // namespace layout

// ============================================================================
// Lock-in Gain Calibration
// ============================================================================

namespace calibration {

// Internal coil calibration tones (Y axis 240 Hz, Z axis 320 Hz)
constexpr double  kRefFreqYHz         = 240.0;
constexpr double  kTargetPeakY        = 62400.0;
constexpr double  kRefFreqZHz         = 320.0;
constexpr double  kTargetPeakZ        = 55600.0;

constexpr int32_t kBandpassOrder      = 100;    // Group delay = 50 samples
constexpr double  kBandHalfWidthHz    = 5.0;    // Band-pass edges at ref +/- 5 Hz
constexpr double  kEnvelopeCutoffHz   = 2.0;    // I/Q smoothing low-pass
constexpr double  kMinAmplitudeFrac   = 0.01;   // Floor as fraction of target peak
constexpr double  kMinGain            = 0.1;
constexpr double  kMaxGain            = 10.0;

} // namespace calibration

// ============================================================================
// Cascaded Calibration-Tone Notch
// ============================================================================

namespace notch {

constexpr double  kBandwidthHz        = 10.0;
constexpr int32_t kFirOrder           = 400;    // Must be even (type I band-stop)
constexpr int32_t kCascade            = 6;      // ~58 dB at centre for 240 Hz @ 4800 Hz
constexpr double  kEdgeMin            = 0.001;  // Normalized edge clip (x Nyquist)
constexpr double  kEdgeMax            = 0.999;

} // namespace notch

// ============================================================================
// RLS Reference Noise Cancellation
// ============================================================================

namespace rls {

constexpr double  kForgettingFactor   = 0.995;
constexpr int32_t kMinSamples         = 100;
constexpr double  kInitialInverseCorr = 1000.0;  // P0 = k * I

} // namespace rls

// ============================================================================
// Homogeneous Field Correction
// ============================================================================

namespace hfc {

// Rank tolerance = max(rows, cols) * kRankEpsilon * sigma_max
constexpr double  kRankEpsilon        = 2.220446049250313e-16;

} // namespace hfc

// ============================================================================
// Power-Line Notch
// ============================================================================

namespace mains {

constexpr double  kFrequenciesHz[]    = {50.0, 100.0, 150.0, 200.0, 250.0};
constexpr int32_t kFrequencyCount     = 5;
constexpr double  kBandwidthHz        = 2.0;

} // namespace mains

} // namespace opmclean

// ============================================================================
// Debug Macros
// ============================================================================

// Single #ifdef CONFIG_DEBUG bridge sets constexpr bool; all downstream code
// uses if constexpr (zero overhead when disabled).
// CMake option OPMCLEAN_DEBUG defines CONFIG_DEBUG.
#ifdef CONFIG_DEBUG
inline constexpr bool kDebugEnabled = true;
#else
inline constexpr bool kDebugEnabled = false;
#endif

inline unsigned long dbg_elapsed_us() {
    static const auto kStart = std::chrono::steady_clock::now();
    return static_cast<unsigned long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - kStart).count());
}

template<typename... Args>
inline void dbg_print(const char* fmt, Args... args) {
    if constexpr (kDebugEnabled) {
        fprintf(stderr, "[%lu] ", dbg_elapsed_us());
        if constexpr (sizeof...(Args) == 0) {
            fputs(fmt, stderr);     // No arguments: fmt is text, not a format
        } else {
            fprintf(stderr, fmt, args...);
        }
        fputc('\n', stderr);
    }
}

template<typename... Args>
inline void dbg_error(const char* fmt, Args... args) {
    if constexpr (kDebugEnabled) {
        fprintf(stderr, "[%lu] ERROR: ", dbg_elapsed_us());
        if constexpr (sizeof...(Args) == 0) {
            fputs(fmt, stderr);     // No arguments: fmt is text, not a format
        } else {
            fprintf(stderr, fmt, args...);
        }
        fputc('\n', stderr);
    }
}

#define DBG_PRINT(fmt, ...) dbg_print(fmt, ##__VA_ARGS__)
#define DBG_ERROR(fmt, ...) dbg_error(fmt, ##__VA_ARGS__)

#endif // OPMCLEAN_CONFIG_H
