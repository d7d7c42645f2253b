// ==============================================================================
// Layer 1: DSP Primitive - Windowed Power Spectrum Transform
// ==============================================================================
// Radix-2 FFT specialised for power spectral estimation. A frame goes in as
// real samples (optionally windowed, zero padded when short) and comes out
// as the one-sided power |X[k]|^2 for k = 0 .. N/2. Scaling to a density is
// left to the caller.
//
// All arithmetic after the window multiply is double precision.
//
// Algorithm: iterative Cooley-Tukey, decimation in time
// ==============================================================================

#pragma once

#include <parity/dsp/core/math_constants.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Parity {
namespace DSP {

/// Smallest transform length accepted by prepare()
inline constexpr size_t kMinFFTSize = 16;

/// Largest transform length accepted by prepare()
inline constexpr size_t kMaxFFTSize = 65536;

// =============================================================================
// PowerSpectrumFFT
// =============================================================================

/// @brief Frame-to-power-spectrum transform of a fixed power-of-two length
///
/// @par Usage Example
/// @code
/// PowerSpectrumFFT fft;
/// if (fft.prepare(4096)) {
///     std::vector<double> power(fft.numBins(), 0.0);
///     fft.transform(frame, frameLength, window.data());
///     fft.accumulatePower(power.data());
/// }
/// @endcode
class PowerSpectrumFFT {
public:
    PowerSpectrumFFT() noexcept = default;

    PowerSpectrumFFT(const PowerSpectrumFFT&) = delete;
    PowerSpectrumFFT& operator=(const PowerSpectrumFFT&) = delete;
    PowerSpectrumFFT(PowerSpectrumFFT&&) noexcept = default;
    PowerSpectrumFFT& operator=(PowerSpectrumFFT&&) noexcept = default;

    /// @brief Build the permutation and twiddle tables for a transform length
    /// @return false (and unprepared) unless size is a power of two in
    ///         [kMinFFTSize, kMaxFFTSize]
    bool prepare(size_t size) {
        size_ = 0;
        if (size < kMinFFTSize || size > kMaxFFTSize || !std::has_single_bit(size)) {
            return false;
        }

        bitReversal_.assign(size, 0);
        for (size_t i = 1, j = 0; i < size; ++i) {
            size_t bit = size >> 1;
            for (; (j & bit) != 0; bit >>= 1) {
                j ^= bit;
            }
            j ^= bit;
            bitReversal_[i] = j;
        }

        // W^k = exp(-2*pi*i*k/N), k < N/2
        twiddles_.resize(size / 2);
        for (size_t k = 0; k < twiddles_.size(); ++k) {
            const double angle = -kTwoPiD * static_cast<double>(k) / static_cast<double>(size);
            twiddles_[k] = {std::cos(angle), std::sin(angle)};
        }

        work_.assign(size, Bin{});
        size_ = size;
        return true;
    }

    /// @brief Transform one frame
    /// @param samples First sample of the frame
    /// @param count   Samples available; the rest of the frame is zero
    /// @param window  size() coefficients, or nullptr for a rectangular window
    void transform(const float* samples, size_t count, const float* window) noexcept {
        if (!isPrepared()) return;

        std::fill(work_.begin(), work_.end(), Bin{});
        const size_t used = samples == nullptr ? 0 : std::min(count, size_);
        for (size_t i = 0; i < used; ++i) {
            const double w = window == nullptr ? 1.0 : static_cast<double>(window[i]);
            work_[bitReversal_[i]].re = static_cast<double>(samples[i]) * w;
        }

        for (size_t span = 2; span <= size_; span <<= 1) {
            const size_t half = span / 2;
            const size_t stride = size_ / span;
            for (size_t base = 0; base < size_; base += span) {
                for (size_t j = 0; j < half; ++j) {
                    const Bin& w = twiddles_[j * stride];
                    Bin& a = work_[base + j];
                    Bin& b = work_[base + j + half];
                    const double tr = b.re * w.re - b.im * w.im;
                    const double ti = b.re * w.im + b.im * w.re;
                    b = {a.re - tr, a.im - ti};
                    a = {a.re + tr, a.im + ti};
                }
            }
        }
    }

    /// @brief |X[k]|^2 of the last transformed frame (0 outside 0 .. N/2)
    [[nodiscard]] double binPower(size_t k) const noexcept {
        if (!isPrepared() || k >= numBins()) return 0.0;
        return work_[k].re * work_[k].re + work_[k].im * work_[k].im;
    }

    /// @brief Add |X[k]|^2 of the last frame to accumulator[0 .. numBins()-1]
    void accumulatePower(double* accumulator) const noexcept {
        if (!isPrepared() || accumulator == nullptr) return;
        for (size_t k = 0; k < numBins(); ++k) {
            accumulator[k] += binPower(k);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief One-sided bin count N/2+1 (0 when unprepared)
    [[nodiscard]] size_t numBins() const noexcept { return size_ == 0 ? 0 : size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0; }

private:
    struct Bin {
        double re = 0.0;
        double im = 0.0;
    };

    size_t size_ = 0;
    std::vector<size_t> bitReversal_;
    std::vector<Bin> twiddles_;
    std::vector<Bin> work_;
};

} // namespace DSP
} // namespace Parity
