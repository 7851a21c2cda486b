// src/core/ChatteringMeasure.cpp
//
// Implements the chattering measures of the **ChatteringOptimizationEngine**.
//
// Mathematical definitions (u_k sampled every dt seconds, N samples):
// • Derivative RMS:  sqrt( 1/(N-1) * sum_k ((u_{k+1} - u_k) / dt)^2 )
// • Spectral power:  1/N * sum_{|f_j| > f_c} |U_j| * |f_j| / f_c,
//                    U_j = sum_k u_k exp(-2πi jk/N), f_j = j / (N dt) folded to
//                    the signed frequency grid.
// • HF ratio:        sum_{|f_j| > f_c} |U_j| / (sum_j |U_j| + 1e-12)
// • Combined:        w_t * derivative_rms + w_f * hf_ratio
#include "ChatteringMeasure.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>

namespace {
const double kPi = 3.14159265358979323846;
}

double DerivativeRMSMeasure::compute(const std::vector<double>& control, double dt) const {
    if (control.size() < 2) return 0.0;
    std::vector<double> du_dt;
    du_dt.reserve(control.size() - 1);
    for (size_t k = 1; k < control.size(); ++k) {
        du_dt.push_back((control[k] - control[k - 1]) / dt);
    }
    return computeRMS(du_dt);
}

SpectralPowerMeasure::SpectralPowerMeasure(double cutoff_hz) : cutoff_hz_(cutoff_hz) {
    if (!(cutoff_hz > 0.0) || !std::isfinite(cutoff_hz)) {
        throw std::invalid_argument("SpectralPowerMeasure: cutoff must be positive");
    }
}

/**
 * @brief One pass over the DFT bins.
 *
 * Uses a direct O(N^2) DFT; control series of a single tuning run are a few
 * thousand samples at most. The twiddle factor is advanced by complex
 * multiplication instead of calling cos/sin for every term.
 */
SpectralPowerMeasure::Spectrum SpectralPowerMeasure::scan(const std::vector<double>& control,
                                                          double dt) const {
    Spectrum out;
    const size_t N = control.size();
    for (size_t j = 0; j < N; ++j) {
        const double step = -2.0 * kPi * static_cast<double>(j) / static_cast<double>(N);
        const double step_re = std::cos(step);
        const double step_im = std::sin(step);
        double tw_re = 1.0, tw_im = 0.0;
        double re = 0.0, im = 0.0;
        for (size_t k = 0; k < N; ++k) {
            re += control[k] * tw_re;
            im += control[k] * tw_im;
            const double next_re = tw_re * step_re - tw_im * step_im;
            tw_im = tw_re * step_im + tw_im * step_re;
            tw_re = next_re;
        }
        const double magnitude = std::sqrt(re * re + im * im);
        // Signed frequency of bin j (numpy fftfreq convention).
        const double bin = (j <= (N - 1) / 2) ? static_cast<double>(j)
                                              : static_cast<double>(j) - static_cast<double>(N);
        const double freq = std::abs(bin / (static_cast<double>(N) * dt));
        out.total += magnitude;
        if (freq > cutoff_hz_) {
            out.hf += magnitude;
            out.weighted_hf += magnitude * freq / cutoff_hz_;
        }
    }
    return out;
}

double SpectralPowerMeasure::compute(const std::vector<double>& control, double dt) const {
    if (control.size() < 2) return 0.0;
    return scan(control, dt).weighted_hf / static_cast<double>(control.size());
}

double SpectralPowerMeasure::highFrequencyRatio(const std::vector<double>& control, double dt) const {
    if (control.size() < 2) return 0.0;
    const Spectrum s = scan(control, dt);
    return s.hf / (s.total + 1e-12);
}

CombinedChatteringMeasure::CombinedChatteringMeasure(double time_weight, double freq_weight,
                                                     double cutoff_hz)
    : time_weight_(time_weight), freq_weight_(freq_weight), freq_domain_(cutoff_hz) {
    if (time_weight < 0.0 || freq_weight < 0.0 || time_weight + freq_weight <= 0.0) {
        throw std::invalid_argument("CombinedChatteringMeasure: weights must be non-negative and not both zero");
    }
}

double CombinedChatteringMeasure::compute(const std::vector<double>& control, double dt) const {
    double index = time_weight_ * time_domain_.compute(control, dt);
    if (freq_weight_ > 0.0) index += freq_weight_ * freq_domain_.highFrequencyRatio(control, dt);
    return index;
}

std::shared_ptr<const ChatteringMeasure> createChatteringMeasure(const std::string& name) {
    if (name == "derivative_rms") return std::make_shared<DerivativeRMSMeasure>();
    if (name == "spectral_power") return std::make_shared<SpectralPowerMeasure>();
    if (name == "combined") return std::make_shared<CombinedChatteringMeasure>();
    throw std::invalid_argument("Unknown chattering measure: " + name);
}
