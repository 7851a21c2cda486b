// src/core/ChatteringMeasure.hpp
//
// Declares the **ChatteringMeasure** strategy family of the
// **ChatteringOptimizationEngine**.
//
// A chattering measure reduces a sampled control signal u_k to a non-negative
// scalar that grows with high-frequency switching activity. The fitness
// evaluator holds one measure and applies it to every trajectory, so the
// choice of measure is a configuration decision rather than a code path.
//
// Provided measures:
// • DerivativeRMSMeasure      – sqrt(mean((Δu/dt)^2)), the default
// • SpectralPowerMeasure      – frequency-weighted DFT magnitude above a cutoff
// • CombinedChatteringMeasure – weighted sum of the two above
#ifndef CHATTERING_MEASURE_HPP
#define CHATTERING_MEASURE_HPP
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Abstract chattering measure.
 *
 * Implementations must be stateless (const compute) so one instance can be
 * shared by concurrent evaluations.
 */
class ChatteringMeasure {
public:
    virtual ~ChatteringMeasure() = default;
    /**
     * @brief Computes the chattering index of a control series.
     *
     * @param control Control input samples.
     * @param dt Sample period in seconds (> 0).
     * @return double Non-negative chattering index.
     */
    virtual double compute(const std::vector<double>& control, double dt) const = 0;
    /// Registry name used by createChatteringMeasure().
    virtual std::string name() const = 0;
};

/**
 * @brief RMS of the forward-difference derivative of the control input.
 *
 * Zero only for a constant signal; strictly increasing in both switching
 * amplitude and switching rate. Returns 0.0 for fewer than two samples.
 */
class DerivativeRMSMeasure : public ChatteringMeasure {
public:
    double compute(const std::vector<double>& control, double dt) const override;
    std::string name() const override { return "derivative_rms"; }
};

/**
 * @brief High-frequency content of the control spectrum.
 *
 * Computes |U(f)| with a direct DFT. compute() returns the frequency-weighted
 * high-frequency amplitude
 *   (1/N) * sum_{|f| > cutoff} |U(f)| * |f| / cutoff,
 * which scales linearly with switching amplitude and grows with switching
 * frequency. highFrequencyRatio() returns the amplitude-free share
 * sum_{|f| > cutoff} |U(f)| / (sum |U(f)| + 1e-12) used by the combined index.
 */
class SpectralPowerMeasure : public ChatteringMeasure {
public:
    explicit SpectralPowerMeasure(double cutoff_hz = 10.0);
    double compute(const std::vector<double>& control, double dt) const override;
    std::string name() const override { return "spectral_power"; }
    double cutoff() const { return cutoff_hz_; }

    /// Share of DFT magnitude above the cutoff, in [0, 1).
    double highFrequencyRatio(const std::vector<double>& control, double dt) const;

private:
    double cutoff_hz_;

    struct Spectrum {
        double weighted_hf = 0.0;  ///< sum over |f| > cutoff of |U| * |f| / cutoff
        double hf = 0.0;           ///< sum over |f| > cutoff of |U|
        double total = 0.0;        ///< sum of |U|
    };
    Spectrum scan(const std::vector<double>& control, double dt) const;
};

/**
 * @brief Weighted blend of the derivative RMS and the high-frequency ratio.
 *
 * Defaults reproduce the index used by the chattering-reduction campaign:
 * 0.7 * derivative_rms + 0.3 * high-frequency share of the spectrum.
 */
class CombinedChatteringMeasure : public ChatteringMeasure {
public:
    CombinedChatteringMeasure(double time_weight = 0.7, double freq_weight = 0.3,
                              double cutoff_hz = 10.0);
    double compute(const std::vector<double>& control, double dt) const override;
    std::string name() const override { return "combined"; }
private:
    double time_weight_;
    double freq_weight_;
    DerivativeRMSMeasure time_domain_;
    SpectralPowerMeasure freq_domain_;
};

/**
 * @brief Factory for chattering measures by registry name.
 *
 * @param name One of "derivative_rms", "spectral_power", "combined".
 * @throws std::invalid_argument for unknown names.
 */
std::shared_ptr<const ChatteringMeasure> createChatteringMeasure(const std::string& name);

#endif // CHATTERING_MEASURE_HPP
