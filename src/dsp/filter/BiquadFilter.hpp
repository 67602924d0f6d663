/**
 * @file BiquadFilter.hpp
 * @brief Second-order IIR filter (RBJ cookbook) in transposed direct form II.
 */

#ifndef SPATIALIZER_BIQUAD_FILTER_HPP
#define SPATIALIZER_BIQUAD_FILTER_HPP

#include "FilterProcessor.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <span>
#include <cstddef>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace spatializer {

enum class FilterType {
    Lowpass,
    Highpass,
    Bandpass
};

/**
 * @brief Selects which of the two independent state pairs a sample runs through.
 */
enum class Side {
    Left = 0,
    Right = 1
};

/**
 * @brief Normalized biquad coefficients (a0 == 1).
 *
 * H(z) = (b0 + b1 z^-1 + b2 z^-2) / (1 + a1 z^-1 + a2 z^-2)
 */
struct BiquadCoefficients {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;

    /**
     * @brief Audio EQ Cookbook design.
     *
     * Bandpass uses the constant 0 dB peak gain form. Cutoff must lie in
     * (0, sample_rate / 2); nothing is checked here.
     */
    static BiquadCoefficients design(FilterType type, double cutoff_hz, double sample_rate, double q) {
        const double w0 = 2.0 * M_PI * cutoff_hz / sample_rate;
        const double cos_w0 = std::cos(w0);
        const double alpha = std::sin(w0) / (2.0 * q);
        const double norm = 1.0 + alpha;

        BiquadCoefficients c;
        switch (type) {
            case FilterType::Lowpass:
                c.b0 = ((1.0 - cos_w0) / 2.0) / norm;
                c.b1 = (1.0 - cos_w0) / norm;
                c.b2 = c.b0;
                break;
            case FilterType::Highpass:
                c.b0 = ((1.0 + cos_w0) / 2.0) / norm;
                c.b1 = -(1.0 + cos_w0) / norm;
                c.b2 = c.b0;
                break;
            case FilterType::Bandpass:
                c.b0 = alpha / norm;
                c.b1 = 0.0;
                c.b2 = -alpha / norm;
                break;
        }
        c.a1 = (-2.0 * cos_w0) / norm;
        c.a2 = (1.0 - alpha) / norm;
        return c;
    }
};

/**
 * @brief Running state of one side of a filter.
 */
struct BiquadState {
    double z1 = 0.0;
    double z2 = 0.0;
};

/**
 * @brief Stateful biquad with independent left and right state.
 *
 * Coefficients are shared by both sides; the state pairs never are. All
 * arithmetic runs in double precision regardless of the sample type.
 */
class BiquadFilter : public FilterProcessor {
public:
    static constexpr double kButterworthQ = 0.707;

    BiquadFilter(FilterType type, int sample_rate, double cutoff_hz, double q = kButterworthQ)
        : type_(type)
        , sample_rate_(sample_rate)
        , cutoff_(cutoff_hz)
        , q_(q)
    {
        update_coefficients();
    }

    /**
     * @brief Recompute coefficients and clear both state pairs.
     */
    BiquadFilter& configure(FilterType type, double cutoff_hz, double q = kButterworthQ) {
        type_ = type;
        cutoff_ = cutoff_hz;
        q_ = q;
        update_coefficients();
        return *this;
    }

    void set_cutoff(double frequency) override {
        cutoff_ = frequency;
        update_coefficients();
    }

    void set_q(double q) override {
        q_ = q;
        update_coefficients();
    }

    void set_sample_rate(int sample_rate) {
        sample_rate_ = sample_rate;
        update_coefficients();
    }

    /**
     * @brief Filter one sample through the state pair of @p side.
     */
    inline float process_one(float sample, Side side) {
        BiquadState& s = state_[static_cast<size_t>(side)];
        const double x = static_cast<double>(sample);
        const double y = coeffs_.b0 * x + s.z1;
        s.z1 = coeffs_.b1 * x - coeffs_.a1 * y + s.z2;
        s.z2 = coeffs_.b2 * x - coeffs_.a2 * y;
        return static_cast<float>(y);
    }

    /**
     * @brief Same as input.size() calls to process_one(). In-place is allowed.
     */
    void process_buffer(std::span<const float> input, std::span<float> output, Side side) {
        const size_t n = std::min(input.size(), output.size());
        for (size_t i = 0; i < n; ++i) {
            output[i] = process_one(input[i], side);
        }
    }

    void reset() override {
        state_[0] = BiquadState{};
        state_[1] = BiquadState{};
    }

    FilterType type() const { return type_; }
    int sample_rate() const { return sample_rate_; }
    double cutoff() const { return cutoff_; }
    double q() const { return q_; }
    const BiquadCoefficients& coefficients() const { return coeffs_; }
    const BiquadState& state(Side side) const { return state_[static_cast<size_t>(side)]; }

private:
    void update_coefficients() {
        coeffs_ = BiquadCoefficients::design(type_, cutoff_, static_cast<double>(sample_rate_), q_);
        // New coefficients against old state would click
        reset();
    }

    FilterType type_;
    int sample_rate_;
    double cutoff_;
    double q_;
    BiquadCoefficients coeffs_;
    std::array<BiquadState, 2> state_{};
};

} // namespace spatializer

#endif // SPATIALIZER_BIQUAD_FILTER_HPP
