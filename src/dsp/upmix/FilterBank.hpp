/**
 * @file FilterBank.hpp
 * @brief The set of biquads that shape the synthesized surround channels.
 */

#ifndef SPATIALIZER_FILTER_BANK_HPP
#define SPATIALIZER_FILTER_BANK_HPP

#include "BiquadFilter.hpp"

namespace spatializer {

/**
 * @brief LFE lowpass, rear highpass pair and side bandpass pair.
 *
 * A bank belongs to exactly one scheduling unit (the sequential run or one
 * worker) and must see one contiguous frame range at a time.
 */
class FilterBank {
public:
    static constexpr double kLfeCutoffHz = 120.0;
    static constexpr double kRearHighpassHz = 200.0;
    static constexpr double kSideBandpassHz = 1500.0;
    static constexpr double kSideQ = 1.0;

    /**
     * @brief True when every cutoff of the bank lies below the Nyquist frequency of @p sample_rate.
     */
    static constexpr bool supports_sample_rate(int sample_rate) {
        return sample_rate > 0 && 2.0 * kSideBandpassHz < static_cast<double>(sample_rate);
    }

    explicit FilterBank(int sample_rate)
        : lfe_(FilterType::Lowpass, sample_rate, kLfeCutoffHz)
        , rear_left_(FilterType::Highpass, sample_rate, kRearHighpassHz)
        , rear_right_(FilterType::Highpass, sample_rate, kRearHighpassHz)
        , side_left_(FilterType::Bandpass, sample_rate, kSideBandpassHz, kSideQ)
        , side_right_(FilterType::Bandpass, sample_rate, kSideBandpassHz, kSideQ)
    {}

    float lfe(float mid) { return lfe_.process_one(mid, Side::Left); }
    float rear_left(float left) { return rear_left_.process_one(left, Side::Left); }
    float rear_right(float right) { return rear_right_.process_one(right, Side::Right); }
    float side_left(float left) { return side_left_.process_one(left, Side::Left); }
    float side_right(float right) { return side_right_.process_one(right, Side::Right); }

    /**
     * @brief Return every filter to silence. Coefficients are kept.
     */
    void reset() {
        lfe_.reset();
        rear_left_.reset();
        rear_right_.reset();
        side_left_.reset();
        side_right_.reset();
    }

    int sample_rate() const { return lfe_.sample_rate(); }

    const BiquadFilter& lfe_filter() const { return lfe_; }
    const BiquadFilter& rear_left_filter() const { return rear_left_; }
    const BiquadFilter& rear_right_filter() const { return rear_right_; }
    const BiquadFilter& side_left_filter() const { return side_left_; }
    const BiquadFilter& side_right_filter() const { return side_right_; }

private:
    BiquadFilter lfe_;
    BiquadFilter rear_left_;
    BiquadFilter rear_right_;
    BiquadFilter side_left_;
    BiquadFilter side_right_;
};

} // namespace spatializer

#endif // SPATIALIZER_FILTER_BANK_HPP
