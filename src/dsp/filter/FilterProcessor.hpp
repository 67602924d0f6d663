/**
 * @file FilterProcessor.hpp
 * @brief Base class for audio filters.
 */

#ifndef SPATIALIZER_FILTER_PROCESSOR_HPP
#define SPATIALIZER_FILTER_PROCESSOR_HPP

namespace spatializer {

/**
 * @brief Abstract base class for filter processors.
 */
class FilterProcessor {
public:
    virtual ~FilterProcessor() = default;

    /**
     * @brief Set the cutoff (or center) frequency.
     *
     * @param frequency Frequency in Hz, below Nyquist.
     */
    virtual void set_cutoff(double frequency) = 0;

    /**
     * @brief Set the quality factor.
     *
     * @param q Q value (0.707 gives a Butterworth response).
     */
    virtual void set_q(double q) = 0;

    /**
     * @brief Clear internal state back to silence.
     */
    virtual void reset() = 0;
};

} // namespace spatializer

#endif // SPATIALIZER_FILTER_PROCESSOR_HPP
