#include <gtest/gtest.h>
#include "UpmixEngine.hpp"
#include "TestHelper.hpp"
#include <cmath>
#include <vector>

using namespace spatializer;

class UpmixEngineTest : public ::testing::Test {
protected:
    static constexpr int sample_rate = 44100;
};

TEST_F(UpmixEngineTest, ChannelCountFollowsMode) {
    FilterBank bank(sample_rate);
    const AudioFrame frame{0.3f, -0.2f};

    EXPECT_EQ(process_frame(frame, OutputMode::Binaural, &bank).size(), 2u);
    EXPECT_EQ(process_frame(frame, OutputMode::Surround51, &bank).size(), 6u);
    EXPECT_EQ(process_frame(frame, OutputMode::Surround51Immersive, &bank).size(), 6u);
    EXPECT_EQ(process_frame(frame, OutputMode::Surround71, &bank).size(), 8u);
    EXPECT_EQ(process_frame(frame, OutputMode::Surround51Fast, &bank).size(), 6u);

    for (OutputMode mode : kAllOutputModes) {
        EXPECT_EQ(process_frame(frame, mode, nullptr).size(), channel_count(mode));
        EXPECT_EQ(channel_layout(mode).size(), channel_count(mode));
    }
}

TEST_F(UpmixEngineTest, BinauralClipsMidPlusSide) {
    const OutputFrame out = process_frame(AudioFrame{1.0f, 0.0f}, OutputMode::Binaural, nullptr);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_NEAR(out[1], -0.1f, 1e-6f);
}

TEST_F(UpmixEngineTest, FastModeArithmetic) {
    const OutputFrame out = process_frame(AudioFrame{1.0f, -1.0f}, OutputMode::Surround51Fast, nullptr);
    const float expected[] = {0.85f, -0.85f, 0.0f, 0.0f, 0.7f, -0.7f};
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_NEAR(out[i], expected[i], 1e-6f) << "channel " << i;
    }
}

TEST_F(UpmixEngineTest, FrontAndCenterAreUnfiltered) {
    FilterBank bank(sample_rate);
    const OutputFrame out = process_frame(AudioFrame{0.4f, 0.2f}, OutputMode::Surround51, &bank);
    EXPECT_NEAR(out[0], 0.36f, 1e-6f);
    EXPECT_NEAR(out[1], 0.18f, 1e-6f);
    EXPECT_NEAR(out[2], 0.27f, 1e-6f);
}

TEST_F(UpmixEngineTest, FirstFilteredFrameUsesFreshState) {
    FilterBank bank(sample_rate);
    const AudioFrame frame{0.4f, 0.2f};
    const OutputFrame out = process_frame(frame, OutputMode::Surround51, &bank);

    const double lfe_b0 = bank.lfe_filter().coefficients().b0;
    const double rear_b0 = bank.rear_left_filter().coefficients().b0;
    EXPECT_NEAR(out[3], static_cast<float>(lfe_b0 * 0.3) * gains::kLfe, 1e-6f);
    EXPECT_NEAR(out[4], static_cast<float>(rear_b0 * 0.4) * gains::kRear, 1e-6f);
    EXPECT_NEAR(out[5], static_cast<float>(rear_b0 * 0.2) * gains::kRear, 1e-6f);
}

TEST_F(UpmixEngineTest, MissingBankPassesSignalThrough) {
    const AudioFrame frame{0.5f, 0.5f};

    const OutputFrame standard = process_frame(frame, OutputMode::Surround51, nullptr);
    EXPECT_NEAR(standard[3], 0.35f, 1e-6f);
    EXPECT_NEAR(standard[4], 0.175f, 1e-6f);
    EXPECT_NEAR(standard[5], 0.175f, 1e-6f);

    const OutputFrame immersive = process_frame(frame, OutputMode::Surround51Immersive, nullptr);
    EXPECT_NEAR(immersive[4], 0.315f, 1e-6f);

    const OutputFrame wide = process_frame(frame, OutputMode::Surround71, nullptr);
    EXPECT_NEAR(wide[6], 0.275f, 1e-6f);
    EXPECT_NEAR(wide[7], 0.275f, 1e-6f);
}

TEST_F(UpmixEngineTest, ImmersiveScalesRearOnly) {
    FilterBank standard_bank(sample_rate);
    FilterBank immersive_bank(sample_rate);
    const auto input = test::noise(2 * 1000, 99, 0.5f);

    for (size_t i = 0; i < 1000; ++i) {
        const AudioFrame frame = frame_at(input, i);
        const OutputFrame a = process_frame(frame, OutputMode::Surround51, &standard_bank);
        const OutputFrame b = process_frame(frame, OutputMode::Surround51Immersive, &immersive_bank);
        for (size_t ch = 0; ch < 4; ++ch) {
            ASSERT_EQ(a[ch], b[ch]);
        }
        ASSERT_NEAR(b[4], a[4] * gains::kImmersiveRear, 1e-5f);
        ASSERT_NEAR(b[5], a[5] * gains::kImmersiveRear, 1e-5f);
    }
}

TEST_F(UpmixEngineTest, Surround71ExtendsSurround51) {
    FilterBank bank51(sample_rate);
    FilterBank bank71(sample_rate);
    const auto input = test::stereo_sine_mix(500);

    for (size_t i = 0; i < 500; ++i) {
        const AudioFrame frame = frame_at(input, i);
        const OutputFrame a = process_frame(frame, OutputMode::Surround51, &bank51);
        const OutputFrame b = process_frame(frame, OutputMode::Surround71, &bank71);
        for (size_t ch = 0; ch < 6; ++ch) {
            ASSERT_EQ(a[ch], b[ch]) << "frame " << i << " channel " << ch;
        }
    }
}

TEST_F(UpmixEngineTest, Surround71SideOrdering) {
    const auto layout = channel_layout(OutputMode::Surround71);
    EXPECT_EQ(layout[6], Channel::SideLeft);
    EXPECT_EQ(layout[7], Channel::SideRight);

    // Left-only input: the left side channel moves, the right one stays silent
    FilterBank bank(sample_rate);
    float left_side_peak = 0.0f;
    for (size_t i = 0; i < 256; ++i) {
        const float left = static_cast<float>(0.8 * std::sin(2.0 * test::kPi * 1500.0 * i / sample_rate));
        const OutputFrame out = process_frame(AudioFrame{left, 0.0f}, OutputMode::Surround71, &bank);
        left_side_peak = std::max(left_side_peak, std::abs(out[6]));
        ASSERT_EQ(out[7], 0.0f);
        ASSERT_EQ(out[5], 0.0f);
    }
    EXPECT_GT(left_side_peak, 0.1f);
}

TEST_F(UpmixEngineTest, RightChannelsRunOnRightState) {
    FilterBank bank(sample_rate);
    for (size_t i = 0; i < 16; ++i) {
        process_frame(AudioFrame{0.0f, 0.5f}, OutputMode::Surround71, &bank);
    }
    EXPECT_NE(bank.rear_right_filter().state(Side::Right).z1, 0.0);
    EXPECT_EQ(bank.rear_right_filter().state(Side::Left).z1, 0.0);
    EXPECT_NE(bank.side_right_filter().state(Side::Right).z1, 0.0);
    EXPECT_EQ(bank.side_right_filter().state(Side::Left).z1, 0.0);
}

TEST_F(UpmixEngineTest, EveryOutputIsClamped) {
    // Full-scale noise plus out-of-range spikes
    auto input = test::noise(2 * 4096, 5, 1.0f);
    for (size_t i = 0; i < input.size(); i += 97) {
        input[i] = (i % 2 == 0) ? 3.0f : -3.0f;
    }

    for (OutputMode mode : kAllOutputModes) {
        FilterBank bank(sample_rate);
        const size_t channels = channel_count(mode);
        std::vector<float> out(4096 * channels);
        process_frame_range(input, out, 0, 4096, mode, &bank);
        for (float s : out) {
            ASSERT_LE(s, 1.0f) << mode_name(mode);
            ASSERT_GE(s, -1.0f) << mode_name(mode);
        }
    }
}

TEST_F(UpmixEngineTest, UnfilteredModesIgnoreBank) {
    FilterBank bank(sample_rate);
    const AudioFrame frame{0.25f, -0.6f};
    for (OutputMode mode : {OutputMode::Binaural, OutputMode::Surround51Fast}) {
        const OutputFrame a = process_frame(frame, mode, &bank);
        const OutputFrame b = process_frame(frame, mode, nullptr);
        EXPECT_EQ(a.samples, b.samples);
    }
    EXPECT_EQ(bank.lfe_filter().state(Side::Left).z1, 0.0);
}

TEST_F(UpmixEngineTest, RangeWritesOnlyItsSlice) {
    const auto input = test::stereo_sine_mix(100);
    std::vector<float> out(100 * 6, 7.0f);
    process_frame_range(input, out, 40, 60, OutputMode::Surround51Fast, nullptr);

    for (size_t i = 0; i < out.size(); ++i) {
        const size_t frame = i / 6;
        if (frame < 40 || frame >= 60) {
            ASSERT_EQ(out[i], 7.0f) << "sample " << i;
        } else {
            ASSERT_NE(out[i], 7.0f) << "sample " << i;
        }
    }
}

TEST_F(UpmixEngineTest, BankRequiresCutoffsBelowNyquist) {
    EXPECT_FALSE(FilterBank::supports_sample_rate(0));
    EXPECT_FALSE(FilterBank::supports_sample_rate(2000));
    EXPECT_FALSE(FilterBank::supports_sample_rate(3000));
    EXPECT_TRUE(FilterBank::supports_sample_rate(3001));
    EXPECT_TRUE(FilterBank::supports_sample_rate(8000));
    EXPECT_TRUE(FilterBank::supports_sample_rate(sample_rate));
}

TEST_F(UpmixEngineTest, LowestSupportedRateStaysBounded) {
    constexpr int rate = 8000;
    ASSERT_TRUE(FilterBank::supports_sample_rate(rate));
    FilterBank bank(rate);
    const auto input = test::stereo_sine_mix(4000, rate);
    std::vector<float> out(4000 * 8);
    process_frame_range(input, out, 0, 4000, OutputMode::Surround71, &bank);
    for (float s : out) {
        ASSERT_FALSE(std::isnan(s));
        ASSERT_LE(s, 1.0f);
        ASSERT_GE(s, -1.0f);
    }
}
