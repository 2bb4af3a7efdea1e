/**
 * @file test_voice_selection.cpp
 * @brief Tests for voice mix selection and its wire format
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "vsc/features/voice/vsc_voice_selection.h"

namespace {

vsc::VoiceSelection make_selection() {
    return vsc::VoiceSelection({"af_bella", "am_adam", "bf_emma", "af_sky"});
}

}  // namespace

// =============================================================================
// SELECTION
// =============================================================================

TEST(VoiceSelection, StartsEmpty) {
    auto selection = make_selection();
    EXPECT_FALSE(selection.has_any());
    EXPECT_EQ(selection.size(), 0u);
    EXPECT_EQ(selection.to_wire_string(), "");
}

TEST(VoiceSelection, RejectsVoicesOutsideCatalog) {
    auto selection = make_selection();
    EXPECT_FALSE(selection.add("zz_unknown"));
    EXPECT_FALSE(selection.has_any());
}

TEST(VoiceSelection, ReAddUpdatesWeightInPlace) {
    auto selection = make_selection();
    ASSERT_TRUE(selection.add("af_bella"));
    ASSERT_TRUE(selection.add("am_adam"));
    ASSERT_TRUE(selection.add("af_bella", 0.5));

    ASSERT_EQ(selection.size(), 2u);
    EXPECT_EQ(selection.entries()[0].voice, "af_bella");
    EXPECT_DOUBLE_EQ(selection.entries()[0].weight, 0.5);
}

TEST(VoiceSelection, WeightsAreClampedToMinimum) {
    auto selection = make_selection();
    selection.add("af_bella", 0.01);
    EXPECT_DOUBLE_EQ(selection.weight_of("af_bella"), vsc::VoiceSelection::MIN_WEIGHT);

    selection.set_weight("af_bella", -3.0);
    EXPECT_DOUBLE_EQ(selection.weight_of("af_bella"), vsc::VoiceSelection::MIN_WEIGHT);
}

TEST(VoiceSelection, ZeroOrNonFiniteWeightFallsBackToDefault) {
    auto selection = make_selection();
    selection.add("af_bella", 0.0);
    EXPECT_DOUBLE_EQ(selection.weight_of("af_bella"), 1.0);

    selection.set_weight("af_bella", std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(selection.weight_of("af_bella"), 1.0);
}

TEST(VoiceSelection, SetWeightRequiresSelectedVoice) {
    auto selection = make_selection();
    EXPECT_FALSE(selection.set_weight("am_adam", 2.0));
    selection.add("am_adam");
    EXPECT_TRUE(selection.set_weight("am_adam", 2.0));
    EXPECT_DOUBLE_EQ(selection.weight_of("am_adam"), 2.0);
}

TEST(VoiceSelection, RemoveAndClear) {
    auto selection = make_selection();
    selection.add("af_bella");
    selection.add("am_adam");

    EXPECT_TRUE(selection.remove("af_bella"));
    EXPECT_FALSE(selection.remove("af_bella"));
    EXPECT_EQ(selection.to_wire_string(), "am_adam");

    selection.clear();
    EXPECT_FALSE(selection.has_any());
}

TEST(VoiceSelection, WeightsAreNotNormalized) {
    auto selection = make_selection();
    selection.add("af_bella", 3.0);
    selection.add("am_adam", 3.0);
    EXPECT_DOUBLE_EQ(selection.weight_of("af_bella"), 3.0);
    EXPECT_DOUBLE_EQ(selection.weight_of("am_adam"), 3.0);
}

// =============================================================================
// WIRE FORMAT
// =============================================================================

TEST(VoiceSelectionWire, SingleVoiceAtDefaultWeightIsBareId) {
    auto selection = make_selection();
    selection.add("af_bella");
    EXPECT_EQ(selection.to_wire_string(), "af_bella");
}

TEST(VoiceSelectionWire, SingleVoiceWithCustomWeightIsParenthesized) {
    auto selection = make_selection();
    selection.add("af_bella", 0.7);
    EXPECT_EQ(selection.to_wire_string(), "af_bella(0.7)");
}

TEST(VoiceSelectionWire, MixIsJoinedInInsertionOrder) {
    auto selection = make_selection();
    selection.add("af_bella", 0.6);
    selection.add("am_adam", 1.2);
    EXPECT_EQ(selection.to_wire_string(), "af_bella(0.6)+am_adam(1.2)");
}

TEST(VoiceSelectionWire, DefaultWeightsInMixRenderAsOne) {
    auto selection = make_selection();
    selection.add("bf_emma");
    selection.add("af_sky");
    EXPECT_EQ(selection.to_wire_string(), "bf_emma(1)+af_sky(1)");
}

TEST(VoiceSelectionWire, FormatWeightIsShortestRoundTrip) {
    EXPECT_EQ(vsc::VoiceSelection::format_weight(1.0), "1");
    EXPECT_EQ(vsc::VoiceSelection::format_weight(0.6), "0.6");
    EXPECT_EQ(vsc::VoiceSelection::format_weight(1.25), "1.25");
    EXPECT_EQ(vsc::VoiceSelection::format_weight(0.1), "0.1");
}

TEST(VoiceSelectionWire, ParseBareAndWeightedForms) {
    std::vector<vsc::VoiceWeight> entries;
    ASSERT_TRUE(vsc::VoiceSelection::parse_wire_string("af_bella(0.6)+am_adam", entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].voice, "af_bella");
    EXPECT_DOUBLE_EQ(entries[0].weight, 0.6);
    EXPECT_EQ(entries[1].voice, "am_adam");
    EXPECT_DOUBLE_EQ(entries[1].weight, 1.0);
}

TEST(VoiceSelectionWire, ParseRejectsMalformedInput) {
    std::vector<vsc::VoiceWeight> entries;
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("", entries));
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("af_bella+", entries));
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("af_bella(0.6", entries));
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("af_bella()", entries));
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("af_bella(abc)", entries));
    EXPECT_FALSE(vsc::VoiceSelection::parse_wire_string("(0.5)", entries));
}

TEST(VoiceSelectionWire, ParsedMixRendersBackIdentically) {
    const std::string wire = "af_bella(0.6)+am_adam(1.2)";
    std::vector<vsc::VoiceWeight> entries;
    ASSERT_TRUE(vsc::VoiceSelection::parse_wire_string(wire, entries));

    auto selection = make_selection();
    for (const auto& entry : entries) {
        ASSERT_TRUE(selection.add(entry.voice, entry.weight));
    }
    EXPECT_EQ(selection.to_wire_string(), wire);
}
