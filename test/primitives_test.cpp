//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "fixtures.hpp"

#include <deck-render/primitives.hpp>

#include <gtest/gtest.h>

using strings = std::vector<std::string>;

TEST(WrapWords, GreedilyFillsLines) {
	EXPECT_EQ(dr::wrap_words("Steal a complete set of properties", 12), (strings{"Steal a", "complete set", "of", "properties"}));
}

TEST(WrapWords, KeepsShortTextOnOneLine) {
	EXPECT_EQ(dr::wrap_words("Pass Go", 10), (strings{"Pass Go"}));
}

TEST(WrapWords, BlankParagraphsBecomeEmptyLines) {
	EXPECT_EQ(dr::wrap_words("one\n\ntwo", 10), (strings{"one", "", "two"}));
}

TEST(WrapWords, BreaksWordsLongerThanALine) {
	EXPECT_EQ(dr::wrap_words("abcdefghij xy", 4), (strings{"abcd", "efgh", "ij", "xy"}));
}

TEST(WrapWords, CollapsesRunsOfSpaces) {
	EXPECT_EQ(dr::wrap_words("  a   b  ", 10), (strings{"a b"}));
}

TEST(MeasureAndWrapText, NeverWrapsBelowTenCharacters) {
	auto const font = dr::test::test_font();
	if (font == nullptr) { GTEST_SKIP() << "No font available."; }
	// Far too narrow for ten 'M's, but the budget floors at ten characters.
	auto const lines = dr::measure_and_wrap_text("abcdefghij klm", *font, 12, 1);
	EXPECT_EQ(lines, (strings{"abcdefghij", "klm"}));
}

TEST(MeasureAndWrapText, WiderBoxesHoldMoreText) {
	auto const font = dr::test::test_font();
	if (font == nullptr) { GTEST_SKIP() << "No font available."; }
	std::string const text = "All players pay you rent for properties you own in one of these colors.";
	EXPECT_GT(dr::measure_and_wrap_text(text, *font, 12, 100).size(), dr::measure_and_wrap_text(text, *font, 12, 300).size());
}

TEST(CreateCanvas, PaintsRoundedBackgroundOverTransparency) {
	DR_REQUIRE_RENDERING();
	auto canvas = dr::create_canvas(100, 80, "#E8F5E0", 20);
	auto const image = canvas.to_image();
	EXPECT_EQ(image.getSize(), sf::Vector2u(100, 80));
	EXPECT_EQ(image.getPixel(50, 40), dr::hex_to_color("#E8F5E0"));
	// Outside the rounded corner.
	EXPECT_EQ(image.getPixel(0, 0).a, 0);
	EXPECT_EQ(image.getPixel(99, 79).a, 0);
}

TEST(DrawCircle, FillsInsideOnly) {
	DR_REQUIRE_RENDERING();
	dr::canvas canvas{100, 100};
	dr::draw_circle(canvas, {50, 50}, 30, {"#FF0000", std::nullopt});
	auto const image = canvas.to_image();
	EXPECT_EQ(image.getPixel(50, 50), sf::Color::Red);
	EXPECT_EQ(image.getPixel(50, 10).a, 0);
}

TEST(DrawCircle, DrawsOutlineInsideRadius) {
	DR_REQUIRE_RENDERING();
	dr::canvas canvas{100, 100};
	dr::draw_circle(canvas, {50, 50}, 30, {sf::Color::White, sf::Color::Black, 4});
	auto const image = canvas.to_image();
	EXPECT_EQ(image.getPixel(50, 22), sf::Color::Black);
	EXPECT_EQ(image.getPixel(50, 50), sf::Color::White);
	EXPECT_EQ(image.getPixel(50, 18).a, 0);
}

TEST(DrawPieSlice, CoversOnlyItsSector) {
	DR_REQUIRE_RENDERING();
	dr::canvas canvas{100, 100};
	// 0 to 90 degrees is the lower-right quadrant, since y points down.
	dr::draw_pie_slice(canvas, {50, 50}, 40, 0, 90, {sf::Color::Blue, std::nullopt});
	auto const image = canvas.to_image();
	EXPECT_EQ(image.getPixel(65, 65), sf::Color::Blue);
	EXPECT_EQ(image.getPixel(35, 35).a, 0);
	EXPECT_EQ(image.getPixel(65, 35).a, 0);
}

TEST(DrawRoundedRect, RespectsRectangle) {
	DR_REQUIRE_RENDERING();
	dr::canvas canvas{100, 100};
	dr::draw_rounded_rect(canvas, {20, 20, 60, 40}, 10, {sf::Color::Green, std::nullopt});
	auto const image = canvas.to_image();
	EXPECT_EQ(image.getPixel(50, 40), sf::Color::Green);
	EXPECT_EQ(image.getPixel(50, 70).a, 0);
	EXPECT_EQ(image.getPixel(21, 21).a, 0);
}

TEST(DrawText, CentersOnAnchor) {
	DR_REQUIRE_RENDERING();
	dr::canvas canvas{200, 100};
	dr::draw_text(canvas, "MMMM", {100, 50}, {*dr::test::test_font(), 30, sf::Text::Bold}, dr::origin::center);
	auto const image = canvas.to_image();

	// Ink lies on both sides of the anchor and nowhere near the edges.
	unsigned left_ink = 0, right_ink = 0;
	for (unsigned y = 0; y < 100; ++y) {
		for (unsigned x = 0; x < 200; ++x) {
			if (image.getPixel(x, y).a == 0) { continue; }
			EXPECT_GT(x, 20u);
			EXPECT_LT(x, 180u);
			(x < 100 ? left_ink : right_ink) += 1;
		}
	}
	EXPECT_GT(left_ink, 0u);
	EXPECT_GT(right_ink, 0u);
}
