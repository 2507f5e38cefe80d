//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "fixtures.hpp"

#include <deck-render/color.hpp>
#include <deck-render/errors.hpp>
#include <deck-render/tokens.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace {
	//! Writes the shipped tokens, pointed at the test font, to a scratch file.
	auto write_token_file(std::filesystem::path const& path) -> void {
		auto tree = dr::test::token_tree();
		tree["global"]["font"]["path"] = DR_TEST_FONT;
		std::ofstream{path} << tree.dump();
	}
}

TEST(DesignTokens, ResolvesDottedPaths) {
	auto const tokens = dr::test::layout_tokens();
	EXPECT_EQ(tokens.get<int>("global.card.width"), 413);
	EXPECT_EQ(tokens.get<int>("card_types.property.layout.rent_section.row_height"), 50);
	EXPECT_EQ(tokens.color("card_types.action.colors.circle_bg"), sf::Color::White);
}

TEST(DesignTokens, MissingKeyNamesThePath) {
	auto const tokens = dr::test::layout_tokens();
	try {
		tokens.at("card_types.property.layout.nonexistent.y");
		FAIL() << "Expected missing_token_key.";
	} catch (dr::missing_token_key const& ex) {
		EXPECT_EQ(ex.path(), "card_types.property.layout.nonexistent.y");
	}
	EXPECT_EQ(tokens.find("global.card.depth"), nullptr);
	EXPECT_NE(tokens.find("global.card"), nullptr);
}

TEST(DesignTokens, WrongTypeIsInvalidValue) {
	auto const tokens = dr::test::layout_tokens();
	EXPECT_THROW(tokens.get<int>("global.footer.text"), dr::invalid_token_value);
	EXPECT_THROW(tokens.get<int>("global.card.width.value"), dr::missing_token_key);
}

TEST(DesignTokens, UnknownColorSetFallsBackToDefault) {
	auto const tokens = dr::test::layout_tokens();
	EXPECT_EQ(tokens.set_color("dark_blue"), dr::hex_to_color("#00008B"));
	EXPECT_EQ(tokens.set_color("chartreuse"), dr::hex_to_color(dr::default_set_color));
}

TEST(DesignTokens, EmbeddedBadHexIsReported) {
	auto tree = dr::test::token_tree();
	tree["global"]["colors"]["property_sets"]["green"] = "#12345";
	dr::design_tokens const tokens{tree};
	EXPECT_THROW(tokens.set_color("green"), dr::invalid_color_format);
}

TEST(DesignTokens, NonStringColorSetEntryIsInvalid) {
	auto tree = dr::test::token_tree();
	tree["global"]["colors"]["property_sets"]["green"] = 5;
	dr::design_tokens const tokens{tree};
	EXPECT_THROW(tokens.set_color("green"), dr::invalid_token_value);
	EXPECT_EQ(tokens.set_color("chartreuse"), dr::hex_to_color(dr::default_set_color));
}

TEST(DesignTokens, ExplicitFallbackOnlyForUnknownKeys) {
	auto const tokens = dr::test::layout_tokens();
	EXPECT_EQ(tokens.set_color("chartreuse", sf::Color::Magenta), sf::Color::Magenta);
	EXPECT_EQ(tokens.set_color("pink", sf::Color::Magenta), dr::hex_to_color("#FF1493"));
}

TEST(DesignTokens, FontIsRequiredToDraw) {
	auto const tokens = dr::test::layout_tokens();
	EXPECT_THROW(tokens.font(), dr::token_load_error);
}

TEST(DesignTokens, RejectsNonObjectTree) {
	EXPECT_THROW(dr::design_tokens{nlohmann::json::array()}, dr::token_load_error);
}

TEST(DesignTokens, MissingFileIsLoadError) {
	EXPECT_THROW(dr::design_tokens::from_file("/nonexistent/design_tokens.json"), dr::token_load_error);
}

TEST(DesignTokens, MalformedFileIsLoadError) {
	auto const path = std::filesystem::temp_directory_path() / "deck-render-malformed-tokens.json";
	std::ofstream{path} << "{ \"global\": ";
	EXPECT_THROW(dr::design_tokens::from_file(path), dr::token_load_error);
	std::filesystem::remove(path);
}

TEST(DesignTokens, MissingFontPathIsLoadError) {
	auto const path = std::filesystem::temp_directory_path() / "deck-render-fontless-tokens.json";
	std::ofstream{path} << R"({"global": {"card": {"width": 10}}})";
	EXPECT_THROW(dr::design_tokens::from_file(path), dr::token_load_error);
	std::filesystem::remove(path);
}

TEST(DesignTokens, DefaultTokenFileLoadsItsFont) {
	if (dr::test::test_font() == nullptr) { GTEST_SKIP() << "No font available."; }
	auto const tokens = dr::design_tokens::from_file(DR_TOKENS_FILE);
	EXPECT_GT(tokens.font().getLineSpacing(12), 0);
}

TEST(DesignTokens, FallsBackToFirstLoadableFont) {
	if (dr::test::test_font() == nullptr) { GTEST_SKIP() << "No font available."; }
	auto const path = std::filesystem::temp_directory_path() / "deck-render-fallback-tokens.json";
	auto tree = dr::test::token_tree();
	tree["global"]["font"]["path"] = "no-such-font.ttf";
	tree["global"]["font"]["fallbacks"] = {"/nonexistent/fonts/Missing.ttf", DR_TEST_FONT};
	std::ofstream{path} << tree.dump();

	auto const tokens = dr::design_tokens::from_file(path);
	EXPECT_GT(tokens.font().getLineSpacing(12), 0);
	std::filesystem::remove(path);
}

TEST(DesignTokens, NoLoadableFontIsLoadError) {
	auto const path = std::filesystem::temp_directory_path() / "deck-render-no-font-tokens.json";
	auto tree = dr::test::token_tree();
	tree["global"]["font"]["path"] = "/nonexistent/fonts/Missing.ttf";
	tree["global"]["font"]["fallbacks"] = {"also-missing.ttf"};
	std::ofstream{path} << tree.dump();

	EXPECT_THROW(dr::design_tokens::from_file(path), dr::token_load_error);
	std::filesystem::remove(path);
}

TEST(DesignTokens, MalformedFallbackListIsLoadError) {
	auto const path = std::filesystem::temp_directory_path() / "deck-render-bad-fallbacks-tokens.json";
	auto tree = dr::test::token_tree();
	tree["global"]["font"]["fallbacks"] = "DejaVuSans.ttf";
	std::ofstream{path} << tree.dump();

	EXPECT_THROW(dr::design_tokens::from_file(path), dr::token_load_error);
	std::filesystem::remove(path);
}

TEST(TokenStore, LoadsOnceAcrossCallsAndThreads) {
	if (dr::test::test_font() == nullptr) { GTEST_SKIP() << "No font available."; }
	auto const path = std::filesystem::temp_directory_path() / "deck-render-store-tokens.json";
	write_token_file(path);

	dr::token_store const store{path};
	EXPECT_EQ(store.load_count(), 0);

	std::vector<dr::design_tokens const*> seen(8, nullptr);
	std::vector<std::thread> readers;
	for (std::size_t i = 0; i < seen.size(); ++i) {
		readers.emplace_back([&store, &seen, i] {
			for (int j = 0; j < 100; ++j) {
				seen[i] = &store.tokens();
			}
		});
	}
	for (auto& reader : readers) {
		reader.join();
	}
	auto const& first = store.tokens();
	auto const& second = store.tokens();

	EXPECT_EQ(store.load_count(), 1);
	EXPECT_EQ(&first, &second);
	for (auto const tokens : seen) {
		EXPECT_EQ(tokens, &first);
	}
	std::filesystem::remove(path);
}

TEST(TokenStore, FailedLoadCanBeRetried) {
	auto const path = std::filesystem::temp_directory_path() / "deck-render-late-tokens.json";
	std::filesystem::remove(path);
	dr::token_store const store{path};
	EXPECT_THROW(store.tokens(), dr::token_load_error);

	if (dr::test::test_font() == nullptr) { GTEST_SKIP() << "No font available."; }
	write_token_file(path);
	EXPECT_EQ(store.tokens().get<int>("global.card.height"), 455);
	std::filesystem::remove(path);
}
