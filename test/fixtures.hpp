//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Shared token trees and rendering guards for the tests.

#pragma once

#include <deck-render/tokens.hpp>

#include <SFML/Graphics/RenderTexture.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <memory>
#include <string>

namespace dr::test {
	//! The shipped token tree.
	inline auto token_tree() -> nlohmann::json {
		std::ifstream fin{DR_TOKENS_FILE};
		return nlohmann::json::parse(fin);
	}

	//! Tokens without a font; enough for layout functions.
	inline auto layout_tokens() -> design_tokens {
		return design_tokens{token_tree()};
	}

	//! The font CMake found, or null if none was found or it does not load.
	inline auto test_font() -> std::shared_ptr<sf::Font const> {
		static auto const font = []() -> std::shared_ptr<sf::Font const> {
			std::string const path = DR_TEST_FONT;
			if (path.empty()) { return nullptr; }
			auto result = std::make_shared<sf::Font>();
			if (!result->loadFromFile(path)) { return nullptr; }
			return result;
		}();
		return font;
	}

	//! Whether this machine can create an off-screen render target.
	inline auto can_render() -> bool {
		static bool const available = [] {
			sf::RenderTexture probe;
			return probe.create(1, 1);
		}();
		return available && test_font() != nullptr;
	}

	//! Tokens with the test font, for tests that draw.
	inline auto render_tokens(nlohmann::json tree = token_tree()) -> design_tokens {
		return design_tokens{std::move(tree), test_font()};
	}
}

//! Skips the current test when there is no font or render target to draw with.
#define DR_REQUIRE_RENDERING() \
	if (!::dr::test::can_render()) { GTEST_SKIP() << "No font or render target available."; }
