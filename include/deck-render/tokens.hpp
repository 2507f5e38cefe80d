//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief The design-token tree: card geometry, per-type layout, and color tables.

#pragma once

#include "errors.hpp"

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Font.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace dr {
	//! Color used for a color-set key that has no entry in @c global.colors.property_sets.
	inline constexpr char const* default_set_color = "#228B22";

	//! Immutable design tokens plus the font they name.
	struct design_tokens {
		//! @param font The typeface used for all card text; may be null for layout-only use.
		design_tokens(nlohmann::json tree, std::shared_ptr<sf::Font const> font = nullptr);

		//! Parses the token file and loads the font at @c global.font.path, or else the first loadable entry of the
		//! optional @c global.font.fallbacks list. Relative font paths are resolved against the file's directory.
		//! @throw token_load_error if the file is missing or malformed or no font can be loaded.
		static auto from_file(std::filesystem::path const& path) -> design_tokens;

		auto tree() const -> nlohmann::json const& {
			return _tree;
		}

		//! The node at a dotted path such as @c global.card.width.
		//! @throw missing_token_key naming @p dotted_path if any segment is absent.
		auto at(std::string_view dotted_path) const -> nlohmann::json const&;

		//! The node at @p dotted_path, or null if it is absent.
		auto find(std::string_view dotted_path) const -> nlohmann::json const*;

		//! @throw missing_token_key if absent, invalid_token_value if it is not convertible to @p T.
		template <typename T>
		auto get(std::string_view dotted_path) const -> T {
			auto const& node = at(dotted_path);
			try {
				return node.get<T>();
			} catch (nlohmann::json::type_error const& ex) {
				throw invalid_token_value{std::string{dotted_path}, ex.what()};
			}
		}

		//! A hex color token, converted.
		//! @throw invalid_color_format if the token is not a valid hex color.
		auto color(std::string_view dotted_path) const -> sf::Color;

		//! The display color for a color-set key, falling back to @ref default_set_color for unknown keys.
		//! @throw invalid_token_value if the key's entry is not a string.
		auto set_color(std::string const& key) const -> sf::Color;

		//! As above, with @p fallback for unknown keys.
		auto set_color(std::string const& key, sf::Color fallback) const -> sf::Color;

		//! @throw token_load_error if these tokens were built without a font.
		auto font() const -> sf::Font const&;

	private:
		nlohmann::json _tree;
		std::shared_ptr<sf::Font const> _font;
	};

	//! Loads a token file on first use, once, and serves the same tokens for the rest of its lifetime.
	struct token_store {
		token_store(std::filesystem::path path);

		//! @throw token_load_error from the first successful load attempt; a failed load may be retried.
		auto tokens() const -> design_tokens const&;

		//! Number of times the backing file has been read.
		auto load_count() const -> int {
			return _load_count.load();
		}

	private:
		std::filesystem::path _path;
		mutable std::mutex _mutex;
		mutable std::optional<design_tokens> _tokens;
		mutable std::atomic<bool> _loaded{false};
		mutable std::atomic<int> _load_count{0};
	};
}
