//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Multi-line, single-style SFML text with per-line alignment.

#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Drawable.hpp>
#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Graphics/Transformable.hpp>

#include <string>
#include <vector>

namespace dr::detail {
	enum class align { left, center, right };

	struct text_block
		: sf::Drawable
		, sf::Transformable //
	{
		//! @param line_spacing Distance between baselines; zero uses the font's own line spacing.
		text_block(std::vector<std::string> const& lines,
			sf::Font const& font,
			unsigned character_size,
			sf::Uint32 style_flags = sf::Text::Regular,
			sf::Color fill_color = sf::Color::Black,
			align alignment = align::left,
			float line_spacing = 0);

		//! Ink bounds of all non-empty lines.
		auto get_local_bounds() const -> sf::FloatRect;

	private:
		auto draw(sf::RenderTarget& target, sf::RenderStates states) const -> void override;

		std::vector<sf::Text> _texts;

		sf::FloatRect _bounds;
	};
}
