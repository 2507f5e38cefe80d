//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include <SFML/Graphics/Color.hpp>

#include <string>
#include <string_view>

namespace dr {
	//! Parses @c #RRGGBB or @c #RRGGBBAA (the leading @c # is optional). Alpha defaults to opaque.
	//! @throw invalid_color_format for any other length or a non-hex digit.
	auto hex_to_color(std::string_view text) -> sf::Color;

	//! Formats @p color as @c #RRGGBB, or @c #RRGGBBAA when it is not opaque.
	auto color_to_hex(sf::Color const& color) -> std::string;

	//! A color argument given either as a resolved color or as a hex string, converted on construction.
	struct paint {
		paint(sf::Color const& color) : _color{color} {}
		paint(char const* hex) : _color{hex_to_color(hex)} {}
		paint(std::string const& hex) : _color{hex_to_color(hex)} {}

		auto color() const -> sf::Color {
			return _color;
		}

	private:
		sf::Color _color;
	};
}
