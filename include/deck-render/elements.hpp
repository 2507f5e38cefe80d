//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Composite card elements built from the primitives.

#pragma once

#include "primitives.hpp"

#include <string_view>
#include <vector>

namespace dr {
	struct badge_colors {
		paint background = sf::Color::White;
		paint border = sf::Color::Black;
		float border_width = 3;
		paint text = sf::Color::Black;
	};

	//! Formats a value in millions, e.g. "$5M".
	auto money_label(int value) -> std::string;

	//! A circle of @p diameter centered on @p center, labeled with @ref money_label of @p value.
	auto draw_value_badge(canvas& target,
		int value,
		sf::Vector2f center,
		float diameter,
		badge_colors const& colors,
		sf::Font const& font) -> void;

	enum class border_pattern {
		//! Dashed perimeter of fixed-length segments.
		chain_link,
		//! Two nested thin rectangles.
		double_line,
		//! One rectangle of the requested width.
		solid,
	};

	//! Maps a token name ("chain_link", "double", or "solid") to its pattern.
	//! @throw invalid_token_value for any other name. Unknown patterns are configuration errors, not solid borders.
	auto parse_border_pattern(std::string_view name) -> border_pattern;

	//! Draws a border inset 10 px from the canvas edges. @p width applies to the solid pattern only.
	auto draw_decorative_border(canvas& target, float width, paint const& color, border_pattern pattern) -> void;

	//! One row of a property rent table, vertically centered on @p y: a house icon carrying the property count, a
	//! dotted leader, and the rent right-aligned at the end of the row.
	auto draw_property_rent_row(canvas& target,
		float y,
		int count,
		int rent,
		paint const& icon_color,
		sf::Font const& font,
		float x_start = 50,
		float row_width = 300) -> void;

	//! Divides [@p x_start, @p x_end] evenly among @p colors and outlines the whole strip. Draws nothing if
	//! @p colors is empty.
	auto draw_color_stripes(canvas& target,
		std::vector<sf::Color> const& colors,
		float y,
		float height,
		float x_start = 30,
		float x_end = 383) -> void;

	//! One equal outlined sector per color, clockwise from 3 o'clock.
	auto draw_pie_segments(canvas& target, sf::Vector2f center, float radius, std::vector<sf::Color> const& colors)
		-> void;
}
