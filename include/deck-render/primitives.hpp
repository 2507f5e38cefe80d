//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Stateless shape and text drawing onto a canvas.

#pragma once

#include "canvas.hpp"
#include "color.hpp"
#include "detail/text_block.hpp"

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/System/Vector2.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dr {
	using detail::align;

	//! Fractional anchor points, as used by @ref draw_text. (0, 0) is the top-left of the text's bounds.
	namespace origin {
		inline sf::Vector2f const top_left{0, 0};
		inline sf::Vector2f const center{0.5f, 0.5f};
		inline sf::Vector2f const center_right{1, 0.5f};
	}

	//! Fill and outline of a shape. An absent color is not drawn. Outlines lie inside the shape.
	struct shape_style {
		std::optional<paint> fill;
		std::optional<paint> outline;
		float outline_width = 1;
	};

	struct text_style {
		sf::Font const& font;
		unsigned size;
		sf::Uint32 flags = sf::Text::Regular;
	};

	//! Allocates a transparent canvas and paints a rounded-rectangle background over all of it.
	auto create_canvas(unsigned width, unsigned height, paint const& background, float corner_radius) -> canvas;

	auto draw_rect(canvas& target, sf::FloatRect const& rect, shape_style const& style) -> void;

	auto draw_rounded_rect(canvas& target, sf::FloatRect const& rect, float radius, shape_style const& style) -> void;

	auto draw_circle(canvas& target, sf::Vector2f center, float radius, shape_style const& style) -> void;

	//! Draws a circular sector. Angles are in degrees, clockwise from the positive x axis.
	auto draw_pie_slice(canvas& target,
		sf::Vector2f center,
		float radius,
		float start_deg,
		float end_deg,
		shape_style const& style) -> void;

	//! @param points Vertices of a convex polygon.
	auto draw_polygon(canvas& target, std::vector<sf::Vector2f> const& points, shape_style const& style) -> void;

	auto draw_line(canvas& target, sf::Vector2f from, sf::Vector2f to, paint const& color, float width = 1) -> void;

	//! Draws @p text (which may contain newlines) so that the fractional @p anchor of its bounds lands on @p position.
	auto draw_text(canvas& target,
		std::string const& text,
		sf::Vector2f position,
		text_style const& style,
		sf::Vector2f anchor = origin::top_left,
		paint const& color = sf::Color::Black) -> void;

	//! Greedy word wrap to at most @p chars_per_line characters per line. Newlines start new paragraphs; a blank
	//! paragraph yields an empty line. Words longer than the budget are broken.
	auto wrap_words(std::string const& text, std::size_t chars_per_line) -> std::vector<std::string>;

	//! Wraps @p text to @p max_width pixels, estimating the character budget from the advance of 'M'. This
	//! approximates rather than measures each line; at least ten characters fit on a line.
	auto measure_and_wrap_text(std::string const& text, sf::Font const& font, unsigned size, float max_width)
		-> std::vector<std::string>;

	//! Wraps @p text and draws it into a box of @p max_width starting at @p top_left.
	//! @param line_spacing Baseline distance as a multiple of the character size.
	auto draw_multiline_text(canvas& target,
		std::string const& text,
		sf::Vector2f top_left,
		text_style const& style,
		float max_width,
		align alignment = align::left,
		paint const& color = sf::Color::Black,
		float line_spacing = 1.2f) -> void;
}
