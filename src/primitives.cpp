//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/primitives.hpp>

#include <SFML/Graphics/CircleShape.hpp>
#include <SFML/Graphics/ConvexShape.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/VertexArray.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {
	constexpr float pi = 3.14159265358979f;
	constexpr std::size_t corner_points = 12;
	constexpr std::size_t circle_points = 96;
	//! Maximum angular step, in degrees, when approximating an arc.
	constexpr float arc_step = 2.f;

	auto point_on_circle(sf::Vector2f center, float radius, float deg) -> sf::Vector2f {
		auto const rad = deg * pi / 180.f;
		return {center.x + radius * std::cos(rad), center.y + radius * std::sin(rad)};
	}

	auto apply_style(sf::Shape& shape, dr::shape_style const& style) -> void {
		shape.setFillColor(style.fill ? style.fill->color() : sf::Color::Transparent);
		if (style.outline) {
			shape.setOutlineColor(style.outline->color());
			// Negative thickness keeps the outline within the shape's bounds.
			shape.setOutlineThickness(-style.outline_width);
		}
	}
}

namespace dr {
	auto create_canvas(unsigned width, unsigned height, paint const& background, float corner_radius) -> canvas {
		canvas result{width, height};
		draw_rounded_rect(result,
			{0, 0, static_cast<float>(width), static_cast<float>(height)},
			corner_radius,
			{background, std::nullopt});
		return result;
	}

	auto draw_rect(canvas& target, sf::FloatRect const& rect, shape_style const& style) -> void {
		sf::RectangleShape shape{{rect.width, rect.height}};
		shape.setPosition(rect.left, rect.top);
		apply_style(shape, style);
		target.draw(shape);
	}

	auto draw_rounded_rect(canvas& target, sf::FloatRect const& rect, float radius, shape_style const& style) -> void {
		radius = std::clamp(radius, 0.f, std::min(rect.width, rect.height) / 2);
		if (radius == 0) {
			draw_rect(target, rect, style);
			return;
		}

		// Corner centers, clockwise from top-left, each paired with the angle its arc starts at.
		struct corner {
			sf::Vector2f center;
			float start_deg;
		};
		corner const corners[] = {
			{{rect.left + radius, rect.top + radius}, 180},
			{{rect.left + rect.width - radius, rect.top + radius}, 270},
			{{rect.left + rect.width - radius, rect.top + rect.height - radius}, 0},
			{{rect.left + radius, rect.top + rect.height - radius}, 90},
		};

		sf::ConvexShape shape{4 * corner_points};
		std::size_t index = 0;
		for (auto const& c : corners) {
			for (std::size_t i = 0; i < corner_points; ++i) {
				auto const deg = c.start_deg + 90.f * i / (corner_points - 1);
				shape.setPoint(index++, point_on_circle(c.center, radius, deg));
			}
		}
		apply_style(shape, style);
		target.draw(shape);
	}

	auto draw_circle(canvas& target, sf::Vector2f center, float radius, shape_style const& style) -> void {
		sf::CircleShape shape{radius, circle_points};
		shape.setOrigin(radius, radius);
		shape.setPosition(center);
		apply_style(shape, style);
		target.draw(shape);
	}

	auto draw_pie_slice(canvas& target,
		sf::Vector2f center,
		float radius,
		float start_deg,
		float end_deg,
		shape_style const& style) -> void {
		if (end_deg <= start_deg) { return; }
		auto const steps = std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil((end_deg - start_deg) / arc_step)));

		std::vector<sf::Vector2f> arc;
		arc.reserve(steps + 1);
		for (std::size_t i = 0; i <= steps; ++i) {
			arc.push_back(point_on_circle(center, radius, start_deg + (end_deg - start_deg) * i / steps));
		}

		if (style.fill) {
			// A fan handles reflex sectors, which a convex shape cannot.
			sf::VertexArray fan{sf::TriangleFan};
			auto const fill = style.fill->color();
			fan.append({center, fill});
			for (auto const& point : arc) {
				fan.append({point, fill});
			}
			target.draw(fan);
		}

		if (style.outline) {
			draw_line(target, center, arc.front(), *style.outline, style.outline_width);
			draw_line(target, center, arc.back(), *style.outline, style.outline_width);
			for (std::size_t i = 1; i < arc.size(); ++i) {
				draw_line(target, arc[i - 1], arc[i], *style.outline, style.outline_width);
			}
		}
	}

	auto draw_polygon(canvas& target, std::vector<sf::Vector2f> const& points, shape_style const& style) -> void {
		sf::ConvexShape shape{points.size()};
		for (std::size_t i = 0; i < points.size(); ++i) {
			shape.setPoint(i, points[i]);
		}
		apply_style(shape, style);
		target.draw(shape);
	}

	auto draw_line(canvas& target, sf::Vector2f from, sf::Vector2f to, paint const& color, float width) -> void {
		auto const delta = to - from;
		auto const length = std::sqrt(delta.x * delta.x + delta.y * delta.y);
		if (length == 0) { return; }
		sf::RectangleShape shape{{length, width}};
		shape.setOrigin(0, width / 2);
		shape.setPosition(from);
		shape.setRotation(std::atan2(delta.y, delta.x) * 180.f / pi);
		shape.setFillColor(color.color());
		target.draw(shape);
	}

	auto draw_text(canvas& target,
		std::string const& text,
		sf::Vector2f position,
		text_style const& style,
		sf::Vector2f anchor,
		paint const& color) -> void {
		std::vector<std::string> lines;
		std::istringstream stream{text};
		for (std::string line; std::getline(stream, line);) {
			lines.push_back(line);
		}
		detail::text_block block{lines, style.font, style.size, style.flags, color.color(), align::center};
		auto const bounds = block.get_local_bounds();
		block.setOrigin(bounds.left + bounds.width * anchor.x, bounds.top + bounds.height * anchor.y);
		block.setPosition(std::round(position.x), std::round(position.y));
		target.draw(block);
	}

	auto wrap_words(std::string const& text, std::size_t chars_per_line) -> std::vector<std::string> {
		chars_per_line = std::max<std::size_t>(chars_per_line, 1);
		std::vector<std::string> lines;
		std::istringstream paragraphs{text};
		for (std::string paragraph; std::getline(paragraphs, paragraph);) {
			std::istringstream words{paragraph};
			std::string line;
			bool blank = true;
			for (std::string word; words >> word;) {
				blank = false;
				if (line.empty()) {
					line = word;
				} else if (line.size() + 1 + word.size() <= chars_per_line) {
					line += ' ';
					line += word;
					continue;
				} else {
					lines.push_back(line);
					line = word;
				}
				// Break words that cannot fit on a line of their own.
				while (line.size() > chars_per_line) {
					lines.push_back(line.substr(0, chars_per_line));
					line.erase(0, chars_per_line);
				}
			}
			lines.push_back(blank ? std::string{} : line);
		}
		return lines;
	}

	auto measure_and_wrap_text(std::string const& text, sf::Font const& font, unsigned size, float max_width)
		-> std::vector<std::string> {
		auto const reference_width = font.getGlyph(U'M', size, false).advance;
		auto const chars_per_line = reference_width > 0 //
			? std::max(10, static_cast<int>(max_width / reference_width))
			: 10;
		return wrap_words(text, static_cast<std::size_t>(chars_per_line));
	}

	auto draw_multiline_text(canvas& target,
		std::string const& text,
		sf::Vector2f top_left,
		text_style const& style,
		float max_width,
		align alignment,
		paint const& color,
		float line_spacing) -> void {
		auto const lines = measure_and_wrap_text(text, style.font, style.size, max_width);
		detail::text_block block{
			lines, style.font, style.size, style.flags, color.color(), alignment, style.size * line_spacing};
		auto const bounds = block.get_local_bounds();
		float x = top_left.x;
		switch (alignment) {
			case align::left:
				break;
			case align::center:
				x += (max_width - bounds.width) / 2 - bounds.left;
				break;
			case align::right:
				x += max_width - bounds.width - bounds.left;
				break;
		}
		block.setPosition(std::round(x), std::round(top_left.y));
		target.draw(block);
	}
}
