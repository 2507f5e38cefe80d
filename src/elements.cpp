//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/elements.hpp>

#include <deck-render/errors.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace {
	constexpr float border_margin = 10;

	auto const muted = sf::Color{0x50, 0x50, 0x50};
}

namespace dr {
	auto money_label(int value) -> std::string {
		return fmt::format("${}M", value);
	}

	auto draw_value_badge(canvas& target,
		int value,
		sf::Vector2f center,
		float diameter,
		badge_colors const& colors,
		sf::Font const& font) -> void {
		draw_circle(target, center, diameter / 2, {colors.background, colors.border, colors.border_width});
		draw_text(target,
			money_label(value),
			center,
			{font, static_cast<unsigned>(diameter / 3), sf::Text::Bold},
			origin::center,
			colors.text);
	}

	auto parse_border_pattern(std::string_view name) -> border_pattern {
		if (name == "chain_link") { return border_pattern::chain_link; }
		if (name == "double") { return border_pattern::double_line; }
		if (name == "solid") { return border_pattern::solid; }
		throw invalid_token_value{"border.pattern", fmt::format("unknown border pattern \"{}\".", name)};
	}

	auto draw_decorative_border(canvas& target, float width, paint const& color, border_pattern pattern) -> void {
		auto const size = target.size();
		auto const right = size.x - border_margin;
		auto const bottom = size.y - border_margin;

		switch (pattern) {
			case border_pattern::chain_link: {
				constexpr float segment = 15;
				constexpr float gap = 5;
				constexpr float thickness = 3;
				for (float x = border_margin; x < right; x += segment + gap) {
					auto const x_end = std::min(x + segment, right);
					draw_line(target, {x, border_margin}, {x_end, border_margin}, color, thickness);
					draw_line(target, {x, bottom}, {x_end, bottom}, color, thickness);
				}
				for (float y = border_margin; y < bottom; y += segment + gap) {
					auto const y_end = std::min(y + segment, bottom);
					draw_line(target, {border_margin, y}, {border_margin, y_end}, color, thickness);
					draw_line(target, {right, y}, {right, y_end}, color, thickness);
				}
				break;
			}
			case border_pattern::double_line: {
				constexpr float inset = 5;
				constexpr float thickness = 2;
				draw_rect(target,
					{border_margin, border_margin, right - border_margin, bottom - border_margin},
					{std::nullopt, color, thickness});
				draw_rect(target,
					{border_margin + inset, border_margin + inset, right - border_margin - 2 * inset, bottom - border_margin - 2 * inset},
					{std::nullopt, color, thickness});
				break;
			}
			case border_pattern::solid:
				draw_rect(target,
					{border_margin, border_margin, right - border_margin, bottom - border_margin},
					{std::nullopt, color, width});
				break;
		}
	}

	auto draw_property_rent_row(canvas& target,
		float y,
		int count,
		int rent,
		paint const& icon_color,
		sf::Font const& font,
		float x_start,
		float row_width) -> void {
		constexpr float icon_size = 40;
		constexpr float badge_radius = 18;
		constexpr float dot_spacing = 10;

		// House: body below a triangular roof.
		auto const icon_x = x_start + 20;
		auto const house_y = y - icon_size / 2;
		auto const eaves_y = house_y + icon_size / 3;
		draw_rect(target, {icon_x, eaves_y, icon_size, icon_size - icon_size / 3}, {icon_color, sf::Color::Black, 2});
		draw_polygon(target,
			{{icon_x, eaves_y}, {icon_x + icon_size / 2, house_y}, {icon_x + icon_size, eaves_y}},
			{icon_color, sf::Color::Black, 1});

		// Property count.
		sf::Vector2f const badge_center{icon_x + icon_size / 2, y};
		draw_circle(target, badge_center, badge_radius, {sf::Color::White, sf::Color::Black, 2});
		draw_text(target, std::to_string(count), badge_center, {font, 16, sf::Text::Bold}, origin::center);

		// Dotted leader.
		auto const dots_end = x_start + row_width - 80;
		for (auto x = icon_x + icon_size + 20; x < dots_end; x += dot_spacing) {
			draw_circle(target, {x + 1.5f, y - 0.5f}, 1.5f, {muted, std::nullopt});
		}

		draw_text(target,
			money_label(rent),
			{x_start + row_width - 50, y},
			{font, 18, sf::Text::Bold},
			origin::center_right);
	}

	auto draw_color_stripes(canvas& target,
		std::vector<sf::Color> const& colors,
		float y,
		float height,
		float x_start,
		float x_end) -> void {
		if (colors.empty()) { return; }

		auto const stripe_width = (x_end - x_start) / colors.size();
		for (std::size_t i = 0; i < colors.size(); ++i) {
			draw_rect(target, {x_start + i * stripe_width, y, stripe_width, height}, {colors[i], std::nullopt});
		}
		draw_rect(target, {x_start, y, x_end - x_start, height}, {std::nullopt, sf::Color::Black, 2});
	}

	auto draw_pie_segments(canvas& target, sf::Vector2f center, float radius, std::vector<sf::Color> const& colors)
		-> void {
		if (colors.empty()) { return; }

		auto const segment = 360.f / colors.size();
		for (std::size_t i = 0; i < colors.size(); ++i) {
			draw_pie_slice(target, center, radius, i * segment, (i + 1) * segment, {colors[i], sf::Color::Black, 2});
		}
	}
}
