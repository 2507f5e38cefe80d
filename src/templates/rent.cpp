//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

#include <deck-render/color.hpp>

namespace {
	//! Inner-disc color for an unknown second color set.
	constexpr char const* inner_disc_fallback = "#FF1493";
}

namespace dr {
	auto layout_rent(rent_card const& card, design_tokens const& tokens) -> rent_layout {
		using detail::type_path;
		auto constexpr type = card_type::rent;

		rent_layout layout{};
		layout.frame = detail::frame_of(type, tokens);
		layout.border = detail::border_of(type, tokens);
		layout.title_y = tokens.get<float>(type_path(type, "layout.title_bar.y"));
		layout.center = {layout.frame.width / 2.f, tokens.get<float>(type_path(type, "layout.color_circles.center_y"))};
		layout.outer_radius = tokens.get<float>(type_path(type, "layout.color_circles.outer_diameter")) / 2;
		layout.inner_radius = tokens.get<float>(type_path(type, "layout.color_circles.inner_diameter")) / 2;

		layout.wild = card.is_wild;
		if (card.is_wild) {
			// The card's own color list does not apply to wild rent.
			for (auto const key : all_color_sets) {
				layout.segments.push_back(tokens.set_color(key));
			}
		} else {
			if (!card.colors.empty()) { layout.discs.push_back(tokens.set_color(card.colors[0])); }
			if (card.colors.size() > 1) {
				layout.discs.push_back(tokens.set_color(card.colors[1], hex_to_color(inner_disc_fallback)));
			}
		}

		layout.description = detail::description_of(card.info, type, tokens, 12);
		layout.badges = detail::badges_of(card.info, tokens, true);
		layout.footer = detail::footer_of(type, tokens);
		return layout;
	}

	auto render_rent(rent_card const& card, design_tokens const& tokens) -> sf::Image {
		auto const layout = layout_rent(card, tokens);
		auto const& font = tokens.font();
		auto const text_color = tokens.color("global.colors.text");

		auto result = detail::begin_card(layout.frame);
		detail::draw_border(result, layout.border);

		draw_text(result,
			"RENT",
			{layout.frame.width / 2.f, layout.title_y},
			{font, 20, sf::Text::Bold},
			origin::center,
			text_color);

		if (layout.wild) {
			draw_pie_segments(result, layout.center, layout.outer_radius, layout.segments);
			draw_circle(result, layout.center, layout.outer_radius, {std::nullopt, sf::Color::Black, 4});
			draw_circle(result, layout.center, layout.inner_radius, {sf::Color::White, sf::Color::Black, 3});
			draw_text(result,
				"ALL",
				{layout.center.x, layout.center.y - 15},
				{font, 42, sf::Text::Bold},
				origin::center,
				text_color);
			draw_text(result,
				"COLORS",
				{layout.center.x, layout.center.y + 22},
				{font, 20, sf::Text::Bold},
				origin::center,
				text_color);
		} else if (!layout.discs.empty()) {
			draw_circle(result, layout.center, layout.outer_radius, {layout.discs[0], sf::Color::Black, 4});
			if (layout.discs.size() > 1) {
				draw_circle(result, layout.center, layout.inner_radius, {layout.discs[1], sf::Color::Black, 3});
			}
		}

		detail::draw_description(result, layout.description, tokens);
		detail::draw_badges(result, layout.badges, tokens);
		detail::draw_footer(result, layout.footer, tokens);
		return result.to_image();
	}
}
