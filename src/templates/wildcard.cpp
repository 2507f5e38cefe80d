//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

#include <algorithm>

namespace dr {
	auto layout_wildcard(wildcard_card const& card, design_tokens const& tokens) -> wildcard_layout {
		using detail::type_path;
		auto constexpr type = card_type::wildcard;

		wildcard_layout layout{};
		layout.frame = detail::frame_of(type, tokens);

		if (card.is_multicolor) {
			for (auto const key : all_color_sets) {
				layout.stripes.push_back(tokens.set_color(key));
			}
		} else {
			auto const count = std::min<std::size_t>(card.allowed_colors.size(), 2);
			for (std::size_t i = 0; i < count; ++i) {
				layout.stripes.push_back(tokens.set_color(card.allowed_colors[i]));
			}
		}
		layout.stripe_y = tokens.get<float>(type_path(type, "layout.color_stripe_header.y"));
		layout.stripe_height = tokens.get<float>(type_path(type, "layout.color_stripe_header.height"));
		layout.stripe_x_start = 30;
		layout.stripe_x_end = layout.frame.width - 30.f;

		layout.title = card.info.title.empty() ? "PROPERTY WILD CARD" : detail::to_upper(card.info.title);
		layout.title_y = tokens.get<float>(type_path(type, "layout.title_bar.y"));
		layout.wild_y = tokens.get<float>(type_path(type, "layout.character_area.center_y"));
		layout.description = detail::description_of(card.info, type, tokens, 11);
		// Wildcards carry a top-left badge only.
		layout.badges = detail::badges_of(card.info, tokens, false);
		layout.footer = detail::footer_of(type, tokens);
		return layout;
	}

	auto render_wildcard(wildcard_card const& card, design_tokens const& tokens) -> sf::Image {
		auto const layout = layout_wildcard(card, tokens);
		auto const& font = tokens.font();
		auto const center_x = layout.frame.width / 2.f;

		auto result = detail::begin_card(layout.frame);

		draw_color_stripes(
			result, layout.stripes, layout.stripe_y, layout.stripe_height, layout.stripe_x_start, layout.stripe_x_end);

		draw_text(result,
			layout.title,
			{center_x, layout.title_y},
			{font, 16, sf::Text::Bold},
			origin::center,
			tokens.color("global.colors.text"));
		draw_text(result,
			"WILD",
			{center_x, layout.wild_y},
			{font, 64, sf::Text::Bold},
			origin::center,
			tokens.color("global.colors.muted"));

		detail::draw_description(result, layout.description, tokens);
		detail::draw_badges(result, layout.badges, tokens);
		detail::draw_footer(result, layout.footer, tokens);
		return result.to_image();
	}
}
