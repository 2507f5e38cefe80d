//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

namespace dr {
	auto layout_money(money_card const& card, design_tokens const& tokens) -> money_layout {
		using detail::type_path;
		auto constexpr type = card_type::money;

		money_layout layout{};
		layout.frame = detail::frame_of(type, tokens);
		layout.border = detail::border_of(type, tokens);
		layout.circle_center = {
			layout.frame.width / 2.f, tokens.get<float>(type_path(type, "layout.denomination_circle.center_y"))};
		layout.circle_radius = tokens.get<float>(type_path(type, "layout.denomination_circle.diameter")) / 2;
		layout.circle_border_width = tokens.get<float>(type_path(type, "layout.denomination_circle.border_width"));
		layout.circle_color = tokens.color(type_path(type, "colors.circle_bg"));
		layout.caption = money_label(card.denomination);
		// The denomination always exists, so both corners always carry it.
		layout.badges = detail::corner_badges(card.denomination, tokens);
		layout.footer = detail::footer_of(type, tokens);
		return layout;
	}

	auto render_money(money_card const& card, design_tokens const& tokens) -> sf::Image {
		auto const layout = layout_money(card, tokens);

		auto result = detail::begin_card(layout.frame);
		detail::draw_border(result, layout.border);

		draw_circle(result,
			layout.circle_center,
			layout.circle_radius,
			{layout.circle_color, sf::Color::Black, layout.circle_border_width});
		draw_text(result,
			layout.caption,
			layout.circle_center,
			{tokens.font(), 60, sf::Text::Bold},
			origin::center,
			tokens.color("global.colors.text"));

		detail::draw_badges(result, layout.badges, tokens);
		detail::draw_footer(result, layout.footer, tokens);
		return result.to_image();
	}
}
