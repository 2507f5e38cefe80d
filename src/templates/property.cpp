//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

namespace dr {
	auto layout_property(property_card const& card, design_tokens const& tokens) -> property_layout {
		using detail::type_path;
		auto constexpr type = card_type::property;

		property_layout layout{};
		layout.frame = detail::frame_of(type, tokens);
		auto const width = static_cast<float>(layout.frame.width);

		auto const header_height = tokens.get<float>(type_path(type, "layout.header_bar.height"));
		auto const header_padding = tokens.get<float>(type_path(type, "layout.header_bar.padding"));
		layout.header = {header_padding, header_padding, width - 2 * header_padding, header_height - header_padding};
		layout.header_color = tokens.set_color(card.color);
		layout.header_text = detail::to_upper(card.property_name);
		layout.header_text_y = header_padding + (header_height - header_padding) / 2;

		auto const start_y = tokens.get<float>(type_path(type, "layout.rent_section.start_y"));
		auto const row_height = tokens.get<float>(type_path(type, "layout.rent_section.row_height"));
		layout.rent_label_y = start_y - tokens.get<float>(type_path(type, "layout.rent_section.label_offset"));
		layout.caption_y = start_y - tokens.get<float>(type_path(type, "layout.rent_section.caption_offset"));
		// Declared order is drawing order; the table is neither sorted nor checked for monotonicity.
		for (std::size_t i = 0; i < card.rent_values.size(); ++i) {
			layout.rows.push_back({start_y + i * row_height, card.rent_values[i].count, card.rent_values[i].rent});
		}

		layout.badges = detail::badges_of(card.info, tokens, false);
		layout.footer = detail::footer_of(type, tokens);
		return layout;
	}

	auto render_property(property_card const& card, design_tokens const& tokens) -> sf::Image {
		auto const layout = layout_property(card, tokens);
		auto const& font = tokens.font();
		auto const text_color = tokens.color("global.colors.text");
		auto const center_x = layout.frame.width / 2.f;

		auto result = detail::begin_card(layout.frame);

		draw_rounded_rect(result, layout.header, 10, {layout.header_color, sf::Color::Black, 2});
		draw_text(result,
			layout.header_text,
			{center_x, layout.header_text_y},
			{font, 18, sf::Text::Bold},
			origin::center,
			text_color);

		draw_text(result, "RENT", {center_x, layout.rent_label_y}, {font, 24, sf::Text::Bold}, origin::center, text_color);
		draw_text(result,
			"(No. of properties\nowned in set)",
			{center_x, layout.caption_y},
			{font, 12},
			origin::center,
			text_color);

		for (auto const& row : layout.rows) {
			draw_property_rent_row(result, row.y, row.count, row.rent, layout.header_color, font, 30, layout.frame.width - 60.f);
		}

		detail::draw_badges(result, layout.badges, tokens);
		detail::draw_footer(result, layout.footer, tokens);
		return result.to_image();
	}
}
