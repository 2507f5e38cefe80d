//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

#include <sstream>

namespace {
	//! Names longer than this are split over two lines.
	constexpr std::size_t max_single_line_name = 12;

	auto join(std::vector<std::string>::const_iterator begin, std::vector<std::string>::const_iterator end)
		-> std::string {
		std::string result;
		for (auto it = begin; it != end; ++it) {
			if (!result.empty()) { result += ' '; }
			result += *it;
		}
		return result;
	}
}

namespace dr {
	auto action_name_lines(std::string const& name) -> std::vector<std::string> {
		if (name.size() <= max_single_line_name) { return {detail::to_upper(name)}; }

		// Bisect the word list, not the measured width.
		std::vector<std::string> words;
		std::istringstream stream{name};
		for (std::string word; stream >> word;) {
			words.push_back(word);
		}
		auto const mid = words.begin() + words.size() / 2;
		return {detail::to_upper(join(words.begin(), mid)), detail::to_upper(join(mid, words.end()))};
	}

	auto layout_action(action_card const& card, design_tokens const& tokens) -> action_layout {
		using detail::type_path;
		auto constexpr type = card_type::action;

		action_layout layout{};
		layout.frame = detail::frame_of(type, tokens);
		layout.border = detail::border_of(type, tokens);
		layout.title_y = tokens.get<float>(type_path(type, "layout.title_bar.y"));
		layout.circle_center = {
			layout.frame.width / 2.f, tokens.get<float>(type_path(type, "layout.title_circle.center_y"))};
		layout.circle_radius = tokens.get<float>(type_path(type, "layout.title_circle.diameter")) / 2;
		layout.circle_border_width = tokens.get<float>(type_path(type, "layout.title_circle.border_width"));
		layout.circle_color = tokens.color(type_path(type, "colors.circle_bg"));
		layout.name_lines = action_name_lines(card.action_name);
		layout.description = detail::description_of(card.info, type, tokens, 12);
		layout.badges = detail::badges_of(card.info, tokens, true);
		layout.footer = detail::footer_of(type, tokens);
		return layout;
	}

	auto render_action(action_card const& card, design_tokens const& tokens) -> sf::Image {
		auto const layout = layout_action(card, tokens);
		auto const& font = tokens.font();
		auto const text_color = tokens.color("global.colors.text");
		auto const center_x = layout.frame.width / 2.f;

		auto result = detail::begin_card(layout.frame);
		detail::draw_border(result, layout.border);

		draw_text(result, "ACTION CARD", {center_x, layout.title_y}, {font, 16, sf::Text::Bold}, origin::center, text_color);

		draw_circle(result,
			layout.circle_center,
			layout.circle_radius,
			{layout.circle_color, sf::Color::Black, layout.circle_border_width});
		text_style const name_style{font, 28, sf::Text::Bold};
		if (layout.name_lines.size() == 1) {
			draw_text(result, layout.name_lines.front(), layout.circle_center, name_style, origin::center, text_color);
		} else {
			auto const [x, y] = layout.circle_center;
			draw_text(result, layout.name_lines[0], {x, y - 20}, name_style, origin::center, text_color);
			draw_text(result, layout.name_lines[1], {x, y + 20}, name_style, origin::center, text_color);
		}

		detail::draw_description(result, layout.description, tokens);
		detail::draw_badges(result, layout.badges, tokens);
		detail::draw_footer(result, layout.footer, tokens);
		return result.to_image();
	}
}
