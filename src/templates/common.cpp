//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include "common.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace dr::detail {
	auto type_path(card_type type, std::string_view path) -> std::string {
		return fmt::format("card_types.{}.{}", to_string(type), path);
	}

	auto to_upper(std::string text) -> std::string {
		std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
		return text;
	}

	auto frame_of(card_type type, design_tokens const& tokens) -> card_frame {
		return {tokens.get<unsigned>("global.card.width"),
			tokens.get<unsigned>("global.card.height"),
			tokens.get<float>("global.card.corner_radius"),
			tokens.color(type_path(type, "colors.background"))};
	}

	auto border_of(card_type type, design_tokens const& tokens) -> border_layout {
		return {tokens.get<float>(type_path(type, "layout.border.width")),
			tokens.color(type_path(type, "layout.border.color")),
			parse_border_pattern(tokens.get<std::string>(type_path(type, "layout.border.pattern")))};
	}

	auto badges_of(card_info const& info, design_tokens const& tokens, bool bottom_right) -> std::vector<badge_layout> {
		if (!info.has_face_value()) { return {}; }
		if (bottom_right) { return corner_badges(*info.value, tokens); }
		auto const diameter = tokens.get<float>("global.value_badge.diameter");
		return {{*info.value,
			{tokens.get<float>("global.value_badge.position.top_left.x"),
				tokens.get<float>("global.value_badge.position.top_left.y")},
			diameter}};
	}

	auto corner_badges(int value, design_tokens const& tokens) -> std::vector<badge_layout> {
		auto const diameter = tokens.get<float>("global.value_badge.diameter");
		auto const width = tokens.get<float>("global.card.width");
		auto const height = tokens.get<float>("global.card.height");
		// Bottom-right offsets are relative to the bottom-right corner.
		return {
			{value,
				{tokens.get<float>("global.value_badge.position.top_left.x"),
					tokens.get<float>("global.value_badge.position.top_left.y")},
				diameter},
			{value,
				{width + tokens.get<float>("global.value_badge.position.bottom_right.x"),
					height + tokens.get<float>("global.value_badge.position.bottom_right.y")},
				diameter},
		};
	}

	auto description_of(card_info const& info, card_type type, design_tokens const& tokens, unsigned size)
		-> std::optional<description_layout> {
		if (!info.description || info.description->empty()) { return std::nullopt; }
		auto const card_width = tokens.get<float>("global.card.width");
		auto const width = tokens.get<float>(type_path(type, "layout.description_area.width"));
		return description_layout{*info.description,
			{(card_width - width) / 2, tokens.get<float>(type_path(type, "layout.description_area.start_y"))},
			width,
			size};
	}

	auto footer_of(card_type type, design_tokens const& tokens) -> footer_layout {
		return {tokens.get<std::string>("global.footer.text"), tokens.get<float>(type_path(type, "layout.footer_text.y"))};
	}

	auto begin_card(card_frame const& frame) -> canvas {
		return create_canvas(frame.width, frame.height, frame.background, frame.corner_radius);
	}

	auto draw_border(canvas& target, border_layout const& border) -> void {
		draw_decorative_border(target, border.width, border.color, border.pattern);
	}

	auto draw_badges(canvas& target, std::vector<badge_layout> const& badges, design_tokens const& tokens) -> void {
		if (badges.empty()) { return; }
		badge_colors const colors{sf::Color::White,
			sf::Color::Black,
			tokens.get<float>("global.value_badge.border_width"),
			tokens.color("global.colors.text")};
		for (auto const& badge : badges) {
			draw_value_badge(target, badge.value, badge.center, badge.diameter, colors, tokens.font());
		}
	}

	auto draw_description(canvas& target, std::optional<description_layout> const& description, design_tokens const& tokens)
		-> void {
		if (!description) { return; }
		draw_multiline_text(target,
			description->text,
			description->top_left,
			{tokens.font(), description->size},
			description->width,
			align::center,
			tokens.color("global.colors.text"));
	}

	auto draw_footer(canvas& target, footer_layout const& footer, design_tokens const& tokens) -> void {
		draw_text(target,
			footer.text,
			{target.size().x / 2.f, footer.y},
			{tokens.font(), 10},
			origin::center,
			tokens.color("global.colors.muted"));
	}
}
