//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Token lookups and drawing steps shared by the card templates.

#pragma once

#include <deck-render/templates.hpp>

#include <string>
#include <string_view>

namespace dr::detail {
	//! @c card_types.<type>.<path>
	auto type_path(card_type type, std::string_view path) -> std::string;

	auto to_upper(std::string text) -> std::string;

	auto frame_of(card_type type, design_tokens const& tokens) -> card_frame;

	auto border_of(card_type type, design_tokens const& tokens) -> border_layout;

	//! Badges for @p info's face value, if it has one: top-left, then bottom-right if @p bottom_right.
	auto badges_of(card_info const& info, design_tokens const& tokens, bool bottom_right) -> std::vector<badge_layout>;

	//! Badges for @p value at both corners, whether or not the card has a face value.
	auto corner_badges(int value, design_tokens const& tokens) -> std::vector<badge_layout>;

	auto description_of(card_info const& info, card_type type, design_tokens const& tokens, unsigned size)
		-> std::optional<description_layout>;

	auto footer_of(card_type type, design_tokens const& tokens) -> footer_layout;

	auto begin_card(card_frame const& frame) -> canvas;

	auto draw_border(canvas& target, border_layout const& border) -> void;

	auto draw_badges(canvas& target, std::vector<badge_layout> const& badges, design_tokens const& tokens) -> void;

	auto draw_description(canvas& target, std::optional<description_layout> const& description, design_tokens const& tokens)
		-> void;

	auto draw_footer(canvas& target, footer_layout const& footer, design_tokens const& tokens) -> void;
}
