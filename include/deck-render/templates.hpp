//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Per-variant card templates.
//!
//! Each variant has a layout function, which resolves every coordinate, string, and color from the design tokens,
//! and a render function, which draws that layout onto a fresh canvas. Neither catches: a missing token or a bad
//! color aborts the card.

#pragma once

#include "card.hpp"
#include "elements.hpp"
#include "tokens.hpp"

#include <SFML/Graphics/Image.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dr {
	//! Canvas size and background shared by every template.
	struct card_frame {
		unsigned width;
		unsigned height;
		float corner_radius;
		sf::Color background;
	};

	struct border_layout {
		float width;
		sf::Color color;
		border_pattern pattern;
	};

	struct badge_layout {
		int value;
		sf::Vector2f center;
		float diameter;
	};

	struct description_layout {
		std::string text;
		sf::Vector2f top_left;
		float width;
		unsigned size;
	};

	struct footer_layout {
		std::string text;
		float y;
	};

	struct rent_row_layout {
		float y;
		int count;
		int rent;
	};

	struct property_layout {
		card_frame frame;
		sf::FloatRect header;
		sf::Color header_color;
		std::string header_text;
		float header_text_y;
		float rent_label_y;
		float caption_y;
		std::vector<rent_row_layout> rows;
		std::vector<badge_layout> badges;
		footer_layout footer;
	};

	struct action_layout {
		card_frame frame;
		border_layout border;
		float title_y;
		sf::Vector2f circle_center;
		float circle_radius;
		float circle_border_width;
		sf::Color circle_color;
		//! One or two upper-case lines.
		std::vector<std::string> name_lines;
		std::optional<description_layout> description;
		std::vector<badge_layout> badges;
		footer_layout footer;
	};

	struct money_layout {
		card_frame frame;
		border_layout border;
		sf::Vector2f circle_center;
		float circle_radius;
		float circle_border_width;
		sf::Color circle_color;
		std::string caption;
		std::vector<badge_layout> badges;
		footer_layout footer;
	};

	struct rent_layout {
		card_frame frame;
		border_layout border;
		float title_y;
		sf::Vector2f center;
		float outer_radius;
		float inner_radius;
		bool wild;
		//! Wild rent: one equal pie segment per color, in canonical order.
		std::vector<sf::Color> segments;
		//! Colored rent: concentric discs, outermost first.
		std::vector<sf::Color> discs;
		std::optional<description_layout> description;
		std::vector<badge_layout> badges;
		footer_layout footer;
	};

	struct wildcard_layout {
		card_frame frame;
		std::vector<sf::Color> stripes;
		float stripe_y;
		float stripe_height;
		float stripe_x_start;
		float stripe_x_end;
		std::string title;
		float title_y;
		float wild_y;
		std::optional<description_layout> description;
		std::vector<badge_layout> badges;
		footer_layout footer;
	};

	//! Splits an action name longer than twelve characters into two lines at the middle word, upper-cased.
	auto action_name_lines(std::string const& name) -> std::vector<std::string>;

	auto layout_property(property_card const& card, design_tokens const& tokens) -> property_layout;
	auto layout_action(action_card const& card, design_tokens const& tokens) -> action_layout;
	auto layout_money(money_card const& card, design_tokens const& tokens) -> money_layout;
	auto layout_rent(rent_card const& card, design_tokens const& tokens) -> rent_layout;
	auto layout_wildcard(wildcard_card const& card, design_tokens const& tokens) -> wildcard_layout;

	auto render_property(property_card const& card, design_tokens const& tokens) -> sf::Image;
	auto render_action(action_card const& card, design_tokens const& tokens) -> sf::Image;
	auto render_money(money_card const& card, design_tokens const& tokens) -> sf::Image;
	auto render_rent(rent_card const& card, design_tokens const& tokens) -> sf::Image;
	auto render_wildcard(wildcard_card const& card, design_tokens const& tokens) -> sf::Image;
}
