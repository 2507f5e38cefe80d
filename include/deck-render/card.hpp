//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief The card data model: one struct per card variant, joined in @ref card.

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dr {
	enum class card_type { property, action, money, rent, wildcard };

	auto to_string(card_type type) -> std::string_view;

	//! @throw unsupported_card_type if @p name is not one of the five card type names.
	auto parse_card_type(std::string_view name) -> card_type;

	//! Parses a comma-separated list of card type names, such as "property,rent". "all" selects every type.
	//! @throw unsupported_card_type if any name is unknown.
	auto parse_card_types(std::string_view list) -> std::vector<card_type>;

	//! The ten property color sets, in the order multi-color artwork draws them.
	inline std::array<char const*, 10> const all_color_sets = {
		"brown", "light_blue", "pink", "orange", "red", "yellow", "green", "dark_blue", "railroad", "utility"};

	//! Fields shared by every card.
	struct card_info {
		std::string id;
		std::string title;
		std::optional<int> value;
		std::optional<std::string> description;
		nlohmann::json metadata = nlohmann::json::object();

		//! Whether a face value should be printed: present and positive.
		auto has_face_value() const -> bool {
			return value.has_value() && *value > 0;
		}
	};

	//! One row of a property's rent table.
	struct rent_tier {
		int count;
		int rent;
	};

	struct property_card {
		static constexpr auto type = card_type::property;

		//! @throw construction_error if @p color is empty.
		property_card(card_info info,
			std::string color,
			std::string property_name,
			std::vector<rent_tier> rent_values,
			int set_size);

		card_info info;
		std::string color;
		std::string property_name;
		//! Rendered in this order, top to bottom.
		std::vector<rent_tier> rent_values;
		int set_size;
	};

	struct action_card {
		static constexpr auto type = card_type::action;

		//! An empty @p action_name is replaced by the title.
		action_card(card_info info, std::string action_name = {});

		card_info info;
		std::string action_name;
	};

	struct money_card {
		static constexpr auto type = card_type::money;

		//! @throw construction_error if @p denomination is not positive.
		money_card(card_info info, int denomination);

		card_info info;
		int denomination;
	};

	struct rent_card {
		static constexpr auto type = card_type::rent;

		//! @throw construction_error if more than two colors are given.
		rent_card(card_info info, std::vector<std::string> colors, bool is_wild = false);

		card_info info;
		//! Ignored when @ref is_wild is set.
		std::vector<std::string> colors;
		//! Rent applies to all ten color sets.
		bool is_wild;
	};

	struct wildcard_card {
		static constexpr auto type = card_type::wildcard;

		wildcard_card(card_info info, std::vector<std::string> allowed_colors, bool is_multicolor = false);

		card_info info;
		std::vector<std::string> allowed_colors;
		//! Valid as any of the ten color sets, regardless of @ref allowed_colors.
		bool is_multicolor;
	};

	using card = std::variant<property_card, action_card, money_card, rent_card, wildcard_card>;

	auto type_of(card const& c) -> card_type;

	auto info_of(card const& c) -> card_info const&;
}
