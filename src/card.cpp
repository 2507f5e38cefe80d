//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/card.hpp>

#include <deck-render/errors.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace dr {
	auto to_string(card_type type) -> std::string_view {
		switch (type) {
			case card_type::property:
				return "property";
			case card_type::action:
				return "action";
			case card_type::money:
				return "money";
			case card_type::rent:
				return "rent";
			case card_type::wildcard:
				return "wildcard";
		}
		throw unsupported_card_type{std::to_string(static_cast<int>(type))};
	}

	auto parse_card_type(std::string_view name) -> card_type {
		for (auto type : {card_type::property, card_type::action, card_type::money, card_type::rent, card_type::wildcard}) {
			if (to_string(type) == name) { return type; }
		}
		throw unsupported_card_type{std::string{name}};
	}

	auto parse_card_types(std::string_view list) -> std::vector<card_type> {
		std::vector<card_type> result;
		while (true) {
			auto const comma = list.find(',');
			auto const name = list.substr(0, comma);
			if (name == "all") {
				result = {card_type::property, card_type::action, card_type::money, card_type::rent, card_type::wildcard};
			} else if (auto const type = parse_card_type(name);
					   std::find(result.begin(), result.end(), type) == result.end()) {
				result.push_back(type);
			}
			if (comma == std::string_view::npos) { break; }
			list.remove_prefix(comma + 1);
		}
		return result;
	}

	property_card::property_card(card_info info,
		std::string color,
		std::string property_name,
		std::vector<rent_tier> rent_values,
		int set_size)
		: info{std::move(info)}
		, color{std::move(color)}
		, property_name{std::move(property_name)}
		, rent_values{std::move(rent_values)}
		, set_size{set_size} //
	{
		if (this->color.empty()) {
			throw construction_error{fmt::format("Property card \"{}\" requires a color.", this->info.id)};
		}
		if (this->property_name.empty()) { this->property_name = this->info.title; }
	}

	action_card::action_card(card_info info, std::string action_name)
		: info{std::move(info)}, action_name{std::move(action_name)} {
		if (this->action_name.empty()) { this->action_name = this->info.title; }
	}

	money_card::money_card(card_info info, int denomination) : info{std::move(info)}, denomination{denomination} {
		if (denomination <= 0) {
			throw construction_error{
				fmt::format("Money card \"{}\" requires a positive denomination, got {}.", this->info.id, denomination)};
		}
	}

	rent_card::rent_card(card_info info, std::vector<std::string> colors, bool is_wild)
		: info{std::move(info)}, colors{std::move(colors)}, is_wild{is_wild} {
		if (this->colors.size() > 2) {
			throw construction_error{fmt::format(
				"Rent card \"{}\" names {} colors; at most two are allowed.", this->info.id, this->colors.size())};
		}
	}

	wildcard_card::wildcard_card(card_info info, std::vector<std::string> allowed_colors, bool is_multicolor)
		: info{std::move(info)}, allowed_colors{std::move(allowed_colors)}, is_multicolor{is_multicolor} {}

	auto type_of(card const& c) -> card_type {
		return std::visit([](auto const& alternative) { return std::decay_t<decltype(alternative)>::type; }, c);
	}

	auto info_of(card const& c) -> card_info const& {
		return std::visit([](auto const& alternative) -> card_info const& { return alternative.info; }, c);
	}
}
