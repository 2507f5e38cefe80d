//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.
//! @brief Builds cards from JSON deck definitions.

#pragma once

#include "card.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace dr {
	//! The deck section listing cards of @p type, e.g. "property_cards".
	auto section_name(card_type type) -> std::string_view;

	//! Creates one card per copy of each definition in the deck sections, in section order: property, action, money,
	//! rent, wildcard. A definition's @c quantity (default 1) repeats it; repeated copies get ids suffixed "-1",
	//! "-2", and so on.
	//! @param types The sections to read; empty reads all of them.
	//! @throw construction_error if a definition lacks a required field or has an invalid one.
	auto cards_from_json(nlohmann::json const& deck, std::vector<card_type> const& types = {}) -> std::vector<card>;

	//! @throw deck_load_error if the file cannot be opened or parsed.
	auto load_deck(std::filesystem::path const& path, std::vector<card_type> const& types = {}) -> std::vector<card>;
}
