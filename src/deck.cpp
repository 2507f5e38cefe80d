//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/deck.hpp>

#include <deck-render/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>

namespace {
	using nlohmann::json;

	//! A required field of a card definition.
	template <typename T>
	auto required_field(json const& j, std::string_view section, char const* field) -> T {
		auto const it = j.find(field);
		if (it == j.end()) {
			throw dr::construction_error{fmt::format("Entry in {} is missing \"{}\".", section, field)};
		}
		try {
			return it->get<T>();
		} catch (json::exception const& ex) {
			throw dr::construction_error{fmt::format("Entry in {} has invalid \"{}\": {}", section, field, ex.what())};
		}
	}

	template <typename T>
	auto optional_field(json const& j, std::string_view section, char const* field, T fallback) -> T {
		if (!j.contains(field)) { return fallback; }
		return required_field<T>(j, section, field);
	}

	auto common_info(json const& j, std::string_view section, std::string id, std::string title) -> dr::card_info {
		dr::card_info info{std::move(id), std::move(title)};
		auto const value = optional_field<int>(j, section, "value", 0);
		if (value != 0) { info.value = value; }
		auto description = optional_field<std::string>(j, section, "description", {});
		if (!description.empty()) { info.description = std::move(description); }
		auto const metadata_it = j.find("metadata");
		if (metadata_it != j.end()) { info.metadata = *metadata_it; }
		return info;
	}

	//! Calls @p make once per copy of the definition, with the copy's id.
	template <typename F>
	auto for_each_copy(json const& j, std::string_view section, std::string const& base_id, F const& make) -> void {
		auto const quantity = optional_field<int>(j, section, "quantity", 1);
		for (int i = 1; i <= quantity; ++i) {
			make(quantity > 1 ? fmt::format("{}-{}", base_id, i) : base_id);
		}
	}

	auto add_cards(json const& definitions, dr::card_type type, std::vector<dr::card>& cards) -> void {
		auto const section = dr::section_name(type);
		for (auto const& j : definitions) {
			switch (type) {
				case dr::card_type::property: {
					auto const name = required_field<std::string>(j, section, "name");
					std::vector<dr::rent_tier> rent_values;
					for (auto const& tier : required_field<std::vector<std::array<int, 2>>>(j, section, "rent_values")) {
						rent_values.push_back({tier[0], tier[1]});
					}
					auto const color = required_field<std::string>(j, section, "color");
					auto const set_size = required_field<int>(j, section, "set_size");
					// Properties must carry a face value.
					required_field<int>(j, section, "value");
					for_each_copy(j, section, required_field<std::string>(j, section, "id"), [&](std::string id) {
						cards.emplace_back(dr::property_card{
							common_info(j, section, std::move(id), name), color, name, rent_values, set_size});
					});
					break;
				}
				case dr::card_type::action: {
					auto const name = required_field<std::string>(j, section, "name");
					required_field<int>(j, section, "value");
					for_each_copy(j, section, required_field<std::string>(j, section, "id"), [&](std::string id) {
						cards.emplace_back(dr::action_card{common_info(j, section, std::move(id), name), name});
					});
					break;
				}
				case dr::card_type::money: {
					auto const denomination = required_field<int>(j, section, "denomination");
					auto info = dr::card_info{{}, fmt::format("${}M", denomination), denomination};
					for_each_copy(j, section, fmt::format("money-{}m", denomination), [&](std::string id) {
						info.id = std::move(id);
						cards.emplace_back(dr::money_card{info, denomination});
					});
					break;
				}
				case dr::card_type::rent: {
					auto const name = required_field<std::string>(j, section, "name");
					auto const colors = optional_field<std::vector<std::string>>(j, section, "colors", {});
					auto const is_wild = optional_field<bool>(j, section, "is_wild", false);
					for_each_copy(j, section, required_field<std::string>(j, section, "id"), [&](std::string id) {
						cards.emplace_back(dr::rent_card{common_info(j, section, std::move(id), name), colors, is_wild});
					});
					break;
				}
				case dr::card_type::wildcard: {
					auto const name = required_field<std::string>(j, section, "name");
					auto const allowed = optional_field<std::vector<std::string>>(j, section, "allowed_colors", {});
					auto const is_multicolor = optional_field<bool>(j, section, "is_multicolor", false);
					for_each_copy(j, section, required_field<std::string>(j, section, "id"), [&](std::string id) {
						cards.emplace_back(
							dr::wildcard_card{common_info(j, section, std::move(id), name), allowed, is_multicolor});
					});
					break;
				}
			}
		}
	}
}

namespace dr {
	auto section_name(card_type type) -> std::string_view {
		switch (type) {
			case card_type::property:
				return "property_cards";
			case card_type::action:
				return "action_cards";
			case card_type::money:
				return "money_cards";
			case card_type::rent:
				return "rent_cards";
			case card_type::wildcard:
				return "wildcard_cards";
		}
		throw unsupported_card_type{std::to_string(static_cast<int>(type))};
	}

	auto cards_from_json(nlohmann::json const& deck, std::vector<card_type> const& types) -> std::vector<card> {
		std::vector<card> cards;
		for (auto type : {card_type::property, card_type::action, card_type::money, card_type::rent, card_type::wildcard}) {
			if (!types.empty() && std::find(types.begin(), types.end(), type) == types.end()) { continue; }
			auto const it = deck.find(std::string{section_name(type)});
			if (it == deck.end()) { continue; }
			if (!it->is_array()) {
				throw construction_error{fmt::format("Deck section {} must be a list.", section_name(type))};
			}
			add_cards(*it, type, cards);
		}
		return cards;
	}

	auto load_deck(std::filesystem::path const& path, std::vector<card_type> const& types) -> std::vector<card> {
		std::ifstream fin{path};
		if (!fin.is_open()) {
			throw deck_load_error{fmt::format("Could not open card definition file \"{}\".", path.string())};
		}

		nlohmann::json deck;
		try {
			fin >> deck;
		} catch (nlohmann::json::exception const& ex) {
			throw deck_load_error{fmt::format("Could not parse card definition file \"{}\": {}", path.string(), ex.what())};
		}

		auto cards = cards_from_json(deck, types);
		spdlog::info("Loaded {} cards from \"{}\".", cards.size(), path.string());
		return cards;
	}
}
