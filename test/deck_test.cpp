//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/deck.hpp>
#include <deck-render/errors.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {
	auto ids_of(std::vector<dr::card> const& cards) -> std::vector<std::string> {
		std::vector<std::string> result;
		for (auto const& c : cards) {
			result.push_back(dr::info_of(c).id);
		}
		return result;
	}

	auto contains(std::vector<std::string> const& ids, std::string const& id) -> bool {
		return std::find(ids.begin(), ids.end(), id) != ids.end();
	}
}

TEST(LoadDeck, SampleDeckExpandsQuantities) {
	auto const cards = dr::load_deck(DR_SAMPLE_DECK);
	ASSERT_EQ(cards.size(), 17u);

	auto const ids = ids_of(cards);
	EXPECT_TRUE(contains(ids, "brown-01"));
	EXPECT_TRUE(contains(ids, "deal-breaker-1"));
	EXPECT_TRUE(contains(ids, "deal-breaker-2"));
	EXPECT_FALSE(contains(ids, "deal-breaker"));
	EXPECT_TRUE(contains(ids, "pass-go"));
	EXPECT_TRUE(contains(ids, "money-1m-6"));
	EXPECT_TRUE(contains(ids, "money-10m"));
	EXPECT_TRUE(contains(ids, "rent-pink-orange-2"));
	EXPECT_TRUE(contains(ids, "wild-multicolor"));
}

TEST(LoadDeck, SectionsKeepTheirOrder) {
	auto const cards = dr::load_deck(DR_SAMPLE_DECK);
	ASSERT_FALSE(cards.empty());
	EXPECT_EQ(dr::type_of(cards.front()), dr::card_type::property);
	EXPECT_EQ(dr::type_of(cards.back()), dr::card_type::wildcard);
	EXPECT_TRUE(std::is_sorted(cards.begin(), cards.end(), [](dr::card const& a, dr::card const& b) {
		return dr::type_of(a) < dr::type_of(b);
	}));
}

TEST(LoadDeck, FilterReadsOneSection) {
	auto const cards = dr::load_deck(DR_SAMPLE_DECK, {dr::card_type::money});
	ASSERT_EQ(cards.size(), 9u);
	for (auto const& c : cards) {
		EXPECT_EQ(dr::type_of(c), dr::card_type::money);
	}
	auto const& five = std::get<dr::money_card>(cards[6]);
	EXPECT_EQ(five.denomination, 5);
	EXPECT_EQ(five.info.title, "$5M");
	EXPECT_EQ(five.info.value, 5);
}

TEST(LoadDeck, MissingFileIsLoadError) {
	EXPECT_THROW(dr::load_deck("/nonexistent/deck.json"), dr::deck_load_error);
}

TEST(CardsFromJson, PropertyFieldsAreRead) {
	auto const deck = nlohmann::json::parse(R"({
		"property_cards": [{
			"id": "odd",
			"name": "Odd Lane",
			"color": "red",
			"value": 3,
			"rent_values": [[2, 4], [1, 2]],
			"set_size": 2,
			"metadata": {"edition": 2}
		}]
	})");
	auto const cards = dr::cards_from_json(deck);
	ASSERT_EQ(cards.size(), 1u);
	auto const& property = std::get<dr::property_card>(cards[0]);
	EXPECT_EQ(property.info.id, "odd");
	EXPECT_EQ(property.property_name, "Odd Lane");
	EXPECT_EQ(property.color, "red");
	ASSERT_EQ(property.rent_values.size(), 2u);
	EXPECT_EQ(property.rent_values[0].count, 2);
	EXPECT_EQ(property.rent_values[1].rent, 2);
	EXPECT_EQ(property.info.metadata["edition"], 2);
}

TEST(CardsFromJson, ZeroOrAbsentValueLeavesNoFaceValue) {
	auto const deck = nlohmann::json::parse(R"({
		"action_cards": [{"id": "zero", "name": "Nothing", "value": 0}],
		"wildcard_cards": [{"id": "wild", "name": "Wild", "is_multicolor": true}]
	})");
	auto const cards = dr::cards_from_json(deck);
	ASSERT_EQ(cards.size(), 2u);
	EXPECT_FALSE(dr::info_of(cards[0]).value.has_value());
	EXPECT_FALSE(dr::info_of(cards[1]).value.has_value());
	EXPECT_FALSE(dr::info_of(cards[1]).description.has_value());
}

TEST(CardsFromJson, MissingRequiredFieldIsConstructionError) {
	auto const deck = nlohmann::json::parse(R"({
		"property_cards": [{"id": "p", "name": "P", "value": 1, "rent_values": [[1, 1]], "set_size": 2}]
	})");
	EXPECT_THROW(dr::cards_from_json(deck), dr::construction_error);
}

TEST(CardsFromJson, MalformedRentTableIsConstructionError) {
	auto const deck = nlohmann::json::parse(R"({
		"property_cards": [{"id": "p", "name": "P", "color": "red", "value": 1, "rent_values": [[1]], "set_size": 2}]
	})");
	EXPECT_THROW(dr::cards_from_json(deck), dr::construction_error);
}

TEST(CardsFromJson, ZeroDenominationIsConstructionError) {
	auto const deck = nlohmann::json::parse(R"({"money_cards": [{"denomination": 0}]})");
	EXPECT_THROW(dr::cards_from_json(deck), dr::construction_error);
}

TEST(CardsFromJson, TooManyRentColorsIsConstructionError) {
	auto const deck = nlohmann::json::parse(R"({
		"rent_cards": [{"id": "r", "name": "Rent", "colors": ["red", "yellow", "green"]}]
	})");
	EXPECT_THROW(dr::cards_from_json(deck), dr::construction_error);
}

TEST(CardsFromJson, NonListSectionIsConstructionError) {
	auto const deck = nlohmann::json::parse(R"({"money_cards": {"denomination": 1}})");
	EXPECT_THROW(dr::cards_from_json(deck), dr::construction_error);
}

TEST(SectionName, NamesEveryType) {
	EXPECT_EQ(dr::section_name(dr::card_type::property), "property_cards");
	EXPECT_EQ(dr::section_name(dr::card_type::wildcard), "wildcard_cards");
}

TEST(LoadDeck, SelectsSeveralSections) {
	auto const cards = dr::load_deck(DR_SAMPLE_DECK, dr::parse_card_types("rent,property"));
	ASSERT_EQ(cards.size(), 5u);
	EXPECT_EQ(dr::type_of(cards.front()), dr::card_type::property);
	EXPECT_EQ(dr::type_of(cards.back()), dr::card_type::rent);
}
