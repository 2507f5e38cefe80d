//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/deck-render.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

auto main(int argc, char* argv[]) -> int {
	if (argc < 3 || argc > 6) {
		fmt::print("Usage: deck-render deck-filename output-directory [tokens-filename] [png|jpg] [all|type,...]\n");
		return EXIT_FAILURE;
	}

	if (auto const level = std::getenv("DECK_RENDER_LOG_LEVEL")) {
		spdlog::set_level(spdlog::level::from_str(level));
	}

	try {
		dr::token_store const store{argc >= 4 ? argv[3] : DR_DEFAULT_TOKENS};
		auto const format = argc >= 5 ? dr::parse_image_format(argv[4]) : dr::image_format::png;
		auto const types = argc == 6 ? dr::parse_card_types(argv[5]) : std::vector<dr::card_type>{};
		auto const cards = dr::load_deck(argv[1], types);
		auto const result = dr::render_batch(cards, argv[2], format, store.tokens());

		fmt::print("Rendered {} cards:\n", result.total());
		for (auto type : {dr::card_type::property,
				 dr::card_type::action,
				 dr::card_type::money,
				 dr::card_type::rent,
				 dr::card_type::wildcard}) {
			auto const it = result.rendered.find(type);
			fmt::print("  {}: {}\n", dr::to_string(type), it == result.rendered.end() ? 0 : it->second);
		}
		for (auto const& failure : result.failures) {
			fmt::print("Failed: {} ({})\n", failure.id, failure.message);
		}
		fmt::print("Output directory: {}\n", std::filesystem::absolute(argv[2]).string());
		return result.failures.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
	} catch (std::exception& ex) {
		fmt::print("Error: {}\n", ex.what());
		return EXIT_FAILURE;
	}
}
