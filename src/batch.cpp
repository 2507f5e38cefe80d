//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/batch.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dr {
	auto batch_result::total() const -> int {
		int result = 0;
		for (auto const& [type, count] : rendered) {
			result += count;
		}
		return result;
	}

	auto render_batch(std::vector<card> const& cards,
		std::filesystem::path const& output_dir,
		image_format format,
		design_tokens const& tokens) -> batch_result {
		batch_result result;
		std::filesystem::create_directories(output_dir);

		for (auto const& c : cards) {
			auto const& id = info_of(c).id;
			auto const path = output_dir / fmt::format("{}.{}", id, extension(format));
			try {
				render_card(c, tokens, path);
				++result.rendered[type_of(c)];
			} catch (std::exception const& ex) {
				spdlog::error("Could not render card \"{}\": {}", id, ex.what());
				result.failures.push_back({id, ex.what()});
			}
		}

		spdlog::info("Rendered {} of {} cards into \"{}\".", result.total(), cards.size(), output_dir.string());
		return result;
	}
}
