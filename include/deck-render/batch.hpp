//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include "card.hpp"
#include "renderer.hpp"
#include "tokens.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dr {
	struct batch_result {
		struct failure {
			std::string id;
			std::string message;
		};

		//! Successfully written cards, by type.
		std::map<card_type, int> rendered;
		std::vector<failure> failures;

		auto total() const -> int;
	};

	//! Renders each card to @c <output_dir>/<id>.<ext>. A card that fails is logged and recorded, and the batch moves
	//! on; other cards' files are unaffected.
	auto render_batch(std::vector<card> const& cards,
		std::filesystem::path const& output_dir,
		image_format format,
		design_tokens const& tokens) -> batch_result;
}
