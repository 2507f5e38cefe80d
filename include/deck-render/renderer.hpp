//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include "card.hpp"
#include "tokens.hpp"

#include <SFML/Graphics/Image.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace dr {
	enum class image_format {
		//! Lossless; the default.
		png,
		//! Lossy; transparency is flattened onto white.
		jpg,
	};

	auto extension(image_format format) -> std::string_view;

	//! @throw encode_error if @p name is neither "png" nor "jpg".
	auto parse_image_format(std::string_view name) -> image_format;

	//! Renders @p card with the template for its variant. If @p output_path is given, creates its parent directories
	//! and writes the image there, encoded according to the path's extension.
	//! @throw encode_error if the image cannot be written; no partial file is left behind.
	auto render_card(card const& c,
		design_tokens const& tokens,
		std::optional<std::filesystem::path> const& output_path = std::nullopt) -> sf::Image;

	//! Writes @p image to @p path, encoded according to its extension (.png, .jpg, or .jpeg).
	//! @throw encode_error on an unsupported extension or a failed write.
	auto save_image(sf::Image const& image, std::filesystem::path const& path) -> void;
}
