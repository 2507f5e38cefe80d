//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/renderer.hpp>

#include <deck-render/detail/visitation.hpp>
#include <deck-render/errors.hpp>
#include <deck-render/templates.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace {
	auto lowercase_extension(std::filesystem::path const& path) -> std::string {
		auto result = path.extension().string();
		std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
		return result;
	}

	//! Composites every pixel over opaque white.
	auto flatten(sf::Image const& image) -> sf::Image {
		auto const size = image.getSize();
		sf::Image result;
		result.create(size.x, size.y, sf::Color::White);
		for (unsigned y = 0; y < size.y; ++y) {
			for (unsigned x = 0; x < size.x; ++x) {
				auto const p = image.getPixel(x, y);
				auto const blend = [&](sf::Uint8 channel) {
					return static_cast<sf::Uint8>((channel * p.a + 255 * (255 - p.a)) / 255);
				};
				result.setPixel(x, y, {blend(p.r), blend(p.g), blend(p.b)});
			}
		}
		return result;
	}
}

namespace dr {
	auto extension(image_format format) -> std::string_view {
		switch (format) {
			case image_format::png:
				return "png";
			case image_format::jpg:
				return "jpg";
		}
		throw encode_error{fmt::format("Unknown image format {}.", static_cast<int>(format))};
	}

	auto parse_image_format(std::string_view name) -> image_format {
		if (name == "png") { return image_format::png; }
		if (name == "jpg" || name == "jpeg") { return image_format::jpg; }
		throw encode_error{fmt::format("Unsupported image format \"{}\".", name)};
	}

	auto render_card(card const& c, design_tokens const& tokens, std::optional<std::filesystem::path> const& output_path)
		-> sf::Image {
		auto const& info = info_of(c);
		spdlog::debug("Rendering {} card \"{}\".", to_string(type_of(c)), info.id);

		auto const image = match(
			c,
			[&](property_card const& property) { return render_property(property, tokens); },
			[&](action_card const& action) { return render_action(action, tokens); },
			[&](money_card const& money) { return render_money(money, tokens); },
			[&](rent_card const& rent) { return render_rent(rent, tokens); },
			[&](wildcard_card const& wildcard) { return render_wildcard(wildcard, tokens); });

		if (output_path) {
			if (output_path->has_parent_path()) { std::filesystem::create_directories(output_path->parent_path()); }
			save_image(image, *output_path);
			spdlog::debug("Wrote \"{}\".", output_path->string());
		}
		return image;
	}

	auto save_image(sf::Image const& image, std::filesystem::path const& path) -> void {
		auto const ext = lowercase_extension(path);
		bool saved = false;
		if (ext == ".png") {
			saved = image.saveToFile(path.string());
		} else if (ext == ".jpg" || ext == ".jpeg") {
			saved = flatten(image).saveToFile(path.string());
		} else {
			throw encode_error{fmt::format("Cannot encode \"{}\": unsupported extension.", path.string())};
		}

		if (!saved) {
			std::error_code ec;
			std::filesystem::remove(path, ec);
			if (ec) { spdlog::warn("Could not remove partial image \"{}\": {}", path.string(), ec.message()); }
			throw encode_error{fmt::format("Failed to save card image to \"{}\".", path.string())};
		}
	}
}
