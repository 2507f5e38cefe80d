//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/color.hpp>

#include <deck-render/errors.hpp>

#include <fmt/format.h>

namespace {
	auto hex_digit(char c) -> int {
		if (c >= '0' && c <= '9') { return c - '0'; }
		if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
		if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
		return -1;
	}
}

namespace dr {
	auto hex_to_color(std::string_view text) -> sf::Color {
		auto digits = text;
		if (!digits.empty() && digits.front() == '#') { digits.remove_prefix(1); }
		if (digits.size() != 6 && digits.size() != 8) { throw invalid_color_format{std::string{text}}; }

		sf::Uint8 channels[4] = {0, 0, 0, 255};
		for (std::size_t i = 0; i < digits.size() / 2; ++i) {
			auto const high = hex_digit(digits[2 * i]);
			auto const low = hex_digit(digits[2 * i + 1]);
			if (high < 0 || low < 0) { throw invalid_color_format{std::string{text}}; }
			channels[i] = static_cast<sf::Uint8>(high * 16 + low);
		}
		return sf::Color{channels[0], channels[1], channels[2], channels[3]};
	}

	auto color_to_hex(sf::Color const& color) -> std::string {
		if (color.a == 255) { return fmt::format("#{:02X}{:02X}{:02X}", color.r, color.g, color.b); }
		return fmt::format("#{:02X}{:02X}{:02X}{:02X}", color.r, color.g, color.b, color.a);
	}
}
