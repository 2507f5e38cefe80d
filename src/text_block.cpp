//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/detail/text_block.hpp>

#include <SFML/Graphics/RenderTarget.hpp>

#include <algorithm>
#include <cmath>

namespace dr::detail {
	text_block::text_block(std::vector<std::string> const& lines,
		sf::Font const& font,
		unsigned character_size,
		sf::Uint32 style_flags,
		sf::Color fill_color,
		align alignment,
		float line_spacing) {
		if (line_spacing <= 0) { line_spacing = font.getLineSpacing(character_size); }

		// Build one text per line, stacked top to bottom.
		float block_width = 0;
		float y = 0;
		for (auto const& line : lines) {
			_texts.emplace_back(sf::String::fromUtf8(line.begin(), line.end()), font, character_size);
			auto& text = _texts.back();
			text.setStyle(style_flags);
			text.setFillColor(fill_color);
			// Round positions to avoid text blurriness.
			text.setPosition(0, std::round(y));
			auto const line_bounds = text.getLocalBounds();
			block_width = std::max(block_width, line_bounds.left + line_bounds.width);
			y += line_spacing;
		}

		// Align each line within the widest line and accumulate ink bounds.
		bool first = true;
		float left = 0, top = 0, right = 0, bottom = 0;
		for (auto& text : _texts) {
			auto const line_bounds = text.getLocalBounds();
			auto const line_width = line_bounds.left + line_bounds.width;
			switch (alignment) {
				case align::left:
					break;
				case align::center:
					text.setPosition(std::round((block_width - line_width) / 2), text.getPosition().y);
					break;
				case align::right:
					text.setPosition(std::round(block_width - line_width), text.getPosition().y);
					break;
			}
			if (text.getString().isEmpty()) { continue; }
			auto const text_bounds = text.getGlobalBounds();
			if (first) {
				left = text_bounds.left;
				top = text_bounds.top;
				right = text_bounds.left + text_bounds.width;
				bottom = text_bounds.top + text_bounds.height;
				first = false;
			} else {
				left = std::min(left, text_bounds.left);
				top = std::min(top, text_bounds.top);
				right = std::max(right, text_bounds.left + text_bounds.width);
				bottom = std::max(bottom, text_bounds.top + text_bounds.height);
			}
		}
		_bounds = {left, top, right - left, bottom - top};
	}

	auto text_block::get_local_bounds() const -> sf::FloatRect {
		return _bounds;
	}

	auto text_block::draw(sf::RenderTarget& target, sf::RenderStates states) const -> void {
		states.transform *= getTransform();
		for (auto const& text : _texts) {
			target.draw(text, states);
		}
	}
}
