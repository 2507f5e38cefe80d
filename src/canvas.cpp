//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/canvas.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace dr {
	canvas::canvas(unsigned width, unsigned height) : _texture{std::make_unique<sf::RenderTexture>()} {
		if (!_texture->create(width, height)) {
			throw std::runtime_error{fmt::format("Could not create a {}x{} render texture.", width, height)};
		}
		_texture->clear(sf::Color::Transparent);
	}

	auto canvas::size() const -> sf::Vector2u {
		return _texture->getSize();
	}

	auto canvas::draw(sf::Drawable const& drawable, sf::RenderStates const& states) -> void {
		_texture->draw(drawable, states);
	}

	auto canvas::to_image() -> sf::Image {
		_texture->display();
		return _texture->getTexture().copyToImage();
	}
}
