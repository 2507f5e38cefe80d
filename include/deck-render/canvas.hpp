//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include <SFML/Graphics/Drawable.hpp>
#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/RenderStates.hpp>
#include <SFML/Graphics/RenderTexture.hpp>

#include <memory>

namespace dr {
	//! A transparent off-screen surface that templates draw onto before it becomes an image.
	struct canvas {
		//! @throw std::runtime_error if the render texture cannot be created.
		canvas(unsigned width, unsigned height);

		auto size() const -> sf::Vector2u;

		auto draw(sf::Drawable const& drawable, sf::RenderStates const& states = sf::RenderStates::Default) -> void;

		//! Resolves all pending draws and copies the pixels out.
		auto to_image() -> sf::Image;

	private:
		std::unique_ptr<sf::RenderTexture> _texture;
	};
}
