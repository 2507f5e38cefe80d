//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/errors.hpp>

#include <fmt/format.h>

namespace dr {
	invalid_color_format::invalid_color_format(std::string const& text)
		: std::domain_error{fmt::format("Invalid hex color: \"{}\".", text)} {}

	missing_token_key::missing_token_key(std::string path)
		: std::runtime_error{fmt::format("Missing design token \"{}\".", path)}, _path{std::move(path)} {}

	invalid_token_value::invalid_token_value(std::string const& path, std::string const& reason)
		: std::runtime_error{fmt::format("Invalid design token \"{}\": {}", path, reason)} {}

	unsupported_card_type::unsupported_card_type(std::string const& name)
		: std::domain_error{fmt::format("Unsupported card type: \"{}\".", name)} {}
}
