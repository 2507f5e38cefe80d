//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include <stdexcept>
#include <string>

namespace dr {
	//! A hex color string that is not @c RRGGBB or @c RRGGBBAA.
	struct invalid_color_format : std::domain_error {
		invalid_color_format(std::string const& text);
	};

	//! The token tree lacks a path some template requires.
	struct missing_token_key : std::runtime_error {
		missing_token_key(std::string path);

		auto path() const -> std::string const& {
			return _path;
		}

	private:
		std::string _path;
	};

	//! A token exists but holds a value of the wrong type or an unknown enumerator.
	struct invalid_token_value : std::runtime_error {
		invalid_token_value(std::string const& path, std::string const& reason);
	};

	struct token_load_error : std::runtime_error {
		using std::runtime_error::runtime_error;
	};

	struct unsupported_card_type : std::domain_error {
		unsupported_card_type(std::string const& name);
	};

	//! A card variant was built without one of its required fields.
	struct construction_error : std::invalid_argument {
		using std::invalid_argument::invalid_argument;
	};

	struct encode_error : std::runtime_error {
		using std::runtime_error::runtime_error;
	};

	struct deck_load_error : std::runtime_error {
		using std::runtime_error::runtime_error;
	};
}
