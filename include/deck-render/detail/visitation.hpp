//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include <utility>
#include <variant>

namespace dr {
	template <typename... Fs>
	struct overloaded : Fs... {
		using Fs::operator()...;
	};

	template <typename... Fs>
	overloaded(Fs...) -> overloaded<Fs...>;

	//! Visits @p v with one callable per alternative. Every alternative must be handled.
	template <typename Variant, typename... Fs>
	decltype(auto) match(Variant&& v, Fs&&... fs) {
		return std::visit(overloaded{std::forward<Fs>(fs)...}, std::forward<Variant>(v));
	}
}
