//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#include <deck-render/tokens.hpp>

#include <deck-render/color.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace dr {
	design_tokens::design_tokens(nlohmann::json tree, std::shared_ptr<sf::Font const> font)
		: _tree{std::move(tree)}, _font{std::move(font)} {
		if (!_tree.is_object()) { throw token_load_error{"Design token tree must be a JSON object."}; }
	}

	auto design_tokens::from_file(std::filesystem::path const& path) -> design_tokens {
		std::ifstream fin{path};
		if (!fin.is_open()) {
			throw token_load_error{fmt::format("Could not open design token file \"{}\".", path.string())};
		}

		nlohmann::json tree;
		try {
			fin >> tree;
		} catch (nlohmann::json::exception const& ex) {
			throw token_load_error{fmt::format("Could not parse design token file \"{}\": {}", path.string(), ex.what())};
		}

		design_tokens without_font{std::move(tree)};
		std::vector<std::filesystem::path> candidates;
		try {
			candidates.emplace_back(without_font.get<std::string>("global.font.path"));
			if (without_font.find("global.font.fallbacks") != nullptr) {
				for (auto const& fallback : without_font.get<std::vector<std::string>>("global.font.fallbacks")) {
					candidates.emplace_back(fallback);
				}
			}
		} catch (std::runtime_error const& ex) {
			throw token_load_error{fmt::format("Design token file \"{}\": {}", path.string(), ex.what())};
		}

		// The first candidate that loads wins; relative paths are relative to the token file.
		auto font = std::make_shared<sf::Font>();
		for (auto& candidate : candidates) {
			if (candidate.empty()) { continue; }
			if (candidate.is_relative()) { candidate = path.parent_path() / candidate; }
			std::error_code ec;
			if (!std::filesystem::is_regular_file(candidate, ec) || !font->loadFromFile(candidate.string())) {
				spdlog::debug("Font \"{}\" is unavailable.", candidate.string());
				continue;
			}
			spdlog::debug("Loaded design tokens from \"{}\" with font \"{}\".", path.string(), candidate.string());
			return design_tokens{without_font.tree(), std::move(font)};
		}
		throw token_load_error{fmt::format("Design token file \"{}\": none of its {} font paths could be loaded.",
			path.string(),
			candidates.size())};
	}

	auto design_tokens::at(std::string_view dotted_path) const -> nlohmann::json const& {
		auto const node = find(dotted_path);
		if (node == nullptr) { throw missing_token_key{std::string{dotted_path}}; }
		return *node;
	}

	auto design_tokens::find(std::string_view dotted_path) const -> nlohmann::json const* {
		auto node = &_tree;
		while (!dotted_path.empty()) {
			auto const dot = dotted_path.find('.');
			auto const key = std::string{dotted_path.substr(0, dot)};
			if (!node->is_object()) { return nullptr; }
			auto const it = node->find(key);
			if (it == node->end()) { return nullptr; }
			node = &*it;
			dotted_path = dot == std::string_view::npos ? std::string_view{} : dotted_path.substr(dot + 1);
		}
		return node;
	}

	auto design_tokens::color(std::string_view dotted_path) const -> sf::Color {
		return hex_to_color(get<std::string>(dotted_path));
	}

	auto design_tokens::set_color(std::string const& key) const -> sf::Color {
		return set_color(key, hex_to_color(default_set_color));
	}

	auto design_tokens::set_color(std::string const& key, sf::Color fallback) const -> sf::Color {
		auto const& sets = at("global.colors.property_sets");
		auto const it = sets.find(key);
		if (it == sets.end()) { return fallback; }
		if (!it->is_string()) {
			throw invalid_token_value{fmt::format("global.colors.property_sets.{}", key), "expected a hex color string."};
		}
		return hex_to_color(it->get<std::string>());
	}

	auto design_tokens::font() const -> sf::Font const& {
		if (_font == nullptr) { throw token_load_error{"Design tokens were loaded without a font."}; }
		return *_font;
	}

	token_store::token_store(std::filesystem::path path) : _path{std::move(path)} {}

	auto token_store::tokens() const -> design_tokens const& {
		if (_loaded.load(std::memory_order_acquire)) { return *_tokens; }

		// Concurrent first callers wait on the one load rather than each reading the file.
		std::lock_guard<std::mutex> const lock{_mutex};
		if (!_tokens) {
			++_load_count;
			_tokens.emplace(design_tokens::from_file(_path));
			_loaded.store(true, std::memory_order_release);
		}
		return *_tokens;
	}
}
