/** \file exclude_notation.cpp
 *  \brief Recursive-descent parser for the exclusion notation.
 */

#include "prune/exclude_notation.hpp"

#include <cctype>
#include <optional>
#include <utility>

namespace prune {

namespace {

constexpr const char* kComponent = "notation.parse";

inline bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0
        || c == '_' || c == '.' || c == '+' || c == '$' || c == '-';
}

inline auto trim(std::string_view s) -> std::string_view {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

class NotationParser {
public:
    NotationParser(std::string_view text, const ExcludeFactory& factory)
        : text_(text), factory_(factory) {}

    auto parse() -> std::expected<exclude_spec, core::error> {
        auto spec = parse_spec();
        if (!spec) return spec;
        skip_ws();
        if (pos_ != text_.size()) {
            return fail("unexpected trailing input");
        }
        return spec;
    }

private:
    using field_result = std::expected<std::optional<std::string>, core::error>;

    auto parse_spec() -> std::expected<exclude_spec, core::error> {
        skip_ws();
        if (pos_ == text_.size()) {
            return fail("expected exclusion spec");
        }
        auto first = parse_field();
        if (!first) return std::unexpected(first.error());
        skip_ws();
        if (first->has_value()) {
            const std::string& word = **first;
            if ((word == "any" || word == "all") && peek() == '(') {
                ++pos_;
                auto list = parse_list();
                if (!list) return std::unexpected(list.error());
                return word == "any" ? factory_.any_of(*list) : factory_.all_of(*list);
            }
            if (word == "everything" && peek() != ':') return factory_.everything();
            if (word == "nothing" && peek() != ':') return factory_.nothing();
        }
        return parse_rule(std::move(*first));
    }

    auto parse_list() -> std::expected<std::vector<exclude_spec>, core::error> {
        std::vector<exclude_spec> specs;
        skip_ws();
        if (peek() == ')') {
            ++pos_;
            return specs;
        }
        for (;;) {
            auto spec = parse_spec();
            if (!spec) return std::unexpected(spec.error());
            specs.push_back(std::move(*spec));
            skip_ws();
            const char c = peek();
            ++pos_;
            if (c == ',') continue;
            if (c == ')') break;
            --pos_;
            return fail("expected ',' or ')'");
        }
        return specs;
    }

    auto parse_rule(std::optional<std::string> group) -> std::expected<exclude_spec, core::error> {
        std::optional<std::string> module_name;
        std::optional<artifact_name> artifact;
        if (peek() == ':') {
            ++pos_;
            skip_ws();
            auto m = parse_field();
            if (!m) return std::unexpected(m.error());
            module_name = std::move(*m);
            skip_ws();
            if (peek() == ':') {
                ++pos_;
                skip_ws();
                auto a = parse_artifact();
                if (!a) return std::unexpected(a.error());
                artifact = std::move(*a);
            }
        }
        return factory_.leaf(std::move(group), std::move(module_name), std::move(artifact));
    }

    auto parse_artifact() -> std::expected<std::optional<artifact_name>, core::error> {
        auto name = parse_field();
        if (!name) return std::unexpected(name.error());
        if (!name->has_value()) return std::optional<artifact_name>{};

        std::optional<std::string> parts[3];
        for (auto& part : parts) {
            if (peek() != '@') break;
            ++pos_;
            auto p = parse_field();
            if (!p) return std::unexpected(p.error());
            part = std::move(*p);
        }
        return artifact_name{
            std::move(**name),
            parts[0].value_or("jar"),
            std::move(parts[1]),
            std::move(parts[2])
        };
    }

    auto parse_field() -> field_result {
        if (peek() == '*') {
            ++pos_;
            return std::optional<std::string>{};
        }
        const auto start = pos_;
        while (pos_ < text_.size() && is_word_char(text_[pos_])) ++pos_;
        if (pos_ == start) {
            return std::unexpected(error_at("expected name or '*'"));
        }
        return std::optional<std::string>{std::string(text_.substr(start, pos_ - start))};
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) ++pos_;
    }

    [[nodiscard]] char peek() const noexcept {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    [[nodiscard]] auto error_at(const char* what) const -> core::error {
        return core::error{
            core::error_code::invalid_argument,
            std::string(what) + " at offset " + std::to_string(pos_),
            kComponent
        };
    }

    auto fail(const char* what) const -> std::unexpected<core::error> {
        return std::unexpected(error_at(what));
    }

    std::string_view text_;
    const ExcludeFactory& factory_;
    std::size_t pos_{0};
};

} // namespace

auto parse_exclude(std::string_view text, const ExcludeFactory& factory)
    -> std::expected<exclude_spec, core::error> {
    return NotationParser(text, factory).parse();
}

auto parse_exclude_lines(const std::vector<std::string>& lines, const ExcludeFactory& factory)
    -> std::expected<std::vector<exclude_spec>, core::error> {
    std::vector<exclude_spec> specs;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        if (auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) continue;

        auto spec = parse_exclude(line, factory);
        if (!spec) {
            auto err = spec.error();
            err.message = "line " + std::to_string(i + 1) + ": " + err.message;
            return std::unexpected(std::move(err));
        }
        specs.push_back(std::move(*spec));
    }
    return specs;
}

} // namespace prune
