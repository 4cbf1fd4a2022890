/**
 * @file label_selector.cpp
 * @brief Tokenizer + recursive-descent parser for label selectors.
 */
#include "negsync/cluster/label_selector.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace negsync::cluster {

namespace {

constexpr std::size_t MAX_NAME_LEN   = 63;
constexpr std::size_t MAX_PREFIX_LEN = 253;

enum class Tok : std::uint8_t {
    Identifier, In, NotIn, Bang, Equals, DoubleEquals, NotEquals,
    Greater, Less, OpenParen, CloseParen, Comma, End
};

struct Token {
    Tok kind{Tok::End};
    std::string_view text;
};

bool is_special(char c) noexcept {
    return c == '!' || c == '=' || c == '>' || c == '<' || c == '(' || c == ')' || c == ',';
}

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<Token> tokenize(std::string_view s) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (is_space(c)) { ++i; continue; }

        const auto two = s.substr(i, 2);
        if (two == "!=") { out.push_back({Tok::NotEquals, two});    i += 2; continue; }
        if (two == "==") { out.push_back({Tok::DoubleEquals, two}); i += 2; continue; }

        switch (c) {
            case '!': out.push_back({Tok::Bang,       s.substr(i, 1)}); ++i; continue;
            case '=': out.push_back({Tok::Equals,     s.substr(i, 1)}); ++i; continue;
            case '>': out.push_back({Tok::Greater,    s.substr(i, 1)}); ++i; continue;
            case '<': out.push_back({Tok::Less,       s.substr(i, 1)}); ++i; continue;
            case '(': out.push_back({Tok::OpenParen,  s.substr(i, 1)}); ++i; continue;
            case ')': out.push_back({Tok::CloseParen, s.substr(i, 1)}); ++i; continue;
            case ',': out.push_back({Tok::Comma,      s.substr(i, 1)}); ++i; continue;
            default: break;
        }

        const std::size_t start = i;
        while (i < s.size() && !is_space(s[i]) && !is_special(s[i])) ++i;
        const auto word = s.substr(start, i - start);
        if (word == "in")         out.push_back({Tok::In, word});
        else if (word == "notin") out.push_back({Tok::NotIn, word});
        else                      out.push_back({Tok::Identifier, word});
    }
    out.push_back({Tok::End, {}});
    return out;
}

bool is_alnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// [A-Za-z0-9]([-A-Za-z0-9_.]*[A-Za-z0-9])?, at most 63 chars.
bool valid_name(std::string_view n) noexcept {
    if (n.empty() || n.size() > MAX_NAME_LEN) return false;
    if (!is_alnum(n.front()) || !is_alnum(n.back())) return false;
    return std::all_of(n.begin(), n.end(), [](char c) {
        return is_alnum(c) || c == '-' || c == '_' || c == '.';
    });
}

// Lowercase DNS subdomain.
bool valid_prefix(std::string_view p) noexcept {
    if (p.empty() || p.size() > MAX_PREFIX_LEN) return false;
    auto lower_alnum = [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'); };
    if (!lower_alnum(p.front()) || !lower_alnum(p.back())) return false;
    return std::all_of(p.begin(), p.end(), [&](char c) {
        return lower_alnum(c) || c == '-' || c == '.';
    });
}

bool valid_key(std::string_view key) noexcept {
    const auto slash = key.find('/');
    if (slash == std::string_view::npos) return valid_name(key);
    return valid_prefix(key.substr(0, slash)) && valid_name(key.substr(slash + 1));
}

bool valid_value(std::string_view v) noexcept {
    return v.empty() || valid_name(v);
}

std::optional<std::int64_t> to_int(std::string_view s) noexcept {
    std::int64_t v{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return v;
}

class Parser {
public:
    explicit Parser(std::string_view expr) : expr_(expr), toks_(tokenize(expr)) {}

    Result<std::vector<SelectorRequirement>> run() {
        std::vector<SelectorRequirement> reqs;
        if (peek().kind == Tok::End) return reqs;
        for (;;) {
            auto req = requirement();
            if (!req) return negsync_detail::unexpected<Error>(req.error());
            reqs.push_back(std::move(*req));

            const Token t = next();
            if (t.kind == Tok::End) return reqs;
            if (t.kind != Tok::Comma) return fail("expected ',' or end of expression", t);
        }
    }

private:
    const Token& peek() const noexcept { return toks_[pos_]; }

    Token next() noexcept {
        const Token t = toks_[pos_];
        if (t.kind != Tok::End) ++pos_;
        return t;
    }

    negsync_detail::unexpected<Error> fail(std::string_view what, const Token& at) const {
        std::string msg = "invalid label selector \"" + std::string(expr_) + "\": " + std::string(what);
        msg += at.kind == Tok::End ? " at end" : ", found \"" + std::string(at.text) + "\"";
        return make_error(ErrorCode::InvalidArgument, std::move(msg));
    }

    Result<std::string> key() {
        const Token t = next();
        if (t.kind != Tok::Identifier) return fail("expected label key", t);
        if (!valid_key(t.text)) return fail("invalid label key", t);
        return std::string(t.text);
    }

    Result<SelectorRequirement> requirement() {
        SelectorRequirement req;
        if (peek().kind == Tok::Bang) {
            next();
            auto k = key();
            if (!k) return negsync_detail::unexpected<Error>(k.error());
            req.key = std::move(*k);
            req.op = SelectorOperator::DoesNotExist;
            return req;
        }

        auto k = key();
        if (!k) return negsync_detail::unexpected<Error>(k.error());
        req.key = std::move(*k);

        const Token op = peek();
        switch (op.kind) {
            case Tok::Comma:
            case Tok::End:
                req.op = SelectorOperator::Exists;
                return req;
            case Tok::Equals:       req.op = SelectorOperator::Equals;       break;
            case Tok::DoubleEquals: req.op = SelectorOperator::DoubleEquals; break;
            case Tok::NotEquals:    req.op = SelectorOperator::NotEquals;    break;
            case Tok::Greater:      req.op = SelectorOperator::GreaterThan;  break;
            case Tok::Less:         req.op = SelectorOperator::LessThan;     break;
            case Tok::In:           req.op = SelectorOperator::In;           break;
            case Tok::NotIn:        req.op = SelectorOperator::NotIn;        break;
            default:
                return fail("expected operator", op);
        }
        next();

        if (req.op == SelectorOperator::In || req.op == SelectorOperator::NotIn) {
            auto vals = value_list();
            if (!vals) return negsync_detail::unexpected<Error>(vals.error());
            req.values = std::move(*vals);
            return req;
        }

        if (req.op == SelectorOperator::GreaterThan || req.op == SelectorOperator::LessThan) {
            const Token v = next();
            if (v.kind != Tok::Identifier || !to_int(v.text)) return fail("expected integer value", v);
            req.values.emplace_back(v.text);
            return req;
        }

        // =, ==, != accept an empty value ("key=" matches an empty label).
        const Token v = peek();
        if (v.kind == Tok::Comma || v.kind == Tok::End) {
            req.values.emplace_back();
            return req;
        }
        next();
        if (v.kind != Tok::Identifier) return fail("expected label value", v);
        if (!valid_value(v.text)) return fail("invalid label value", v);
        req.values.emplace_back(v.text);
        return req;
    }

    Result<std::vector<std::string>> value_list() {
        const Token open = next();
        if (open.kind != Tok::OpenParen) return fail("expected '('", open);

        std::vector<std::string> vals;
        for (;;) {
            const Token v = next();
            if (v.kind != Tok::Identifier) return fail("expected label value", v);
            if (!valid_value(v.text)) return fail("invalid label value", v);
            vals.emplace_back(v.text);

            const Token sep = next();
            if (sep.kind == Tok::CloseParen) return vals;
            if (sep.kind != Tok::Comma) return fail("expected ',' or ')'", sep);
        }
    }

    std::string_view expr_;
    std::vector<Token> toks_;
    std::size_t pos_{0};
};

} // namespace

bool SelectorRequirement::matches(const Labels& labels) const {
    const auto it = labels.find(key);
    const bool has = it != labels.end();
    const auto in_values = [&] {
        return has && std::find(values.begin(), values.end(), it->second) != values.end();
    };

    switch (op) {
        case SelectorOperator::Equals:
        case SelectorOperator::DoubleEquals:
        case SelectorOperator::In:
            return in_values();
        case SelectorOperator::NotEquals:
        case SelectorOperator::NotIn:
            return !in_values();
        case SelectorOperator::Exists:
            return has;
        case SelectorOperator::DoesNotExist:
            return !has;
        case SelectorOperator::GreaterThan:
        case SelectorOperator::LessThan: {
            if (!has || values.empty()) return false;
            const auto lhs = to_int(it->second);
            const auto rhs = to_int(values.front());
            if (!lhs || !rhs) return false;
            return op == SelectorOperator::GreaterThan ? *lhs > *rhs : *lhs < *rhs;
        }
    }
    return false;
}

Result<LabelSelector> LabelSelector::parse(std::string_view expr) {
    Parser p(expr);
    auto reqs = p.run();
    if (!reqs) return negsync_detail::unexpected<Error>(reqs.error());
    LabelSelector sel;
    sel.reqs_ = std::move(*reqs);
    return sel;
}

bool LabelSelector::matches(const Labels& labels) const {
    return std::all_of(reqs_.begin(), reqs_.end(),
                       [&](const SelectorRequirement& r) { return r.matches(labels); });
}

} // namespace negsync::cluster
