#include <cctype>
#include <cstddef>
#include <string_view>

#include "lexer.hpp"

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

namespace
{
auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

auto is_whitespace(char chr) -> bool
{
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r';
}

auto keyword_or_identifier(std::string_view word) -> token_type
{
    using enum token_type;
    if (word == "let") {
        return kw_let;
    }
    if (word == "true") {
        return kw_true;
    }
    if (word == "false") {
        return kw_false;
    }
    if (word == "if") {
        return kw_if;
    }
    if (word == "else") {
        return kw_else;
    }
    if (word == "return") {
        return kw_return;
    }
    return ident;
}

auto single_char_type(char chr) -> token_type
{
    using enum token_type;
    switch (chr) {
        case '=':
            return assign;
        case '+':
            return plus;
        case '-':
            return minus;
        case '*':
            return asterisk;
        case '/':
            return slash;
        case '!':
            return bang;
        case '<':
            return less_than;
        case '>':
            return greater_than;
        case ',':
            return comma;
        case ';':
            return semicolon;
        case '(':
            return lparen;
        case ')':
            return rparen;
        case '{':
            return lbrace;
        case '}':
            return rbrace;
        default:
            return illegal;
    }
}
}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    const auto loc = here();
    if (at_end()) {
        return token {.type = eof, .literal = {}, .loc = loc};
    }

    const auto chr = current();
    if (is_letter(chr)) {
        return scan_word(loc);
    }
    if (is_digit(chr)) {
        return scan_number(loc);
    }

    const auto start = m_offset;
    if ((chr == '=' || chr == '!') && lookahead() == '=') {
        advance();
        advance();
        return token {.type = chr == '=' ? equals : not_equals, .literal = text_from(start), .loc = loc};
    }
    advance();
    return token {.type = single_char_type(chr), .literal = text_from(start), .loc = loc};
}

auto lexer::at_end() const -> bool
{
    return m_offset >= m_input.size();
}

auto lexer::current() const -> char
{
    return at_end() ? '\0' : m_input[m_offset];
}

auto lexer::lookahead() const -> char
{
    return m_offset + 1 < m_input.size() ? m_input[m_offset + 1] : '\0';
}

auto lexer::here() const -> location
{
    return location {.filename = m_filename, .line = m_line, .column = m_offset - m_line_start + 1};
}

auto lexer::text_from(std::size_t start) const -> std::string_view
{
    return m_input.substr(start, m_offset - start);
}

void lexer::advance()
{
    if (current() == '\n') {
        ++m_line;
        m_line_start = m_offset + 1;
    }
    ++m_offset;
}

void lexer::skip_whitespace()
{
    while (!at_end() && is_whitespace(current())) {
        advance();
    }
}

auto lexer::scan_word(location loc) -> token
{
    const auto start = m_offset;
    while (!at_end() && is_letter(current())) {
        advance();
    }
    const auto word = text_from(start);
    return token {.type = keyword_or_identifier(word), .literal = word, .loc = loc};
}

auto lexer::scan_number(location loc) -> token
{
    const auto start = m_offset;
    while (!at_end() && is_digit(current())) {
        advance();
    }
    return token {.type = token_type::integer, .literal = text_from(start), .loc = loc};
}
