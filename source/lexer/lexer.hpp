#pragma once

#include <cstddef>
#include <string_view>

#include "location.hpp"
#include "token.hpp"

// Splits program text into tokens on demand. Holds a view of the input, so the text must outlive the lexer and
// every token it hands out.
class lexer final
{
  public:
    explicit lexer(std::string_view input, std::string_view filename = "<stdin>");

    // Returns eof forever once the input is exhausted.
    auto next_token() -> token;

  private:
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto current() const -> char;
    [[nodiscard]] auto lookahead() const -> char;
    [[nodiscard]] auto here() const -> location;
    [[nodiscard]] auto text_from(std::size_t start) const -> std::string_view;
    void advance();
    void skip_whitespace();
    auto scan_word(location loc) -> token;
    auto scan_number(location loc) -> token;

    std::string_view m_input;
    std::string_view m_filename;
    std::size_t m_offset {};
    std::size_t m_line {1};
    std::size_t m_line_start {};
};
