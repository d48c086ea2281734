//======== ======== ======== ======== ======== ======== ======== ========
///	\file
///
///	\copyright
///		Copyright (c) 2020 Tiago Miguel Oliveira Freire
///
///		Permission is hereby granted, free of charge, to any person obtaining a copy
///		of this software and associated documentation files (the "Software"), to deal
///		in the Software without restriction, including without limitation the rights
///		to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
///		copies of the Software, and to permit persons to whom the Software is
///		furnished to do so, subject to the following conditions:
///
///		The above copyright notice and this permission notice shall be included in all
///		copies or substantial portions of the Software.
///
///		THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
///		IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
///		FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
///		AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
///		LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
///		OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
///		SOFTWARE.
//======== ======== ======== ======== ======== ======== ======== ========

#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "SINI/sini_items.hpp"

namespace sini::_p
{

constexpr uintptr_t npos = std::u8string_view::npos;

constexpr std::array<char8_t, 3> BOM_UTF8 = {0xEF, 0xBB, 0xBF};

inline constexpr bool is_no_printSpace(char8_t p_val)
{
	return (p_val > 0x08 && p_val < 0x0E);
}

inline constexpr bool is_space(char8_t p_val)
{
	return is_no_printSpace(p_val) || p_val == ' ';
}

inline constexpr bool is_utf8_continuation(char8_t p_val)
{
	return (p_val & 0xC0) == 0x80;
}

///	\brief A line of the source as found between line terminators
struct physical_line
{
	std::u8string_view	text;		//!< Line content without the line terminator
	uint64_t			offset = 0;	//!< Byte offset of the first character in the source
	uint64_t			number = 0;	//!< Line number, count starts from 1
};

///	\return Position of the first non space character at or after p_pos, or p_text.size()
[[nodiscard]] uintptr_t skip_space(std::u8string_view p_text, uintptr_t p_pos = 0);

///	\return Position one past the last non space character before p_end, never lower than p_floor
[[nodiscard]] uintptr_t trim_end(std::u8string_view p_text, uintptr_t p_end, uintptr_t p_floor = 0);

///	\return Number of code points in p_text
[[nodiscard]] uint64_t count_columns(std::u8string_view p_text);

[[nodiscard]] bool starts_with_any(std::u8string_view p_text, const std::vector<std::u8string>& p_prefixes);

///	\brief
///		Finds where an inline comment starts in p_line, searching [p_from, p_end)
///	\note
///		A prefix only counts at the start of the line or right after a space
///	\return position of the comment or npos
[[nodiscard]] uintptr_t find_inline_comment(std::u8string_view p_line, uintptr_t p_from, uintptr_t p_end, const std::vector<std::u8string>& p_prefixes);

///	\brief
///		Finds the leftmost delimiter. On a tie the first delimiter in p_delimiters wins
///	\param[out] p_length - size of the delimiter found
///	\return position of the delimiter or npos
[[nodiscard]] uintptr_t find_delimiter(std::u8string_view p_text, const std::vector<std::u8string>& p_delimiters, uintptr_t& p_length);

///	\brief Span of the bytes [p_begin, p_end) of p_line
[[nodiscard]] span make_span(const physical_line& p_line, uintptr_t p_begin, uintptr_t p_end);

} //namespace sini::_p
