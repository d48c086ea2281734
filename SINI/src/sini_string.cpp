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

#include <SINI/sini_string.hpp>

#include "sini_text.hpp"

namespace sini
{

std::u8string fold_case(std::u8string_view p_text)
{
	std::u8string t_out{p_text};
	for(char8_t& t_char : t_out)
	{
		if(t_char >= u8'A' && t_char <= u8'Z')
		{
			t_char = static_cast<char8_t>(t_char + (u8'a' - u8'A'));
		}
	}
	return t_out;
}

std::optional<bool> to_boolean(std::u8string_view p_text)
{
	const std::u8string t_text = fold_case(p_text);

	if(t_text == u8"1" || t_text == u8"yes" || t_text == u8"true" || t_text == u8"on")
	{
		return true;
	}
	if(t_text == u8"0" || t_text == u8"no" || t_text == u8"false" || t_text == u8"off")
	{
		return false;
	}
	return {};
}

namespace _p
{

uintptr_t skip_space(std::u8string_view p_text, uintptr_t p_pos)
{
	const uintptr_t t_size = p_text.size();
	while(p_pos < t_size && is_space(p_text[p_pos]))
	{
		++p_pos;
	}
	return p_pos;
}

uintptr_t trim_end(std::u8string_view p_text, uintptr_t p_end, uintptr_t p_floor)
{
	while(p_end > p_floor && is_space(p_text[p_end - 1]))
	{
		--p_end;
	}
	return p_end;
}

uint64_t count_columns(std::u8string_view p_text)
{
	uint64_t t_count = 0;
	for(const char8_t t_char : p_text)
	{
		if(!is_utf8_continuation(t_char)) ++t_count;
	}
	return t_count;
}

bool starts_with_any(std::u8string_view p_text, const std::vector<std::u8string>& p_prefixes)
{
	for(const std::u8string& t_prefix : p_prefixes)
	{
		if(!t_prefix.empty() && p_text.starts_with(t_prefix))
		{
			return true;
		}
	}
	return false;
}

uintptr_t find_inline_comment(std::u8string_view p_line, uintptr_t p_from, uintptr_t p_end, const std::vector<std::u8string>& p_prefixes)
{
	const std::u8string_view t_window = p_line.substr(0, p_end);
	uintptr_t t_best = npos;

	for(const std::u8string& t_prefix : p_prefixes)
	{
		if(t_prefix.empty()) continue;

		uintptr_t t_pos = t_window.find(t_prefix, p_from);
		while(t_pos != npos && t_pos < t_best)
		{
			if(t_pos == 0 || is_space(t_window[t_pos - 1]))
			{
				t_best = t_pos;
				break;
			}
			t_pos = t_window.find(t_prefix, t_pos + 1);
		}
	}
	return t_best;
}

uintptr_t find_delimiter(std::u8string_view p_text, const std::vector<std::u8string>& p_delimiters, uintptr_t& p_length)
{
	uintptr_t t_best = npos;
	p_length = 0;

	for(const std::u8string& t_delimiter : p_delimiters)
	{
		if(t_delimiter.empty()) continue;

		const uintptr_t t_pos = p_text.find(t_delimiter);
		if(t_pos < t_best)
		{
			t_best		= t_pos;
			p_length	= t_delimiter.size();
		}
	}
	return t_best;
}

span make_span(const physical_line& p_line, uintptr_t p_begin, uintptr_t p_end)
{
	span t_span;
	t_span.begin		= p_line.offset + p_begin;
	t_span.end			= p_line.offset + p_end;
	t_span.line			= p_line.number;
	t_span.end_line		= p_line.number;
	t_span.column		= count_columns(p_line.text.substr(0, p_begin)) + 1;
	t_span.end_column	= t_span.column + count_columns(p_line.text.substr(p_begin, p_end - p_begin));
	return t_span;
}

} //namespace _p
} //namespace sini
