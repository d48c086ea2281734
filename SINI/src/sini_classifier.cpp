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

#include "sini_classifier.hpp"

#include <algorithm>
#include <utility>

namespace sini::format
{

static std::u8string MissingDelimiterMessage(const dialect& p_dialect)
{
	std::u8string t_message = u8"variable assignment missing one of: ";
	bool t_first = true;
	for(const std::u8string& t_delimiter : p_dialect.key_value_delimiters)
	{
		if(!t_first) t_message.append(u8", ");
		t_first = false;
		t_message.push_back(u8'`');
		t_message.append(t_delimiter);
		t_message.push_back(u8'`');
	}
	return t_message;
}

static raw_entry MakeMalformed(const _p::physical_line& p_line, uintptr_t p_begin, uintptr_t p_end, std::u8string&& p_message)
{
	raw_entry t_entry;
	t_entry.kind		= LineKind::Malformed;
	t_entry.indent		= p_begin;
	t_entry.message		= std::move(p_message);
	t_entry.location	= _p::make_span(p_line, p_begin, p_end);
	return t_entry;
}

static raw_entry MakeBlank(const _p::physical_line& p_line, const dialect& p_dialect, const line_context& p_context, uintptr_t p_indent)
{
	raw_entry t_entry;
	t_entry.kind		= (p_context.value_open && p_dialect.has(Flag::EmptyLinesInValues)) ? LineKind::Continuation : LineKind::Blank;
	t_entry.indent		= p_indent;
	t_entry.location	= _p::make_span(p_line, p_indent, p_indent);
	return t_entry;
}

//Note:
//	1. p_end is moved back over the backslash and the spaces before it
static void StripBackslash(std::u8string_view p_text, uintptr_t p_begin, uintptr_t& p_end, const dialect& p_dialect, bool& p_continued)
{
	p_continued = false;
	if(p_dialect.has(Flag::BackslashContinuation) && p_end > p_begin && p_text[p_end - 1] == u8'\\')
	{
		p_continued	= true;
		p_end		= _p::trim_end(p_text, p_end - 1, p_begin);
	}
}

static raw_entry MakeContinuation(const _p::physical_line& p_line, const dialect& p_dialect, uintptr_t p_strip, uintptr_t p_indent, uintptr_t p_end)
{
	raw_entry t_entry;
	t_entry.kind	= LineKind::Continuation;
	t_entry.indent	= p_indent;

	StripBackslash(p_line.text, p_indent, p_end, p_dialect, t_entry.continued);

	t_entry.name		= p_line.text.substr(p_strip, p_end - p_strip);
	t_entry.location	= _p::make_span(p_line, p_indent, p_end);
	t_entry.value_span	= t_entry.location;
	return t_entry;
}

static raw_entry ClassifySection(const _p::physical_line& p_line, const dialect& p_dialect, uintptr_t p_begin, uintptr_t p_end)
{
	const std::u8string_view t_content = p_line.text.substr(p_begin, p_end - p_begin);

	const uintptr_t t_close = t_content.rfind(u8']');
	if(t_close == _p::npos)
	{
		raw_entry t_entry = MakeMalformed(p_line, p_begin, p_end, u8"section was not closed: missing ']'");
		t_entry.unrecoverable = true;
		return t_entry;
	}

	const std::u8string_view t_name = t_content.substr(1, t_close - 1);
	if(t_name.empty())
	{
		return MakeMalformed(p_line, p_begin, p_end, u8"empty section name");
	}
	if(!p_dialect.has(Flag::BracketsInSectionName) && t_name.find(u8']') != _p::npos)
	{
		return MakeMalformed(p_line, p_begin, p_end, u8"invalid section name: contains ']'");
	}

	raw_entry t_entry;
	t_entry.kind		= LineKind::Section;
	t_entry.indent		= p_begin;
	t_entry.name		= t_name;
	t_entry.name_span	= _p::make_span(p_line, p_begin + 1, p_begin + t_close);
	t_entry.location	= _p::make_span(p_line, p_begin, p_begin + t_close + 1);
	return t_entry;
}

raw_entry classify(const _p::physical_line& p_line, const dialect& p_dialect, const line_context& p_context)
{
	const std::u8string_view t_text = p_line.text;
	const uintptr_t t_indent = _p::skip_space(t_text);
	uintptr_t t_end = _p::trim_end(t_text, t_text.size(), t_indent);

	const bool t_nested =
		p_context.value_open &&
		p_dialect.has(Flag::AllowContinuation) &&
		t_indent > p_context.entry_indent;

	if(!p_context.forced)
	{
		if(t_indent == t_end)
		{
			return MakeBlank(p_line, p_dialect, p_context, t_indent);
		}

		if(_p::starts_with_any(t_text.substr(t_indent), p_dialect.comment_prefixes) &&
			(!t_nested || p_dialect.has(Flag::IndentedComments)))
		{
			raw_entry t_entry;
			t_entry.kind		= LineKind::Comment;
			t_entry.indent		= t_indent;
			t_entry.location	= _p::make_span(p_line, t_indent, t_end);
			return t_entry;
		}
	}

	const uintptr_t t_cut = _p::find_inline_comment(t_text, t_indent, t_end, p_dialect.inline_comment_prefixes);
	if(t_cut != _p::npos)
	{
		t_end = _p::trim_end(t_text, t_cut, t_indent);
	}

	if(p_context.forced)
	{
		return MakeContinuation(p_line, p_dialect, t_indent, t_indent, t_end);
	}

	if(t_indent == t_end)
	{
		return MakeBlank(p_line, p_dialect, p_context, t_indent);
	}

	const std::u8string_view t_content = t_text.substr(t_indent, t_end - t_indent);

	if(t_content.front() == u8'[')
	{
		raw_entry t_entry = ClassifySection(p_line, p_dialect, t_indent, t_end);
		t_entry.nested = t_nested;
		return t_entry;
	}

	uintptr_t t_delimiterSize = 0;
	const uintptr_t t_delimiter = _p::find_delimiter(t_content, p_dialect.key_value_delimiters, t_delimiterSize);

	if(t_nested && (t_delimiter == _p::npos || p_dialect.has(Flag::DelimitedContinuation)))
	{
		const uintptr_t t_strip = (p_context.continuation_indent == _p::npos) ? t_indent : std::min(t_indent, p_context.continuation_indent);
		return MakeContinuation(p_line, p_dialect, t_strip, t_indent, t_end);
	}

	if(t_delimiter == _p::npos)
	{
		return MakeMalformed(p_line, t_indent, t_end, MissingDelimiterMessage(p_dialect));
	}

	const uintptr_t t_keyEnd = _p::trim_end(t_text, t_indent + t_delimiter, t_indent);
	if(t_keyEnd == t_indent)
	{
		return MakeMalformed(p_line, t_indent, t_end, u8"empty option name");
	}

	const uintptr_t t_delimiterEnd	= t_indent + t_delimiter + t_delimiterSize;
	uintptr_t t_valueEnd			= std::max(t_end, t_delimiterEnd);
	const uintptr_t t_valueBegin	= std::min(_p::skip_space(t_text, t_delimiterEnd), t_valueEnd);

	raw_entry t_entry;
	t_entry.kind	= LineKind::KeyValue;
	t_entry.indent	= t_indent;

	StripBackslash(t_text, t_valueBegin, t_valueEnd, p_dialect, t_entry.continued);

	t_entry.name		= t_text.substr(t_indent, t_keyEnd - t_indent);
	t_entry.value		= t_text.substr(t_valueBegin, t_valueEnd - t_valueBegin);
	t_entry.name_span	= _p::make_span(p_line, t_indent, t_keyEnd);
	t_entry.value_span	= _p::make_span(p_line, t_valueBegin, t_valueEnd);
	t_entry.location	= _p::make_span(p_line, t_indent, std::max(t_valueEnd, t_delimiterEnd));
	return t_entry;
}

} //namespace sini::format
