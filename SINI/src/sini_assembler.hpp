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
#include <string>
#include <string_view>

#include "SINI/SINI.hpp"
#include "sini_text.hpp"

namespace sini::format
{

///	\brief Splits the source into physical lines
///	\note
///		1. "\n", "\r\n" and a lone "\r" all end a line
///		2. A UTF-8 byte order mark at the start of the text is skipped, offsets still count it
class line_reader
{
private:
	std::u8string_view	m_text;
	uintptr_t			m_pos	= 0;
	uint64_t			m_line	= 0;

public:
	line_reader(std::u8string_view p_text);

	[[nodiscard]] bool next(_p::physical_line& p_out);

	[[nodiscard]] inline uint64_t line() const { return m_line; }
};

enum class EventKind: uint8_t
{
	Section		= 0x00,	//!< Section header
	KeyValue	= 0x01,	//!< Finalized key/value entry
	Malformed	= 0x02,	//!< Line that could not be interpreted
};

struct event
{
	EventKind			kind			= EventKind::Malformed;
	std::u8string_view	name;					//!< Section name or key, as written
	std::u8string		value;					//!< KeyValue only, continuation lines joined with '\n'
	std::u8string		message;				//!< Malformed only
	span				location;				//!< Whole entry
	span				name_span;
	span				value_span;
	bool				unterminated	= false;	//!< KeyValue ended by the end of input while a backslash continuation was pending
	bool				unrecoverable	= false;	//!< Malformed line without a valid fallback
	bool				nested			= false;	//!< Section header indented inside the value it closed
};

using event_f = Error (*)(const event&, void*);

///	\brief
///		Reads p_text line by line and hands every finalized entry to p_sink
///	\return Error::None, or the first error returned by p_sink, in which case assembly stops immediately
Error assemble(std::u8string_view p_text, const dialect& p_dialect, event_f p_sink, void* p_context);

} //namespace sini::format
