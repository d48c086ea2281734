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

enum class LineKind: uint8_t
{
	Blank			= 0x00,	//!< Nothing but spaces, or an inline comment alone
	Comment			= 0x01,	//!< Full line comment
	Section			= 0x02,	//!< Section header
	KeyValue		= 0x03,	//!< Start of a key/value entry
	Continuation	= 0x04,	//!< Extends the open value
	Malformed		= 0x05,	//!< Could not be interpreted
};

///	\brief State of the assembler that affects how a line is read
struct line_context
{
	bool		value_open			= false;		//!< A key/value entry is still accepting continuation lines
	bool		forced				= false;		//!< The previous value line ended with a backslash continuation
	uintptr_t	entry_indent		= 0;			//!< Indentation of the key owning the open value
	uintptr_t	continuation_indent	= _p::npos;		//!< Indentation of the first continuation line of the open value
};

struct raw_entry
{
	LineKind			kind			= LineKind::Blank;
	std::u8string_view	name;							//!< Section name, key, or continuation text
	std::u8string_view	value;							//!< KeyValue only
	uintptr_t			indent			= 0;			//!< Number of leading space characters
	bool				continued		= false;		//!< Ends with a backslash continuation
	bool				unrecoverable	= false;		//!< Malformed line that leaves the parser without a valid fallback
	bool				nested			= false;		//!< Section header indented inside an open value
	std::u8string		message;						//!< Malformed only, why the line was rejected
	span				location;						//!< Meaningful content of the line
	span				name_span;
	span				value_span;
};

///	\brief Decides what a physical line is
///	\note
///		Rules, in order:
///			1. forced continuation
///			2. blank (or empty continuation inside a value)
///			3. comment
///			4. section header
///			5. continuation
///			6. key/value
///			7. malformed
[[nodiscard]] raw_entry classify(const _p::physical_line& p_line, const dialect& p_dialect, const line_context& p_context);

} //namespace sini::format
