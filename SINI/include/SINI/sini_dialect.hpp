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
#include <vector>

#include <CoreLib/core_type.hpp>

namespace sini
{

constexpr uint16_t default_max_interpolation_depth = 32;	//!< Longest reference chain followed before giving up

///	\brief Placeholder substitution applied to values when they are read
enum class Interpolation: uint8_t
{
	None		= 0x00,	//!< Values are returned verbatim
	Basic		= 0x01,	//!< %(name)s references to the same section, %% escapes a percent sign
	Extended	= 0x02,	//!< ${name} or ${section:name} references, $$ escapes a dollar sign
};

///	\note
///		1. In Strict mode the warning callback is never consulted, the first problem fails the parse
///		2. MalformedAsComment has no effect in Strict mode
///		3. DelimitedContinuation only matters if AllowContinuation is set
enum class Flag: uint16_t
{
	Default					= 0x0000,	//!< All flags disabled
	Strict					= 0x0001,	//!< Duplicates and malformed lines are fatal
	AllowContinuation		= 0x0002,	//!< Lines indented deeper than their key extend the key's value
	EmptyLinesInValues		= 0x0004,	//!< Blank lines inside a multi-line value are kept instead of closing it
	FoldSections			= 0x0008,	//!< Section names are compared case-insensitively
	FoldKeys				= 0x0010,	//!< Key names are compared case-insensitively
	KeysBeforeSection		= 0x0020,	//!< Keys before the first header belong to the default section
	MalformedAsComment		= 0x0040,	//!< Lines that cannot be interpreted are dropped without a diagnostic
	IndentedComments		= 0x0080,	//!< Comment prefixes are recognized on lines indented inside a multi-line value
	BracketsInSectionName	= 0x0100,	//!< ']' is allowed inside a section name
	DelimitedContinuation	= 0x0200,	//!< An indented line with a delimiter continues the open value instead of starting a new key
	BackslashContinuation	= 0x0400,	//!< A value line ending in '\' is continued by the next line regardless of indentation

	Standard				= AllowContinuation | EmptyLinesInValues | FoldKeys | KeysBeforeSection | BracketsInSectionName,
	//Python configparser behaviour
	ConfigParser			= Standard | DelimitedContinuation,
};

CORE_MAKE_ENUM_FLAG(Flag);

///	\brief
///		Parsing options. A copy is kept by the document for the whole of its lifetime
///
///	\note
///		1. Delimiters are searched left to right, when two delimiters match at the same position the first one listed wins
///		2. Inline comment prefixes only count at the start of a line or after a white space
struct dialect
{
	std::vector<std::u8string>	key_value_delimiters	= {u8"=", u8":"};
	std::vector<std::u8string>	comment_prefixes		= {u8"#", u8";"};
	std::vector<std::u8string>	inline_comment_prefixes;
	std::u8string				default_section			= u8"DEFAULT";
	Flag						flags					= Flag::Standard;
	Interpolation				interpolation			= Interpolation::None;
	uint16_t					max_interpolation_depth	= default_max_interpolation_depth;

	[[nodiscard]] inline bool has(Flag p_flag) const { return (flags & p_flag) != Flag{}; }
	[[nodiscard]] inline bool strict() const { return has(Flag::Strict); }
};

}	//namespace sini
