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

#include <string>
#include <string_view>

#include <SINI/sini_items.hpp>
#include <SINI/SINI.hpp>

namespace sini::_p
{

class Danger_Action
{
public:
	static inline _Error_Context& publicError(Error_Context& p_obj) { return p_obj; }

	static inline bool fetch_effective(const keyedValue& p_value, std::u8string& p_out)
	{
		return p_value.fetch_effective(p_out);
	}

	static inline void store_effective(const keyedValue& p_value, std::u8string_view p_effective)
	{
		p_value.store_effective(p_effective);
	}

	static inline void push_section(document& p_doc, const itemProxy<section>& p_section)
	{
		p_doc.push_section(p_section);
	}

	static inline itemProxy<section> defaults(document& p_doc) { return p_doc.m_defaults; }

	static inline std::u8string section_key	(const document& p_doc, std::u8string_view p_name) { return p_doc.section_key(p_name); }
	static inline std::u8string entry_key	(const document& p_doc, std::u8string_view p_name) { return p_doc.entry_key(p_name); }
	static inline bool			is_default	(const document& p_doc, std::u8string_view p_key) { return p_doc.is_default(p_key); }

	static inline itemProxy<const keyedValue> lookup(const document& p_doc, const section& p_section, std::u8string_view p_key)
	{
		return p_doc.lookup(p_section, p_key);
	}
};

} //namespace sini::_p
