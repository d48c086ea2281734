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

#include "SINI/SINI.hpp"
#include "sini_format.hpp"
#include "sini_assembler.hpp"

namespace sini::format
{

struct BuilderFlow
{
	inline BuilderFlow(document& p_document, _Warning_Def& p_warn, const dialect& p_dialect)
		: m_document(p_document)
		, m_warnDef(p_warn)
		, m_dialect(p_dialect)
	{
	}

	document&			m_document;
	_Warning_Def&		m_warnDef;
	const dialect&		m_dialect;
	itemProxy<section>	m_current;					//!< Section receiving keys, null before the first header
	bool				m_discardSection = false;	//!< Keys are dropped until the next header
};

///	\brief
///		Event sink for \ref assemble, adds each event to the document
///	\param[in] p_context - must point to a \ref BuilderFlow
///	\note
///		1. Duplicate sections are merged, duplicate keys keep the last value
///		2. Every problem goes through \ref _Warning_Def::Notify, and is recorded in the document's diagnostics
Error build_event(const event& p_event, void* p_context);

} //namespace sini::format
