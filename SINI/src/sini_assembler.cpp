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

#include "sini_assembler.hpp"

#include <utility>

#include "sini_classifier.hpp"

namespace sini::format
{

//======== ======== class line_reader
line_reader::line_reader(std::u8string_view p_text)
	: m_text(p_text)
{
	const std::u8string_view t_bom{_p::BOM_UTF8.data(), _p::BOM_UTF8.size()};
	if(m_text.starts_with(t_bom))
	{
		m_pos = t_bom.size();
	}
}

bool line_reader::next(_p::physical_line& p_out)
{
	const uintptr_t t_size = m_text.size();
	if(m_pos >= t_size)
	{
		return false;
	}

	uintptr_t t_end = m_pos;
	while(t_end < t_size && m_text[t_end] != u8'\n' && m_text[t_end] != u8'\r')
	{
		++t_end;
	}

	p_out.text		= m_text.substr(m_pos, t_end - m_pos);
	p_out.offset	= m_pos;
	p_out.number	= ++m_line;

	if(t_end < t_size)
	{
		if(m_text[t_end] == u8'\r' && t_end + 1 < t_size && m_text[t_end + 1] == u8'\n')
		{
			t_end += 2;
		}
		else
		{
			++t_end;
		}
	}
	m_pos = t_end;
	return true;
}


//======== ======== Assembly

struct AssemblerFlow
{
	inline AssemblerFlow(event_f p_sink, void* p_context)
		: m_sink(p_sink)
		, m_context(p_context)
	{
	}

	event_f			m_sink;
	void*			m_context;
	line_context	m_lineContext;
	event			m_pending;	//!< Entry accumulating continuation lines, valid while m_lineContext.value_open
};

static Error FlushValue(AssemblerFlow& p_flow)
{
	line_context& t_context = p_flow.m_lineContext;
	if(!t_context.value_open)
	{
		return Error::None;
	}

	t_context.value_open			= false;
	t_context.forced				= false;
	t_context.continuation_indent	= _p::npos;

	//blank continuation lines at the end do not belong to the value
	std::u8string& t_value = p_flow.m_pending.value;
	t_value.resize(_p::trim_end(t_value, t_value.size()));

	return p_flow.m_sink(p_flow.m_pending, p_flow.m_context);
}

static void OpenValue(AssemblerFlow& p_flow, const raw_entry& p_entry)
{
	event& t_pending = p_flow.m_pending;
	t_pending = event{};
	t_pending.kind			= EventKind::KeyValue;
	t_pending.name			= p_entry.name;
	t_pending.value			= p_entry.value;
	t_pending.location		= p_entry.location;
	t_pending.name_span		= p_entry.name_span;
	t_pending.value_span	= p_entry.value_span;

	line_context& t_context = p_flow.m_lineContext;
	t_context.value_open			= true;
	t_context.forced				= p_entry.continued;
	t_context.entry_indent			= p_entry.indent;
	t_context.continuation_indent	= _p::npos;
}

static void AppendContinuation(AssemblerFlow& p_flow, const raw_entry& p_entry)
{
	event& t_pending = p_flow.m_pending;
	line_context& t_context = p_flow.m_lineContext;

	t_pending.value.push_back(u8'\n');
	t_pending.value.append(p_entry.name);

	if(!p_entry.location.empty())
	{
		t_pending.value_span.merge(p_entry.value_span);
		t_pending.location.merge(p_entry.location);

		if(t_context.continuation_indent == _p::npos && !t_context.forced)
		{
			t_context.continuation_indent = p_entry.indent;
		}
	}
	t_context.forced = p_entry.continued;
}

Error assemble(std::u8string_view p_text, const dialect& p_dialect, event_f p_sink, void* p_context)
{
	AssemblerFlow t_flow(p_sink, p_context);
	line_reader t_reader{p_text};
	_p::physical_line t_line;

	Error lastError = Error::None;

	while(t_reader.next(t_line))
	{
		raw_entry t_entry = classify(t_line, p_dialect, t_flow.m_lineContext);

		switch(t_entry.kind)
		{
			case LineKind::Blank:
				//blank lines kept inside values arrive as Continuation
				lastError = FlushValue(t_flow);
				break;
			case LineKind::Comment:
				break;
			case LineKind::Continuation:
				AppendContinuation(t_flow, t_entry);
				break;
			case LineKind::KeyValue:
				lastError = FlushValue(t_flow);
				if(lastError == Error::None)
				{
					OpenValue(t_flow, t_entry);
				}
				break;
			case LineKind::Section:
				lastError = FlushValue(t_flow);
				if(lastError == Error::None)
				{
					event t_event;
					t_event.kind		= EventKind::Section;
					t_event.name		= t_entry.name;
					t_event.location	= t_entry.location;
					t_event.name_span	= t_entry.name_span;
					t_event.nested		= t_entry.nested;
					lastError = p_sink(t_event, p_context);
				}
				break;
			case LineKind::Malformed:
				lastError = FlushValue(t_flow);
				if(lastError == Error::None)
				{
					event t_event;
					t_event.kind			= EventKind::Malformed;
					t_event.name			= t_line.text.substr(t_entry.indent);
					t_event.message			= std::move(t_entry.message);
					t_event.location		= t_entry.location;
					t_event.unrecoverable	= t_entry.unrecoverable;
					lastError = p_sink(t_event, p_context);
				}
				break;
			default:
				return Error::UnknownInternal;
		}

		if(lastError != Error::None)
		{
			return lastError;
		}
	}

	if(t_flow.m_lineContext.forced)
	{
		t_flow.m_pending.unterminated = true;
	}
	return FlushValue(t_flow);
}

} //namespace sini::format
