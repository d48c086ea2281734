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

#include "sini_interpolation.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sini_danger_act_p.hpp"
#include "sini_text.hpp"

namespace sini::format
{

struct ResolveFlow
{
	struct link
	{
		const section*		m_context;
		const keyedValue*	m_entry;
	};

	inline ResolveFlow(const document& p_document, Error_Context& p_error)
		: m_document(p_document)
		, m_dialect(p_document.config())
		, m_error(p_error)
	{
	}

	const document&		m_document;
	const dialect&		m_dialect;
	Error_Context&		m_error;
	std::vector<link>	m_chain;	//!< Values currently being expanded, outermost first
};

static Error Expand(ResolveFlow& p_flow, const section& p_context, const keyedValue& p_entry, std::u8string& p_out);

//======== ======== Error reporting

static std::u8string LinkName(const section* p_origin, const section& p_context, std::u8string_view p_key)
{
	if(p_origin == &p_context)
	{
		return std::u8string{p_key};
	}
	std::u8string t_name{p_context.name()};
	t_name.push_back(u8':');
	t_name.append(p_key);
	return t_name;
}

static std::vector<std::u8string> ChainNames(const ResolveFlow& p_flow)
{
	std::vector<std::u8string> t_names;
	if(p_flow.m_chain.empty())
	{
		return t_names;
	}

	const section* const t_origin = p_flow.m_chain.front().m_context;
	t_names.reserve(p_flow.m_chain.size() + 1);
	for(const ResolveFlow::link& t_link : p_flow.m_chain)
	{
		t_names.push_back(LinkName(t_origin, *t_link.m_context, t_link.m_entry->view_name()));
	}
	return t_names;
}

static std::u8string JoinChain(const std::vector<std::u8string>& p_chain)
{
	std::u8string t_out;
	for(uintptr_t i = 0; i < p_chain.size(); ++i)
	{
		if(i)
		{
			t_out.append(u8" → ");
		}
		t_out.append(p_chain[i]);
	}
	return t_out;
}

static std::u8string CurrentName(const ResolveFlow& p_flow)
{
	if(p_flow.m_chain.empty())
	{
		return {};
	}
	return std::u8string{p_flow.m_chain.back().m_entry->view_name()};
}

static Error Fail(ResolveFlow& p_flow, Error p_code, std::u8string_view p_subject, std::u8string&& p_message)
{
	_p::_Error_Context& t_error = _p::Danger_Action::publicError(p_flow.m_error);
	t_error.clear();
	t_error.SetError(p_code, p_subject, std::move(p_message));
	t_error.m_severity = Severity::Fatal;
	if(!p_flow.m_chain.empty())
	{
		t_error.set_location(p_flow.m_chain.back().m_entry->value_span());
	}
	return p_code;
}

static Error SyntaxError(ResolveFlow& p_flow, std::u8string_view p_reason, std::u8string_view p_text)
{
	std::u8string t_message{p_reason};
	t_message.append(u8" in `");
	t_message.append(CurrentName(p_flow));
	t_message.append(u8"`: ");
	t_message.append(p_text);
	return Fail(p_flow, Error::InterpolationSyntax, CurrentName(p_flow), std::move(t_message));
}

static Error MissingError(ResolveFlow& p_flow, std::u8string_view p_what, std::u8string_view p_name)
{
	std::u8string t_message{u8"missing "};
	t_message.append(p_what);
	t_message.append(u8" `");
	t_message.append(p_name);
	t_message.append(u8"` referenced from `");
	t_message.append(CurrentName(p_flow));
	t_message.push_back(u8'`');

	const Error t_ret = Fail(p_flow, Error::InterpolationMissingKey, p_name, std::move(t_message));
	_p::Danger_Action::publicError(p_flow.m_error).SetChain(ChainNames(p_flow));
	return t_ret;
}


//======== ======== Expansion

static Error FollowReference(ResolveFlow& p_flow, const section& p_context, std::u8string_view p_name, std::u8string& p_out)
{
	const std::u8string t_key = _p::Danger_Action::entry_key(p_flow.m_document, p_name);
	itemProxy<const keyedValue> t_entry = _p::Danger_Action::lookup(p_flow.m_document, p_context, t_key);
	if(!t_entry)
	{
		return MissingError(p_flow, u8"option", p_name);
	}

	std::u8string t_value;
	const Error t_ret = Expand(p_flow, p_context, *t_entry, t_value);
	if(t_ret != Error::None)
	{
		return t_ret;
	}
	p_out.append(t_value);
	return Error::None;
}

//	%% and %(name)s
static Error ExpandBasic(ResolveFlow& p_flow, const section& p_context, std::u8string_view p_text, std::u8string& p_out)
{
	const uintptr_t t_size = p_text.size();
	uintptr_t t_pos = 0;

	while(t_pos < t_size)
	{
		const uintptr_t t_mark = p_text.find(u8'%', t_pos);
		if(t_mark == _p::npos)
		{
			p_out.append(p_text.substr(t_pos));
			break;
		}
		p_out.append(p_text.substr(t_pos, t_mark - t_pos));

		const char8_t t_next = (t_mark + 1 < t_size) ? p_text[t_mark + 1] : u8'\0';
		if(t_next == u8'%')
		{
			p_out.push_back(u8'%');
			t_pos = t_mark + 2;
			continue;
		}

		if(t_next != u8'(')
		{
			return SyntaxError(p_flow, u8"'%' must be followed by '%' or '('", p_text.substr(t_mark));
		}

		const uintptr_t t_close = p_text.find(u8')', t_mark + 2);
		if(t_close == _p::npos || t_close == t_mark + 2 || t_close + 1 >= t_size || p_text[t_close + 1] != u8's')
		{
			return SyntaxError(p_flow, u8"bad interpolation variable reference", p_text.substr(t_mark));
		}

		const Error t_ret = FollowReference(p_flow, p_context, p_text.substr(t_mark + 2, t_close - t_mark - 2), p_out);
		if(t_ret != Error::None)
		{
			return t_ret;
		}
		t_pos = t_close + 2;
	}
	return Error::None;
}

//	$$, ${name} and ${section:name}
static Error ExpandExtended(ResolveFlow& p_flow, const section& p_context, std::u8string_view p_text, std::u8string& p_out)
{
	const uintptr_t t_size = p_text.size();
	uintptr_t t_pos = 0;

	while(t_pos < t_size)
	{
		const uintptr_t t_mark = p_text.find(u8'$', t_pos);
		if(t_mark == _p::npos)
		{
			p_out.append(p_text.substr(t_pos));
			break;
		}
		p_out.append(p_text.substr(t_pos, t_mark - t_pos));

		const char8_t t_next = (t_mark + 1 < t_size) ? p_text[t_mark + 1] : u8'\0';
		if(t_next == u8'$')
		{
			p_out.push_back(u8'$');
			t_pos = t_mark + 2;
			continue;
		}

		if(t_next != u8'{')
		{
			return SyntaxError(p_flow, u8"'$' must be followed by '$' or '{'", p_text.substr(t_mark));
		}

		const uintptr_t t_close = p_text.find(u8'}', t_mark + 2);
		if(t_close == _p::npos || t_close == t_mark + 2)
		{
			return SyntaxError(p_flow, u8"bad interpolation variable reference", p_text.substr(t_mark));
		}

		const std::u8string_view t_path = p_text.substr(t_mark + 2, t_close - t_mark - 2);
		const uintptr_t t_colon = t_path.find(u8':');

		Error t_ret;
		if(t_colon == _p::npos)
		{
			t_ret = FollowReference(p_flow, p_context, t_path, p_out);
		}
		else
		{
			if(t_path.find(u8':', t_colon + 1) != _p::npos)
			{
				return SyntaxError(p_flow, u8"more than one ':' found", p_text.substr(t_mark, t_close + 1 - t_mark));
			}

			const std::u8string_view t_sectionName = t_path.substr(0, t_colon);
			itemProxy<const section> t_section = p_flow.m_document.find_section(t_sectionName);
			if(!t_section)
			{
				return MissingError(p_flow, u8"section", t_sectionName);
			}
			t_ret = FollowReference(p_flow, *t_section, t_path.substr(t_colon + 1), p_out);
		}

		if(t_ret != Error::None)
		{
			return t_ret;
		}
		t_pos = t_close + 1;
	}
	return Error::None;
}

static Error Expand(ResolveFlow& p_flow, const section& p_context, const keyedValue& p_entry, std::u8string& p_out)
{
	const bool t_owned = (p_context.find_key(p_entry.key()).get() == &p_entry);
	if(t_owned && _p::Danger_Action::fetch_effective(p_entry, p_out))
	{
		return Error::None;
	}

	for(const ResolveFlow::link& t_link : p_flow.m_chain)
	{
		if(t_link.m_context == &p_context && t_link.m_entry == &p_entry)
		{
			std::vector<std::u8string> t_chain = ChainNames(p_flow);
			t_chain.push_back(LinkName(p_flow.m_chain.front().m_context, p_context, p_entry.view_name()));

			std::u8string t_message{u8"interpolation cycle: "};
			t_message.append(JoinChain(t_chain));

			const Error t_ret = Fail(p_flow, Error::InterpolationCycle, p_entry.view_name(), std::move(t_message));
			_p::Danger_Action::publicError(p_flow.m_error).SetChain(std::move(t_chain));
			return t_ret;
		}
	}

	if(p_flow.m_chain.size() >= p_flow.m_dialect.max_interpolation_depth)
	{
		std::u8string t_message{u8"interpolation depth exceeded while resolving `"};
		t_message.append(p_entry.view_name());
		t_message.push_back(u8'`');

		const Error t_ret = Fail(p_flow, Error::InterpolationDepthExceeded, p_entry.view_name(), std::move(t_message));
		_p::_Error_Context& t_error = _p::Danger_Action::publicError(p_flow.m_error);
		t_error.SetChain(ChainNames(p_flow));
		t_error.SetDepthLimit(p_flow.m_dialect.max_interpolation_depth);
		return t_ret;
	}

	p_flow.m_chain.push_back({&p_context, &p_entry});

	std::u8string t_value;
	const Error t_ret = (p_flow.m_dialect.interpolation == Interpolation::Basic)
		? ExpandBasic	(p_flow, p_context, p_entry.view_value(), t_value)
		: ExpandExtended(p_flow, p_context, p_entry.view_value(), t_value);

	p_flow.m_chain.pop_back();

	if(t_ret != Error::None)
	{
		return t_ret;
	}

	if(t_owned)
	{
		_p::Danger_Action::store_effective(p_entry, t_value);
	}
	p_out = std::move(t_value);
	return Error::None;
}


Error resolve(const document& p_document, const section& p_context, const keyedValue& p_entry, std::u8string& p_out, Error_Context& p_error)
{
	if(p_document.config().interpolation == Interpolation::None)
	{
		p_out = p_entry.value();
		return Error::None;
	}

	ResolveFlow t_flow(p_document, p_error);
	return Expand(t_flow, p_context, p_entry, p_out);
}

} //namespace sini::format
