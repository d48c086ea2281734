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

#include <SINI/SINI.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sini_danger_act_p.hpp"
#include "sini_format.hpp"
#include "sini_assembler.hpp"
#include "sini_builder.hpp"
#include "sini_interpolation.hpp"

namespace sini
{

warningBehaviour DefaultWarningHandler(const Error_Context&, void*)
{
	return warningBehaviour::Default;
}

namespace _p
{
	void _Error_Context::clear()
	{
		m_error_code	= Error::None;
		m_severity		= Severity::Warning;
		m_location		= span{};
		m_related		= span{};
		m_extra			= ExtraInfo_t{};
		m_subject.clear();
		m_message.clear();
		m_chain.clear();
	}

	void _Error_Context::SetError(Error p_code, std::u8string_view p_subject, std::u8string&& p_message)
	{
		m_error_code	= p_code;
		m_subject		= p_subject;
		m_message		= std::move(p_message);
	}
} //namespace _p

namespace format
{
	void _Warning_Def::Record(Severity p_severity)
	{
		_p::Danger_Action::publicError(*_error_context).m_severity = p_severity;
		_diagnostics->push_back(*_error_context);
	}
} //namespace format


//======== ======== ======== document ======== ======== ========

document::document()
{
	reset_content();
}

document::document(document&& p_other)
	: m_dialect		(p_other.m_dialect)
	, m_last_error	(std::move(p_other.m_last_error))
	, m_diagnostics	(std::move(p_other.m_diagnostics))
	, m_sections	(std::move(p_other.m_sections))
	, m_index		(std::move(p_other.m_index))
	, m_defaults	(std::move(p_other.m_defaults))
{
	p_other.clear();
}

document& document::operator = (document&& p_other)
{
	if(this != &p_other)
	{
		m_dialect		= p_other.m_dialect;
		m_last_error	= std::move(p_other.m_last_error);
		m_diagnostics	= std::move(p_other.m_diagnostics);
		m_sections		= std::move(p_other.m_sections);
		m_index			= std::move(p_other.m_index);
		m_defaults		= std::move(p_other.m_defaults);
		p_other.clear();
	}
	return *this;
}

void document::clear()
{
	reset_content();
	m_diagnostics.clear();
	m_last_error.clear();
}

Error document::load(std::u8string_view p_text, const dialect& p_dialect, _warning_callback p_warning_callback, void* p_user_context)
{
	m_dialect = p_dialect;
	clear();

	format::_Warning_Def t_warnDef
	{
		._error_context			= &m_last_error,
		._user_warning_callback	= p_warning_callback ? p_warning_callback : DefaultWarningHandler,
		._user_context			= p_user_context,
		._diagnostics			= &m_diagnostics,
		._strict				= m_dialect.strict(),
	};

	format::BuilderFlow t_flow(*this, t_warnDef, m_dialect);

	const Error t_ret = format::assemble(p_text, m_dialect, format::build_event, &t_flow);
	if(t_ret != Error::None)
	{
		//errors raised without a diagnostic still need to be reported
		if(m_diagnostics.empty() || m_diagnostics.back().severity() != Severity::Fatal)
		{
			_p::_Error_Context& t_error = _p::Danger_Action::publicError(m_last_error);
			t_error.clear();
			t_error.SetPlainError(t_ret);
			t_warnDef.Record(Severity::Fatal);
		}
		reset_content();
		return t_ret;
	}

	m_last_error.clear();
	return Error::None;
}


//---- structure ----

std::vector<std::u8string_view> document::sections() const
{
	std::vector<std::u8string_view> t_out;
	t_out.reserve(m_sections.size());
	for(const itemProxy<section>& t_section : m_sections)
	{
		t_out.push_back(t_section->view_name());
	}
	return t_out;
}

std::vector<std::u8string_view> document::keys(std::u8string_view p_section) const
{
	std::vector<std::u8string_view> t_out;
	itemProxy<const section> t_section = find_section(p_section);
	if(!t_section)
	{
		return t_out;
	}

	for(const itemProxy<keyedValue>& t_entry : *t_section)
	{
		t_out.push_back(t_entry->view_name());
	}

	//inherited keys follow, unless shadowed
	if(t_section != m_defaults)
	{
		for(const itemProxy<keyedValue>& t_entry : *m_defaults)
		{
			if(!t_section->find_key(t_entry->key()))
			{
				t_out.push_back(t_entry->view_name());
			}
		}
	}
	return t_out;
}

bool document::has_section(std::u8string_view p_section) const
{
	const std::u8string t_key = section_key(p_section);
	return !is_default(t_key) && m_index.contains(t_key);
}

bool document::has_key(std::u8string_view p_section, std::u8string_view p_key) const
{
	return static_cast<bool>(find_key(p_section, p_key));
}

itemProxy<section> document::find_section(std::u8string_view p_section)
{
	const std::u8string t_key = section_key(p_section);
	if(is_default(t_key))
	{
		return m_defaults;
	}

	const auto t_it = m_index.find(t_key);
	if(t_it == m_index.end())
	{
		return nullptr;
	}
	return m_sections[t_it->second];
}

itemProxy<const section> document::find_section(std::u8string_view p_section) const
{
	return const_cast<document*>(this)->find_section(p_section);
}

itemProxy<const keyedValue> document::find_key(std::u8string_view p_section, std::u8string_view p_key) const
{
	itemProxy<const section> t_section = find_section(p_section);
	if(!t_section)
	{
		return nullptr;
	}
	return lookup(*t_section, entry_key(p_key));
}


//---- values ----

Error document::resolve(std::u8string_view p_section, std::u8string_view p_key, std::u8string& p_out, Error_Context* p_error) const
{
	Error_Context t_localError;
	Error_Context& t_error = p_error ? *p_error : t_localError;
	t_error.clear();

	itemProxy<const section> t_section = find_section(p_section);
	if(!t_section)
	{
		_p::_Error_Context& t_context = _p::Danger_Action::publicError(t_error);
		t_context.SetError(Error::NoSection, p_section, u8"no section `" + std::u8string{p_section} + u8"`");
		t_context.m_severity = Severity::Fatal;
		return Error::NoSection;
	}

	itemProxy<const keyedValue> t_entry = lookup(*t_section, entry_key(p_key));
	if(!t_entry)
	{
		_p::_Error_Context& t_context = _p::Danger_Action::publicError(t_error);
		t_context.SetError(Error::NoKey, p_key, u8"no option `" + std::u8string{p_key} + u8"` in section `" + std::u8string{p_section} + u8"`");
		t_context.m_severity = Severity::Fatal;
		return Error::NoKey;
	}

	return format::resolve(*this, *t_section, *t_entry, p_out, t_error);
}

std::optional<std::u8string> document::get(std::u8string_view p_section, std::u8string_view p_key) const
{
	std::u8string t_out;
	if(resolve(p_section, p_key, t_out) != Error::None)
	{
		return {};
	}
	return t_out;
}

std::optional<std::u8string> document::get_raw(std::u8string_view p_section, std::u8string_view p_key) const
{
	itemProxy<const keyedValue> t_entry = find_key(p_section, p_key);
	if(!t_entry)
	{
		return {};
	}
	return t_entry->value();
}

std::optional<std::u8string> document::get_localized(std::u8string_view p_section, std::u8string_view p_key, std::u8string_view p_tag) const
{
	std::u8string t_tagged{p_key};
	t_tagged.push_back(u8'[');
	t_tagged.append(p_tag);
	t_tagged.push_back(u8']');

	if(has_key(p_section, t_tagged))
	{
		return get(p_section, t_tagged);
	}
	return get(p_section, p_key);
}

std::optional<bool> document::get_bool(std::u8string_view p_section, std::u8string_view p_key) const
{
	const std::optional<std::u8string> t_value = get(p_section, p_key);
	if(!t_value.has_value())
	{
		return {};
	}
	return to_boolean(t_value.value());
}


//---- spans ----

std::optional<span> document::section_span(std::u8string_view p_section) const
{
	itemProxy<const section> t_section = find_section(p_section);
	if(!t_section || !t_section->location().is_set())
	{
		return {};
	}
	return t_section->location();
}

std::optional<span> document::key_span(std::u8string_view p_section, std::u8string_view p_key) const
{
	itemProxy<const keyedValue> t_entry = find_key(p_section, p_key);
	if(!t_entry || !t_entry->key_span().is_set())
	{
		return {};
	}
	return t_entry->key_span();
}

std::optional<span> document::value_span(std::u8string_view p_section, std::u8string_view p_key) const
{
	itemProxy<const keyedValue> t_entry = find_key(p_section, p_key);
	if(!t_entry || !t_entry->value_span().is_set())
	{
		return {};
	}
	return t_entry->value_span();
}

std::optional<span> document::entry_span(std::u8string_view p_section, std::u8string_view p_key) const
{
	itemProxy<const keyedValue> t_entry = find_key(p_section, p_key);
	if(!t_entry || !t_entry->location().is_set())
	{
		return {};
	}
	return t_entry->location();
}


//---- modification ----

Error document::add_section(std::u8string_view p_section)
{
	if(find_section(p_section))
	{
		return Error::DuplicateSection;
	}

	itemProxy<section> t_section = section::make();
	t_section->set_name(p_section, m_dialect.has(Flag::FoldSections));
	push_section(t_section);
	return Error::None;
}

Error document::set(std::u8string_view p_section, std::u8string_view p_key, std::u8string_view p_value)
{
	itemProxy<section> t_section = find_section(p_section);
	if(!t_section)
	{
		return Error::NoSection;
	}

	const std::u8string t_key = entry_key(p_key);
	itemProxy<keyedValue> t_entry = t_section->find_key(t_key);
	if(t_entry)
	{
		t_entry->set_value(p_value);
	}
	else
	{
		t_entry = keyedValue::make();
		t_entry->set_name(p_key, m_dialect.has(Flag::FoldKeys));
		t_entry->set_value(p_value);
		t_section->push_back(t_entry);
	}
	invalidate();
	return Error::None;
}

bool document::remove_key(std::u8string_view p_section, std::u8string_view p_key)
{
	itemProxy<section> t_section = find_section(p_section);
	if(!t_section || !t_section->erase(entry_key(p_key)))
	{
		return false;
	}
	invalidate();
	return true;
}

bool document::remove_section(std::u8string_view p_section)
{
	const std::u8string t_key = section_key(p_section);
	if(is_default(t_key))
	{
		if(m_defaults->empty())
		{
			return false;
		}
		m_defaults->clear();
		invalidate();
		return true;
	}

	const auto t_it = m_index.find(t_key);
	if(t_it == m_index.end())
	{
		return false;
	}

	m_sections.erase(m_sections.begin() + static_cast<std::ptrdiff_t>(t_it->second));
	m_index.clear();
	for(uintptr_t i = 0; i < m_sections.size(); ++i)
	{
		m_index.emplace(m_sections[i]->key(), i);
	}
	invalidate();
	return true;
}


//---- private ----

std::u8string document::section_key(std::u8string_view p_section) const
{
	return m_dialect.has(Flag::FoldSections) ? fold_case(p_section) : std::u8string{p_section};
}

std::u8string document::entry_key(std::u8string_view p_key) const
{
	return m_dialect.has(Flag::FoldKeys) ? fold_case(p_key) : std::u8string{p_key};
}

bool document::is_default(std::u8string_view p_sectionKey) const
{
	return p_sectionKey == section_key(m_dialect.default_section);
}

itemProxy<const keyedValue> document::lookup(const section& p_section, std::u8string_view p_key) const
{
	itemProxy<const keyedValue> t_entry = p_section.find_key(p_key);
	if(t_entry || &p_section == m_defaults.get())
	{
		return t_entry;
	}
	return m_defaults->find_key(p_key);
}

void document::push_section(const itemProxy<section>& p_section)
{
	m_index.emplace(p_section->key(), m_sections.size());
	m_sections.push_back(p_section);
}

void document::reset_content()
{
	m_sections.clear();
	m_index.clear();
	m_defaults = section::make();
	m_defaults->set_name(m_dialect.default_section, m_dialect.has(Flag::FoldSections));
}

void document::invalidate() const
{
	m_defaults->invalidate();
	for(const itemProxy<section>& t_section : m_sections)
	{
		t_section->invalidate();
	}
}

} //namespace sini
