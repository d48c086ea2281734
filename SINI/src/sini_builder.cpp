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

#include "sini_builder.hpp"

#include <string>
#include <utility>

#include "sini_danger_act_p.hpp"

namespace sini::format
{

static std::u8string Quoted(std::u8string_view p_prefix, std::u8string_view p_name)
{
	std::u8string t_out{p_prefix};
	t_out.push_back(u8'`');
	t_out.append(p_name);
	t_out.push_back(u8'`');
	return t_out;
}

static _p::_Error_Context& Describe(BuilderFlow& p_flow, Error p_code, const span& p_location, std::u8string_view p_subject, std::u8string&& p_message)
{
	_p::_Error_Context& t_error = _p::Danger_Action::publicError(*p_flow.m_warnDef._error_context);
	t_error.clear();
	t_error.SetError(p_code, p_subject, std::move(p_message));
	t_error.set_location(p_location);
	return t_error;
}

static Error OnSection(BuilderFlow& p_flow, const event& p_event)
{
	document& t_doc = p_flow.m_document;

	//strict diagnostics only hold the failure, a nested header is still a valid header
	if(p_event.nested && !p_flow.m_dialect.strict())
	{
		Describe(p_flow, Error::SectionInValue, p_event.location, p_event.name, Quoted(u8"section header inside a multi-line value ", p_event.name));

		switch(p_flow.m_warnDef.Notify())
		{
			case warningBehaviour::Default:
			case warningBehaviour::Continue:
			case warningBehaviour::Accept:
				p_flow.m_warnDef.Record(Severity::Warning);
				break;
			case warningBehaviour::Discard:
				//header ignored, following keys stay where they were
				p_flow.m_warnDef.Record(Severity::Warning);
				return Error::None;
			case warningBehaviour::Abort:
			default:
				p_flow.m_warnDef.Record(Severity::Fatal);
				return Error::SectionInValue;
		}
	}

	p_flow.m_discardSection = false;

	if(_p::Danger_Action::is_default(t_doc, _p::Danger_Action::section_key(t_doc, p_event.name)))
	{
		itemProxy<section> t_defaults = _p::Danger_Action::defaults(t_doc);
		if(!t_defaults->location().is_set())
		{
			t_defaults->set_location(p_event.location);
		}
		p_flow.m_current = t_defaults;
		return Error::None;
	}

	itemProxy<section> t_existing = t_doc.find_section(p_event.name);
	if(t_existing)
	{
		Describe(p_flow, Error::DuplicateSection, p_event.location, p_event.name, Quoted(u8"duplicate section ", p_event.name))
			.set_related(t_existing->location());

		switch(p_flow.m_warnDef.Notify())
		{
			case warningBehaviour::Default:
			case warningBehaviour::Continue:
			case warningBehaviour::Accept:
				p_flow.m_warnDef.Record(Severity::Warning);
				p_flow.m_current = t_existing;
				return Error::None;
			case warningBehaviour::Discard:
				p_flow.m_warnDef.Record(Severity::Warning);
				p_flow.m_current.reset();
				p_flow.m_discardSection = true;
				return Error::None;
			case warningBehaviour::Abort:
			default:
				p_flow.m_warnDef.Record(Severity::Fatal);
				return Error::DuplicateSection;
		}
	}

	itemProxy<section> t_section = section::make();
	t_section->set_name(p_event.name, p_flow.m_dialect.has(Flag::FoldSections));
	t_section->set_location(p_event.location);
	_p::Danger_Action::push_section(t_doc, t_section);
	p_flow.m_current = t_section;
	return Error::None;
}

static Error OnKeyValue(BuilderFlow& p_flow, const event& p_event)
{
	if(p_flow.m_discardSection)
	{
		return Error::None;
	}

	itemProxy<section> t_target = p_flow.m_current;
	if(!t_target)
	{
		if(p_flow.m_dialect.has(Flag::KeysBeforeSection))
		{
			t_target = _p::Danger_Action::defaults(p_flow.m_document);
		}
		else
		{
			Describe(p_flow, Error::MissingSectionHeader, p_event.location, p_event.name, Quoted(u8"no section header before option ", p_event.name));

			switch(p_flow.m_warnDef.Notify())
			{
				case warningBehaviour::Accept:
					p_flow.m_warnDef.Record(Severity::Warning);
					t_target = _p::Danger_Action::defaults(p_flow.m_document);
					break;
				case warningBehaviour::Default:
				case warningBehaviour::Continue:
				case warningBehaviour::Discard:
					p_flow.m_warnDef.Record(Severity::Warning);
					return Error::None;
				case warningBehaviour::Abort:
				default:
					p_flow.m_warnDef.Record(Severity::Fatal);
					return Error::MissingSectionHeader;
			}
		}
	}

	if(p_event.unterminated)
	{
		Describe(p_flow, Error::UnterminatedContinuation, p_event.location, p_event.name, Quoted(u8"input ended inside the continued value of ", p_event.name));

		switch(p_flow.m_warnDef.Notify())
		{
			case warningBehaviour::Default:
			case warningBehaviour::Continue:
			case warningBehaviour::Accept:
				p_flow.m_warnDef.Record(Severity::Warning);
				break;
			case warningBehaviour::Discard:
				p_flow.m_warnDef.Record(Severity::Warning);
				return Error::None;
			case warningBehaviour::Abort:
			default:
				p_flow.m_warnDef.Record(Severity::Fatal);
				return Error::UnterminatedContinuation;
		}
	}

	const bool t_fold = p_flow.m_dialect.has(Flag::FoldKeys);

	itemProxy<keyedValue> t_existing = t_target->find_key(t_fold ? fold_case(p_event.name) : std::u8string{p_event.name});
	if(t_existing)
	{
		Describe(p_flow, Error::DuplicateKey, p_event.name_span, p_event.name, Quoted(u8"duplicate option ", p_event.name))
			.set_related(t_existing->key_span());

		switch(p_flow.m_warnDef.Notify())
		{
			case warningBehaviour::Default:
			case warningBehaviour::Continue:
			case warningBehaviour::Accept:
				p_flow.m_warnDef.Record(Severity::Warning);
				t_existing->set_value(p_event.value);
				t_existing->merge_location(p_event.location);
				t_existing->merge_value_span(p_event.value_span);
				return Error::None;
			case warningBehaviour::Discard:
				p_flow.m_warnDef.Record(Severity::Warning);
				return Error::None;
			case warningBehaviour::Abort:
			default:
				p_flow.m_warnDef.Record(Severity::Fatal);
				return Error::DuplicateKey;
		}
	}

	itemProxy<keyedValue> t_item = keyedValue::make();
	t_item->set_name		(p_event.name, t_fold);
	t_item->set_value		(p_event.value);
	t_item->set_location	(p_event.location);
	t_item->set_key_span	(p_event.name_span);
	t_item->set_value_span	(p_event.value_span);
	t_target->push_back(t_item);
	return Error::None;
}

static Error OnMalformed(BuilderFlow& p_flow, const event& p_event)
{
	if(!p_event.unrecoverable && !p_flow.m_dialect.strict() && p_flow.m_dialect.has(Flag::MalformedAsComment))
	{
		return Error::None;
	}

	Describe(p_flow, Error::MalformedLine, p_event.location, p_event.name, std::u8string{p_event.message});

	switch(p_flow.m_warnDef.Notify())
	{
		case warningBehaviour::Continue:
		case warningBehaviour::Accept:
		case warningBehaviour::Discard:
			p_flow.m_warnDef.Record(Severity::Warning);
			return Error::None;
		case warningBehaviour::Default:
			if(!p_event.unrecoverable)
			{
				p_flow.m_warnDef.Record(Severity::Warning);
				return Error::None;
			}
			[[fallthrough]];
		case warningBehaviour::Abort:
		default:
			p_flow.m_warnDef.Record(Severity::Fatal);
			return Error::MalformedLine;
	}
}

Error build_event(const event& p_event, void* p_context)
{
	BuilderFlow& t_flow = *reinterpret_cast<BuilderFlow*>(p_context);

	switch(p_event.kind)
	{
		case EventKind::Section:
			return OnSection(t_flow, p_event);
		case EventKind::KeyValue:
			return OnKeyValue(t_flow, p_event);
		case EventKind::Malformed:
			return OnMalformed(t_flow, p_event);
		default:
			break;
	}
	return Error::UnknownInternal;
}

} //namespace sini::format
