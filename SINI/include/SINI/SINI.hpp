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


//Notes:
//	1. The library does not read files, text arrives already in memory as UTF-8
//	2. Errors are never thrown, every fallible operation returns an \ref sini::Error

//---- Standard Libraries ----
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

//---- Other ----
#include <CoreLib/string/core_string_numeric.hpp>
#include <CoreLib/core_type.hpp>

#include "sini_dialect.hpp"
#include "sini_items.hpp"
#include "sini_string.hpp"

///	\n
//
namespace sini
{

constexpr uint16_t __SINI_API_VERSION	= 1;	//!< Latest supported version of the API

constexpr uint64_t noline = 0;		//!< Used to indicate an error context that is not tied to a line in the document

enum class Error: uint8_t
{
	None						= 0x00,	//!< No error
	MalformedLine				= 0x01,	//!< A line could not be interpreted: missing delimiter, empty key, bad or unterminated section header
	DuplicateSection			= 0x02,	//!< A section header repeats the name of a previous one. \ref Error_Context::related points to the first header
	DuplicateKey				= 0x03,	//!< A key repeats within a section. \ref Error_Context::related points to the first use
	UnterminatedContinuation	= 0x04,	//!< Input ended while a backslash continuation was still expecting a line
	MissingSectionHeader		= 0x05,	//!< A key appeared before any section header and the dialect does not accept it
	SectionInValue				= 0x06,	//!< A section header is indented inside a multi-line value, it closes the value

	InterpolationMissingKey		= 0x10,	//!< A reference names a key or section that does not exist
	InterpolationCycle			= 0x11,	//!< A value depends on itself, \ref Error_Context::chain holds the references followed
	InterpolationDepthExceeded	= 0x12,	//!< References nest deeper than \ref dialect::max_interpolation_depth, \ref Error_Context::extra_info().interpolation_depth is used
	InterpolationSyntax			= 0x13,	//!< A placeholder is not well formed

	NoSection					= 0x20,	//!< The requested section does not exist
	NoKey						= 0x21,	//!< The requested key does not exist in the section nor in the default section

	UnknownInternal				= 0x80,	//!< An unclassified internal error ocured
};

/// \brief Type of control flow to adopt when using user mode error reporting
enum class warningBehaviour: uint8_t
{
	Default		= 0x00,	//!< Chose best in context
	Continue	= 0x01,	//!< Chose best in context between accept or discard as long as parsing continues
	Accept		= 0x02,	//!< Accepts the item, as if it was ok
	Discard		= 0x03,	//!< Discards the item, as if it didn't exist
	Abort		= 0xFF	//!< Fails the parsing
};

CORE_MAKE_ENUM_ORDERABLE(warningBehaviour);

/// \brief How a diagnostic affected the parse
enum class Severity: uint8_t
{
	Warning	= 0x00,	//!< Parsing continued
	Fatal	= 0x01,	//!< Parsing stopped on this diagnostic
};

namespace _p
{
	class Danger_Action;

	struct _Error_Context
	{
	public:
		union ExtraInfo_t
		{
			struct
			{
				uint16_t	limit;		//!< Configured maximum depth. Used when \ref error_code = \ref sini::Error::InterpolationDepthExceeded
			} interpolation_depth;
		};

		void clear();

		inline Error								error_code	() const { return m_error_code; }
		inline Severity								severity	() const { return m_severity; }
		inline uint64_t								line		() const { return m_location.line; }
		inline uint64_t								column		() const { return m_location.column; }
		inline const span&							location	() const { return m_location; }
		inline const span&							related		() const { return m_related; }
		inline std::u8string_view					subject		() const { return m_subject; }
		inline std::u8string_view					message		() const { return m_message; }
		inline const std::vector<std::u8string>&	chain		() const { return m_chain; }
		inline ExtraInfo_t							extra_info	() const { return m_extra; }

		inline void set_location(const span& p_span) { m_location = p_span; }
		inline void set_related	(const span& p_span) { m_related = p_span; }

		void SetError				(Error p_code, std::u8string_view p_subject, std::u8string&& p_message);
		inline void SetChain		(std::vector<std::u8string>&& p_chain)	{ m_chain = std::move(p_chain); }
		inline void SetDepthLimit	(uint16_t p_limit)						{ m_extra.interpolation_depth.limit = p_limit; }
		inline void SetPlainError	(Error p_code)							{ m_error_code = p_code; }

		Error		m_error_code	= Error::None;		//!< Error code of type \ref sini::Error
		Severity	m_severity		= Severity::Warning;
		span		m_location;							//!< Where the error ocured, line is \ref sini::noline if the error is not associated to a line in the document
		span		m_related;							//!< Secondary location, ex. first use of a duplicated name
		ExtraInfo_t	m_extra{};

		std::u8string				m_subject;	//!< Name of the section or key the error is about
		std::u8string				m_message;	//!< Human readable description
		std::vector<std::u8string>	m_chain;	//!< References followed during interpolation, in order
	};

} //namespace _p


/// \brief Used to store an error context
class Error_Context: private _p::_Error_Context
{
	friend _p::Danger_Action;
public:
	using _p::_Error_Context::clear;
	using _p::_Error_Context::error_code;
	using _p::_Error_Context::severity;
	using _p::_Error_Context::line;
	using _p::_Error_Context::column;
	using _p::_Error_Context::location;
	using _p::_Error_Context::related;
	using _p::_Error_Context::subject;
	using _p::_Error_Context::message;
	using _p::_Error_Context::chain;
	using _p::_Error_Context::extra_info;
};

///	\brief
///		The default warning handler
//
warningBehaviour DefaultWarningHandler(const Error_Context&, void*);

using _warning_callback = warningBehaviour (*)(const Error_Context&, void*);


///	\brief
///		Parsed INI document
///
///	\note
///		1. Section and key arguments are given as written, folding is applied according to the dialect used to load
///		2. The default section is not listed by \ref sections, but can be addressed by its name
///		3. Reads are thread safe, modifications are not
class document
{
	friend _p::Danger_Action;
public:
	using section_list = std::vector<itemProxy<section>>;

public:
	document();
	~document() = default;

	document(const document&)				= delete;
	document& operator = (const document&)	= delete;
	///	\note The moved from document is left empty, keeping its dialect
	document(document&& p_other);
	document& operator = (document&& p_other);

	[[nodiscard]] inline const	dialect&						config		() const	{ return m_dialect; }
	[[nodiscard]] inline		Error_Context&					last_error	()			{ return m_last_error; }
	[[nodiscard]] inline const	Error_Context&					last_error	() const	{ return m_last_error; }
	[[nodiscard]] inline const	std::vector<Error_Context>&		diagnostics	() const	{ return m_diagnostics; }
	[[nodiscard]] inline const	section_list&					section_items() const	{ return m_sections; }
	[[nodiscard]] inline		itemProxy<const section>		defaults	() const	{ return m_defaults; }

	void clear();

	///	\brief Parses p_text, replacing the current content
	///	\return
	///		Error::None if the document was built, in which case \ref diagnostics holds the warnings.
	///		Otherwise the document is left empty and the last entry of \ref diagnostics describes the failure.
	Error load(std::u8string_view p_text, const dialect& p_dialect = {}, _warning_callback p_warning_callback = nullptr, void* p_user_context = nullptr);

	//---- structure ----
	[[nodiscard]] std::vector<std::u8string_view>	sections	() const;
	[[nodiscard]] std::vector<std::u8string_view>	keys		(std::u8string_view p_section) const;
	[[nodiscard]] bool								has_section	(std::u8string_view p_section) const;
	[[nodiscard]] bool								has_key		(std::u8string_view p_section, std::u8string_view p_key) const;

	[[nodiscard]] itemProxy<section>			find_section(std::u8string_view p_section);
	[[nodiscard]] itemProxy<const section>		find_section(std::u8string_view p_section) const;
	[[nodiscard]] itemProxy<const keyedValue>	find_key	(std::u8string_view p_section, std::u8string_view p_key) const;

	//---- values ----
	[[nodiscard]] std::optional<std::u8string> get			(std::u8string_view p_section, std::u8string_view p_key) const;
	[[nodiscard]] std::optional<std::u8string> get_raw		(std::u8string_view p_section, std::u8string_view p_key) const;
	[[nodiscard]] std::optional<std::u8string> get_localized(std::u8string_view p_section, std::u8string_view p_key, std::u8string_view p_tag) const;
	[[nodiscard]] std::optional<bool>			get_bool	(std::u8string_view p_section, std::u8string_view p_key) const;

	template<core::char_conv_dec_supported_c T>
	[[nodiscard]] std::optional<T> get_num(std::u8string_view p_section, std::u8string_view p_key) const;

	///	\brief Same as \ref get, but reports why a value could not be produced
	Error resolve(std::u8string_view p_section, std::u8string_view p_key, std::u8string& p_out, Error_Context* p_error = nullptr) const;

	//---- spans ----
	[[nodiscard]] std::optional<span> section_span	(std::u8string_view p_section) const;
	[[nodiscard]] std::optional<span> key_span		(std::u8string_view p_section, std::u8string_view p_key) const;
	[[nodiscard]] std::optional<span> value_span	(std::u8string_view p_section, std::u8string_view p_key) const;
	[[nodiscard]] std::optional<span> entry_span	(std::u8string_view p_section, std::u8string_view p_key) const;

	//---- modification ----
	Error add_section	(std::u8string_view p_section);
	Error set			(std::u8string_view p_section, std::u8string_view p_key, std::u8string_view p_value);
	bool remove_key		(std::u8string_view p_section, std::u8string_view p_key);
	bool remove_section	(std::u8string_view p_section);

private:
	[[nodiscard]] std::u8string section_key	(std::u8string_view p_section) const;
	[[nodiscard]] std::u8string entry_key	(std::u8string_view p_key) const;
	[[nodiscard]] bool			is_default	(std::u8string_view p_sectionKey) const;

	[[nodiscard]] itemProxy<const keyedValue> lookup(const section& p_section, std::u8string_view p_key) const;

	void push_section(const itemProxy<section>& p_section);
	void reset_content();
	void invalidate() const;

private:
	dialect										m_dialect;		//!< Options the document was loaded with
	Error_Context								m_last_error;	//!< last error
	std::vector<Error_Context>					m_diagnostics;	//!< Everything reported during the last load
	section_list								m_sections;		//!< Sections in order of appearance, default section excluded
	std::unordered_map<std::u8string, uintptr_t>	m_index;		//!< Lookup key to position in m_sections
	itemProxy<section>							m_defaults;		//!< Default section, always present
};


//======== ======== ======== Inline optimizations ======== ======== ========

template<core::char_conv_dec_supported_c T>
std::optional<T> document::get_num(std::u8string_view p_section, std::u8string_view p_key) const
{
	const std::optional<std::u8string> t_value = get(p_section, p_key);
	if(!t_value.has_value())
	{
		return {};
	}

	const core::from_chars_result<T> t_num = core::from_chars<T>(std::u8string_view{t_value.value()});
	if(!t_num.has_value())
	{
		return {};
	}
	return t_num.value();
}

}	//namespace sini
