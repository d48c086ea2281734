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
#include <string_view>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <type_traits>

#include <CoreLib/string/core_string_numeric.hpp>
#include <CoreLib/core_type.hpp>

#include "sini_string.hpp"

namespace sini
{

//======== ======== ======== Type Handling ======== ======== ========

class item;
class section;
class keyedValue;


///	\brief Indicates the underlying type of item
enum class ItemType: uint8_t
{
	section		= 0x01,	//!< Named group of key/value entries
	key_value	= 0x02,	//!< Contains key and value
};

namespace _p
{
template <typename T> struct valid_sini_proxy	{ static constexpr bool value = false; };
template <> struct valid_sini_proxy<item>		{ static constexpr bool value = true; };
template <> struct valid_sini_proxy<section>	{ static constexpr bool value = true; };
template <> struct valid_sini_proxy<keyedValue>	{ static constexpr bool value = true; };

template<typename T>
concept is_valid_sini_proxy_c = valid_sini_proxy<std::remove_const_t<T>>::value;
} //namespace _p

/// \brief handles ownership model for items in a document
/// \tparam T - Item type
template<_p::is_valid_sini_proxy_c T>
using itemProxy = std::shared_ptr<T>;


//======== ======== ======== Source location ======== ======== ========

///	\brief
///		Location of a token in the source text
///
///	\note
///		1. [begin, end) is a byte range, end_column is one past the last character
///		2. Columns count code points, UTF-8 continuation bytes do not advance them
///		3. line == 0 means the span is not tied to the source (ex. items added after loading)
struct span
{
	uint64_t begin		= 0;	//!< Byte offset of the first character
	uint64_t end		= 0;	//!< Byte offset one past the last character
	uint64_t line		= 0;	//!< Line of the first character, count starts from 1
	uint64_t column		= 0;	//!< Column of the first character, count starts from 1
	uint64_t end_line	= 0;	//!< Line of the last character
	uint64_t end_column	= 0;	//!< Column one past the last character

	[[nodiscard]] inline bool		is_set	() const { return line != 0; }
	[[nodiscard]] inline bool		empty	() const { return begin == end; }
	[[nodiscard]] inline uint64_t	size	() const { return end - begin; }

	///	\brief Grows this span to also cover p_other
	void merge(const span& p_other);
};


//======== ======== ======== Common data model ======== ======== ========
namespace _p
{

class Danger_Action;

/// \brief Wraps the property of an item having a name
class NamedItem
{
protected:
	NamedItem() = default;

	std::u8string _name;	//!< As written in the source
	std::u8string _key;		//!< Name used for lookups
public:
	[[nodiscard]] const std::u8string&	name		() const;
	[[nodiscard]] std::u8string_view	view_name	() const;
	[[nodiscard]] const std::u8string&	key			() const;

	///	\param[in] p_fold - if true, the lookup key is \ref sini::fold_case of the name
	void set_name(std::u8string_view p_name, bool p_fold);
};

} //namespace _p


//======== ======== ======== Items ======== ======== ========

/// \brief Abstract class representing an entity of a document
class item
{
protected:
	item(ItemType p_type);

public:
	virtual ~item();

	[[nodiscard]] ItemType		type		() const;
	[[nodiscard]] uint64_t		line		() const;
	[[nodiscard]] uint64_t		column		() const;
	[[nodiscard]] const span&	location	() const;

	void set_location	(const span& p_span);
	void merge_location	(const span& p_span);

private:
	item(const item&)				= delete;
	item(item&&)					= delete;
	item& operator = (const item&)	= delete;
	item& operator = (item&&)		= delete;

	const ItemType _type;
	span _span;
};


///	\brief
///		Contains a key and its value
///
///	\note
///		1. \ref location covers the whole entry, from the key to the last line contributing to the value
///		2. The value is kept raw, interpolation results are cached separately and can be dropped with \ref invalidate
///		3. Cache access is synchronized, a value can be resolved from several threads at once
class keyedValue final: public item, public _p::NamedItem
{
	friend _p::Danger_Action;
private:
	std::u8string	_value;
	span			m_keySpan;
	span			m_valueSpan;

	mutable std::mutex						m_cacheLock;
	mutable std::optional<std::u8string>	m_effective;

private:
	keyedValue();

	[[nodiscard]] bool fetch_effective(std::u8string& p_out) const;
	void store_effective(std::u8string_view p_value) const;

public:
	[[nodiscard]] static itemProxy<keyedValue> make();
	[[nodiscard]] static constexpr ItemType static_type(){ return ItemType::key_value; }

	[[nodiscard]] const std::u8string&	value		() const;
	[[nodiscard]] std::u8string_view	view_value	() const;

	template<core::char_conv_dec_supported_c T>
	[[nodiscard]] inline ::core::from_chars_result<T> value_as_num() const { return core::from_chars<T>(std::u8string_view{_value}); };
	[[nodiscard]] inline std::optional<bool> value_as_bool() const { return to_boolean(_value); }

	void set_value(std::u8string_view p_text);

	[[nodiscard]] const span& key_span	() const;
	[[nodiscard]] const span& value_span() const;

	void set_key_span	(const span& p_span);
	void set_value_span	(const span& p_span);
	void merge_value_span(const span& p_span);

	void invalidate() const;
};


///	\brief
///		Named, ordered group of key/value entries
///
///	\note
///		1. Lookups expect the key in its lookup form (see \ref _p::NamedItem::key)
///		2. Keys are unique within a section, \ref push_back does not check it
class section final: public item, public _p::NamedItem
{
public:
	using entry_list		= std::vector<itemProxy<keyedValue>>;
	using const_iterator	= entry_list::const_iterator;

private:
	entry_list									_entries;
	std::unordered_map<std::u8string, uintptr_t>	_index;

private:
	section();

public:
	[[nodiscard]] static itemProxy<section> make();
	[[nodiscard]] static constexpr ItemType static_type() { return ItemType::section; }

	[[nodiscard]] uintptr_t			size	() const;
	[[nodiscard]] bool				empty	() const;
	[[nodiscard]] const_iterator	begin	() const;
	[[nodiscard]] const_iterator	end		() const;
	[[nodiscard]] itemProxy<const keyedValue> operator [] (uintptr_t p_index) const;

	[[nodiscard]] itemProxy<keyedValue>			find_key(std::u8string_view p_key);
	[[nodiscard]] itemProxy<const keyedValue>	find_key(std::u8string_view p_key) const;

	void push_back	(const itemProxy<keyedValue>& p_item);
	bool erase		(std::u8string_view p_key);
	void clear		();
	void invalidate	() const;
};


//======== ======== ======== Inline optimizations ======== ======== ========

namespace _p
{
//======== ======== class NamedItem
inline const std::u8string&	NamedItem::name		() const { return _name; }
inline std::u8string_view	NamedItem::view_name() const { return _name; }
inline const std::u8string&	NamedItem::key		() const { return _key; }

inline void NamedItem::set_name(std::u8string_view p_name, bool p_fold)
{
	_name = p_name;
	_key = p_fold ? fold_case(p_name) : _name;
}

} //namespace _p

//======== ======== class item
inline item::item(ItemType p_type): _type(p_type) {}

inline ItemType		item::type			() const				{ return _type; }
inline uint64_t		item::line			() const				{ return _span.line; }
inline uint64_t		item::column		() const				{ return _span.column; }
inline const span&	item::location		() const				{ return _span; }
inline void			item::set_location	(const span& p_span)	{ _span = p_span; }
inline void			item::merge_location(const span& p_span)	{ _span.merge(p_span); }

//======== ======== class keyedValue
inline keyedValue::keyedValue(): item(static_type()), NamedItem() {}
inline itemProxy<keyedValue> keyedValue::make() { return itemProxy<keyedValue>{new keyedValue()}; }

inline const std::u8string&	keyedValue::value		() const { return _value; }
inline std::u8string_view	keyedValue::view_value	() const { return _value; }

inline const span&	keyedValue::key_span		() const				{ return m_keySpan; }
inline const span&	keyedValue::value_span		() const				{ return m_valueSpan; }
inline void			keyedValue::set_key_span	(const span& p_span)	{ m_keySpan = p_span; }
inline void			keyedValue::set_value_span	(const span& p_span)	{ m_valueSpan = p_span; }
inline void			keyedValue::merge_value_span(const span& p_span)	{ m_valueSpan.merge(p_span); }

//======== ======== class section
inline section::section(): item(static_type()), NamedItem() {}
inline itemProxy<section> section::make() { return itemProxy<section>{new section()}; }

inline uintptr_t					section::size		() const					{ return _entries.size(); }
inline bool							section::empty		() const					{ return _entries.empty(); }
inline section::const_iterator		section::begin		() const					{ return _entries.cbegin(); }
inline section::const_iterator		section::end		() const					{ return _entries.cend(); }
inline itemProxy<const keyedValue>	section::operator []	(uintptr_t p_index) const	{ return _entries[p_index]; }

} //namespace sini
