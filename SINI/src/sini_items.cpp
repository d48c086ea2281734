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

#include <SINI/sini_items.hpp>

#include <cstddef>


namespace sini
{

//======== ======== class span
void span::merge(const span& p_other)
{
	if(!p_other.is_set())
	{
		return;
	}
	if(!is_set())
	{
		*this = p_other;
		return;
	}

	if(p_other.begin < begin)
	{
		begin	= p_other.begin;
		line	= p_other.line;
		column	= p_other.column;
	}
	if(p_other.end > end)
	{
		end			= p_other.end;
		end_line	= p_other.end_line;
		end_column	= p_other.end_column;
	}
}

//======== ======== class item
item::~item() = default;

//======== ======== class keyedValue
void keyedValue::set_value(std::u8string_view p_text)
{
	_value = p_text;
	invalidate();
}

bool keyedValue::fetch_effective(std::u8string& p_out) const
{
	std::lock_guard t_lock{m_cacheLock};
	if(m_effective.has_value())
	{
		p_out = m_effective.value();
		return true;
	}
	return false;
}

void keyedValue::store_effective(std::u8string_view p_value) const
{
	std::lock_guard t_lock{m_cacheLock};
	m_effective.emplace(p_value);
}

void keyedValue::invalidate() const
{
	std::lock_guard t_lock{m_cacheLock};
	m_effective.reset();
}

//======== ======== class section
itemProxy<keyedValue> section::find_key(std::u8string_view p_key)
{
	const auto t_it = _index.find(std::u8string{p_key});
	if(t_it == _index.end())
	{
		return {};
	}
	return _entries[t_it->second];
}

itemProxy<const keyedValue> section::find_key(std::u8string_view p_key) const
{
	const auto t_it = _index.find(std::u8string{p_key});
	if(t_it == _index.end())
	{
		return {};
	}
	return _entries[t_it->second];
}

void section::push_back(const itemProxy<keyedValue>& p_item)
{
	_index.emplace(p_item->key(), _entries.size());
	_entries.push_back(p_item);
}

bool section::erase(std::u8string_view p_key)
{
	const auto t_it = _index.find(std::u8string{p_key});
	if(t_it == _index.end())
	{
		return false;
	}

	const uintptr_t t_pos = t_it->second;
	_entries.erase(_entries.begin() + static_cast<std::ptrdiff_t>(t_pos));
	_index.erase(t_it);

	for(auto& t_entry : _index)
	{
		if(t_entry.second > t_pos) --t_entry.second;
	}
	return true;
}

void section::clear()
{
	_entries.clear();
	_index.clear();
}

void section::invalidate() const
{
	for(const itemProxy<keyedValue>& t_entry : _entries)
	{
		t_entry->invalidate();
	}
}

} //namespace sini
