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

#include "SINI/SINI.hpp"

namespace sini::format
{

///	\brief
///		Computes the effective value of p_entry as seen from p_context
///
///	\param[in] p_context - section the value was requested from
///	\param[out] p_out - effective value, only written on success
///	\param[out] p_error - filled in when the value could not be produced
///
///	\note
///		1. Values inherited from the default section are expanded in the context of the requesting section
///		2. Results are cached on the value only when p_entry belongs to p_context
///		3. With \ref Interpolation::None the raw value is returned untouched
Error resolve(const document& p_document, const section& p_context, const keyedValue& p_entry, std::u8string& p_out, Error_Context& p_error);

} //namespace sini::format
