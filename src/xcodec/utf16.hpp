#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include "bytes.hpp"
#include "endec.hpp"
#include "utf8.hpp"
#include "detail/exceptions.hpp"
namespace xcodec
{
namespace utf16
{
	struct utf16_options
	{
		//without a byte-order mark detect falls back to big-endian
		byte_order byte_order_ = byte_order::detect;
		//keep lone surrogates instead of substituting U+FFFD
		bool allow_unpaired_ = false;
		bool code_points_ = false;
	};

	typedef utf8::decoded_text decoded_text;

	static inline bool is_high_surrogate(uint32_t unit)
	{
		return unit >= 0xD800 && unit <= 0xDBFF;
	}

	static inline bool is_low_surrogate(uint32_t unit)
	{
		return unit >= 0xDC00 && unit <= 0xDFFF;
	}

	/*
	Reads `bytes` as UTF-16. A leading mark in the selected order is
	skipped. A dangling odd byte is one U+FFFD, which also stands for
	a high surrogate left waiting for it unless allow_unpaired_ is set.
	*/
	static inline decoded_text decode_bytes(const byte_sequence &bytes, const utf16_options &options = {})
	{
		const uint8_t *ptr = bytes.data();
		std::size_t len = bytes.size();
		bool little_endian = options.byte_order_ == byte_order::little;

		if (len >= 2)
		{
			uint16_t bom = endec::get_uint<uint16_t>(ptr, 2, false);
			if (options.byte_order_ == byte_order::detect && (bom == 0xFEFF || bom == 0xFFFE))
			{
				little_endian = bom == 0xFFFE;
				ptr += 2;
				len -= 2;
			}
			else if (bom == (little_endian ? 0xFFFE : 0xFEFF))
			{
				ptr += 2;
				len -= 2;
			}
		}

		std::vector<uint32_t> code_points;
		code_points.reserve(len / 2 + 1);

		auto unpaired = [&](uint32_t unit)
		{
			code_points.push_back(options.allow_unpaired_ ? unit : utf8::replacement_char);
		};

		bool pending = false;
		uint32_t high = 0;
		for (std::size_t i = 0; i + 1 < len; i += 2)
		{
			uint32_t unit = endec::get_uint<uint16_t>(ptr + i, 2, little_endian);
			if (pending)
			{
				pending = false;
				if (is_low_surrogate(unit))
				{
					code_points.push_back(0x10000 + ((high - 0xD800) << 10) + (unit - 0xDC00));
					continue;
				}
				unpaired(high);
			}
			if (is_high_surrogate(unit))
			{
				pending = true;
				high = unit;
			}
			else if (is_low_surrogate(unit))
				unpaired(unit);
			else
				code_points.push_back(unit);
		}

		if (pending && (options.allow_unpaired_ || len % 2 == 0))
			unpaired(high);
		if (len % 2)
			code_points.push_back(utf8::replacement_char);

		return utf8::make_decoded_text(std::move(code_points), options.code_points_);
	}

	//code units are written as they are, lone surrogates included
	static inline byte_sequence encode(const std::u16string &text, bool little_endian = false, bool add_bom = false)
	{
		byte_sequence bytes((text.size() + (add_bom ? 1 : 0)) * 2);
		uint8_t *ptr = bytes.data();
		if (add_bom)
		{
			endec::put_uint<uint16_t>(ptr, 0xFEFF, little_endian);
			ptr += 2;
		}
		for (auto &itr : text)
		{
			endec::put_uint<uint16_t>(ptr, (uint16_t)itr, little_endian);
			ptr += 2;
		}
		return bytes;
	}

	static inline byte_sequence encode(const std::vector<uint32_t> &code_points, bool little_endian = false, bool add_bom = false)
	{
		std::u16string units;
		units.reserve(code_points.size());
		for (auto &itr : code_points)
		{
			if (itr > utf8::max_code_point)
				throw invalid_code_point(itr, "Invalid codepoint: " + std::to_string(itr));
			utf8::append_utf16(units, itr);
		}
		return encode(units, little_endian, add_bom);
	}
}
}
