#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include "bytes.hpp"
#include "endec.hpp"
#include "utf8.hpp"
#include "utf16.hpp"
#include "detail/exceptions.hpp"
namespace xcodec
{
namespace utf32
{
	struct utf32_options
	{
		//without a byte-order mark detect falls back to big-endian
		byte_order byte_order_ = byte_order::detect;
		bool code_points_ = false;
	};

	typedef utf8::decoded_text decoded_text;

	//units above U+10FFFF and a trailing partial unit each give one U+FFFD
	static inline decoded_text decode_bytes(const byte_sequence &bytes, const utf32_options &options = {})
	{
		const uint8_t *ptr = bytes.data();
		std::size_t len = bytes.size();
		bool little_endian = options.byte_order_ == byte_order::little;

		if (len >= 4)
		{
			uint32_t bom = endec::get_uint<uint32_t>(ptr, 4, false);
			if (options.byte_order_ == byte_order::detect && (bom == 0x0000FEFF || bom == 0xFFFE0000))
			{
				little_endian = bom == 0xFFFE0000;
				ptr += 4;
				len -= 4;
			}
			else if (bom == (little_endian ? 0xFFFE0000 : 0x0000FEFF))
			{
				ptr += 4;
				len -= 4;
			}
		}

		std::vector<uint32_t> code_points;
		code_points.reserve(len / 4 + 1);
		for (std::size_t i = 0; i + 3 < len; i += 4)
		{
			uint32_t value = endec::get_uint<uint32_t>(ptr + i, 4, little_endian);
			code_points.push_back(value > utf8::max_code_point ? utf8::replacement_char : value);
		}
		if (len % 4)
			code_points.push_back(utf8::replacement_char);

		return utf8::make_decoded_text(std::move(code_points), options.code_points_);
	}

	static inline byte_sequence encode(const std::vector<uint32_t> &code_points, bool little_endian = false, bool add_bom = false)
	{
		byte_sequence bytes((code_points.size() + (add_bom ? 1 : 0)) * 4);
		uint8_t *ptr = bytes.data();
		if (add_bom)
		{
			endec::put_uint<uint32_t>(ptr, 0xFEFF, little_endian);
			ptr += 4;
		}
		for (auto &itr : code_points)
		{
			if (itr > utf8::max_code_point)
				throw invalid_code_point(itr, "Invalid codepoint: " + std::to_string(itr));
			endec::put_uint<uint32_t>(ptr, itr, little_endian);
			ptr += 4;
		}
		return bytes;
	}

	//surrogate pairs are joined, a lone surrogate keeps its own value
	static inline byte_sequence encode(const std::u16string &text, bool little_endian = false, bool add_bom = false)
	{
		std::vector<uint32_t> code_points;
		code_points.reserve(text.size());
		for (std::size_t i = 0; i < text.size(); i++)
		{
			uint32_t unit = text[i];
			if (utf16::is_high_surrogate(unit) && i + 1 < text.size() && utf16::is_low_surrogate(text[i + 1]))
			{
				uint32_t low = text[++i];
				code_points.push_back(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
				continue;
			}
			code_points.push_back(unit);
		}
		return encode(code_points, little_endian, add_bom);
	}
}
}
