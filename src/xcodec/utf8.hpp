#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include "bytes.hpp"
#include "detail/exceptions.hpp"
namespace xcodec
{
namespace utf8
{
	struct utf8_options
	{
		//throw instead of substituting U+FFFD
		bool strict_ = false;
		bool allow_overlong_ = false;
		bool allow_surrogates_ = false;
		//fill decoded_text::code_points_ instead of text_
		bool code_points_ = false;
		bool strip_bom_ = false;
	};

	struct decoded_text
	{
		std::u16string text_;
		std::vector<uint32_t> code_points_;
	};

	static constexpr uint32_t replacement_char = 0xFFFD;
	static constexpr uint32_t max_code_point = 0x10FFFF;

	static inline void append_utf16(std::u16string &text, uint32_t code_point)
	{
		if (code_point < 0x10000)
		{
			text.push_back((char16_t)code_point);
			return;
		}
		code_point -= 0x10000;
		text.push_back((char16_t)(0xD800 | (code_point >> 10)));
		text.push_back((char16_t)(0xDC00 | (code_point & 0x3FF)));
	}

	static inline decoded_text make_decoded_text(std::vector<uint32_t> &&code_points, bool as_code_points)
	{
		decoded_text result;
		if (as_code_points)
		{
			result.code_points_ = std::move(code_points);
			return result;
		}
		result.text_.reserve(code_points.size());
		for (auto &itr : code_points)
			append_utf16(result.text_, itr);
		return result;
	}

	/*
	Reads `bytes` as UTF-8.

	Table 3-7. Well-Formed UTF-8 Byte Sequences
	-----------------------------------------------------------------------------
	|  Code Points        | First Byte | Second Byte | Third Byte | Fourth Byte |
	|  U+0000..U+007F     |     00..7F |             |            |             |
	|  U+0080..U+07FF     |     C2..DF |      80..BF |            |             |
	|  U+0800..U+0FFF     |         E0 |      A0..BF |     80..BF |             |
	|  U+1000..U+CFFF     |     E1..EC |      80..BF |     80..BF |             |
	|  U+D000..U+D7FF     |         ED |      80..9F |     80..BF |             |
	|  U+E000..U+FFFF     |     EE..EF |      80..BF |     80..BF |             |
	|  U+10000..U+3FFFF   |         F0 |      90..BF |     80..BF |      80..BF |
	|  U+40000..U+FFFFF   |     F1..F3 |      80..BF |     80..BF |      80..BF |
	|  U+100000..U+10FFFF |         F4 |     80..BF* |     80..BF |      80..BF |
	-----------------------------------------------------------------------------

	allow_overlong_ opens C0/C1 leads and widens the E0 and F0 second byte
	to 80..BF; allow_surrogates_ widens the ED second byte to 80..BF.
	*F4 takes any continuation byte and a result above U+10FFFF becomes a
	single U+FFFD (or invalid_code_point when strict).

	A byte that cannot continue the current sequence yields one U+FFFD
	and is then read again as the start of a new sequence.
	*/
	static inline decoded_text decode_bytes(const byte_sequence &bytes, const utf8_options &options = {})
	{
		std::vector<uint32_t> code_points;
		code_points.reserve(bytes.size());

		const std::size_t len = bytes.size();
		std::size_t i = 0;
		if (options.strip_bom_ && len >= 3 &&
			bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF)
			i = 3;

		auto fail = [&](std::size_t offset)
		{
			if (options.strict_)
				throw invalid_utf8(offset);
			code_points.push_back(replacement_char);
		};

		while (i < len)
		{
			uint8_t lead = bytes[i];
			if (lead < 0x80)
			{
				code_points.push_back(lead);
				i++;
				continue;
			}

			int need = 0;
			uint8_t lower = 0x80;
			uint8_t upper = 0xBF;
			uint32_t code_point = 0;

			if (lead >= 0xC2 && lead <= 0xDF)
			{
				need = 1;
				code_point = lead & 0x1F;
			}
			else if ((lead == 0xC0 || lead == 0xC1) && options.allow_overlong_)
			{
				need = 1;
				code_point = lead & 0x1F;
			}
			else if (lead >= 0xE0 && lead <= 0xEF)
			{
				need = 2;
				code_point = lead & 0x0F;
				if (lead == 0xE0 && !options.allow_overlong_)
					lower = 0xA0;
				else if (lead == 0xED && !options.allow_surrogates_)
					upper = 0x9F;
			}
			else if (lead >= 0xF0 && lead <= 0xF4)
			{
				need = 3;
				code_point = lead & 0x07;
				if (lead == 0xF0 && !options.allow_overlong_)
					lower = 0x90;
			}
			else
			{
				fail(i);
				i++;
				continue;
			}

			std::size_t next = i + 1;
			bool ok = true;
			for (int k = 0; k < need; k++, next++)
			{
				if (next >= len || bytes[next] < lower || bytes[next] > upper)
				{
					ok = false;
					break;
				}
				lower = 0x80;
				upper = 0xBF;
				code_point = (code_point << 6) | (bytes[next] & 0x3F);
			}
			if (!ok)
			{
				fail(next);
				i = next;
				continue;
			}

			if (code_point > max_code_point)
			{
				if (options.strict_)
					throw invalid_code_point(code_point, "Invalid code point " + std::to_string(code_point));
				code_point = replacement_char;
			}
			code_points.push_back(code_point);
			i = next;
		}

		return make_decoded_text(std::move(code_points), options.code_points_);
	}

	//true iff strict decoding succeeds
	static inline bool check(const byte_sequence &bytes)
	{
		utf8_options options;
		options.strict_ = true;
		options.code_points_ = true;
		try
		{
			decode_bytes(bytes, options);
		}
		catch (const codec_error &)
		{
			return false;
		}
		return true;
	}

	static inline void append_utf8(byte_sequence &bytes, uint32_t code_point)
	{
		if (code_point < 0x80)
		{
			bytes.push_back((uint8_t)code_point);
		}
		else if (code_point < 0x800)
		{
			bytes.push_back((uint8_t)(0xC0 | (code_point >> 6)));
			bytes.push_back((uint8_t)(0x80 | (code_point & 0x3F)));
		}
		else if (code_point < 0x10000)
		{
			bytes.push_back((uint8_t)(0xE0 | (code_point >> 12)));
			bytes.push_back((uint8_t)(0x80 | ((code_point >> 6) & 0x3F)));
			bytes.push_back((uint8_t)(0x80 | (code_point & 0x3F)));
		}
		else if (code_point <= max_code_point)
		{
			bytes.push_back((uint8_t)(0xF0 | (code_point >> 18)));
			bytes.push_back((uint8_t)(0x80 | ((code_point >> 12) & 0x3F)));
			bytes.push_back((uint8_t)(0x80 | ((code_point >> 6) & 0x3F)));
			bytes.push_back((uint8_t)(0x80 | (code_point & 0x3F)));
		}
		else
			throw invalid_code_point(code_point, "Invalid codepoint: " + std::to_string(code_point));
	}

	static inline byte_sequence encode(const std::vector<uint32_t> &code_points)
	{
		byte_sequence bytes;
		bytes.reserve(code_points.size());
		for (auto &itr : code_points)
			append_utf8(bytes, itr);
		return bytes;
	}

	//paired surrogates are joined, a lone one is written as three bytes
	static inline byte_sequence encode(const std::u16string &text)
	{
		byte_sequence bytes;
		bytes.reserve(text.size());
		for (std::size_t i = 0; i < text.size(); i++)
		{
			uint32_t unit = text[i];
			if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < text.size() &&
				text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF)
			{
				uint32_t low = text[++i];
				append_utf8(bytes, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
				continue;
			}
			append_utf8(bytes, unit);
		}
		return bytes;
	}

	/*
	The UTF-8 encoding of `text`, one latin-1 char per byte:
	u"café" becomes "caf\xc3\xa9".
	*/
	static inline std::string reinterpret_as_latin1_bytes(const std::u16string &text)
	{
		return to_latin1(encode(text));
	}
}
}
