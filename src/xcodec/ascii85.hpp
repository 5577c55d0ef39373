#pragma once
#include <string>
#include <algorithm>
#include <cstdint>
#include "bytes.hpp"
#include "detail/exceptions.hpp"
namespace xcodec
{
namespace ascii85
{
	/*
	Adobe/btoa flavour: digits '!'..'u', 'z' for four zero bytes.
	A short final group of n bytes is written as n + 1 digits.
	No "<~" "~>" delimiters are emitted.
	*/
	static inline std::string encode(const uint8_t *ptr, std::size_t len)
	{
		std::string buffer;
		buffer.reserve(5 * ((len + 3) / 4));

		for (std::size_t offset = 0; offset < len; offset += 4)
		{
			std::size_t count = std::min<std::size_t>(4, len - offset);
			uint32_t value = 0;
			for (std::size_t i = 0; i < 4; i++)
			{
				value <<= 8;
				if (i < count)
					value |= ptr[offset + i];
			}

			if (count == 4 && value == 0)
			{
				buffer.push_back('z');
				continue;
			}

			char digits[5];
			for (int i = 4; i >= 0; i--)
			{
				digits[i] = (char)('!' + value % 85);
				value /= 85;
			}
			buffer.append(digits, count + 1);
		}
		return buffer;
	}

	static inline std::string encode(const byte_sequence &bytes)
	{
		return encode(bytes.data(), bytes.size());
	}

	namespace detail
	{
		static inline void flush_group(byte_sequence &out, const uint8_t *digits, std::size_t count)
		{
			uint64_t value = 0;
			for (std::size_t i = 0; i < 5; i++)
				value = value * 85 + (i < count ? digits[i] : 84);
			if (value > 0xFFFFFFFFULL)
				throw syntax_error("Invalid ASCII85 group");

			for (std::size_t i = 0; i < count - 1; i++)
				out.push_back((uint8_t)((value >> (24 - 8 * i)) & 0xff));
		}
	}

	//whitespace is skipped, a leading "<~" is skipped and '~' ends the data
	static inline byte_sequence decode(const std::string &in)
	{
		byte_sequence out;
		out.reserve(4 * (in.size() / 5) + 4);

		uint8_t digits[5];
		std::size_t count = 0;
		std::size_t i = 0;
		if (in.compare(0, 2, "<~") == 0)
			i = 2;

		for (; i < in.size(); i++)
		{
			char c = in[i];
			if (c == '~')
				break;
			if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == '\0')
				continue;
			if (c == 'z')
			{
				if (count)
					throw syntax_error("Unexpected `z` shorthand");
				out.insert(out.end(), 4, 0);
				continue;
			}
			if (c < '!' || c > 'u')
				throw syntax_error(std::string("Unexpected character \"") + c + "\"");

			digits[count++] = (uint8_t)(c - '!');
			if (count == 5)
			{
				detail::flush_group(out, digits, count);
				count = 0;
			}
		}
		//a single leftover digit carries no complete byte
		if (count > 1)
			detail::flush_group(out, digits, count);
		return out;
	}
}
}
