#pragma once
#include <string>
#include <cstdint>
#include "bytes.hpp"
namespace xcodec
{
namespace base64
{
	static constexpr unsigned char to_b64_tab[] =
		"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

	static constexpr unsigned char pad = 64;
	static constexpr unsigned char bad = 255;

	static constexpr unsigned char un_b64_tab[] =
	{
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 62,  255, 255, 255, 63,
		52,  53,  54,  55,  56,  57,  58,  59,  60,  61,  255, 255, 255, 64,  255, 255,
		255, 0,   1,   2,   3,   4,   5,   6,   7,   8,   9,   10,  11,  12,  13,  14,
		15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25,  255, 255, 255, 255, 255,
		255, 26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,
		41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51,  255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
		255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255
	};

	static inline std::string encode(const uint8_t *ptr, std::size_t size)
	{
		std::string buffer;
		buffer.reserve(4 * ((size + 2) / 3));

		int64_t len = (int64_t)size;
		while (len-- > 0)
		{
			int x, y;
			x = *ptr++;
			buffer.push_back((char)to_b64_tab[(x >> 2) & 63]);

			if (len-- <= 0)
			{
				buffer.push_back((char)to_b64_tab[(x << 4) & 63]);
				buffer.push_back('=');
				buffer.push_back('=');
				break;
			}

			y = *ptr++;
			buffer.push_back((char)(to_b64_tab[((x << 4) | ((y >> 4) & 15)) & 63]));

			if (len-- <= 0)
			{
				buffer.push_back((char)to_b64_tab[(y << 2) & 63]);
				buffer.push_back('=');
				break;
			}

			x = *ptr++;
			buffer.push_back((char)(to_b64_tab[((y << 2) | ((x >> 6) & 3)) & 63]));
			buffer.push_back((char)(to_b64_tab[x & 63]));
		}
		return buffer;
	}

	static inline std::string encode(const byte_sequence &data)
	{
		return encode(data.data(), data.size());
	}

	//latin-1 string, one char per byte
	static inline std::string encode(const std::string &data)
	{
		return encode((const uint8_t*)data.data(), data.size());
	}

	/*
	Lenient decoder: characters outside the alphabet (whitespace, line
	breaks, url-safe leftovers) are dropped before decoding. `=` or the
	end of input in the third or fourth place of a group ends that group.
	*/
	static inline byte_sequence decode_bytes(const std::string &in)
	{
		std::string code;
		code.reserve(in.size());
		for (auto &itr : in)
		{
			if (un_b64_tab[(uint8_t)itr] != bad)
				code.push_back(itr);
		}

		byte_sequence out;
		out.reserve(3 * (code.size() / 4) + 2);

		auto value = [&code](std::size_t i) -> unsigned char
		{
			return i < code.size() ? un_b64_tab[(uint8_t)code[i]] : pad;
		};

		for (std::size_t i = 0; i < code.size(); i += 4)
		{
			unsigned char a = value(i);
			unsigned char b = value(i + 1);
			if (a == pad || b == pad)
				continue;
			out.push_back((uint8_t)((a << 2) | (b >> 4)));

			unsigned char c = value(i + 2);
			if (c == pad)
				continue;
			out.push_back((uint8_t)(((b & 15) << 4) | (c >> 2)));

			unsigned char d = value(i + 3);
			if (d == pad)
				continue;
			out.push_back((uint8_t)(((c & 3) << 6) | d));
		}
		return out;
	}

	//decoded bytes mapped one-to-one onto latin-1 chars (no UTF-8 decoding)
	static inline std::string decode(const std::string &in)
	{
		return to_latin1(decode_bytes(in));
	}

	//true only for canonical padded Base64
	static inline bool check(const std::string &in)
	{
		if (in.size() % 4)
			return false;

		std::size_t pads = 0;
		for (std::size_t i = 0; i < in.size(); i++)
		{
			unsigned char x = un_b64_tab[(uint8_t)in[i]];
			if (x == bad)
				return false;
			if (x == pad)
			{
				if (i + 2 < in.size())
					return false;
				pads++;
			}
			else if (pads)
				return false;
		}
		if (!pads)
			return true;

		//unused low bits of the last data char must be zero
		unsigned char last = un_b64_tab[(uint8_t)in[in.size() - pads - 1]];
		return pads == 1 ? !(last & 3) : !(last & 15);
	}
}
}
