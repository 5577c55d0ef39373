#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "base64.hpp"
#include "detail/exceptions.hpp"
namespace xcodec
{
namespace vlq
{
	/*
	Source-map style Base64 VLQ. The sign sits in the lowest bit, then
	5-bit groups follow, least significant first, with 0x20 marking that
	another group comes. A "negative zero" stands for INT32_MIN.
	*/
	static inline void encode(int32_t value, std::string &out)
	{
		uint64_t vlq;
		if (value == INT32_MIN)
			vlq = 1;
		else if (value < 0)
			vlq = ((uint64_t)(-(int64_t)value) << 1) | 1;
		else
			vlq = (uint64_t)value << 1;

		do
		{
			unsigned digit = vlq & 31;
			vlq >>= 5;
			if (vlq)
				digit |= 32;
			out.push_back((char)base64::to_b64_tab[digit]);
		} while (vlq);
	}

	static inline std::string encode(int32_t value)
	{
		std::string out;
		encode(value, out);
		return out;
	}

	static inline std::string encode(const std::vector<int32_t> &values)
	{
		std::string out;
		for (auto &itr : values)
			encode(itr, out);
		return out;
	}

	static inline std::vector<int32_t> decode(const std::string &in)
	{
		std::vector<int32_t> values;
		uint64_t vlq = 0;
		int shift = 0;
		for (auto &itr : in)
		{
			unsigned char digit = base64::un_b64_tab[(uint8_t)itr];
			if (digit >= 64)
				throw syntax_error(std::string("Bad character: ") + itr);
			if (shift > 32)
				throw syntax_error("VLQ value out of range");

			vlq |= (uint64_t)(digit & 31) << shift;
			shift += 5;
			if (digit & 32)
				continue;

			bool negative = vlq & 1;
			int64_t value = (int64_t)(vlq >> 1);
			//-2^31 is reachable only as "negative zero" or as a negative magnitude
			if (value > (negative ? (int64_t)INT32_MAX + 1 : (int64_t)INT32_MAX))
				throw syntax_error("VLQ value out of range");
			if (negative)
				value = value ? -value : INT32_MIN;
			values.push_back((int32_t)value);
			vlq = 0;
			shift = 0;
		}
		if (shift)
			throw syntax_error("Unterminated VLQ sequence");
		return values;
	}
}
}
