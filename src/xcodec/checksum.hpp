#pragma once
#include <cstdint>
#include <cstddef>
#include "bytes.hpp"
namespace xcodec
{
	static inline uint32_t rotl(uint32_t value, int64_t bits)
	{
		int shift = (int)(((bits % 32) + 32) % 32);
		if (shift == 0)
			return value;
		return (value << shift) | (value >> (32 - shift));
	}

	static inline uint32_t rotr(uint32_t value, int64_t bits)
	{
		int shift = (int)(((bits % 32) + 32) % 32);
		if (shift == 0)
			return value;
		return (value >> shift) | (value << (32 - shift));
	}

	/*
	Adler-32 (RFC 1950). `adler` is the running value of the data seen so
	far, so adler32(b, n, adler32(a, m)) == adler32 of a followed by b.
	*/
	static inline uint32_t adler32(const uint8_t *data, std::size_t len, uint32_t adler = 1)
	{
		static const uint32_t base = 65521;

		uint32_t a = adler & 0xffff;
		uint32_t b = (adler >> 16) & 0xffff;
		while (len)
		{
			//5552 is the largest n with 255n(n+1)/2 + (n+1)(base-1) < 2^32
			std::size_t block = len < 5552 ? len : 5552;
			len -= block;
			while (block--)
			{
				a += *data++;
				b += a;
			}
			a %= base;
			b %= base;
		}
		return (b << 16) | a;
	}

	static inline uint32_t adler32(const byte_sequence &bytes, uint32_t adler = 1)
	{
		return adler32(bytes.data(), bytes.size(), adler);
	}

	namespace detail
	{
		struct crc32_table
		{
			crc32_table()
			{
				for (uint32_t i = 0; i < 256; i++)
				{
					uint32_t c = i;
					for (int k = 0; k < 8; k++)
						c = (c & 1) ? (0xEDB88320 ^ (c >> 1)) : (c >> 1);
					table_[i] = c;
				}
			}
			uint32_t table_[256];
		};

		static inline const uint32_t *get_crc32_table()
		{
			static const crc32_table inst;
			return inst.table_;
		}
	}

	//reflected CRC-32, zlib convention for the running value
	static inline uint32_t crc32(const uint8_t *data, std::size_t len, uint32_t crc = 0)
	{
		const uint32_t *table = detail::get_crc32_table();
		uint32_t c = crc ^ 0xFFFFFFFF;
		for (std::size_t i = 0; i < len; i++)
			c = table[(c ^ data[i]) & 0xff] ^ (c >> 8);
		return c ^ 0xFFFFFFFF;
	}

	static inline uint32_t crc32(const byte_sequence &bytes, uint32_t crc = 0)
	{
		return crc32(bytes.data(), bytes.size(), crc);
	}
}
