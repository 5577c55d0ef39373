#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include "detail/exceptions.hpp"
namespace xcodec
{
	typedef std::vector<uint8_t> byte_sequence;

	// A std::string is taken as Latin-1: every char is one byte.
	static inline byte_sequence from_text(const std::string &text)
	{
		return byte_sequence(text.begin(), text.end());
	}

	static inline byte_sequence from_text(const std::u16string &text)
	{
		byte_sequence bytes;
		bytes.reserve(text.size());
		for (std::size_t i = 0; i < text.size(); i++)
		{
			if (text[i] > 0xFF)
				throw codec_error("Character out of Latin-1 range at offset " + std::to_string(i));
			bytes.push_back((uint8_t)text[i]);
		}
		return bytes;
	}

	static inline byte_sequence from_bytes(const void *data, std::size_t len)
	{
		const uint8_t *ptr = static_cast<const uint8_t*>(data);
		return byte_sequence(ptr, ptr + len);
	}

	static inline std::string to_latin1(const byte_sequence &bytes)
	{
		return std::string(bytes.begin(), bytes.end());
	}

	static inline std::u16string to_u16string(const byte_sequence &bytes)
	{
		return std::u16string(bytes.begin(), bytes.end());
	}
}
