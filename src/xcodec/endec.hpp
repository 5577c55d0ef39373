#pragma once
#include <vector>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include "bytes.hpp"
namespace xcodec
{
	//detect reads the order from a byte-order mark
	enum class byte_order
	{
		detect,
		big,
		little
	};

	namespace endec
	{
		inline void put_uint8(uint8_t *&buffer_, uint8_t value)
		{
			*buffer_ = value;
			buffer_ += sizeof(value);
		}

		inline uint8_t get_uint8(const uint8_t *&buffer_)
		{
			uint8_t value = buffer_[0];
			buffer_ += sizeof(value);
			return value;
		}

		inline void put_uint16(uint8_t *&buffer_, uint16_t value)
		{
			buffer_[0] = (uint8_t)(((value) >> 8) & 0xff);
			buffer_[1] = (uint8_t)(value & 0xff);
			buffer_ += sizeof(value);
		}

		inline uint16_t get_uint16(const uint8_t *&buffer_)
		{
			uint16_t value = (uint16_t)((((uint16_t)buffer_[0]) << 8) | ((uint16_t)buffer_[1]));
			buffer_ += sizeof(value);
			return value;
		}

		inline void put_uint32(uint8_t *&buffer_, uint32_t value)
		{
			buffer_[0] = (uint8_t)(((value) >> 24) & 0xff);
			buffer_[1] = (uint8_t)(((value) >> 16) & 0xff);
			buffer_[2] = (uint8_t)(((value) >> 8) & 0xff);
			buffer_[3] = (uint8_t)(value & 0xff);
			buffer_ += sizeof(value);
		}

		inline uint32_t get_uint32(const uint8_t *&buffer_)
		{
			uint32_t value =
				(((uint32_t)buffer_[0]) << 24) |
				(((uint32_t)buffer_[1]) << 16) |
				(((uint32_t)buffer_[2]) << 8) |
				((uint32_t)buffer_[3]);
			buffer_ += sizeof(value);
			return value;
		}

		inline void put_uint64(uint8_t *&buffer_, uint64_t value)
		{
			buffer_[0] = (uint8_t)(((value) >> 56) & 0xff);
			buffer_[1] = (uint8_t)(((value) >> 48) & 0xff);
			buffer_[2] = (uint8_t)(((value) >> 40) & 0xff);
			buffer_[3] = (uint8_t)(((value) >> 32) & 0xff);
			buffer_[4] = (uint8_t)(((value) >> 24) & 0xff);
			buffer_[5] = (uint8_t)(((value) >> 16) & 0xff);
			buffer_[6] = (uint8_t)(((value) >> 8) & 0xff);
			buffer_[7] = (uint8_t)(value & 0xff);
			buffer_ += sizeof(value);
		}

		inline uint64_t get_uint64(const uint8_t *&buffer_)
		{
			uint64_t value =
				((((uint64_t)buffer_[0]) << 56) |
				(((uint64_t)buffer_[1]) << 48) |
				(((uint64_t)buffer_[2]) << 40) |
				(((uint64_t)buffer_[3]) << 32) |
				(((uint64_t)buffer_[4]) << 24) |
				(((uint64_t)buffer_[5]) << 16) |
				(((uint64_t)buffer_[6]) << 8) |
				((uint64_t)buffer_[7]));
			buffer_ += sizeof(value);
			return value;
		}

		/*
		Reads one integer from `count` bytes (count <= sizeof(T)).
		A short big-endian group supplies the high-order bytes and the
		missing low-order bytes are zero; a short little-endian group is
		read as-is since the missing bytes are the high-order ones.
		*/
		template<typename T>
		inline typename std::enable_if<std::is_unsigned<T>::value, T>::type
			get_uint(const uint8_t *ptr, std::size_t count, bool little_endian)
		{
			T value = 0;
			for (std::size_t i = 0; i < count && i < sizeof(T); i++)
			{
				auto shift = little_endian ? 8 * i : 8 * (sizeof(T) - 1 - i);
				value |= (T)((T)ptr[i] << shift);
			}
			return value;
		}

		template<typename T>
		inline typename std::enable_if<std::is_unsigned<T>::value, void>::type
			put_uint(uint8_t *ptr, T value, bool little_endian)
		{
			for (std::size_t i = 0; i < sizeof(T); i++)
			{
				auto shift = little_endian ? 8 * i : 8 * (sizeof(T) - 1 - i);
				ptr[i] = (uint8_t)((value >> shift) & 0xff);
			}
		}
	}

	template<typename T>
	inline typename std::enable_if<std::is_integral<T>::value, std::vector<T>>::type
		bytes_to_uint(const byte_sequence &bytes, bool little_endian = false)
	{
		typedef typename std::make_unsigned<T>::type unsigned_type;

		std::vector<T> values;
		values.reserve((bytes.size() + sizeof(T) - 1) / sizeof(T));
		for (std::size_t offset = 0; offset < bytes.size(); offset += sizeof(T))
		{
			auto count = std::min(sizeof(T), bytes.size() - offset);
			values.push_back(static_cast<T>(
				endec::get_uint<unsigned_type>(bytes.data() + offset, count, little_endian)));
		}
		return values;
	}

	template<typename T>
	inline typename std::enable_if<std::is_integral<T>::value, byte_sequence>::type
		uint_to_bytes(const std::vector<T> &values, bool little_endian = false)
	{
		typedef typename std::make_unsigned<T>::type unsigned_type;

		byte_sequence bytes(values.size() * sizeof(T));
		uint8_t *ptr = bytes.data();
		for (auto &itr : values)
		{
			endec::put_uint<unsigned_type>(ptr, static_cast<unsigned_type>(itr), little_endian);
			ptr += sizeof(T);
		}
		return bytes;
	}

	inline std::vector<uint16_t> bytes_to_uint16(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<uint16_t>(bytes, little_endian);
	}

	inline std::vector<uint32_t> bytes_to_uint32(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<uint32_t>(bytes, little_endian);
	}

	inline std::vector<uint64_t> bytes_to_uint64(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<uint64_t>(bytes, little_endian);
	}

	inline std::vector<int8_t> bytes_to_int8(const byte_sequence &bytes)
	{
		return bytes_to_uint<int8_t>(bytes);
	}

	inline std::vector<int16_t> bytes_to_int16(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<int16_t>(bytes, little_endian);
	}

	inline std::vector<int32_t> bytes_to_int32(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<int32_t>(bytes, little_endian);
	}

	inline std::vector<int64_t> bytes_to_int64(const byte_sequence &bytes, bool little_endian = false)
	{
		return bytes_to_uint<int64_t>(bytes, little_endian);
	}

	inline byte_sequence uint16_to_bytes(const std::vector<uint16_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline byte_sequence uint16_to_bytes(uint16_t value, bool little_endian = false)
	{
		return uint_to_bytes(std::vector<uint16_t>{ value }, little_endian);
	}

	inline byte_sequence uint32_to_bytes(const std::vector<uint32_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline byte_sequence uint32_to_bytes(uint32_t value, bool little_endian = false)
	{
		return uint_to_bytes(std::vector<uint32_t>{ value }, little_endian);
	}

	inline byte_sequence uint64_to_bytes(const std::vector<uint64_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline byte_sequence uint64_to_bytes(uint64_t value, bool little_endian = false)
	{
		return uint_to_bytes(std::vector<uint64_t>{ value }, little_endian);
	}

	inline byte_sequence int8_to_bytes(const std::vector<int8_t> &values)
	{
		return uint_to_bytes(values);
	}

	inline byte_sequence int16_to_bytes(const std::vector<int16_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline byte_sequence int32_to_bytes(const std::vector<int32_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline byte_sequence int64_to_bytes(const std::vector<int64_t> &values, bool little_endian = false)
	{
		return uint_to_bytes(values, little_endian);
	}

	inline std::vector<float> bytes_to_float32(const byte_sequence &bytes, bool little_endian = false)
	{
		std::vector<float> values;
		for (auto &itr : bytes_to_uint<uint32_t>(bytes, little_endian))
		{
			float value;
			memcpy(&value, &itr, sizeof(value));
			values.push_back(value);
		}
		return values;
	}

	inline std::vector<double> bytes_to_float64(const byte_sequence &bytes, bool little_endian = false)
	{
		std::vector<double> values;
		for (auto &itr : bytes_to_uint<uint64_t>(bytes, little_endian))
		{
			double value;
			memcpy(&value, &itr, sizeof(value));
			values.push_back(value);
		}
		return values;
	}

	inline byte_sequence float32_to_bytes(const std::vector<float> &values, bool little_endian = false)
	{
		std::vector<uint32_t> bits(values.size());
		memcpy(bits.data(), values.data(), values.size() * sizeof(float));
		return uint_to_bytes(bits, little_endian);
	}

	inline byte_sequence float64_to_bytes(const std::vector<double> &values, bool little_endian = false)
	{
		std::vector<uint64_t> bits(values.size());
		memcpy(bits.data(), values.data(), values.size() * sizeof(double));
		return uint_to_bytes(bits, little_endian);
	}
}
