#pragma once
#include <algorithm>
#include <string>
#include <cstdint>
#include "frame.hpp"
#include "../endec.hpp"
#include "../detail/exceptions.hpp"

namespace xcodec
{
namespace websocket
{
	/*
	0                   1                   2                   3
	0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
	+-+-+-+-+-------+-+-------------+-------------------------------+
	|F|R|R|R| opcode|M| Payload len |    Extended payload length    |
	|I|S|S|S|  (4)  |A|     (7)     |             (16/64)           |
	|N|V|V|V|       |S|             |   (if payload len==126/127)   |
	| |1|2|3|       |K|             |                               |
	+-+-+-+-+-------+-+-------------+ - - - - - - - - - - - - - - - +
	|     Extended payload length continued, if payload len == 127  |
	+ - - - - - - - - - - - - - - - +-------------------------------+
	|                               |Masking-key, if MASK set to 1  |
	+-------------------------------+-------------------------------+
	| Masking-key (continued)       |          Payload Data         |
	+-------------------------------- - - - - - - - - - - - - - - - +
	:                     Payload Data continued ...                :
	+ - - - - - - - - - - - - - - - - - - - - - - - - - - - - - - - +
	|                     Payload Data continued ...                |
	+---------------------------------------------------------------+
	*/

	/*
	Decodes the frame at the start of `data`. Bytes past the payload go
	to trailer_. A buffer that ends inside the payload yields what is
	there, with remaining_ set to the number of missing bytes. A buffer
	that ends inside the header throws frame_error.
	With keep_masked the payload is returned as it was on the wire.
	*/
	static inline frame decode_frame(const uint8_t *data, std::size_t len, bool keep_masked = false)
	{
		frame result;
		const uint8_t *ptr = data;
		const uint8_t *end = data + len;

		auto require = [&](std::size_t size, const char *field)
		{
			if ((std::size_t)(end - ptr) < size)
				throw frame_error(std::string("Incomplete frame header: missing ") + field);
		};

		require(2, "fixed header");
		uint8_t byte0 = endec::get_uint8(ptr);
		result.fin_ = !!(byte0 & 0x80);
		result.rsv1_ = !!(byte0 & 0x40);
		result.rsv2_ = !!(byte0 & 0x20);
		result.rsv3_ = !!(byte0 & 0x10);
		result.opcode_ = byte0 & 0x0f;

		uint8_t byte1 = endec::get_uint8(ptr);
		result.masked_ = !!(byte1 & 0x80);

		uint64_t payload_len = byte1 & 0x7f;
		if (payload_len == 126)
		{
			require(2, "extended payload length");
			payload_len = endec::get_uint16(ptr);
		}
		else if (payload_len == 127)
		{
			require(8, "extended payload length");
			payload_len = endec::get_uint64(ptr);
		}

		if (result.masked_)
		{
			require(4, "masking key");
			result.masking_key_ = endec::get_uint32(ptr);
		}

		uint64_t available = (uint64_t)(end - ptr);
		uint64_t size = std::min(payload_len, available);
		result.payload_.assign(ptr, ptr + size);
		ptr += size;
		result.remaining_ = payload_len - size;
		result.trailer_.assign(ptr, end);

		if (result.masked_ && !keep_masked)
			apply_masking_key(result.payload_.data(), result.payload_.size(), result.masking_key_);

		return result;
	}

	static inline frame decode_frame(const byte_sequence &bytes, bool keep_masked = false)
	{
		return decode_frame(bytes.data(), bytes.size(), keep_masked);
	}
}
}
