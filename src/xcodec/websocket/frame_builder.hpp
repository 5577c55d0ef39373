#pragma once
#include <cstdint>
#include <cstring>
#include "frame.hpp"
#include "../endec.hpp"
#include "../detail/exceptions.hpp"
namespace xcodec
{
namespace websocket
{
	//largest length the 64-bit field can carry, its top bit must stay clear
	static constexpr uint64_t max_payload_len = 0x7FFFFFFFFFFFFFFFULL;

	/*
	Writes the header fields of `header` followed by `len` bytes of
	`data`; header.payload_ is not read. The length field is picked as
	small as possible. With apply_mask the payload is masked with
	header.masking_key_, otherwise it is copied as given.
	*/
	static inline byte_sequence encode_frame(const frame &header, const uint8_t *data, uint64_t len, bool apply_mask = false)
	{
		if (len > max_payload_len)
			throw payload_too_large();

		int extended_payload_len = (len <= 125 ? 0 : (len <= 65535 ? 2 : 8));
		int mask_key_len = header.masked_ ? 4 : 0;
		std::size_t header_size = 2 + extended_payload_len + mask_key_len;
		if (len > (uint64_t)(SIZE_MAX - header_size))
			throw payload_too_large();

		byte_sequence buffer(header_size + (std::size_t)len);
		uint8_t *ptr = buffer.data();

		uint8_t byte0 = header.opcode_ & 0x0f;
		if (header.fin_)
			byte0 |= 0x80;
		if (header.rsv1_)
			byte0 |= 0x40;
		if (header.rsv2_)
			byte0 |= 0x20;
		if (header.rsv3_)
			byte0 |= 0x10;
		endec::put_uint8(ptr, byte0);

		uint8_t mask_bit = header.masked_ ? 0x80 : 0;
		if (len <= 125)
		{
			endec::put_uint8(ptr, mask_bit | (uint8_t)len);
		}
		else if (len <= 65535)
		{
			endec::put_uint8(ptr, mask_bit | 126);
			endec::put_uint16(ptr, (uint16_t)len);
		}
		else
		{
			endec::put_uint8(ptr, mask_bit | 127);
			endec::put_uint64(ptr, len);
		}

		if (header.masked_)
			endec::put_uint32(ptr, header.masking_key_);

		if (len)
		{
			memcpy(ptr, data, (std::size_t)len);
			if (header.masked_ && apply_mask)
				apply_masking_key(ptr, len, header.masking_key_);
		}
		return buffer;
	}

	static inline byte_sequence encode_frame(const frame &f, bool apply_mask = false)
	{
		return encode_frame(f, f.payload_.data(), f.payload_.size(), apply_mask);
	}

	class frame_builder
	{
	public:
		frame_builder()
		{
			header_.fin_ = true;
		}
		frame_builder &reset_masking_key()
		{
			header_.masked_ = false;
			header_.masking_key_ = 0;
			return *this;
		}
		frame_builder &set_masking_key(uint32_t masking_key)
		{
			header_.masked_ = true;
			header_.masking_key_ = masking_key;
			return *this;
		}
		frame_builder &set_fin(bool val)
		{
			header_.fin_ = val;
			return *this;
		}
		frame_builder &set_rsv(bool rsv1, bool rsv2, bool rsv3)
		{
			header_.rsv1_ = rsv1;
			header_.rsv2_ = rsv2;
			header_.rsv3_ = rsv3;
			return *this;
		}
		frame_builder &set_frame_type(frame_type type)
		{
			header_.opcode_ = (uint8_t)type;
			return *this;
		}
		//the payload is masked when a masking key is set
		byte_sequence make_frame(const void *data, std::size_t len) const
		{
			return encode_frame(header_, static_cast<const uint8_t*>(data), len, true);
		}
		byte_sequence make_frame(const byte_sequence &payload) const
		{
			return make_frame(payload.data(), payload.size());
		}
		frame make(const byte_sequence &payload) const
		{
			frame result = header_;
			result.payload_ = payload;
			return result;
		}
	private:
		frame header_;
	};
}
}
