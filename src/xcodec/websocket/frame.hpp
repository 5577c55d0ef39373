#pragma once
#include <cstdint>
#include "../bytes.hpp"
namespace xcodec
{
namespace websocket
{
	enum frame_type
	{
		e_continuation = 0x00,
		e_text = 0x01,
		e_binary = 0x02,
		e_connection_close = 0x08,
		e_ping = 0x09,
		e_pong = 0xa
	};

	enum class opname
	{
		e_continue,
		e_text,
		e_binary,
		e_close,
		e_ping,
		e_pong,
		e_reserved
	};

	static inline opname to_opname(uint8_t opcode)
	{
		switch (opcode & 0x0f)
		{
		case e_continuation:
			return opname::e_continue;
		case e_text:
			return opname::e_text;
		case e_binary:
			return opname::e_binary;
		case e_connection_close:
			return opname::e_close;
		case e_ping:
			return opname::e_ping;
		case e_pong:
			return opname::e_pong;
		default:
			return opname::e_reserved;
		}
	}

	static inline const char *to_string(opname name)
	{
		switch (name)
		{
		case opname::e_continue:
			return "continue";
		case opname::e_text:
			return "text";
		case opname::e_binary:
			return "binary";
		case opname::e_close:
			return "close";
		case opname::e_ping:
			return "ping";
		case opname::e_pong:
			return "pong";
		default:
			return "reserved";
		}
	}

	struct frame
	{
		bool fin_ = false;
		bool rsv1_ = false;
		bool rsv2_ = false;
		bool rsv3_ = false;
		uint8_t opcode_ = e_continuation;

		//masking_key_ is meaningful only while masked_ is set
		bool masked_ = false;
		uint32_t masking_key_ = 0;

		byte_sequence payload_;

		//bytes following the payload in the decoded buffer
		byte_sequence trailer_;

		//payload bytes the decoded buffer was short of
		uint64_t remaining_ = 0;

		uint64_t length() const
		{
			return payload_.size();
		}

		opname name() const
		{
			return to_opname(opcode_);
		}
	};

	//xor against the key's bytes in network order, cycled by index mod 4
	static inline void apply_masking_key(uint8_t *data, uint64_t len, uint32_t masking_key)
	{
		const uint8_t mask[4] = {
			(uint8_t)((masking_key >> 24) & 0xff),
			(uint8_t)((masking_key >> 16) & 0xff),
			(uint8_t)((masking_key >> 8) & 0xff),
			(uint8_t)(masking_key & 0xff)
		};
		for (uint64_t i = 0; i < len; i++)
			data[i] ^= mask[i % 4];
	}
}
}
