#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include "bytes.hpp"
#include "checksum.hpp"
#include "endec.hpp"
namespace xcodec
{
	class sha1
	{
	public:
		sha1()
		{
			reset();
		}

		void reset()
		{
			length_ = 0;
			message_block_index_ = 0;

			h_[0] = 0x67452301;
			h_[1] = 0xEFCDAB89;
			h_[2] = 0x98BADCFE;
			h_[3] = 0x10325476;
			h_[4] = 0xC3D2E1F0;

			computed_ = false;
			corrupted_ = false;
		}

		//false if more input arrived after the digest was taken
		bool result(uint8_t (&digest)[20])
		{
			if (corrupted_)
				return false;

			if (!computed_)
			{
				pad_message();
				computed_ = true;
			}

			uint8_t *ptr = digest;
			for (int i = 0; i < 5; i++)
				endec::put_uint32(ptr, h_[i]);
			return true;
		}

		void input(const uint8_t *message_array, std::size_t length)
		{
			if (!length)
				return;

			if (computed_ || corrupted_)
			{
				corrupted_ = true;
				return;
			}

			length_ += (uint64_t)length * 8;
			while (length--)
			{
				message_block_[message_block_index_++] = *message_array++;
				if (message_block_index_ == 64)
					process_message_block();
			}
		}

		void input(const void *message_array, std::size_t length)
		{
			input(static_cast<const uint8_t*>(message_array), length);
		}

		sha1& operator<<(const byte_sequence &bytes)
		{
			input(bytes.data(), bytes.size());
			return *this;
		}

		sha1& operator<<(const std::string &str)
		{
			input(str.data(), str.size());
			return *this;
		}

	private:
		void process_message_block()
		{
			const uint32_t K[] =
			{
				0x5A827999,
				0x6ED9EBA1,
				0x8F1BBCDC,
				0xCA62C1D6
			};
			int t;
			uint32_t temp;
			uint32_t W[80];
			uint32_t A, B, C, D, E;

			const uint8_t *ptr = message_block_;
			for (t = 0; t < 16; t++)
				W[t] = endec::get_uint32(ptr);

			for (t = 16; t < 80; t++)
				W[t] = rotl(W[t - 3] ^ W[t - 8] ^ W[t - 14] ^ W[t - 16], 1);

			A = h_[0];
			B = h_[1];
			C = h_[2];
			D = h_[3];
			E = h_[4];

			for (t = 0; t < 80; t++)
			{
				uint32_t f;
				if (t < 20)
					f = ((B & C) | ((~B) & D)) + K[0];
				else if (t < 40)
					f = (B ^ C ^ D) + K[1];
				else if (t < 60)
					f = ((B & C) | (B & D) | (C & D)) + K[2];
				else
					f = (B ^ C ^ D) + K[3];

				temp = rotl(A, 5) + f + E + W[t];
				E = D;
				D = C;
				C = rotl(B, 30);
				B = A;
				A = temp;
			}

			h_[0] += A;
			h_[1] += B;
			h_[2] += C;
			h_[3] += D;
			h_[4] += E;

			message_block_index_ = 0;
		}

		void pad_message()
		{
			message_block_[message_block_index_++] = 0x80;
			if (message_block_index_ > 56)
			{
				while (message_block_index_ < 64)
					message_block_[message_block_index_++] = 0;
				process_message_block();
			}
			while (message_block_index_ < 56)
				message_block_[message_block_index_++] = 0;

			uint8_t *ptr = message_block_ + 56;
			endec::put_uint64(ptr, length_);

			process_message_block();
		}

		uint32_t h_[5];

		uint64_t length_;

		uint8_t message_block_[64];
		int32_t message_block_index_;

		bool computed_;
		bool corrupted_;
	};

	static inline byte_sequence sha1_digest(const uint8_t *data, std::size_t len)
	{
		uint8_t digest[20];
		sha1 sha;
		sha.input(data, len);
		if (!sha.result(digest))
			throw codec_error("sha1 digest unavailable");
		return byte_sequence(digest, digest + sizeof(digest));
	}

	static inline byte_sequence sha1_digest(const byte_sequence &bytes)
	{
		return sha1_digest(bytes.data(), bytes.size());
	}

	static inline std::string sha1_hex(const byte_sequence &bytes)
	{
		static const char hex[] = "0123456789abcdef";

		std::string str;
		str.reserve(40);
		for (auto &itr : sha1_digest(bytes))
		{
			str.push_back(hex[itr >> 4]);
			str.push_back(hex[itr & 0x0f]);
		}
		return str;
	}
}
