#include <algorithm>
#include "xcodec/utf32.hpp"
#include "xtest/xtest.hpp"

using namespace xcodec;
using namespace xcodec::utf32;

XTEST_SUITE(utf32)
{
	static byte_sequence with_bom(const byte_sequence &bytes, bool little_endian)
	{
		byte_sequence result = little_endian ? byte_sequence{ 0xFF, 0xFE, 0x00, 0x00 } : byte_sequence{ 0x00, 0x00, 0xFE, 0xFF };
		result.insert(result.end(), bytes.begin(), bytes.end());
		return result;
	}

	static byte_sequence swapped(byte_sequence bytes)
	{
		for (std::size_t i = 0; i + 3 < bytes.size(); i += 4)
			std::reverse(bytes.begin() + i, bytes.begin() + i + 4);
		return bytes;
	}

	static decoded_text decode_as(const byte_sequence &bytes, byte_order order)
	{
		utf32_options options;
		options.byte_order_ = order;
		return decode_bytes(bytes, options);
	}

	static void check_encode(const std::u16string &text, const byte_sequence &big)
	{
		xassert(encode(text) == big);
		xassert(encode(text, false, true) == with_bom(big, false));
		xassert(encode(text, true) == swapped(big));
		xassert(encode(text, true, true) == with_bom(swapped(big), true));
	}

	static void check_decode(const byte_sequence &big, const std::u16string &expected)
	{
		xassert(decode_bytes(big).text_ == expected);
		xassert(decode_as(big, byte_order::big).text_ == expected);
		xassert(decode_bytes(with_bom(big, false)).text_ == expected);

		byte_sequence little = swapped(big);
		xassert(decode_as(little, byte_order::little).text_ == expected);
		xassert(decode_bytes(with_bom(little, true)).text_ == expected);
		xassert(decode_as(with_bom(little, true), byte_order::little).text_ == expected);

		utf32_options options;
		options.code_points_ = true;
		std::vector<uint32_t> code_points = bytes_to_uint32(big);
		xassert(decode_bytes(with_bom(big, false), options).code_points_ == code_points);
	}

	XUNIT_TEST(encode_rejects_invalid_code_points)
	{
		std::vector<uint32_t> huge = { 0x7FFFFFFF };
		try
		{
			encode(huge);
			xassert(false);
		}
		catch (const invalid_code_point &e)
		{
			xassert(std::string(e.what()) == "Invalid codepoint: 2147483647");
		}
		std::vector<uint32_t> wrapped = { (uint32_t)-2 };
		xassert_throw(encode(wrapped), invalid_code_point);
		std::vector<uint32_t> beyond = { 0x110000 };
		xassert_throw(encode(beyond), invalid_code_point);
	}

	XUNIT_TEST(encode_empty)
	{
		xassert(encode(std::u16string()).empty());
		xassert(encode(std::vector<uint32_t>()).empty());
		byte_sequence bom = { 0xFF, 0xFE, 0x00, 0x00 };
		xassert(encode(std::vector<uint32_t>(), true, true) == bom);
	}

	XUNIT_TEST(encode_text)
	{
		check_encode(std::u16string(u"XYZ\0", 4), { 0, 0, 0, 0x58, 0, 0, 0, 0x59, 0, 0, 0, 0x5A, 0, 0, 0, 0x00 });
		check_encode(u"\u00A7\u00BA\u00AD\n", { 0, 0, 0, 0xA7, 0, 0, 0, 0xBA, 0, 0, 0, 0xAD, 0, 0, 0, 0x0A });
		check_encode(u"€→│λ", { 0, 0, 0x20, 0xAC, 0, 0, 0x21, 0x92, 0, 0, 0x25, 0x02, 0, 0, 0x03, 0xBB });
		check_encode(u"Джон", { 0, 0, 0x04, 0x14, 0, 0, 0x04, 0x36, 0, 0, 0x04, 0x3E, 0, 0, 0x04, 0x3D });
		check_encode(u"\U00010437", { 0, 0x01, 0x04, 0x37 });
		check_encode(u"\U0001F602", { 0, 0x01, 0xF6, 0x02 });
		check_encode(u"\U00024B62", { 0, 0x02, 0x4B, 0x62 });
		check_encode(u"\U0001202D\U00012030", { 0, 0x01, 0x20, 0x2D, 0, 0x01, 0x20, 0x30 });
		check_encode(u"\U000103C9\f\U000103B8", { 0, 0x01, 0x03, 0xC9, 0, 0, 0, 0x0C, 0, 0x01, 0x03, 0xB8 });
		for (int i = 0; i < 255; i++)
			check_encode(std::u16string(1, (char16_t)i), { 0, 0, 0, (uint8_t)i });
	}

	XUNIT_TEST(encode_unpaired_surrogates)
	{
		std::u16string high(1, (char16_t)0xD801);
		std::u16string low(1, (char16_t)0xDC37);
		std::u16string pair = u"\U00010437";

		check_encode(high, { 0, 0, 0xD8, 0x01 });
		check_encode(high + u"X", { 0, 0, 0xD8, 0x01, 0, 0, 0, 0x58 });
		check_encode(pair + high, { 0, 0x01, 0x04, 0x37, 0, 0, 0xD8, 0x01 });
		check_encode(high + pair, { 0, 0, 0xD8, 0x01, 0, 0x01, 0x04, 0x37 });
		check_encode(low, { 0, 0, 0xDC, 0x37 });
		check_encode(u"X" + low, { 0, 0, 0, 0x58, 0, 0, 0xDC, 0x37 });
		check_encode(pair + low, { 0, 0x01, 0x04, 0x37, 0, 0, 0xDC, 0x37 });
		check_encode(low + pair, { 0, 0, 0xDC, 0x37, 0, 0x01, 0x04, 0x37 });
	}

	XUNIT_TEST(decode_text)
	{
		for (int i = 0; i < 255; i++)
			check_decode({ 0, 0, 0, (uint8_t)i }, std::u16string(1, (char16_t)i));
		check_decode({ 0, 0, 0x20, 0xAC }, u"€");
		check_decode({ 0, 0, 0, 0x4A, 0, 0, 0, 0x6F, 0, 0, 0, 0x68, 0, 0, 0, 0x6E }, u"John");
		check_decode({ 0, 0, 0x20, 0xAC, 0, 0, 0x21, 0x92, 0, 0, 0x25, 0x02, 0, 0, 0x03, 0xBB }, u"€→│λ");
		check_decode({ 0, 0x01, 0x04, 0x37, 0, 0x01, 0xF6, 0x02, 0, 0x02, 0x4B, 0x62, 0, 0x01, 0x03, 0xCF },
			u"\U00010437\U0001F602\U00024B62\U000103CF");
		check_decode({ 0, 0, 0, 0x4A, 0, 0x01, 0x04, 0x37, 0, 0, 0x20, 0xAC }, u"J\U00010437€");
		xassert(decode_bytes(byte_sequence()).text_.empty());
	}

	XUNIT_TEST(decode_incomplete_units)
	{
		byte_sequence short_unit = { 0, 0, 0x20 };
		xassert(decode_bytes(short_unit).text_ == u"\uFFFD");
		byte_sequence trailing = { 0, 0, 0x20, 0xAC, 0 };
		xassert(decode_bytes(trailing).text_ == u"€\uFFFD");

		byte_sequence short_little = { 0xAC, 0x20, 0 };
		xassert(decode_as(short_little, byte_order::little).text_ == u"\uFFFD");
		byte_sequence trailing_little = { 0xAC, 0x20, 0, 0, 0 };
		xassert(decode_as(trailing_little, byte_order::little).text_ == u"€\uFFFD");
	}

	XUNIT_TEST(decode_out_of_range_units)
	{
		byte_sequence beyond = { 0x00, 0x11, 0x00, 0x00, 0x00, 0x00, 0x00, 0x58 };
		utf32_options options;
		options.code_points_ = true;
		std::vector<uint32_t> expected = { 0xFFFD, 0x58 };
		xassert(decode_bytes(beyond, options).code_points_ == expected);
	}
}
