#include "xcodec/endec.hpp"
#include "xtest/xtest.hpp"

using namespace xcodec;

XTEST_SUITE(endec)
{
	XUNIT_TEST(cursor_put_get)
	{
		uint8_t buffer[14];
		uint8_t *out = buffer;
		endec::put_uint16(out, 0x1234);
		endec::put_uint32(out, 0xAABBCCDD);
		endec::put_uint64(out, 0x0102030405060708ULL);
		xassert(out == buffer + sizeof(buffer));
		xassert(buffer[0] == 0x12 && buffer[2] == 0xAA && buffer[13] == 0x08);

		const uint8_t *in = buffer;
		xassert(endec::get_uint16(in) == 0x1234);
		xassert(endec::get_uint32(in) == 0xAABBCCDD);
		xassert(endec::get_uint64(in) == 0x0102030405060708ULL);
		xassert(in == buffer + sizeof(buffer));
	}

	XUNIT_TEST(bytes_to_uint16)
	{
		byte_sequence bytes = { 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF };
		std::vector<uint16_t> be = { 0xAABB, 0xCCDD, 0xEEFF };
		std::vector<uint16_t> le = { 0xBBAA, 0xDDCC, 0xFFEE };
		xassert(bytes_to_uint16(bytes) == be);
		xassert(bytes_to_uint16(bytes, true) == le);

		byte_sequence odd = { 0xFF, 0xBB, 0xCC };
		std::vector<uint16_t> odd_be = { 0xFFBB, 0xCC00 };
		std::vector<uint16_t> odd_le = { 0xBBFF, 0x00CC };
		xassert(bytes_to_uint16(odd) == odd_be);
		xassert(bytes_to_uint16(odd, true) == odd_le);
	}

	XUNIT_TEST(bytes_to_uint32)
	{
		byte_sequence bytes = { 0x12, 0x34, 0x56, 0x78, 0xAB, 0xCD, 0xEF, 0x35 };
		std::vector<uint32_t> be = { 0x12345678, 0xABCDEF35 };
		std::vector<uint32_t> le = { 0x78563412, 0x35EFCDAB };
		xassert(bytes_to_uint32(bytes) == be);
		xassert(bytes_to_uint32(bytes, true) == le);
	}

	XUNIT_TEST(bytes_to_uint32_zero_pads)
	{
		byte_sequence one = { 0x34 };
		xassert(bytes_to_uint32(one)[0] == 0x34000000);
		byte_sequence leftover = { 0x9E };
		xassert(bytes_to_uint32(leftover, true)[0] == 0x9E);

		byte_sequence bytes = { 0xAA, 0xBB, 0xCC, 0xDD, 0x12, 0x34, 0x56 };
		std::vector<uint32_t> be = { 0xAABBCCDD, 0x12345600 };
		std::vector<uint32_t> le = { 0xDDCCBBAA, 0x00563412 };
		xassert(bytes_to_uint32(bytes) == be);
		xassert(bytes_to_uint32(bytes, true) == le);
		xassert(bytes_to_uint32(byte_sequence()).empty());
	}

	XUNIT_TEST(bytes_to_uint64)
	{
		byte_sequence bytes = {
			0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88,
			0xAB, 0xCD, 0xEF, 0x12, 0x34, 0x56, 0x78, 0x91,
			0xAB, 0xCD };
		std::vector<uint64_t> be = { 0x1122334455667788ULL, 0xABCDEF1234567891ULL, 0xABCD000000000000ULL };
		std::vector<uint64_t> le = { 0x8877665544332211ULL, 0x9178563412EFCDABULL, 0x000000000000CDABULL };
		xassert(bytes_to_uint64(bytes) == be);
		xassert(bytes_to_uint64(bytes, true) == le);
	}

	XUNIT_TEST(uint_to_bytes)
	{
		byte_sequence be = { 0x12, 0x34, 0x56, 0x78 };
		byte_sequence le = { 0x78, 0x56, 0x34, 0x12 };
		xassert(uint32_to_bytes((uint32_t)0x12345678) == be);
		xassert(uint32_to_bytes((uint32_t)0x12345678, true) == le);

		std::vector<uint16_t> values = { 0x0102, 0x0304 };
		byte_sequence expected = { 0x02, 0x01, 0x04, 0x03 };
		xassert(uint16_to_bytes(values, true) == expected);

		byte_sequence wide = { 0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11 };
		xassert(uint64_to_bytes((uint64_t)0x1122334455667788ULL, true) == wide);
	}

	XUNIT_TEST(round_trip_pads_with_zeros)
	{
		byte_sequence bytes = { 1, 2, 3, 4, 5 };
		byte_sequence padded = { 1, 2, 3, 4, 5, 0, 0, 0 };
		xassert(uint32_to_bytes(bytes_to_uint32(bytes)) == padded);
		xassert(uint32_to_bytes(bytes_to_uint32(bytes, true), true) == padded);

		byte_sequence padded16 = { 1, 2, 3, 4, 5, 0 };
		xassert(uint16_to_bytes(bytes_to_uint16(bytes)) == padded16);
		xassert(uint16_to_bytes(bytes_to_uint16(bytes, true), true) == padded16);
	}

	XUNIT_TEST(signed_values)
	{
		byte_sequence bytes = { 0xFF, 0xFE, 0x80, 0x00 };
		std::vector<int16_t> be = { -2, -32768 };
		xassert(bytes_to_int16(bytes) == be);
		xassert(bytes_to_int8(bytes)[0] == -1);
		xassert(bytes_to_int32(bytes)[0] == -98304);

		std::vector<int32_t> values = { -1 };
		byte_sequence expected = { 0xFF, 0xFF, 0xFF, 0xFF };
		xassert(int32_to_bytes(values) == expected);

		std::vector<int64_t> big = { -2 };
		xassert(int64_to_bytes(big, true)[0] == 0xFE);
		xassert(int64_to_bytes(big, true)[7] == 0xFF);
	}

	XUNIT_TEST(float_values)
	{
		byte_sequence one = { 0x3F, 0x80, 0x00, 0x00 };
		xassert(bytes_to_float32(one)[0] == 1.0f);
		byte_sequence minus_two = { 0xC0 };
		xassert(bytes_to_float32(minus_two)[0] == -2.0f);
		byte_sequence twenty_five = { 0x00, 0x00, 0xC8, 0x41 };
		xassert(bytes_to_float32(twenty_five, true)[0] == 25.0f);
		std::vector<float> floats = { 25.0f };
		xassert(float32_to_bytes(floats, true) == twenty_five);

		std::vector<double> values = { 1.0 };
		byte_sequence expected = { 0x3F, 0xF0, 0, 0, 0, 0, 0, 0 };
		xassert(float64_to_bytes(values) == expected);
		xassert(bytes_to_float64(expected)[0] == 1.0);
	}
}
