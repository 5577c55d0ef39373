#include "xcodec/checksum.hpp"
#include "xtest/xtest.hpp"

using namespace xcodec;

XTEST_SUITE(checksum)
{
	static const byte_sequence buffer_a = {
		0x08, 0xC6, 0x9C, 0x1C, 0xF0, 0xEF, 0xE1, 0xD7,
		0xE1, 0x0B, 0xF2, 0xF6, 0xC5, 0x7F, 0xD0 };
	static const byte_sequence buffer_b = {
		0x90, 0x9F, 0x38, 0x8C, 0xCC, 0x69, 0x48, 0x61,
		0x47, 0xB3, 0xD0, 0xF2, 0x22, 0x3A, 0x00 };

	static byte_sequence concat(const byte_sequence &a, const byte_sequence &b)
	{
		byte_sequence result(a);
		result.insert(result.end(), b.begin(), b.end());
		return result;
	}

	XUNIT_TEST(adler32_text)
	{
		xassert(adler32(from_text("foo-bar")) == 0x0AA402A7);
		xassert(adler32(from_text("Wikipedia")) == 0x11E60398);
		xassert(adler32(byte_sequence()) == 1);
	}

	XUNIT_TEST(adler32_binary)
	{
		xassert(adler32(buffer_a) == 0x49F60A06);
		xassert(adler32(buffer_b) == 0x3BDC06EA);
		xassert(adler32(concat(buffer_a, buffer_b)) == 0x1C2C10EF);
	}

	XUNIT_TEST(adler32_running)
	{
		xassert(adler32(buffer_b, adler32(buffer_a)) == 0x1C2C10EF);
	}

	XUNIT_TEST(adler32_large_input)
	{
		//long enough to need the deferred modulo more than once
		byte_sequence bytes(100000, 0xFF);
		uint32_t a = 1, b = 0;
		for (auto &itr : bytes)
		{
			a = (a + itr) % 65521;
			b = (b + a) % 65521;
		}
		xassert(adler32(bytes) == ((b << 16) | a));
	}

	XUNIT_TEST(crc32_text)
	{
		xassert(crc32(from_text("Foo123")) == 0x67EDF5DB);
		xassert(crc32(from_text("foo-bar")) == 0x4C2CD9E9);
		//-0x52553FD2 as a signed 32-bit value
		xassert(crc32(from_text("Wikipedia")) == 0xADAAC02E);
		xassert(crc32(byte_sequence()) == 0);
	}

	XUNIT_TEST(crc32_binary)
	{
		byte_sequence bytes = { 0x00, 0x1B, 0xA4, 0x00, 0x07 };
		xassert(crc32(bytes) == 0x012F479C);
		xassert(crc32(buffer_a) == 0x2CD129D3);
		xassert(crc32(buffer_b) == 0x0F9640D1);
		xassert(crc32(concat(buffer_a, buffer_b)) == 0xD48AE423);
		xassert((int32_t)crc32(concat(buffer_a, buffer_b)) == -0x2B751BDD);
	}

	XUNIT_TEST(crc32_running)
	{
		xassert(crc32(buffer_b, crc32(buffer_a)) == 0xD48AE423);
	}

	XUNIT_TEST(rotate_wraps_modulo_32)
	{
		xassert(rotl(0xF8000000, 32) == 0xF8000000);
		xassert(rotr(0xF8000000, 32) == 0xF8000000);
		xassert(rotl(0xF8000000, 33) == 0xF0000001);
		xassert(rotr(0xF8000000, 33) == 0x7C000000);
		xassert(rotl(0xF8000000, 34) == 0xE0000003);
		xassert(rotr(0xF8000000, 34) == 0x3E000000);
		xassert(rotl(0x12345678, -4) == 0x81234567);
	}

	XUNIT_TEST(rotl_mirrors_rotr)
	{
		const uint32_t values[] = { 0, 1, 0x80000000, 0xDEADBEEF, 0x12345678 };
		for (auto x : values)
		{
			for (int64_t n = -40; n <= 70; n++)
			{
				int64_t back = 32 - (((n % 32) + 32) % 32);
				xassert(rotl(x, n) == rotr(x, back));
			}
		}
	}
}
