#pragma once
#include <exception>
#include <string>
#include <cstdint>
#include <cstddef>
namespace xcodec
{
	struct codec_error : std::exception
	{
		codec_error(const std::string &error_str)
			:error_str_(error_str)
		{
		}
		virtual char const* what() const throw()
		{
			return error_str_.c_str();
		}
		std::string error_str_;
	};

	struct invalid_code_point : codec_error
	{
		invalid_code_point(uint32_t code_point, const std::string &error_str)
			:codec_error(error_str),
			code_point_(code_point)
		{
		}
		uint32_t code_point_;
	};

	struct invalid_utf8 : codec_error
	{
		invalid_utf8(std::size_t offset)
			:codec_error("Invalid UTF-8 at offset " + std::to_string(offset)),
			offset_(offset)
		{
		}
		std::size_t offset_;
	};

	struct payload_too_large : codec_error
	{
		payload_too_large()
			:codec_error("Payload too large")
		{
		}
	};

	struct frame_error : codec_error
	{
		frame_error(const std::string &error_str)
			:codec_error(error_str)
		{
		}
	};

	struct syntax_error : codec_error
	{
		syntax_error(const std::string &error_str)
			:codec_error(error_str)
		{
		}
	};
}
