#include <iostream>
#include <iterator>
#include <iomanip>
#include <string>
#include <vector>
#include "xcodec/xcodec.hpp"
#include "xlog/xlog.hpp"

using namespace xcodec;

struct tool_config
{
	std::string command_;
	std::string argument_;
	bool little_endian_ = false;
	bool keep_masked_ = false;
	utf8::utf8_options utf8_options_;
	std::string log_path_ = "xcodec_tool.log";
	xlog::log_level log_level_ = xlog::log_level::INFO;
};

static void usage()
{
	std::cerr <<
		"usage: xcodec_tool <command> [flags] [arg] < input\n"
		"commands:\n"
		"  adler32 | crc32 | sha1\n"
		"  base64-encode | base64-decode | ascii85-encode | ascii85-decode\n"
		"  utf8-check | utf8-decode\n"
		"  uint16 | uint32 | uint64\n"
		"  ws-decode | ws-accept <key>\n"
		"flags:\n"
		"  --le --strict --allow-overlong --allow-surrogates --strip-bom --keep-masked\n"
		"  --log <file> --log-level info|warn|crit\n";
}

static bool parse_args(int argc, char **argv, tool_config &config)
{
	for (int i = 1; i < argc; i++)
	{
		std::string arg = argv[i];
		if (arg == "--le")
			config.little_endian_ = true;
		else if (arg == "--strict")
			config.utf8_options_.strict_ = true;
		else if (arg == "--allow-overlong")
			config.utf8_options_.allow_overlong_ = true;
		else if (arg == "--allow-surrogates")
			config.utf8_options_.allow_surrogates_ = true;
		else if (arg == "--strip-bom")
			config.utf8_options_.strip_bom_ = true;
		else if (arg == "--keep-masked")
			config.keep_masked_ = true;
		else if (arg == "--log" && i + 1 < argc)
			config.log_path_ = argv[++i];
		else if (arg == "--log-level" && i + 1 < argc)
			config.log_level_ = xlog::level_from_string(argv[++i]);
		else if (arg.compare(0, 2, "--") == 0)
			return false;
		else if (config.command_.empty())
			config.command_ = arg;
		else if (config.argument_.empty())
			config.argument_ = arg;
		else
			return false;
	}
	return !config.command_.empty();
}

static byte_sequence read_input()
{
	std::cin >> std::noskipws;
	std::istreambuf_iterator<char> begin(std::cin), end;
	std::string data(begin, end);
	return from_text(data);
}

template<typename T>
static void print_values(const std::vector<T> &values)
{
	for (auto &itr : values)
		std::cout << "0x" << std::hex << std::setw(sizeof(T) * 2) << std::setfill('0')
			<< (uint64_t)itr << std::dec << "\n";
}

static void print_frame(const websocket::frame &f)
{
	std::cout << "fin: " << f.fin_ << "\n"
		<< "rsv: " << f.rsv1_ << f.rsv2_ << f.rsv3_ << "\n"
		<< "opcode: " << (int)f.opcode_ << " (" << websocket::to_string(f.name()) << ")\n";
	if (f.masked_)
		std::cout << "mask: 0x" << std::hex << std::setw(8) << std::setfill('0')
			<< f.masking_key_ << std::dec << "\n";
	std::cout << "length: " << f.length() << "\n"
		<< "remaining: " << f.remaining_ << "\n"
		<< "trailer: " << f.trailer_.size() << "\n"
		<< "payload: " << base64::encode(f.payload_) << "\n";
}

//returns false when the command is unknown
static bool run(const tool_config &config)
{
	const std::string &cmd = config.command_;
	if (cmd == "ws-accept")
	{
		std::cout << websocket::make_accept_key(config.argument_) << "\n";
		return true;
	}

	byte_sequence input = read_input();
	XLOG_INFO << "command " << cmd << " input bytes " << (uint64_t)input.size();

	if (cmd == "adler32")
		print_values(std::vector<uint32_t>{ adler32(input) });
	else if (cmd == "crc32")
		print_values(std::vector<uint32_t>{ crc32(input) });
	else if (cmd == "sha1")
		std::cout << sha1_hex(input) << "\n";
	else if (cmd == "base64-encode")
		std::cout << base64::encode(input) << "\n";
	else if (cmd == "base64-decode")
		std::cout << to_latin1(base64::decode_bytes(to_latin1(input)));
	else if (cmd == "ascii85-encode")
		std::cout << ascii85::encode(input) << "\n";
	else if (cmd == "ascii85-decode")
		std::cout << to_latin1(ascii85::decode(to_latin1(input)));
	else if (cmd == "utf8-check")
	{
		bool valid = utf8::check(input);
		std::cout << (valid ? "valid" : "invalid") << "\n";
		if (!valid)
			XLOG_WARN << "input is not well-formed UTF-8";
	}
	else if (cmd == "utf8-decode")
	{
		utf8::utf8_options options = config.utf8_options_;
		options.code_points_ = true;
		for (auto &itr : utf8::decode_bytes(input, options).code_points_)
			std::cout << "U+" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
				<< itr << std::dec << std::nouppercase << "\n";
	}
	else if (cmd == "uint16")
		print_values(bytes_to_uint16(input, config.little_endian_));
	else if (cmd == "uint32")
		print_values(bytes_to_uint32(input, config.little_endian_));
	else if (cmd == "uint64")
		print_values(bytes_to_uint64(input, config.little_endian_));
	else if (cmd == "ws-decode")
		print_frame(websocket::decode_frame(input, config.keep_masked_));
	else
		return false;
	return true;
}

int main(int argc, char **argv)
{
	tool_config config;
	if (!parse_args(argc, argv, config))
	{
		usage();
		return 2;
	}
	XLOG_OPEN(config.log_path_, config.log_level_);

	try
	{
		if (!run(config))
		{
			XLOG_WARN << "unknown command " << config.command_;
			usage();
			return 2;
		}
	}
	catch (const codec_error &e)
	{
		XLOG_CRIT << config.command_ << " failed: " << e.what();
		std::cerr << "xcodec_tool: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
