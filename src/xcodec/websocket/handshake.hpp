#pragma once
#include <map>
#include <string>
#include "../sha1.hpp"
#include "../base64.hpp"
#include "../detail/exceptions.hpp"
namespace xcodec
{
namespace websocket
{
	static constexpr const char *accept_guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

	//Sec-WebSocket-Accept for the client's Sec-WebSocket-Key
	static inline std::string make_accept_key(const std::string &key)
	{
		return base64::encode(sha1_digest(from_text(key + accept_guid)));
	}

	static inline std::string make_handshake(const std::string &key, const std::string &protocol, const std::map<std::string, std::string> &headers = {})
	{
		if (key.empty())
			throw codec_error("key must not empty");

		std::string data;
		data.reserve(128);

		data.append("HTTP/1.1 101 Switching Protocols\r\n");
		data.append("Upgrade: websocket\r\n");
		data.append("Connection: Upgrade\r\n");
		for (auto &itr : headers)
			data.append(itr.first + ": " + itr.second + "\r\n");

		data.append("Sec-WebSocket-Accept: ");
		data.append(make_accept_key(key));
		data.append("\r\n");

		if (protocol.size())
		{
			data.append("Sec-WebSocket-Protocol: ");
			data.append(protocol);
			data.append("\r\n");
		}
		data.append("\r\n");
		return data;
	}
}
}
