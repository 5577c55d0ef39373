#pragma once
#include "detail/exceptions.hpp"
#include "bytes.hpp"
#include "endec.hpp"
#include "checksum.hpp"
#include "sha1.hpp"
#include "base64.hpp"
#include "ascii85.hpp"
#include "vlq.hpp"
#include "utf8.hpp"
#include "utf16.hpp"
#include "utf32.hpp"
#include "websocket/frame.hpp"
#include "websocket/frame_parser.hpp"
#include "websocket/frame_builder.hpp"
#include "websocket/handshake.hpp"
