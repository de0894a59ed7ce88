#pragma once

#include <cstdint>
#include <string>

namespace asmhom {

// Parse a listen address: "host:port", ":port" (all interfaces) or
// "[v6addr]:port". Returns false on invalid format or port.
bool parse_listen_address(const std::string& addr, std::string& host, uint16_t& port);

} // namespace asmhom
