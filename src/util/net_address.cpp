#include "util/net_address.hpp"

#include <cstdlib>

namespace asmhom {

bool parse_listen_address(const std::string& addr, std::string& host, uint16_t& port) {
    std::string h;
    std::string p;
    if (!addr.empty() && addr[0] == '[') {
        auto close = addr.find(']');
        if (close == std::string::npos || close + 1 >= addr.size() ||
            addr[close + 1] != ':') {
            return false;
        }
        h = addr.substr(1, close - 1);
        p = addr.substr(close + 2);
    } else {
        auto colon = addr.rfind(':');
        if (colon == std::string::npos) return false;
        h = addr.substr(0, colon);
        p = addr.substr(colon + 1);
        if (h.find(':') != std::string::npos) return false;  // unbracketed IPv6
    }
    if (p.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(p.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;

    host = h.empty() ? "0.0.0.0" : h;
    port = static_cast<uint16_t>(val);
    return true;
}

} // namespace asmhom
