#pragma once

#include <string>

namespace doorsid

{
    
    /**
     * URL query-component encoding (RFC 3986)
     * unreserved characters (A-Z a-z 0-9 - . _ ~) are copied, every other byte is emitted as %XX
    */
    std::string percent_encode(const std::string &str);

}
