#pragma once

#include <sstream>
#include <string>
#include <type_traits>
#include <doorsid/core/exception/Exceptions.hpp>

namespace doorsid

{

    // stream based conversion, the whole input must be consumed
    template <typename OutputT, typename InputT> OutputT lexical_cast(const InputT &input)
    {
        if constexpr (std::is_same<OutputT, InputT>::value) {
            // identity cast
            return input;
        } else if constexpr (std::is_same<OutputT, bool>::value) {
            std::ostringstream oss;
            oss << input;
            auto str = oss.str();
            if (str == "true" || str == "1" || str == "yes" || str == "on") {
                return true;
            }
            if (str == "false" || str == "0" || str == "no" || str == "off") {
                return false;
            }
            THROWF(doorsid::InputException) << "Unable to convert value to bool: '" << str << "'" << THROWF_END;
        } else {
            std::stringstream ss;
            ss << input;
            if constexpr (std::is_unsigned<OutputT>::value) {
                // streams wrap negative values around for unsigned types
                auto str = ss.str();
                auto pos = str.find_first_not_of(" \t\n\r\f\v");
                if (pos != std::string::npos && str[pos] == '-') {
                    THROWF(doorsid::InputException) << "Negative value for an unsigned type: '" << str << "'" << THROWF_END;
                }
            }
            OutputT output;
            if (!(ss >> output) || ss.peek() != std::char_traits<char>::eof()) {
                THROWF(doorsid::InputException) << "Unable to convert value: '" << input << "'" << THROWF_END;
            }
            return output;
        }
    }

}
