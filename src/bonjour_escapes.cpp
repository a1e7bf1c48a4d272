#include "bonjour_escapes.h"

namespace bridgelink {
namespace bonjour_escapes {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

std::string decode(const std::string& input) {
    if (input.find('\\') == std::string::npos) {
        return input;
    }

    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];
        if (c != '\\' || i + 1 >= input.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        if (i + 3 < input.size() &&
            is_digit(input[i + 1]) && is_digit(input[i + 2]) && is_digit(input[i + 3])) {
            int value = (input[i + 1] - '0') * 100 + (input[i + 2] - '0') * 10 + (input[i + 3] - '0');
            if (value <= 255) {
                out.push_back(static_cast<char>(static_cast<unsigned char>(value)));
                i += 4;
                continue;
            }
        }

        out.push_back(input[i + 1]);
        i += 2;
    }

    return out;
}

} // namespace bonjour_escapes
} // namespace bridgelink
