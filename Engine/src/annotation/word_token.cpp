#include <annotation/word_token.hpp>

namespace Rosetta {

std::string WordToken::render() const {
    std::string out = headword;
    if (reading) out += "(" + *reading + ")";
    if (sense && *sense != 0) out += "[" + std::to_string(*sense) + "]";
    if (display) out += "{" + *display + "}";
    if (example) out += "~";
    return out;
}

} // namespace Rosetta
