#include "errors.hpp"

#include <algorithm>
#include <sstream>

namespace veq {

LexError::LexError(std::size_t position, char character)
    : SyntaxError(position, std::string("unexpected character '") + character + "'"),
      ch(character) {}

std::string formatDiagnostic(const std::string& source, const SyntaxError& error) {
    std::ostringstream out;
    out << "column " << error.position() << ": " << error.what() << '\n';
    out << "  " << source << '\n';
    // Позиция End-лексемы совпадает с длиной строки, указатель встает сразу за ней
    std::size_t column = std::min(error.position(), source.size());
    out << "  " << std::string(column, ' ') << '^';
    return out.str();
}

} // namespace veq
