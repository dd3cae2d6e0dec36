#include "test_utils.hpp"
#include <stdexcept>

secr::idgen::codegen::source_file test_source(std::string text)
{
    return secr::idgen::codegen::tokenize("test.hpp", std::move(text));
}

std::size_t token_index(const secr::idgen::codegen::source_file& file, const std::string& text)
{
    for (std::size_t i = 0 ; i < file.tokens.size() ; ++i)
    {
        if (file.tokens[i].text == text)
            return i;
    }
    throw std::logic_error("no token " + text);
}
