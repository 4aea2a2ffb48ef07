/**
 * @file declaration.h
 * @brief Detection of bindable declarations in a single source line.
 */

#pragma once

#include <string>

#include "record.h"

namespace marginalia {

/// A declaration found on one line. `valid` is false when nothing matched.
struct Declaration {
    std::string symbol;
    SymbolType type = SymbolType::Function;
    bool valid = false;
};

/**
 * Recognise, after optional indentation and in this priority order:
 *   def NAME(  /  async def NAME(     -> Function
 *   class NAME(  /  class NAME:       -> Class
 *   NAME = ...                        -> Variable  ("NAME == ..." is not)
 */
Declaration find_declaration(const std::string& line);

}  // namespace marginalia
