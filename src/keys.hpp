#pragma once
/*
 * Keys
 *
 * Purpose: translate raw terminal key codes into the interpreter's key symbols.
 * Symbols: single printable chars ("a", " "), "Escape", "Enter", "Backspace", "Tab", "Delete",
 *          "Up", "Down", "Left", "Right", "Home", "End", "PageUp", "PageDown", "Ctrl+<letter>".
 */
#include <string>

// empty when the code has no symbol (resize events, function keys, ...)
std::string key_symbol(int ch);
