// src/include/utf8proc_compat.hpp
#pragma once

#if __has_include(<utf8proc.h>)
// Upstream header: everything is in the global namespace.
#include <utf8proc.h>
#else
// DuckDB vendored header (in-tree extension builds): typedefs are global,
// functions and enums are in duckdb::
#include <utf8proc.hpp>

using duckdb::utf8proc_encode_char;
using duckdb::utf8proc_iterate;
#endif
