#pragma once
#include <iostream>
#include <sstream>
#include <string>
#include <cstring>
#include <ctime>

/** \file
 * Debug tracing for mandi.  Tracing is compiled in only when `MANDI_DEBUG` is defined (the CMake
 * option of the same name does this); otherwise every macro below expands to a statement the
 * compiler removes, though its arguments must still compile.
 *
 * Each traced line goes to stderr as a single write, prefixed with the source file (relative to
 * the mandi/ directory), the line number and the function name.
 */

#ifdef MANDI_DEBUG
#define MANDI_DEBUG_BOOL true
#else
#define MANDI_DEBUG_BOOL false
#endif

namespace mandi { namespace debug {

/// Returns `path` with everything up to and including the last "/mandi/" removed.
inline const char* short_file(const char *path) {
    const char *last = nullptr;
    for (const char *p = std::strstr(path, "/mandi/"); p; p = std::strstr(p + 1, "/mandi/"))
        last = p;
    return last ? last + 7 : path;
}

/// Builds the "[time] file:line:function(): " prefix of a traced line.
inline std::string prefix(const char *file, int line, const char *func, bool timestamped) {
    std::ostringstream out;
    if (timestamped) {
        std::time_t t = std::time(nullptr);
        char buf[64];
        if (std::strftime(buf, sizeof buf, "[%Y-%m-%d %H:%M:%S] ", std::localtime(&t))) out << buf;
    }
    out << short_file(file) << ':' << line << ':' << func << "(): ";
    return out.str();
}

/// Writes one complete line to stderr.
inline void emit(const std::string &line) {
    std::cerr << line << std::flush;
}

}}

#define _mandi_trace(timestamped, stuff) do { if (MANDI_DEBUG_BOOL) { \
    std::ostringstream _mandi_dbg_out; \
    _mandi_dbg_out << mandi::debug::prefix(__FILE__, __LINE__, __func__, timestamped) << stuff << '\n'; \
    mandi::debug::emit(_mandi_dbg_out.str()); } } while (0)

/** MANDI_DBG(a << b << c) traces `a << b << c` when debugging is enabled, and does nothing
 * otherwise.
 */
#define MANDI_DBG(stuff) _mandi_trace(false, stuff)

/// MANDI_DBGVAR(x) is MANDI_DBG("x = " << (x))
#define MANDI_DBGVAR(x) MANDI_DBG(#x " = " << (x))

/// Like MANDI_DBG, with the local date and time added to the prefix.  Used from background threads.
#define MANDI_TDBG(stuff) _mandi_trace(true, stuff)
