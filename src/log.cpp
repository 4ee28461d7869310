#include "httpstream/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace httpstream {

namespace {

std::atomic<bool> g_verbose{false};

void vlog(FILE* out, const char* level, const char* fmt, va_list args) {
    fprintf(out, "[httpstream] %s", level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "debug: ", fmt, args);
    va_end(args);
}

}  // namespace httpstream
