#include <tmp12x/log.hpp>

#include <cstdio>

namespace tmp12x {

void stdio_log::debug(const char *msg) noexcept {
    std::fprintf(stderr, "[tmp12x] debug: %s\n", msg);
}

void stdio_log::warn(const char *msg) noexcept {
    std::fprintf(stderr, "[tmp12x] warn: %s\n", msg);
}

}
