#include "logger.hpp"

#include <print>

Logger::Logger(std::string tag, bool verbose, std::FILE* out)
    : tag_(std::move(tag)), verbose_(verbose), out_(out) {}

void Logger::log(std::string_view msg) const {
    if (verbose_) {
        std::println(out_, "[{}] {}", tag_, msg);
    }
}

void Logger::warn(std::string_view msg) const {
    std::println(out_, "[{}] warning: {}", tag_, msg);
}

void Logger::error(std::string_view msg) const {
    std::println(out_, "[{}] error: {}", tag_, msg);
}
