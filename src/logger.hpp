#pragma once

#include <cstdio>
#include <string>
#include <string_view>

// Line logger handed down by reference from main(). The destination is fixed
// at construction; nothing here is global.
class Logger {
public:
    explicit Logger(std::string tag, bool verbose = false, std::FILE* out = stderr);

    // Debug chatter, printed only in verbose mode.
    void log(std::string_view msg) const;
    void warn(std::string_view msg) const;
    void error(std::string_view msg) const;

    bool verbose() const { return verbose_; }

private:
    std::string tag_;
    bool verbose_;
    std::FILE* out_;
};
