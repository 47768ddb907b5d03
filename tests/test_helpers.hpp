#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace test {

// Sets (or unsets) an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(std::string name, std::optional<std::string> value)
        : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str())) old_ = old;
        if (value) {
            ::setenv(name_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> old_;
};

// Temporary directory of shell scripts standing in for xsel, wtype and friends.
// Point PATH at it with path_guard() so nothing real is ever spawned.
class FakeToolDir {
public:
    FakeToolDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "sd_test_tools_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data())) dir_ = buf.data();
    }

    ~FakeToolDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FakeToolDir(const FakeToolDir&) = delete;
    FakeToolDir& operator=(const FakeToolDir&) = delete;

    const std::filesystem::path& dir() const { return dir_; }

    ScopedEnv path_guard() const { return ScopedEnv("PATH", dir_.string()); }

    void add_script(const std::string& name, const std::string& body) const {
        auto path = dir_ / name;
        {
            std::ofstream f(path);
            f << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    }

    // Saves its arguments (one per line) to <name>.args and its stdin to
    // <name>.stdin, optionally complains on stderr, then exits with exit_code.
    void add_recording_tool(const std::string& name, int exit_code = 0,
                            const std::string& stderr_msg = "") const {
        auto base = (dir_ / name).string();
        std::string body;
        body += ": > '" + base + ".args'\n";
        body += "for a in \"$@\"; do printf '%s\\n' \"$a\" >> '" + base + ".args'; done\n";
        body += "/bin/cat > '" + base + ".stdin'\n";
        if (!stderr_msg.empty()) body += "echo '" + stderr_msg + "' >&2\n";
        body += "exit " + std::to_string(exit_code);
        add_script(name, body);
    }

    bool was_run(const std::string& name) const {
        return std::filesystem::exists(dir_ / (name + ".args"));
    }

    std::vector<std::string> args_of(const std::string& name) const {
        std::vector<std::string> args;
        std::ifstream f(dir_ / (name + ".args"));
        std::string line;
        while (std::getline(f, line)) args.push_back(line);
        return args;
    }

    std::string stdin_of(const std::string& name) const {
        std::ifstream f(dir_ / (name + ".stdin"));
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

private:
    std::filesystem::path dir_;
};

} // namespace test
