#pragma once
#include <string>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#ifdef _WIN32
#define TERM_CODER_POPEN _popen
#define TERM_CODER_PCLOSE _pclose
#else
#include <sys/wait.h>
#define TERM_CODER_POPEN popen
#define TERM_CODER_PCLOSE pclose
#endif

namespace term_coder {

struct ProcessResult {
    std::string output;
    int exit_code;
    bool success;
};

class SubProcess {
public:
    // Single-quote an argument for /bin/sh.
    static std::string quote(const std::string& arg) {
        std::string out = "'";
        for (char c : arg) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += "'";
        return out;
    }

    static ProcessResult run(const std::string& cmd) {
        std::array<char, 256> buffer;
        std::string result;

        // Redirect stderr to stdout to capture everything
        std::string full_cmd = cmd + " 2>&1";

        FILE* pipe = TERM_CODER_POPEN(full_cmd.c_str(), "r");
        if (!pipe) throw std::runtime_error("popen() failed for: " + cmd);

        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            result += buffer.data();
        }

        int status = TERM_CODER_PCLOSE(pipe);
        int rc = status;
#ifndef _WIN32
        if (status != -1 && WIFEXITED(status)) rc = WEXITSTATUS(status);
#endif
        return { result, rc, rc == 0 };
    }

    // Runs `cmd` with `cwd` as working directory.
    static ProcessResult run_in(const std::filesystem::path& cwd, const std::string& cmd) {
        return run("cd " + quote(cwd.string()) + " && " + cmd);
    }

    // PATH lookup, like `which`. Empty when not found.
    static std::string find_executable(const std::string& name) {
        if (name.empty()) return "";
        if (name.find('/') != std::string::npos) {
            std::error_code ec;
            return std::filesystem::exists(name, ec) ? name : "";
        }
        const char* path_env = std::getenv("PATH");
        if (!path_env) return "";

        std::string paths(path_env);
        size_t start = 0;
        while (start <= paths.size()) {
            size_t end = paths.find(':', start);
            if (end == std::string::npos) end = paths.size();
            std::string dir = paths.substr(start, end - start);
            if (!dir.empty()) {
                std::filesystem::path candidate = std::filesystem::path(dir) / name;
                std::error_code ec;
                if (std::filesystem::is_regular_file(candidate, ec)) return candidate.string();
            }
            start = end + 1;
        }
        return "";
    }
};

}
