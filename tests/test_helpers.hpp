#pragma once
#include <string>
#include <filesystem>
#include "term_coder/config/EngineConfig.hpp"

namespace term_coder::test_support {

// Scratch project root, removed on destruction.
class TempProject {
public:
    TempProject();
    ~TempProject();

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    const std::filesystem::path& root() const { return root_; }

    void write(const std::string& rel, const std::string& content) const;
    std::string read(const std::string& rel) const;
    bool exists(const std::string& rel) const;

private:
    std::filesystem::path root_;
};

// Defaults without formatters, so tests never spawn external tools.
EngineConfig quiet_config();

}
