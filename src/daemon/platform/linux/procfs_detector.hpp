#pragma once

#include "platform/process_detector.hpp"

#include <optional>
#include <string>
#include <string_view>

// Reads I3PM_PROJECT_NAME from /proc/<pid>/environ, walking up the parent
// chain when a process does not carry it (terminals spawning shells, etc.).
class ProcfsDetector : public ProcessDetector {
public:
    static constexpr int MAX_DEPTH = 8;

    explicit ProcfsDetector(std::string proc_root = "/proc");

    std::optional<std::string> project_for_pid(int pid) const override;

private:
    std::optional<std::string> read_environ_var(int pid, std::string_view name) const;
    int read_ppid(int pid) const;

    std::string proc_root_;
};

// Value of `name` in a NUL-separated environ block.
std::optional<std::string> find_env_value(std::string_view environ, std::string_view name);
