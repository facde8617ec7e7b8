#pragma once

#include <optional>
#include <string>

class ProcessDetector {
public:
    virtual ~ProcessDetector() = default;

    // Project a process (or one of its ancestors) was launched for.
    virtual std::optional<std::string> project_for_pid(int pid) const = 0;
};
