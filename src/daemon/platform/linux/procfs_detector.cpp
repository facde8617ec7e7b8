#include "platform/linux/procfs_detector.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

ProcfsDetector::ProcfsDetector(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::optional<std::string> ProcfsDetector::project_for_pid(int pid) const {
    for (int depth = 0; pid > 1 && depth < MAX_DEPTH; ++depth) {
        auto project = read_environ_var(pid, "I3PM_PROJECT_NAME");
        if (project && !project->empty()) return project;
        pid = read_ppid(pid);
    }
    return std::nullopt;
}

std::optional<std::string> ProcfsDetector::read_environ_var(int pid, std::string_view name) const {
    std::ifstream f(std::format("{}/{}/environ", proc_root_, pid), std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    std::string environ((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return find_env_value(environ, name);
}

int ProcfsDetector::read_ppid(int pid) const {
    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return 0;
    std::string stat;
    std::getline(f, stat);

    // comm may contain spaces and parentheses; fields resume after the last ')'.
    auto close = stat.rfind(')');
    if (close == std::string::npos) return 0;

    std::istringstream rest(stat.substr(close + 1));
    char state = 0;
    int ppid = 0;
    if (!(rest >> state >> ppid)) return 0;
    return ppid;
}

std::optional<std::string> find_env_value(std::string_view environ, std::string_view name) {
    while (!environ.empty()) {
        auto end = environ.find('\0');
        auto entry = environ.substr(0, end);
        if (entry.size() > name.size() && entry.starts_with(name) && entry[name.size()] == '=') {
            return std::string(entry.substr(name.size() + 1));
        }
        if (end == std::string_view::npos) break;
        environ.remove_prefix(end + 1);
    }
    return std::nullopt;
}
