#include "core/paths.hpp"
#include <algorithm>
#include <limits.h>
#include <unistd.h>

namespace crew::core::paths {

std::filesystem::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> roots;
    auto add_with_parents = [&roots](std::filesystem::path p) {
        for (int depth = 0; depth < 3 && !p.empty(); ++depth) {
            if (std::find(roots.begin(), roots.end(), p) == roots.end()) {
                roots.push_back(p);
            }
            if (p == p.parent_path()) break;
            p = p.parent_path();
        }
    };

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        add_with_parents(cwd);
    }
    add_with_parents(executable_dir());
    return roots;
}

std::optional<std::filesystem::path> find_relative(const std::string& relative) {
    for (const auto& base : project_search_paths()) {
        auto candidate = base / relative;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return std::filesystem::canonical(candidate, ec);
        }
    }
    return std::nullopt;
}

} // namespace crew::core::paths
