#include "ContainmentChecker.hpp"
#include <string>

bool ContainmentChecker::contains(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    const std::string& r = root.native();
    const std::string& c = candidate.native();
    if (r.empty() || c.empty() || !root.is_absolute() || !candidate.is_absolute()) {
        return false;
    }
    if (c == r) {
        return true;
    }
    if (c.size() <= r.size() || c.compare(0, r.size(), r) != 0) {
        return false;
    }
    // "/" already ends with the separator
    if (r.back() == '/') {
        return true;
    }
    return c[r.size()] == '/';
}

const AllowedRoot* ContainmentChecker::findRoot(const std::filesystem::path& canonical, const std::vector<AllowedRoot>& roots) {
    const AllowedRoot* best = nullptr;
    for (const auto& root : roots) {
        if (!contains(root.path(), canonical)) {
            continue;
        }
        if (!best || root.path().native().size() > best->path().native().size()) {
            best = &root;
        }
    }
    return best;
}

const AllowedRoot& ContainmentChecker::isContained(const ResolvedPath& resolved, const std::vector<AllowedRoot>& roots) {
    const AllowedRoot* root = findRoot(resolved.path(), roots);
    if (!root) {
        throw AccessError::accessDenied();
    }
    return *root;
}
