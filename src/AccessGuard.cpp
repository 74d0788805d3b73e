#include "AccessGuard.hpp"
#include "ContainmentChecker.hpp"
#include "PathResolver.hpp"

void AccessGuard::requireConfigured() const {
    if (config_.status() != ConfigStatus::Configured) {
        throw AccessError(ErrorKind::NotConfigured, config_.statusMessage());
    }
}

GuardedPath AccessGuard::guard(const std::string& rawPath) const {
    requireConfigured();
    try {
        ResolvedPath resolved = PathResolver::resolve(rawPath);
        const AllowedRoot& root = ContainmentChecker::isContained(resolved, config_.roots());
        return GuardedPath(resolved, root);
    } catch (const AccessError& e) {
        if (e.kind() == ErrorKind::NotFound || e.kind() == ErrorKind::IOError) {
            auto nearest = PathResolver::resolveNearest(rawPath);
            if (!ContainmentChecker::findRoot(nearest, config_.roots())) {
                throw AccessError::accessDenied();
            }
        }
        throw;
    }
}

GuardedPath AccessGuard::guardRoot(const AllowedRoot& root) const {
    ResolvedPath current = PathResolver::refresh(root.resolved());
    if (current != root.resolved()) {
        // replaced by a symlink (or the like) since startup
        throw AccessError(ErrorKind::NotAllowed, "Allowed directory no longer resolves to itself");
    }
    return GuardedPath(current, root);
}
