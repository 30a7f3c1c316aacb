#include "Paths.hpp"

#include <cstdlib>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path homeDirectory() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return home;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir)
        return pw->pw_dir;
    throw std::runtime_error("Cannot determine home directory");
}

Paths Paths::under(const fs::path& root) {
    Paths p;
    p.root = root;
    p.configFile = root / "config";
    p.sessionDir = root / "session";
    p.vaultDir = root / "vault";
    p.logFile = root / "hidemail.log";
    return p;
}

Paths Paths::resolve() {
    if (const char* custom = std::getenv("HIDEMAIL_HOME"); custom && *custom)
        return under(custom);
    return under(homeDirectory() / ".hidemail");
}

void Paths::ensureRoot() const {
    std::error_code ec;
    if (fs::create_directories(root, ec)) {
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    if (ec) {
        throw std::runtime_error("Cannot create state directory '" + root.string() + "': " + ec.message());
    }
}
