#include "common/privilege.hpp"

#include <QString>

#include <pwd.h>
#include <unistd.h>

namespace steward {

namespace {

std::string homeForUser(const std::string &userName)
{
    if (userName.empty()) {
        return {};
    }
    const passwd *entry = getpwnam(userName.c_str());
    if (!entry || !entry->pw_dir) {
        return {};
    }
    return entry->pw_dir;
}

} // namespace

PrivilegeContext currentPrivilegeContext()
{
    PrivilegeContext context;
    context.uid = static_cast<int>(getuid());
    context.euid = static_cast<int>(geteuid());
    context.elevated = context.euid == 0;

    const QString sudoUser = qEnvironmentVariable("SUDO_USER");
    if (!sudoUser.isEmpty()) {
        context.userName = sudoUser.toStdString();
        context.home = homeForUser(context.userName);
    } else {
        context.userName = qEnvironmentVariable("USER").toStdString();
    }

    if (context.home.empty()) {
        context.home = qEnvironmentVariable("HOME").toStdString();
    }
    return context;
}

bool actsForInvokingUser(const PrivilegeContext &context)
{
    return context.elevated && !context.userName.empty() && context.userName != "root";
}

std::string expandHome(const std::string &path, const PrivilegeContext &context)
{
    if (path == "~") {
        return context.home;
    }
    if (path.rfind("~/", 0) == 0 && !context.home.empty()) {
        return context.home + path.substr(1);
    }
    return path;
}

} // namespace steward
