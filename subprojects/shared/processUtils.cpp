#include "processUtils.hpp"
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#include <pwd.h>
#endif

#include <cstdlib>

void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__APPLE__)
    pthread_setname_np(name.c_str());
#elif defined(__linux__)
    // Linux limits the name to 16 chars including NUL
    const std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
#else
    (void)name;
#endif
}

std::filesystem::path ProcessUtils::get_home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home);
    }
#if defined(__linux__) || defined(__APPLE__)
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
#endif
    return std::filesystem::current_path();
}
