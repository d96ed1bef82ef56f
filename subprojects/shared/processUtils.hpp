#pragma once
#include <cstdint>
#include <functional>
#include <filesystem>
#include <thread>
#include <sstream>
#include <string>

#if defined(__linux__)
    #include <sys/syscall.h>
    #include <unistd.h>
#elif defined(__APPLE__)
    #include <pthread.h>
#endif

class ProcessUtils {
public:
    // Native thread ID as shown by debuggers and top -H
    static uint64_t get_native_thread_id() {
#if defined(__linux__)
        return static_cast<uint64_t>(syscall(SYS_gettid));
#elif defined(__APPLE__)
        uint64_t thread_id;
        pthread_threadid_np(NULL, &thread_id);
        return thread_id;
#else
        return std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
    }

    static std::string get_thread_info() {
        std::ostringstream oss;
        oss << "Native ID: " << get_native_thread_id()
            << ", std::thread ID: " << std::this_thread::get_id();
        return oss.str();
    }

    // Set current thread name (best-effort, platform-specific)
    static void set_current_thread_name(const std::string& name);

    // $HOME, or the password database entry when HOME is unset
    static std::filesystem::path get_home_dir();
};
