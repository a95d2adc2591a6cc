#pragma once
#include <cstdint>
#include <thread>
#include <sstream>
#include <string>

#if defined(__linux__)
    #include <sys/syscall.h>
    #include <unistd.h>
#elif defined(__APPLE__)
    #include <pthread.h>
#endif

/// Thread helpers used by the transport workers for diagnostics.
class ProcessUtils {
public:
    // Native thread ID as shown by debuggers and top -H
    static std::uint64_t get_native_thread_id() {
#if defined(__linux__)
        return static_cast<std::uint64_t>(syscall(SYS_gettid));
#elif defined(__APPLE__)
        std::uint64_t thread_id;
        pthread_threadid_np(NULL, &thread_id);
        return thread_id;
#else
        return std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
    }

    static std::string get_thread_info() {
        std::ostringstream oss;
        oss << "native id " << get_native_thread_id()
            << ", std::thread id " << std::this_thread::get_id();
        return oss.str();
    }

    // Set current thread name (best-effort, truncated to the platform limit)
    static void set_current_thread_name(const std::string& name);
};
