#ifndef LOGGER_HPP
#define LOGGER_HPP

// Requires C++17 for <filesystem> and inline variables
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

// ––––––––––––––––––
// Configuration Flags
// ––––––––––––––––––
// Enable/disable logging (default: enabled)
#ifndef LOG_ENABLED
#define LOG_ENABLED 1
#endif

// Enable/disable benchmarking (default: enabled)
#ifndef BENCHMARK_ENABLED
#define BENCHMARK_ENABLED 1
#endif

// Optional: compile-time top-level output directory.
// Example: g++ -DOUTPUT_DIR="\"/home/myuser\"" ...
// At run time the environment variable CEP_OUTPUT_DIR takes precedence.

namespace logger {

// Folders of the current run: <top>/plan_<timestamp>/{logs,obs,bench}
struct RunFolders {
    std::filesystem::path run;
    std::filesystem::path logs;
    std::filesystem::path obs;
    std::filesystem::path bench;
};

inline std::mutex init_mutex;
inline std::unique_ptr<RunFolders> folders;

// protect the stream cache
inline std::mutex log_streams_mutex;
inline std::unordered_map<std::string, std::shared_ptr<std::ofstream>> log_streams;

// makes every LOG line atomic
inline std::mutex write_mutex;

inline std::string make_timestamped_folder_name() {
    auto t = std::time(nullptr);
    auto tm = *std::localtime(&t);
    std::ostringstream name;
    name << "plan_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return name.str();
}

inline std::filesystem::path top_level_dir() {
    if (const char* env = std::getenv("CEP_OUTPUT_DIR"); env != nullptr && *env != '\0') {
        return std::filesystem::path(env);
    }
#ifdef OUTPUT_DIR
    return std::filesystem::path(OUTPUT_DIR);
#else
    return std::filesystem::current_path();
#endif
}

inline void flush_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) kv.second->flush();
    }
}

inline void close_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) kv.second->close();
    }
    log_streams.clear();
}

// Creates the run folders on first use and registers the exit handler
inline const RunFolders& run_folders() {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (folders) return *folders;

    auto f = std::make_unique<RunFolders>();
    f->run = top_level_dir() / make_timestamped_folder_name();
    f->logs = f->run / "logs";
    f->obs = f->run / "obs";
    f->bench = f->run / "bench";
    std::filesystem::create_directories(f->logs);
    std::filesystem::create_directories(f->obs);
    std::filesystem::create_directories(f->bench);
    folders = std::move(f);

    std::atexit([]() {
        flush_all_logs();
        close_all_logs();
    });
    return *folders;
}

inline std::string log_dir() { return run_folders().logs.string(); }
inline std::string obs_dir() { return run_folders().obs.string(); }
inline std::string bench_dir() { return run_folders().bench.string(); }

// relpath is relative to the run folder, e.g. "logs/planner.log"
inline std::shared_ptr<std::ofstream> ensure_log_stream(const std::string& relpath) {
    const auto& run = run_folders().run;

    std::lock_guard<std::mutex> lock(log_streams_mutex);
    auto it = log_streams.find(relpath);
    if (it != log_streams.end()) return it->second;

    std::filesystem::path p = run / relpath;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    auto ofs = std::make_shared<std::ofstream>(p.string(), std::ios::app | std::ios::binary);
    if (!ofs->is_open()) {
        ofs->open((run / "unnamed.log").string(), std::ios::app | std::ios::binary);
    }

    log_streams.emplace(relpath, ofs);
    return ofs;
}

inline std::ofstream& log_file(const std::string& relpath) { return *ensure_log_stream(relpath); }

}  // namespace logger

// ––––––––––––––––––
// Macros
// ––––––––––––––––––

// LOG(file, msg)
// file  : file name inside logs/ (can include subdirs)
// msg   : <<-style stream expression (e.g. "N0=" << n0)
#if LOG_ENABLED
#define LOG(file, msg)                                                 \
    do {                                                               \
        std::ostringstream _oss;                                       \
        _oss << msg;                                                   \
        std::lock_guard<std::mutex> _lg(logger::write_mutex);          \
        logger::log_file(std::string("logs/") + (file)) << _oss.str(); \
    } while (0)
#else
#define LOG(file, msg) \
    do {               \
    } while (0)
#endif

// LOG_BENCHMARK(file, msg): like LOG, written under bench/
#if BENCHMARK_ENABLED
#define LOG_BENCHMARK(file, msg)                                        \
    do {                                                                \
        std::ostringstream _oss;                                        \
        _oss << msg;                                                    \
        std::lock_guard<std::mutex> _lg(logger::write_mutex);           \
        logger::log_file(std::string("bench/") + (file)) << _oss.str(); \
    } while (0)
#else
#define LOG_BENCHMARK(file, msg) \
    do {                         \
    } while (0)
#endif

// BENCHMARK(var, { code })
// var must be a declared realtype; it receives the elapsed wall time in seconds.
#if BENCHMARK_ENABLED
#define BENCHMARK(var, code)                                                      \
    do {                                                                          \
        auto _bench_start = std::chrono::steady_clock::now();                     \
        code;                                                                     \
        auto _bench_end = std::chrono::steady_clock::now();                       \
        var = std::chrono::duration<realtype>(_bench_end - _bench_start).count(); \
    } while (0)
#else
#define BENCHMARK(var, code) \
    do {                     \
        code;                \
    } while (0)
#endif

#endif  // LOGGER_HPP
