#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Small process-wide logger with "{}" placeholder formatting
class MinimalLogger {
public:
    enum class Level { Debug, Info, Warn, Error, Off };

    explicit MinimalLogger(std::string name) : name_(std::move(name)) {}

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool enabled(Level level) const { return level >= level_ && level_ != Level::Off; }

    void add_file(const std::filesystem::path& path);

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (!enabled(level)) return;
        write(level, format_message(fmt, std::forward<Args>(args)...));
    }

    void write(Level level, const std::string& msg);

    static const char* level_to_string(Level level);

    template<typename T>
    static std::string to_string_helper(const T& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    static std::string to_string_helper(const std::string& value) {
        return value;
    }

    static std::string to_string_helper(const char* value) {
        return std::string(value);
    }

    static std::string format_message(const std::string& fmt) {
        return fmt;
    }

    template<typename T, typename... Args>
    static std::string format_message(const std::string& fmt, T&& first, Args&&... rest) {
        size_t pos = fmt.find("{}");
        if (pos == std::string::npos) {
            return fmt;
        }
        std::string result = fmt.substr(0, pos) + to_string_helper(std::forward<T>(first));
        result += format_message(fmt.substr(pos + 2), std::forward<Args>(rest)...);
        return result;
    }

    std::string name_;
    Level level_ = Level::Info;
    std::mutex mutex_;
    std::vector<std::unique_ptr<std::ofstream>> files_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
auto Logger() -> std::shared_ptr<MinimalLogger>;
