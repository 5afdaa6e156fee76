#include "cst/core/util/Logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace {

std::string timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

const char* MinimalLogger::level_to_string(Level level)
{
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        default:           return "?????";
    }
}

void MinimalLogger::write(Level level, const std::string& msg)
{
    std::ostringstream oss;
    oss << "[" << timestamp() << "] [" << level_to_string(level) << "] ["
        << name_ << "] " << msg << "\n";
    const std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line;
    std::cout.flush();
    for (auto& file : files_) {
        if (file && file->is_open()) {
            (*file) << line;
            file->flush();
        }
    }
}

void MinimalLogger::add_file(const std::filesystem::path& path)
{
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        throw std::runtime_error("Cannot open log file: " + path.string());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    files_.push_back(std::move(file));
}

auto Logger() -> std::shared_ptr<MinimalLogger>
{
    static auto logger = std::make_shared<MinimalLogger>("cellstitch");
    return logger;
}

void AddLogFile(const std::filesystem::path& path)
{
    Logger()->add_file(path);
}

void SetLogLevel(const std::string& s)
{
    using Level = MinimalLogger::Level;
    Level level;

    if (s == "debug" || s == "DEBUG") {
        level = Level::Debug;
    } else if (s == "info" || s == "INFO") {
        level = Level::Info;
    } else if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING") {
        level = Level::Warn;
    } else if (s == "error" || s == "ERROR") {
        level = Level::Error;
    } else if (s == "off" || s == "OFF") {
        level = Level::Off;
    } else {
        throw std::invalid_argument("Unknown log level: " + s);
    }

    Logger()->set_level(level);
}
