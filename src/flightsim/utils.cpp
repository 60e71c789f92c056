#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace flightsim {

namespace math {

double wrapAngle(double angle) {
    double wrapped = std::fmod(angle + M_PI, 2.0 * M_PI);
    if (wrapped < 0.0) {
        wrapped += 2.0 * M_PI;
    }
    return wrapped - M_PI;
}

double clamp(double value, double min_val, double max_val) {
    return std::max(min_val, std::min(max_val, value));
}

double cross(const Vec2& a, const Vec2& b) {
    return a.x() * b.y() - a.y() * b.x();
}

Vec2 safeNormalized(const Vec2& v) {
    double n = v.norm();
    if (n == 0.0) {
        return Vec2::Zero();
    }
    return v / n;
}

Vec2 headingVector(double rotation) {
    return Vec2(std::sin(rotation), -std::cos(rotation));
}

} // namespace math

namespace logging {

Logger::Logger(const std::string& filename, LogLevel level)
    : to_stderr_(filename.empty()), level_(level) {
    if (!to_stderr_) {
        file_.open(filename, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + filename);
        }
    }
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }
    std::ostream& out = to_stderr_ ? std::cerr : static_cast<std::ostream&>(file_);
    out << "[" << getTimestamp() << "] [" << levelToString(level) << "] " << message << '\n';
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace logging

namespace units {

double degToRad(double degrees) {
    return degrees * M_PI / 180.0;
}

double radToDeg(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace units

} // namespace flightsim
