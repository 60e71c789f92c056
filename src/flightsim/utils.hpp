#pragma once

#include "types.hpp"
#include <fstream>
#include <string>

namespace flightsim {

/**
 * @brief Mathematical utility functions
 */
namespace math {

    /**
     * @brief Wrap an angle to [-pi, pi]
     * @param angle Angle [rad]
     * @return Shortest signed equivalent angle
     */
    double wrapAngle(double angle);

    /**
     * @brief Clamp value to range
     * @param value Value to clamp
     * @param min_val Minimum value
     * @param max_val Maximum value
     * @return Clamped value
     */
    double clamp(double value, double min_val, double max_val);

    /**
     * @brief Scalar (z) component of the planar cross product a x b
     */
    double cross(const Vec2& a, const Vec2& b);

    /**
     * @brief Unit vector, or zero for a zero-length input
     */
    Vec2 safeNormalized(const Vec2& v);

    /**
     * @brief Unit thrust direction for a craft rotation
     * @param rotation Rotation [rad]
     * @return (sin(rotation), -cos(rotation))
     */
    Vec2 headingVector(double rotation);
}

/**
 * @brief Logging utilities
 */
namespace logging {

    /**
     * @brief Log level enumeration
     */
    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    /**
     * @brief Logger class
     *
     * Writes "[timestamp] [LEVEL] message" lines to a file, or to standard error
     * when constructed with an empty filename.
     */
    class Logger {
    public:
        /**
         * @brief Constructor
         * @param filename Log filename, empty for standard error
         * @param level Log level
         */
        explicit Logger(const std::string& filename, LogLevel level = LogLevel::INFO);

        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Log message
         * @param level Log level
         * @param message Message to log
         */
        void log(LogLevel level, const std::string& message);

        void debug(const std::string& message);
        void info(const std::string& message);
        void warning(const std::string& message);
        void error(const std::string& message);

        void setLevel(LogLevel level);
        LogLevel getLevel() const { return level_; }

        /**
         * @brief Check if messages at a level would be written
         */
        bool isEnabled(LogLevel level) const { return level >= level_; }

    private:
        std::ofstream file_;
        bool to_stderr_;
        LogLevel level_;

        std::string levelToString(LogLevel level) const;
        std::string getTimestamp() const;
    };
}

/**
 * @brief Unit conversion utilities
 */
namespace units {

    double degToRad(double degrees);
    double radToDeg(double radians);
}

} // namespace flightsim
