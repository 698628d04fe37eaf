#pragma once

#include <chrono>
#include <string>
#include <sstream>

namespace libcookstat {
namespace utils {

/**
 * @brief Process-wide leveled logging for libcookstat
 *
 * Lines go to stderr as:
 *   [2024-01-01 12:00:00.000] [cookstat/DEBUG] line_fit_solver.hpp:182 - message
 *
 * The level is read once from COOKSTAT_LOG_LEVEL (trace, debug, info, warn,
 * error, none) on first use; unset or unrecognized means warn in release
 * builds and info otherwise. The level is atomic and the output is
 * serialized, so models on different threads may log concurrently.
 *
 *   COOKSTAT_DEBUG("Fitting " << n << " observations");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	static LogLevel GetLogLevel();

	/// Override the level for the whole process; wins over the environment
	static void SetLogLevel(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param fallback Level returned when the name is not recognized
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static std::string LevelName(LogLevel level);

	/// NONE is a threshold, never a message level
	static bool ShouldLog(LogLevel level);

	static void Log(LogLevel level, const char *file, int line, const std::string &message);

	Tracer() = delete;
};

/**
 * @brief Wall time of one operation, reported at debug level
 *
 * Started on construction; Finish() logs "<operation> completed in X ms"
 * and returns the elapsed milliseconds.
 */
class OperationTimer {
public:
	OperationTimer(const char *file, int line);

	double Finish(const std::string &operation_name) const;

private:
	std::chrono::steady_clock::time_point start_;
	const char *file_;
	int line_;
};

#define COOKSTAT_LOG_AT(level, msg)                                                                                    \
	do {                                                                                                               \
		if (libcookstat::utils::Tracer::ShouldLog(level)) {                                                            \
			std::ostringstream cookstat_oss_;                                                                          \
			cookstat_oss_ << msg;                                                                                      \
			libcookstat::utils::Tracer::Log(level, __FILE__, __LINE__, cookstat_oss_.str());                           \
		}                                                                                                              \
	} while (0)

/// Usage: COOKSTAT_TRACE(message << stream << contents)
#define COOKSTAT_TRACE(msg) COOKSTAT_LOG_AT(libcookstat::utils::LogLevel::TRACE, msg)

#define COOKSTAT_DEBUG(msg) COOKSTAT_LOG_AT(libcookstat::utils::LogLevel::DBG, msg)

#define COOKSTAT_INFO(msg) COOKSTAT_LOG_AT(libcookstat::utils::LogLevel::INFO, msg)

#define COOKSTAT_WARN(msg) COOKSTAT_LOG_AT(libcookstat::utils::LogLevel::WARN, msg)

#define COOKSTAT_ERROR(msg) COOKSTAT_LOG_AT(libcookstat::utils::LogLevel::ERR, msg)

/// One timer per scope: COOKSTAT_TIMING_START(); ... COOKSTAT_TIMING_END("Operation name");
#define COOKSTAT_TIMING_START() const libcookstat::utils::OperationTimer cookstat_timer_(__FILE__, __LINE__)

#define COOKSTAT_TIMING_END(operation_name) cookstat_timer_.Finish(operation_name)

} // namespace utils
} // namespace libcookstat
