#include "libcookstat/utils/tracing.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace libcookstat {
namespace utils {

namespace {

#ifdef NDEBUG
constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<LogLevel> g_level {kDefaultLevel};
std::once_flag g_env_once;
std::mutex g_output_mutex;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

void LoadLevelFromEnvironment() {
	std::call_once(g_env_once, [] {
		const char *env_level = std::getenv("COOKSTAT_LOG_LEVEL");
		if (env_level != nullptr) {
			g_level.store(Tracer::ParseLevel(env_level, kDefaultLevel), std::memory_order_relaxed);
		}
	});
}

std::string FormatTimestamp(std::chrono::system_clock::time_point now) {
	const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::tm local {};
#ifdef _WIN32
	localtime_s(&local, &seconds);
#else
	localtime_r(&seconds, &local);
#endif

	std::ostringstream oss;
	oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms;
	return oss.str();
}

const char *BaseName(const char *path) {
	const char *slash = std::strrchr(path, '/');
	const char *backslash = std::strrchr(path, '\\');
	const char *last = slash > backslash ? slash : backslash;
	return last == nullptr ? path : last + 1;
}

} // namespace

LogLevel Tracer::GetLogLevel() {
	LoadLevelFromEnvironment();
	return g_level.load(std::memory_order_relaxed);
}

void Tracer::SetLogLevel(LogLevel level) {
	// Consume the environment first so a later lazy load cannot overwrite this
	LoadLevelFromEnvironment();
	g_level.store(level, std::memory_order_relaxed);
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string lowered = name;
	for (auto &c : lowered) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (lowered == "trace") {
		return LogLevel::TRACE;
	} else if (lowered == "debug") {
		return LogLevel::DBG;
	} else if (lowered == "info") {
		return LogLevel::INFO;
	} else if (lowered == "warn") {
		return LogLevel::WARN;
	} else if (lowered == "error") {
		return LogLevel::ERR;
	} else if (lowered == "none") {
		return LogLevel::NONE;
	}
	return fallback;
}

std::string Tracer::LevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	}
	return "UNKNOWN";
}

bool Tracer::ShouldLog(LogLevel level) {
	return level != LogLevel::NONE && level >= GetLogLevel();
}

void Tracer::Log(LogLevel level, const char *file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const std::string timestamp = FormatTimestamp(std::chrono::system_clock::now());

	std::lock_guard<std::mutex> lock(g_output_mutex);
	std::cerr << "[" << timestamp << "] [cookstat/" << LevelName(level) << "] " << BaseName(file) << ":" << line
	          << " - " << message << '\n';
}

OperationTimer::OperationTimer(const char *file, int line)
    : start_(std::chrono::steady_clock::now()), file_(file), line_(line) {
}

double OperationTimer::Finish(const std::string &operation_name) const {
	const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
	const double duration_ms = elapsed.count();

	if (Tracer::ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
		Tracer::Log(LogLevel::DBG, file_, line_, oss.str());
	}

	return duration_ms;
}

} // namespace utils
} // namespace libcookstat
