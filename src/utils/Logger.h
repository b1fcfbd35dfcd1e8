#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <atomic>
#include <optional>

namespace utils {

// All output goes to stderr so converted EDL/JSON can be written to stdout.
class Logger {
public:
	enum Level {
		ERROR = 0,
		WARN = 1,
		INFO = 2,
		DEBUG = 3
	};

	static void setLevel(Level level) {
		currentLevel = level;
	}

	static Level getLevel() {
		return currentLevel;
	}

	// "error", "warn", "info", "debug"
	static std::optional<Level> levelFromString(const std::string& name);

	template<typename... Args>
	static void error(const std::string& format, Args... args) {
		log(ERROR, "ERROR", format, args...);
	}

	template<typename... Args>
	static void warn(const std::string& format, Args... args) {
		log(WARN, "WARN", format, args...);
	}

	template<typename... Args>
	static void info(const std::string& format, Args... args) {
		log(INFO, "INFO", format, args...);
	}

	template<typename... Args>
	static void debug(const std::string& format, Args... args) {
		log(DEBUG, "DEBUG", format, args...);
	}

	// Placeholder substitution without the timestamp/level prefix
	template<typename... Args>
	static std::string format(const std::string& format, Args... args) {
		std::string message = format;
		(replaceFirst(message, "{}", toString(args)), ...);
		return message;
	}

private:
	static inline std::atomic<Level> currentLevel{INFO};

	template<typename... Args>
	static void log(Level level, const std::string& levelStr,
		const std::string& fmt, Args... args) {

		if (level > currentLevel) {
			return;
		}

		auto now = std::chrono::system_clock::now();
		auto time_t = std::chrono::system_clock::to_time_t(now);

		std::stringstream ss;
		ss << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S") << "] ";
		ss << "[" << levelStr << "] ";
		ss << format(fmt, args...);

		std::cerr << ss.str() << std::endl;
	}

	static void replaceFirst(std::string& str, const std::string& from,
		const std::string& to) {
		size_t pos = str.find(from);
		if (pos != std::string::npos) {
			str.replace(pos, from.length(), to);
		}
	}

	template<typename T>
	static std::string toString(const T& value) {
		std::stringstream ss;
		ss << value;
		return ss.str();
	}
};

} // namespace utils
