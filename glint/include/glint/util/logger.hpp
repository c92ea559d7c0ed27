#pragma once
#include <fmt/format.h>
#include <glint/defines.hpp>
#include <glint/util/enum_array.hpp>
#include <glint/util/pinned.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace glint {
class Logger {
  public:
	///
	/// \brief The output pipe for logging.
	///
	enum class Pipe : std::uint8_t { eStdOut, eStdErr };
	///
	/// \brief The level of a log message.
	///
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };
	static constexpr auto levels_v{EnumArray<Level, char>{'E', 'W', 'I', 'D'}};

	///
	/// \brief The format for a log message.
	///
	inline static std::string s_format{"[{level}] [{context}] {message} [{timestamp}]"};

	struct Entry {
		std::string formatted_message{};
		Level level{};
	};

	struct BufferSize;
	struct Accessor;
	struct Sink;

	static BufferSize buffer_size();
	///
	/// \brief Access the log buffer (under lock).
	/// \param accessor Concrete sub-type of Accessor
	///
	static void access_buffer(Accessor& accessor);
	///
	/// \brief Attach a sink to receive log callbacks.
	///
	/// Sink's destructor will detach itself.
	///
	static void attach(Sink& out_sink);

	static void print_to(Pipe pipe, Entry entry);

	///
	/// \brief Format a log message given the level.
	/// \param level The level of this log message
	/// \param context The context (component) logging the message
	/// \param message The log message text
	/// \returns Text formatted according to s_format
	///
	static std::string format(Level level, std::string_view context, std::string_view message);

	template <typename... Args>
	static std::string format(Level level, std::string_view const context, fmt::format_string<Args...> fmt, Args const&... args) {
		return format(level, context, fmt::vformat(fmt, fmt::make_format_args(args...)));
	}

	virtual ~Logger() = default;

	Logger(std::string_view context = "General") : context(context) {}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eError]) { return; }
		print(Entry{format(Level::eError, context, fmt, args...), Level::eError});
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eWarn]) { return; }
		print(Entry{format(Level::eWarn, context, fmt, args...), Level::eWarn});
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eInfo]) { return; }
		print(Entry{format(Level::eInfo, context, fmt, args...), Level::eInfo});
	}

	///
	/// \brief Log a debug message (compiled out unless GLINT_DEBUG is defined).
	///
	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args const&... args) const {
		if constexpr (debug_v) {
			if (silent[Level::eDebug]) { return; }
			print(Entry{format(Level::eDebug, context, fmt, args...), Level::eDebug});
		}
	}

	void print(Entry entry) const { print_to(entry.level == Level::eError ? Pipe::eStdErr : Pipe::eStdOut, std::move(entry)); }

	std::string_view context{};
	///
	/// \brief Levels that should be suppressed from being logged.
	///
	EnumArray<Level, bool> silent{};
};

///
/// \brief Size of the buffer for stored logs.
///
struct Logger::BufferSize {
	///
	/// \brief Lower threshold: will shrink down to this size.
	///
	std::size_t limit{500};
	///
	/// \brief Extra space beyond lower threshold: crossing this will trigger a shrink.
	///
	std::size_t delta{100};

	constexpr std::size_t total() const { return limit + delta; }
};

struct Logger::Accessor {
	virtual void operator()(std::span<Entry const> entries) = 0;
};

struct Logger::Sink : Pinned {
	virtual ~Sink();

	virtual void on_log(Entry const& entry) = 0;
};
} // namespace glint
