#include <glint/util/logger.hpp>
#include <glint/util/ptr.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace glint {
namespace {
struct Timestamp {
	char buffer[32]{};
	operator char const*() const { return buffer; }
};

Timestamp make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	auto ret = Timestamp{};
	if (!std::strftime(ret.buffer, sizeof(ret.buffer), "%H:%M:%S", std::localtime(&now))) { return {}; }
	return ret;
}

struct Storage {
	struct Buffer {
		Logger::BufferSize size{};

		std::vector<Logger::Entry> entries{};

		void push(Logger::Entry entry) {
			entries.push_back(std::move(entry));
			if (entries.size() > size.total()) {
				auto const new_begin = entries.begin() + static_cast<std::ptrdiff_t>(size.delta);
				std::rotate(entries.begin(), new_begin, entries.end());
				entries.resize(size.limit);
			}
		}
	};

	Buffer buffer{};
	std::unordered_set<Ptr<Logger::Sink>> sinks{};
	std::mutex mutex{};
};

Storage g_storage{};
} // namespace

Logger::Sink::~Sink() {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.erase(this);
}

Logger::BufferSize Logger::buffer_size() { return g_storage.buffer.size; }

void Logger::access_buffer(Accessor& accessor) {
	auto lock = std::scoped_lock{g_storage.mutex};
	accessor(g_storage.buffer.entries);
}

void Logger::attach(Sink& out_sink) {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.insert(&out_sink);
}

std::string Logger::format(Level level, std::string_view context, std::string_view const message) {
	if (context.empty()) { context = "Unknown"; }
	return fmt::format(fmt::runtime(s_format), fmt::arg("level", levels_v[level]), fmt::arg("context", context), fmt::arg("message", message),
					   fmt::arg("timestamp", static_cast<char const*>(make_timestamp())));
}

void Logger::print_to(Pipe pipe, Entry entry) {
	auto* fd = pipe == Pipe::eStdErr ? stderr : stdout;
	std::fprintf(fd, "%s\n", entry.formatted_message.c_str());
	auto lock = std::scoped_lock{g_storage.mutex};
	for (auto const& sink : g_storage.sinks) { sink->on_log(entry); }
	g_storage.buffer.push(std::move(entry));
}
} // namespace glint
