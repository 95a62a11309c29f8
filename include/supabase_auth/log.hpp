#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace supabase_auth {
    namespace log {

        enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

        /**
         * @brief Process-wide leveled logger.
         *
         * The level may be changed from any thread; writes to the sink are
         * serialized. A null sink discards every record.
         */
        class Logger {
           public:
            static Logger& instance() {
                static Logger inst;
                return inst;
            }

            void set_level(Level lvl) noexcept {
                m_level.store(lvl, std::memory_order_relaxed);
            }

            Level level() const noexcept {
                return m_level.load(std::memory_order_relaxed);
            }

            bool enabled(Level lvl) const noexcept {
                return lvl != Level::Off && lvl >= level();
            }

            void set_output(std::ostream* os) noexcept {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_out = os;
            }

            void log(Level lvl, const std::string& msg) {
                if (!enabled(lvl)) return;
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_out == nullptr) return;
                *m_out << timestamp() << " [" << level_name(lvl)
                       << "] supabase_auth: " << msg << '\n';
                m_out->flush();
            }

           private:
            Logger() = default;

            static const char* level_name(Level lvl) {
                switch (lvl) {
                    case Level::Trace:
                        return "TRACE";
                    case Level::Debug:
                        return "DEBUG";
                    case Level::Info:
                        return "INFO";
                    case Level::Warn:
                        return "WARN";
                    case Level::Error:
                        return "ERROR";
                    case Level::Off:
                        break;
                }
                return "?????";
            }

            static std::string timestamp() {
                using namespace std::chrono;
                auto t = system_clock::to_time_t(system_clock::now());
                std::tm tm{};
                localtime_r(&t, &tm);
                char buf[64];
                std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
                return buf;
            }

            std::ostream* m_out{&std::cerr};
            std::atomic<Level> m_level{Level::Warn};
            std::mutex m_mutex;
        };

        /// Collects `<<` operands and emits one record on destruction.
        class LogStream {
           public:
            explicit LogStream(Level lvl) : m_level(lvl) {}

            template <typename T>
            LogStream& operator<<(const T& v) {
                m_stream << v;
                return *this;
            }

            ~LogStream() { Logger::instance().log(m_level, m_stream.str()); }

           private:
            Level m_level;
            std::ostringstream m_stream;
        };

    }  // namespace log
}  // namespace supabase_auth

// The message expression is only evaluated when the level is enabled.
#define SUPABASE_AUTH_LOG(lvl, msg)                                  \
    do {                                                             \
        if (::supabase_auth::log::Logger::instance().enabled((lvl))) \
            ::supabase_auth::log::LogStream((lvl)) << msg;           \
    } while (0)

#define SUPABASE_AUTH_TRACE(msg) \
    SUPABASE_AUTH_LOG(::supabase_auth::log::Level::Trace, msg)
#define SUPABASE_AUTH_DEBUG(msg) \
    SUPABASE_AUTH_LOG(::supabase_auth::log::Level::Debug, msg)
#define SUPABASE_AUTH_INFO(msg) \
    SUPABASE_AUTH_LOG(::supabase_auth::log::Level::Info, msg)
#define SUPABASE_AUTH_WARN(msg) \
    SUPABASE_AUTH_LOG(::supabase_auth::log::Level::Warn, msg)
#define SUPABASE_AUTH_ERROR(msg) \
    SUPABASE_AUTH_LOG(::supabase_auth::log::Level::Error, msg)
