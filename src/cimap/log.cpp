#include <chrono>
#include <cimap/log.hpp>
#include <cimap/string/utils.hpp>
#include <cstdarg>
#include <ctime>
#include <regex>
#include <thread>

namespace cimap
{
    namespace log
    {
        void time_handler::handle(level, const char *, std::ostream &ss) const
        {
            using namespace std::chrono;
            auto now = system_clock::now();
            long long ns = duration_cast<nanoseconds>(now.time_since_epoch()).count() % 1000000000;

            time_t time_t_now = system_clock::to_time_t(now);
            std::tm tm_now;
#ifdef _WIN32
            localtime_s(&tm_now, &time_t_now);
#else
            localtime_r(&time_t_now, &tm_now);
#endif
            ss << cimap::format("%04d-%02d-%02d %02d:%02d:%02d.%09lld", tm_now.tm_year + 1900, tm_now.tm_mon + 1,
                                tm_now.tm_mday, tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec, ns);
        }

        void thread_id_handler::handle(level, const char *, std::ostream &ss) const
        {
            ss << std::this_thread::get_id();
        }

        void level_name_handler::handle(level level, const char *, std::ostream &ss) const
        {
            switch (level)
            {
                case level::info:
                    ss << "INFO";
                    break;
                case level::debug:
                    ss << "DEBUG";
                    break;
                case level::trace:
                    ss << "TRACE";
                    break;
                case level::warn:
                    ss << "WARN";
                    break;
                case level::error:
                    ss << "ERROR";
                    break;
                case level::fatal:
                    ss << "FATAL";
                    break;
                default:
                    ss << "UNKNOWN";
                    break;
            }
        }

        void color_handler::handle(level level, const char *, std::ostream &ss) const
        {
            switch (level)
            {
                case level::fatal:
                    ss << colors::magenta;
                    break;
                case level::error:
                    ss << colors::red;
                    break;
                case level::warn:
                    ss << colors::yellow;
                    break;
                case level::info:
                    ss << colors::green;
                    break;
                case level::debug:
                    ss << colors::blue;
                    break;
                case level::trace:
                    ss << colors::cyan;
                    break;
                default:
                    ss << colors::reset;
                    break;
            }
        }

        void logger_base::set_pattern(const std::string &pattern)
        {
            static const std::regex token_regex("%\\((.*?)\\)");
            _tokens.clear();

            size_t last_pos = 0;
            for (std::sregex_iterator it(pattern.begin(), pattern.end(), token_regex), end; it != end; ++it)
            {
                size_t pos = static_cast<size_t>(it->position());
                if (pos != last_pos)
                    _tokens.push_back(std::make_shared<text_handler>(pattern.substr(last_pos, pos - last_pos)));

                const std::string token = it->str(1);
                if (token == "ascii_time")
                    _tokens.push_back(std::make_shared<time_handler>());
                else if (token == "level_name")
                    _tokens.push_back(std::make_shared<level_name_handler>());
                else if (token == "thread")
                    _tokens.push_back(std::make_shared<thread_id_handler>());
                else if (token == "message")
                    _tokens.push_back(std::make_shared<message_handler>());
                else if (token == "color_auto")
                    _tokens.push_back(std::make_shared<color_handler>());
                else if (token == "color_off")
                    _tokens.push_back(std::make_shared<decolor_handler>());

                last_pos = pos + static_cast<size_t>(it->length());
            }
            if (last_pos != pattern.size()) _tokens.push_back(std::make_shared<text_handler>(pattern.substr(last_pos)));
        }

        void log_service::remove_logger(const std::string &name)
        {
            auto it = _loggers.find(name);
            if (it == _loggers.end()) return;
            dispatch();
            logger_base *logger = it->second;
            _loggers.erase(it);
            if (default_logger == logger) default_logger = nullptr;
            cimap::release(logger);
        }

        size_t log_service::dispatch()
        {
            size_t written = 0;
            std::pair<logger_base *, std::string> record;
            while (_queue.try_pop(record))
            {
                record.first->write(record.second);
                _count.fetch_sub(1, std::memory_order_relaxed);
                ++written;
            }
            return written;
        }

        void log_service::await(bool force)
        {
            if (force)
            {
                _queue.clear();
                _count.store(0, std::memory_order_relaxed);
                return;
            }
            while (_count.load(std::memory_order_relaxed) > 0)
                if (dispatch() == 0) std::this_thread::yield();
        }

        void log_service::log(logger_base *logger, enum level level, const char *message, ...)
        {
            if (!logger || level > threshold) return;
            std::stringstream ss;
            logger->parse_tokens(level, message, ss);
            va_list args;
            va_start(args, message);
            std::string record = cimap::format_va_list(ss.str().c_str(), args);
            va_end(args);
            _count.fetch_add(1, std::memory_order_relaxed);
            _queue.emplace(logger, std::move(record));
            if (auto_dispatch) dispatch();
        }

        log_service::~log_service()
        {
            dispatch();
            for (auto &logger : _loggers) cimap::release(logger.second);
            _loggers.clear();
            default_logger = nullptr;
            if (instance == this) instance = nullptr;
        }

        log_service *log_service::instance = nullptr;
    } // namespace log
} // namespace cimap
