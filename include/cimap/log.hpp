#ifndef CIMAP_LOG_H
#define CIMAP_LOG_H

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <oneapi/tbb/concurrent_queue.h>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "api.hpp"
#include "hash/hashmap.hpp"
#include "memory/alloc.hpp"

namespace cimap
{
    namespace log
    {
        enum class level
        {
            fatal,
            error,
            warn,
            info,
            debug,
            trace
        };

        class token_handler_base
        {
        public:
            virtual ~token_handler_base() = default;
            virtual void handle(level level, const char *message, std::ostream &ss) const = 0;
        };

        using token_handler_list = std::vector<std::shared_ptr<token_handler_base>>;

        class text_handler final : public token_handler_base
        {
        public:
            explicit text_handler(std::string_view text) : _text(text) {}

            void handle(level, const char *, std::ostream &ss) const override { ss << _text; }

        private:
            const std::string _text;
        };

        class time_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, std::ostream &ss) const override;
        };

        class thread_id_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, std::ostream &ss) const override;
        };

        class level_name_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, std::ostream &ss) const override;
        };

        class message_handler final : public token_handler_base
        {
        public:
            void handle(level, const char *message, std::ostream &ss) const override { ss << message; }
        };

        namespace colors
        {
            constexpr std::string_view red = "\x1b[31m";
            constexpr std::string_view green = "\x1b[32m";
            constexpr std::string_view yellow = "\x1b[33m";
            constexpr std::string_view blue = "\x1b[34m";
            constexpr std::string_view magenta = "\x1b[35m";
            constexpr std::string_view cyan = "\x1b[36m";
            constexpr std::string_view reset = "\x1b[0m";
        }; // namespace colors

        class color_handler final : public token_handler_base
        {
        public:
            void handle(level level, const char *message, std::ostream &ss) const override;
        };

        class decolor_handler final : public token_handler_base
        {
        public:
            void handle(level, const char *, std::ostream &ss) const override { ss << colors::reset; }
        };

        class CIMAP_API logger_base
        {
        public:
            explicit logger_base(const std::string &name) : _name(name) {}

            virtual ~logger_base() = default;

            /// Splits `pattern` into literal text and `%(token)` handlers. Unknown tokens are dropped.
            void set_pattern(const std::string &pattern);

            const std::string &name() const { return _name; }

            virtual std::ostream &stream() = 0;

            virtual void write(const std::string &message) = 0;

            void parse_tokens(level level, const char *message, std::ostream &ss) const
            {
                for (auto &token : _tokens) token->handle(level, message, ss);
            }

        private:
            std::string _name;
            token_handler_list _tokens;
        };

        class CIMAP_API file_logger final : public logger_base
        {
        public:
            file_logger(const std::string &name, const std::string &path, std::ios_base::openmode flags)
                : logger_base(name), _path(path)
            {
                _fs.open(path.c_str(), flags);
            }

            ~file_logger()
            {
                if (_fs.is_open()) _fs.close();
            }

            std::ostream &stream() override { return _fs; }

            void write(const std::string &message) override
            {
                if (_fs.is_open()) _fs << message << std::flush;
            }

            const std::string &path() const { return _path; }

        private:
            std::string _path;
            std::ofstream _fs;
        };

        class console_logger final : public logger_base
        {
        public:
            explicit console_logger(const std::string &name) : logger_base(name) {}

            std::ostream &stream() override { return std::cout; }

            void write(const std::string &message) override { std::cout << message; }
        };

        /**
         * @class The Log Service
         * @brief Owns the named loggers of the process.
         *
         * Records are formatted on the calling thread and queued. `dispatch()` writes out everything
         * queued so far; with `auto_dispatch` set, every `log()` call dispatches before returning.
         */
        class CIMAP_API log_service final
        {
        public:
            CIMAP_API static log_service *instance;
            logger_base *default_logger;
            level threshold;
            bool auto_dispatch;

            log_service() : default_logger(nullptr), threshold(level::error), auto_dispatch(true) { instance = this; }
            ~log_service();

            log_service(const log_service &) = delete;
            log_service &operator=(const log_service &) = delete;

            /**
             * @brief Adds a logger under the specified name, replacing any logger of that name.
             * @param name The name of the logger.
             * @param args Extra constructor arguments of the logger type.
             * @return A pointer to the added logger, owned by the service.
             */
            template <typename T, typename... Args>
            T *add_logger(const std::string &name, Args &&...args)
            {
                remove_logger(name);
                auto *logger = cimap::alloc<T>(name, std::forward<Args>(args)...);
                _loggers[name] = logger;
                return logger;
            }

            /**
             * @brief Gets the logger with the specified name.
             * @param name The name of the logger to retrieve.
             * @return A pointer to the logger, or nullptr if the logger was not found.
             */
            logger_base *get_logger(const std::string &name) const
            {
                auto it = _loggers.find(name);
                return it == _loggers.end() ? nullptr : it->second;
            }

            /**
             * @brief Removes the logger with the specified name. Queued records are written out first.
             * @param name The name of the logger to remove.
             */
            void remove_logger(const std::string &name);

            __attribute__((format(printf, 4, 5))) void log(logger_base *logger, enum level level,
                                                           const char *message, ...);

            /// Writes out every queued record. Returns the number written.
            size_t dispatch();

            /// Blocks until the queue is empty. With `force`, queued records are dropped instead.
            void await(bool force = false);

        private:
            hashmap<std::string, logger_base *> _loggers;
            oneapi::tbb::concurrent_queue<std::pair<logger_base *, std::string>> _queue;
            std::atomic<int> _count{0};
        };

        inline logger_base *get_logger(const std::string &name) { return log_service::instance->get_logger(name); }

        inline logger_base *get_default_logger() { return log_service::instance->default_logger; }
    } // namespace log
} // namespace cimap

#ifdef CIMAP_LOG_ENABLE
    #define CIMAP_LOG_EMIT(lvl, ...)                                                                    \
        do {                                                                                            \
            if (cimap::log::log_service::instance && cimap::log::get_default_logger())                  \
                cimap::log::log_service::instance->log(cimap::log::get_default_logger(), lvl, __VA_ARGS__); \
        } while (0)
    #define logInfo(...)  CIMAP_LOG_EMIT(cimap::log::level::info, __VA_ARGS__)
    #define logDebug(...) CIMAP_LOG_EMIT(cimap::log::level::debug, __VA_ARGS__)
    #define logTrace(...) CIMAP_LOG_EMIT(cimap::log::level::trace, __VA_ARGS__)
    #define logWarn(...)  CIMAP_LOG_EMIT(cimap::log::level::warn, __VA_ARGS__)
    #define logError(...) CIMAP_LOG_EMIT(cimap::log::level::error, __VA_ARGS__)
    #define logFatal(...) CIMAP_LOG_EMIT(cimap::log::level::fatal, __VA_ARGS__)
#else
    #define logInfo(...)  ((void)0)
    #define logDebug(...) ((void)0)
    #define logTrace(...) ((void)0)
    #define logWarn(...)  ((void)0)
    #define logError(...) ((void)0)
    #define logFatal(...) ((void)0)
#endif
#endif
