/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "sth_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace statehub::format_tools;

namespace statehub::utils
{

namespace
{

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand, SetErrorCallbackCommand>;

void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        // Promise already satisfied; the waiting side has its answer.
        STH_DEBUG("Logger: promise already satisfied: {}", e.what());
    }
}

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // anonymous namespace

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &message);
    void write_to_sink(const LogMessage &msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_; // worker thread only
    std::unique_ptr<Sink> sink_;                              // worker thread only
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::thread worker_thread_;
    size_t max_queue_size_{10000}; // guarded by queue_mutex_
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<size_t> messages_dropped_{0};   // batch counter, exchanged to 0 by the worker
    std::atomic<size_t> total_dropped_{0};      // reset on sink switch
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, SetSinkCommand> || std::is_same_v<T, FlushCommand> ||
                          std::is_same_v<T, SetErrorCallbackCommand>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if ((is_log && current >= max_queue_size_) || current >= max_queue_size_ * 2)
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            total_dropped_.fetch_add(1, std::memory_order_relaxed);
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (!error_callback_)
    {
        STH_DEBUG("Logger error with no write-error callback installed: {}", message);
        return;
    }
    try
    {
        error_callback_(message);
    }
    catch (const std::exception &e)
    {
        // An exception escaping the worker thread would terminate the process.
        STH_DEBUG("Logger write-error callback threw: {}", e.what());
    }
}

void Logger::Impl::write_to_sink(const LogMessage &msg)
{
    try
    {
        sink_->write(msg);
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Logger sink '{}' write failed: {}", sink_->description(), e.what()));
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();
        }
        auto clear_batch = basics::make_scope_guard([&local_queue]() noexcept { local_queue.clear(); });

        if (const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed); dropped > 0)
        {
            write_to_sink(make_message(
                Logger::Level::L_WARNING,
                make_buffer("Logger queue was full; {} messages were dropped.", dropped)));
        }

        for (auto &cmd : local_queue)
        {
            if (auto *msg = std::get_if<LogMessage>(&cmd))
            {
                if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                {
                    write_to_sink(*msg);
                }
                continue;
            }

            std::visit(
                [this](auto &&arg)
                {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, SetSinkCommand>)
                    {
                        const std::string old_desc = sink_->description();
                        const std::string new_desc = arg.new_sink->description();
                        write_to_sink(make_message(Logger::Level::L_SYSTEM,
                                                   make_buffer("Switching log sink to: {}", new_desc)));
                        sink_->flush();
                        sink_ = std::move(arg.new_sink);
                        total_dropped_.store(0, std::memory_order_relaxed);
                        write_to_sink(make_message(Logger::Level::L_SYSTEM,
                                                   make_buffer("Log sink switched from: {}", old_desc)));
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                    {
                        report_error(arg.error_message);
                    }
                    else if constexpr (std::is_same_v<T, FlushCommand>)
                    {
                        sink_->flush();
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                    {
                        error_callback_ = std::move(arg.callback);
                        promise_set_safe(arg.promise, true);
                    }
                },
                cmd);
        }

        if (stopping)
        {
            STH_DEBUG("Logger worker thread shutting down.");
            write_to_sink(make_message(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down.")));
            sink_->flush();
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::set_console()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise}))
        return false;
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::runtime_error &e)
    {
        pImpl->enqueue_command(SinkCreationErrorCommand{e.what()});
        return false;
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise}))
        return false;
    return future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(FlushCommand{promise}))
        return;
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->max_queue_size_ = max_size == 0 ? 1 : max_size;
}

size_t Logger::dropped_message_count() const
{
    return pImpl->total_dropped_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise}))
        return;
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed)) &&
           !pImpl->shutdown_requested_.load(std::memory_order_relaxed);
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        (void)pImpl->enqueue_command(make_message(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        // Dropped like a queue overflow.
        pImpl->messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        pImpl->total_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace statehub::utils
