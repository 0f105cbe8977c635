#pragma once

#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

#include <fmt/format.h>

#include <pcr/typedefs.hpp>

/*
        A Log can be called from any thread and will write to the console and/or a specified file
        Both are optional and choosen by the client at initialization
*/
class Log
{
  public:
    Log(LogFlags log_flags, std::string_view log_name);
    ~Log();

    /*
            Getter for all instances of a logger
    */
    static Log* GetInstance(std::string_view log_name);

    /*
            Register a thread's name
    */
    static bool RegisterThreadName(std::string_view thread_name);
    static std::string_view GetThreadName(const std::thread::id& thread_id);

    /*
            Context attached to every message logged from the current thread while the scope lives,
            e.g. the card row that is being rendered. Scopes nest, the innermost one wins.
    */
    class ScopedContext
    {
      public:
        explicit ScopedContext(std::string context);
        ~ScopedContext();

        ScopedContext(const ScopedContext&) = delete;
        ScopedContext& operator=(const ScopedContext&) = delete;

      private:
        std::string m_Previous;
    };
    static std::string_view GetContext();

    /*
            LogLevels dictate the severity of the log
    */
    enum class LogLevel
    {
        Information,
        Debug,
        Warning,
        Error,
        Fatal
    };

    /*
            The Detail information that can be used to give a developer more information about a log
    */
    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        std::size_t m_Column;
        std::string_view m_Function;
        std::string_view m_Thread;
        std::string_view m_Context;
    };

    /*
            Register a hook for external handling of messages, hooks see every message regardless of the flags
    */
    using LogHook = std::function<void(const Log::DetailInformation&, Log::LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    /*
            Wrapper for a log message, ensures that used strings are constant expressions
    */
    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message;
        std::source_location m_SourceInfo;
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<std::type_identity_t<Args>...>;

    /*
            Raw Print function accepts a null-terminated string
            Templated print function uses fmtlib for formatting
    */
    void PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message);
    template<class... Args>
    void Print(const DetailInformation& detail_info, LogLevel level, fmt::format_string<Args...> message, Args&&... args)
    {
        const auto formatted = fmt::format(message, std::forward<Args>(args)...);
        PrintRaw(detail_info, level, formatted.c_str());
    }

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log_sink = Log::GetInstance(log_name);
        if (log_sink)
        {
            const DetailInformation detail_info{
                std::time(nullptr),
                message.m_SourceInfo.file_name(),
                message.m_SourceInfo.line(),
                message.m_SourceInfo.column(),
                message.m_SourceInfo.function_name(),
                GetThreadName(std::this_thread::get_id()),
                GetContext(),
            };
            log_sink->Print(detail_info, level, message.m_Message, std::forward<Args>(args)...);
        }
    }

    /*
            The name of the main log, globally available so one can query for the main log or create it themselves
    */
    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogFatal(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(::Log::c_MainLogName, Log::LogLevel::Fatal, message, std::forward<Args>(args)...);
}
