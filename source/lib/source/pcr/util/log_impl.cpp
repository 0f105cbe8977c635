#include "log_impl.hpp"

#include <cstdlib>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
{
    if (IsSet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock<std::shared_mutex> read_lock(g_InstanceListMutex);

    auto it = g_Instances.find(std::string{ log_name });
    if (it != g_Instances.end())
    {
        return it->second->m_ParentLog;
    }
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    m_ParentLog = parent_log;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    }
    g_Instances[m_LogName] = this;
}
void Log::LogImpl::UnregisterInstance()
{
    m_ParentLog = nullptr;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    const auto it{ g_Instances.find(m_LogName) };
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
}

bool Log::LogImpl::RegisterThreadName(std::string_view thread_name)
{
    std::unique_lock<std::shared_mutex> write_lock(g_ThreadListMutex);

    const std::thread::id thread_id = std::this_thread::get_id();
    if (g_ThreadList.contains(thread_id))
    {
        return false;
    }

    g_ThreadList[thread_id] = thread_name;
    return true;
}

std::string_view Log::LogImpl::GetThreadName(const std::thread::id& thread_id)
{
    std::shared_lock<std::shared_mutex> read_lock(g_ThreadListMutex);

    auto it = g_ThreadList.find(thread_id);
    if (it != g_ThreadList.end())
    {
        return it->second;
    }

    return "Unregistered";
}

std::string Log::LogImpl::SwapContext(std::string context)
{
    std::swap(g_ThreadContext, context);
    return context;
}

std::string_view Log::LogImpl::GetContext()
{
    return g_ThreadContext;
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    m_LogHooks.push_back({ m_NextHookId++, std::move(hook) });
    return m_LogHooks.back().m_HookId;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message)
{
    Flush(detail_info, level, message);

    if (IsSet(m_LogFlags, LogFlags::FatalQuit) && level == LogLevel::Fatal)
    {
        std::exit(-1);
    }
}

void Log::LogImpl::Flush(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    std::stringstream stream;

    if (message[0] == '\n')
    {
        stream << "\n";
        message++;
    }

    const char* prefix{ "[???]" };
    switch (level)
    {
    case LogLevel::Information:
        prefix = " [INFO]";
        break;
    case LogLevel::Debug:
        prefix = "[DEBUG]";
        break;
    case LogLevel::Warning:
        prefix = " [WARN]";
        break;
    case LogLevel::Error:
        prefix = "[ERROR]";
        break;
    case LogLevel::Fatal:
        prefix = "[FATAL]";
        break;
    }
    stream << prefix;

    // Detailed information, e.g. time, file, line...
    const LogFlags detail_bits = m_LogFlags & LogFlags::DetailAll;
    if (IsAnySet(detail_bits, LogFlags::DetailAll))
    {
        std::vector<std::string> details;
        if (IsSet(detail_bits, LogFlags::DetailTime))
        {
            details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
        }
        if (IsSet(detail_bits, LogFlags::DetailFile))
        {
            std::string_view file{ detail_info.m_File };
#ifdef PCR_SOURCE_ROOT
            if (file.starts_with(PCR_SOURCE_ROOT))
            {
                file.remove_prefix(std::string_view{ PCR_SOURCE_ROOT }.size());
            }
#endif
            details.emplace_back(file);
        }
        if (IsSet(detail_bits, LogFlags::DetailColumn))
        {
            details.push_back(fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column));
        }
        else if (IsSet(detail_bits, LogFlags::DetailLine))
        {
            details.push_back(fmt::format("{}", detail_info.m_Line));
        }
        if (IsSet(detail_bits, LogFlags::DetailFunction))
        {
            details.emplace_back(detail_info.m_Function);
        }
        if (IsSet(detail_bits, LogFlags::DetailThread))
        {
            details.emplace_back(detail_info.m_Thread);
        }
        if (!details.empty())
        {
            stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
        }
    }
    if (IsSet(m_LogFlags, LogFlags::DetailContext) && !detail_info.m_Context.empty())
    {
        stream << "[" << detail_info.m_Context << "]";
    }

    stream << ": ";
    stream << std::string_view(message) << "\n";

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    if (IsSet(m_LogFlags, LogFlags::Console))
    {
        fmt::print(stderr, "{}", full_message_str);
    }
    if (m_FileStream.is_open())
    {
        m_FileStream << full_message_str << std::flush;
    }

    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    const std::string file_name{
        fmt::format("logs/{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)))
    };

    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::exists(logs_directory) || !fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (fs::directory_iterator dir_iter(logs_directory); dir_iter != fs::directory_iterator{}; ++dir_iter)
    {
        if (fs::is_regular_file(dir_iter->status()))
        {
            files_sorted_by_modify_time.insert({ fs::last_write_time(dir_iter->path()), dir_iter->path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles = 256;
    const std::size_t num_files = files_sorted_by_modify_time.size();
    if (num_files > c_MaxNumLogFiles)
    {
        auto it = files_sorted_by_modify_time.begin();
        for (std::size_t i = 0; i < num_files - c_MaxNumLogFiles; i++, ++it)
        {
            fs::remove(it->second);
        }
    }

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(file_name);
}
